#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>
#include "CancellationToken.hpp"
#include "MediaEngine.hpp"
#include "MusicGroup.hpp"
#include "PlaybackSession.hpp"
#include <nlohmann/json.hpp>

namespace Jukebox {

struct PlaybackTiming {
    // Poll period of the "is playing" loop
    std::chrono::milliseconds pollInterval{10};
    // Delay between play() and the fade in
    std::chrono::milliseconds settleDelay{100};
    int fadeSteps = 20;
    double fadeSeconds = 2.0;
};

struct CurrentlyPlaying {
    const MusicGroup* group = nullptr;
    const TrackList* trackList = nullptr;
    const PlaybackSession* session = nullptr;
};

/**
 * Owns the music configuration and the single playback session.
 *
 * Config keys: "volume" (0-100, required), "directory", "sort" (default
 * true), "groups" (required, list of MusicGroup configs).
 *
 * requestPlay() and cancel() are serialized; a new session is only
 * started after the previous one has stopped its engine handle and
 * cleared the session state.
 */
class MusicManager {
public:
    using SessionListener =
        std::function<void(const std::string& trackListName, SessionOutcome outcome, const std::string& message)>;

    MusicManager(const nlohmann::json& config, std::shared_ptr<MediaEngine> engine,
                 PlaybackTiming timing = PlaybackTiming(), std::optional<uint32_t> seed = std::nullopt);
    ~MusicManager();

    MusicManager(const MusicManager&) = delete;
    MusicManager& operator=(const MusicManager&) = delete;

    // Throws IndexError for indices outside the configuration
    void requestPlay(size_t groupIndex, size_t trackListIndex);

    // No-op when idle. Otherwise blocks until the session has torn down.
    void cancel();

    /**
     * Sets the music volume (clamped to 0-100).
     *
     * @param setGlobal store as the global volume, also when nothing plays
     * @param smooth    ramp the live handle linearly instead of jumping
     * @param steps     number of volume writes in the ramp
     * @param seconds   duration of the ramp
     *
     * A smooth ramp blocks the caller for `seconds` and is abandoned when
     * the session owning the handle is cancelled.
     */
    void setVolume(int volume, bool setGlobal = true, bool smooth = true, int steps = 20, double seconds = 2.0);

    // Track list directory, else group directory, else the global one.
    // Throws DirectoryError when none is set.
    std::string resolveDirectory(const MusicGroup& group, const TrackList& trackList) const;

    int volume() const;
    const std::optional<std::string>& directory() const { return m_directory; }
    const std::vector<MusicGroup>& groups() const { return m_groups; }
    const PlaybackTiming& timing() const { return m_timing; }

    std::optional<CurrentlyPlaying> currentlyPlaying() const;
    bool isPlaying() const;
    std::optional<SessionOutcome> lastOutcome() const;

    // Called on the session thread after teardown. Must not call back
    // into requestPlay() or cancel().
    void setSessionListener(SessionListener listener);

private:
    friend class PlaybackSession;

    std::shared_ptr<MediaHandle> openPlayer(const std::string& path);
    void releasePlayer();
    bool fadePlayer(const std::shared_ptr<MediaHandle>& player, const std::shared_ptr<CancellationToken>& token,
                    int target, int steps, double seconds);
    // Ramps a muted handle up to the global volume, re-reading it on every
    // step so a volume change during the ramp is followed
    bool fadeIn(const std::shared_ptr<MediaHandle>& player, const std::shared_ptr<CancellationToken>& token);
    void finishSession(const PlaybackSession& session, SessionOutcome outcome, const std::string& message);
    void stopSession();

    std::shared_ptr<MediaEngine> m_engine;
    PlaybackTiming m_timing;
    std::optional<std::string> m_directory;
    std::vector<MusicGroup> m_groups;

    // Serializes requestPlay() and cancel()
    std::mutex m_controlMutex;
    std::unique_ptr<PlaybackSession> m_session;
    std::mt19937 m_rng;

    // Guards everything below; shared with the session thread
    mutable std::mutex m_stateMutex;
    int m_volume = 0;
    std::optional<CurrentlyPlaying> m_currentlyPlaying;
    std::shared_ptr<MediaHandle> m_currentPlayer;
    std::shared_ptr<CancellationToken> m_currentToken;
    std::optional<SessionOutcome> m_lastOutcome;
    SessionListener m_listener;
};

} // namespace Jukebox
