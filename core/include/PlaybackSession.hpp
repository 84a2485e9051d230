#pragma once
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include "CancellationToken.hpp"
#include "MusicGroup.hpp"
#include "TrackList.hpp"

namespace Jukebox {

class MusicManager;

// How a session ended. Reported once, after teardown.
enum class SessionOutcome {
    Completed,
    Cancelled,
    Failed
};

const char* toString(SessionOutcome outcome);

/**
 * One run of a track list on its own thread.
 *
 * LOADING -> PLAYING(track) -> ADVANCING | STOPPING -> LOADING (loop) | TERMINATED
 *
 * The session owns the engine handle of the track it is playing and is
 * the only code that tears down the manager's session state, on every
 * exit path (completion, cancellation or failure).
 */
class PlaybackSession {
public:
    PlaybackSession(MusicManager& manager, const MusicGroup& group, const TrackList& trackList,
                    uint32_t seed);
    ~PlaybackSession();

    PlaybackSession(const PlaybackSession&) = delete;
    PlaybackSession& operator=(const PlaybackSession&) = delete;

    // Spawns the worker and returns once it is running
    void start();
    void requestStop();
    // Blocks until the worker has finished its teardown
    void join();

    const MusicGroup& group() const { return m_group; }
    const TrackList& trackList() const { return m_trackList; }
    std::shared_ptr<CancellationToken> token() const { return m_token; }

private:
    // Internal unwinding signal, never leaves run()
    struct Cancelled {};

    void run();
    void playTrack(const Track& track);
    void finish(SessionOutcome outcome, const std::string& message);
    void pause(std::chrono::steady_clock::duration duration);
    void throwIfCancelled() const;

    MusicManager& m_manager;
    const MusicGroup& m_group;
    const TrackList& m_trackList;
    std::shared_ptr<CancellationToken> m_token;
    std::mt19937 m_rng;

    std::thread m_worker;
    std::mutex m_startMutex;
    std::condition_variable m_startCV;
    bool m_started = false;
};

} // namespace Jukebox
