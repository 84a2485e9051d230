#include "PlaybackSession.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "MusicManager.hpp"
#include "Shuffle.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace Jukebox {

const char* toString(SessionOutcome outcome) {
    switch (outcome) {
        case SessionOutcome::Completed: return "completed";
        case SessionOutcome::Cancelled: return "cancelled";
        case SessionOutcome::Failed: return "failed";
    }
    return "unknown";
}

PlaybackSession::PlaybackSession(MusicManager& manager, const MusicGroup& group, const TrackList& trackList,
                                 uint32_t seed)
    : m_manager(manager), m_group(group), m_trackList(trackList),
      m_token(std::make_shared<CancellationToken>()), m_rng(seed) {
}

PlaybackSession::~PlaybackSession() {
    requestStop();
    join();
}

void PlaybackSession::start() {
    m_worker = std::thread(&PlaybackSession::run, this);

    std::unique_lock<std::mutex> lock(m_startMutex);
    m_startCV.wait(lock, [this]() { return m_started; });
}

void PlaybackSession::requestStop() {
    m_token->cancel();
}

void PlaybackSession::join() {
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

void PlaybackSession::run() {
    {
        std::lock_guard<std::mutex> lock(m_startMutex);
        m_started = true;
    }
    m_startCV.notify_all();

    // Teardown runs exactly once, whatever ends the session
    struct Teardown {
        PlaybackSession& session;
        SessionOutcome outcome = SessionOutcome::Failed;
        std::string message = "Session terminated unexpectedly";
        ~Teardown() { session.finish(outcome, message); }
    } teardown{*this};

    const std::string& name = m_trackList.name();
    try {
        Log::info("[PlaybackSession] Loading '" + name + "'");
        if (m_trackList.tracks().empty()) {
            Log::warn("[PlaybackSession] '" + name + "' has no tracks");
        } else {
            do {
                throwIfCancelled();
                const std::vector<Track> order = m_trackList.shuffle()
                    ? shuffled(m_trackList.tracks(), m_rng)
                    : m_trackList.tracks();
                for (const Track& track : order) {
                    playTrack(track);
                }
            } while (m_trackList.loop());
        }
        teardown.outcome = SessionOutcome::Completed;
        teardown.message = "Finished '" + name + "'";
    } catch (const Cancelled&) {
        teardown.outcome = SessionOutcome::Cancelled;
        teardown.message = "Cancelled '" + name + "'";
    } catch (const SessionError& e) {
        teardown.message = e.what();
    } catch (const std::exception& e) {
        teardown.message = "Playback of '" + name + "' stopped: " + e.what();
    }
}

void PlaybackSession::playTrack(const Track& track) {
    const std::string root = m_manager.resolveDirectory(m_group, m_trackList);
    const fs::path path = fs::path(root) / track.file();
    if (!fs::is_regular_file(path)) {
        throw FileNotFoundError("File " + path.string() + " does not exist");
    }
    throwIfCancelled();

    const PlaybackTiming& timing = m_manager.timing();
    std::shared_ptr<MediaHandle> player = m_manager.openPlayer(path.string());
    player->setVolume(0);  // no pop when the device starts
    if (!player->play()) {
        throw EngineStartError("Failed to play " + path.string());
    }
    if (track.startAt()) {
        player->setTime(*track.startAt());
    }
    Log::info("[PlaybackSession] Now Playing: " + track.file());

    pause(timing.settleDelay);
    if (!m_manager.fadeIn(player, m_token)) {
        Log::debug("[PlaybackSession] Received cancellation request for " + track.file());
        throw Cancelled();
    }

    while (player->isPlaying()) {
        if (track.endAt() && player->getTime() >= *track.endAt()) {
            player->stop();
        }
        if (!m_token->sleepFor(timing.pollInterval)) {
            Log::debug("[PlaybackSession] Received cancellation request for " + track.file());
            throw Cancelled();
        }
    }
    Log::info("[PlaybackSession] Finished playing: " + track.file());

    // Close this handle before the next track opens its own
    m_manager.releasePlayer();
}

void PlaybackSession::finish(SessionOutcome outcome, const std::string& message) {
    m_manager.finishSession(*this, outcome, message);
}

void PlaybackSession::pause(std::chrono::steady_clock::duration duration) {
    if (!m_token->sleepFor(duration)) {
        throw Cancelled();
    }
}

void PlaybackSession::throwIfCancelled() const {
    if (m_token->isCancelled()) {
        throw Cancelled();
    }
}

} // namespace Jukebox
