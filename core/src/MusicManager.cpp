#include "MusicManager.hpp"
#include "ConfigFields.hpp"
#include "Errors.hpp"
#include "Log.hpp"

#include <algorithm>
#include <cmath>
#include <system_error>
#include <thread>

namespace Jukebox {

namespace {

int clampVolume(int volume) {
    return std::max(0, std::min(100, volume));
}

int readVolume(const nlohmann::json& config) {
    const auto& value = ConfigFields::require(config, "volume", "MusicManager");
    if (!value.is_number_integer()) {
        throw ConfigError("MusicManager field 'volume' must be an integer");
    }
    const int64_t volume = value.get<int64_t>();
    if (volume < 0 || volume > 100) {
        throw ConfigError("MusicManager volume " + std::to_string(volume) + " is outside 0-100");
    }
    return static_cast<int>(volume);
}

} // namespace

MusicManager::MusicManager(const nlohmann::json& config, std::shared_ptr<MediaEngine> engine,
                           PlaybackTiming timing, std::optional<uint32_t> seed)
    : m_engine(std::move(engine)), m_timing(timing) {
    if (!m_engine) {
        throw ConfigError("MusicManager requires a media engine");
    }
    ConfigFields::requireObject(config, "MusicManager");

    m_volume = readVolume(config);
    m_directory = ConfigFields::optionalString(config, "directory", "MusicManager");

    const auto& groups = ConfigFields::requireArray(config, "groups", "MusicManager");
    m_groups.reserve(groups.size());
    for (const auto& groupConfig : groups) {
        m_groups.emplace_back(groupConfig);
    }

    if (ConfigFields::optionalBool(config, "sort", true, "MusicManager")) {
        std::stable_sort(m_groups.begin(), m_groups.end(),
                         [](const MusicGroup& a, const MusicGroup& b) { return a.name() < b.name(); });
    }

    if (seed) {
        m_rng.seed(*seed);
    } else {
        std::random_device rd;
        m_rng.seed(rd());
    }
}

MusicManager::~MusicManager() {
    cancel();
}

void MusicManager::requestPlay(size_t groupIndex, size_t trackListIndex) {
    if (groupIndex >= m_groups.size()) {
        throw IndexError("Group index " + std::to_string(groupIndex) + " out of range ("
                         + std::to_string(m_groups.size()) + " groups)");
    }
    const MusicGroup& group = m_groups[groupIndex];
    if (trackListIndex >= group.trackLists().size()) {
        throw IndexError("Track list index " + std::to_string(trackListIndex) + " out of range for group '"
                         + group.name() + "' (" + std::to_string(group.trackLists().size()) + " track lists)");
    }
    const TrackList& trackList = group.trackLists()[trackListIndex];

    Log::debug("[MusicManager] Received request to play music from group " + std::to_string(groupIndex)
               + " at index " + std::to_string(trackListIndex) + " (" + trackList.name() + ")");

    std::lock_guard<std::mutex> control(m_controlMutex);
    stopSession();

    auto session = std::make_unique<PlaybackSession>(*this, group, trackList, static_cast<uint32_t>(m_rng()));
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_currentlyPlaying = CurrentlyPlaying{&group, &trackList, session.get()};
        m_currentToken = session->token();
    }
    try {
        session->start();
    } catch (const std::system_error& e) {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_currentlyPlaying.reset();
        m_currentToken.reset();
        throw;
    }
    m_session = std::move(session);

    Log::debug("[MusicManager] Created a task to play '" + trackList.name() + "'");
}

void MusicManager::cancel() {
    std::lock_guard<std::mutex> control(m_controlMutex);
    stopSession();
}

void MusicManager::stopSession() {
    if (!m_session) return;

    if (isPlaying()) {
        Log::debug("[MusicManager] Cancelling '" + m_session->trackList().name() + "'");
    }
    m_session->requestStop();
    m_session->join();
    m_session.reset();
}

void MusicManager::setVolume(int volume, bool setGlobal, bool smooth, int steps, double seconds) {
    volume = clampVolume(volume);

    std::shared_ptr<MediaHandle> player;
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        if (setGlobal) {
            m_volume = volume;
        }
        player = m_currentPlayer;
        token = m_currentToken;
    }
    if (setGlobal) {
        Log::debug("[MusicManager] Changed music volume to " + std::to_string(volume));
    }

    if (!player) return;

    if (!smooth || steps <= 0) {
        player->setVolume(volume);
        return;
    }
    fadePlayer(player, token, volume, steps, seconds);
}

bool MusicManager::fadePlayer(const std::shared_ptr<MediaHandle>& player,
                              const std::shared_ptr<CancellationToken>& token,
                              int target, int steps, double seconds) {
    if (steps <= 0) {
        player->setVolume(target);
        return !(token && token->isCancelled());
    }

    const int startVolume = player->getVolume();
    const double stepSize = static_cast<double>(startVolume - target) / steps;
    const auto delay = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(seconds / steps));

    for (int i = 0; i < steps; ++i) {
        if (token && token->isCancelled()) return false;

        const double next = startVolume - (i + 1) * stepSize;
        player->setVolume(clampVolume(static_cast<int>(std::lround(next))));

        if (token) {
            if (!token->sleepFor(delay)) return false;
        } else {
            std::this_thread::sleep_for(delay);
        }
    }
    return true;
}

bool MusicManager::fadeIn(const std::shared_ptr<MediaHandle>& player,
                          const std::shared_ptr<CancellationToken>& token) {
    const int steps = m_timing.fadeSteps;
    if (steps <= 0) {
        player->setVolume(volume());
        return !token->isCancelled();
    }

    const auto delay = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(m_timing.fadeSeconds / steps));
    for (int i = 0; i < steps; ++i) {
        if (token->isCancelled()) return false;

        const double next = static_cast<double>(volume()) * (i + 1) / steps;
        player->setVolume(clampVolume(static_cast<int>(std::lround(next))));

        if (!token->sleepFor(delay)) return false;
    }
    return true;
}

std::string MusicManager::resolveDirectory(const MusicGroup& group, const TrackList& trackList) const {
    if (trackList.directory()) return *trackList.directory();
    if (group.directory()) return *group.directory();
    if (m_directory) return *m_directory;
    throw DirectoryError("Failed to play '" + trackList.name() + "'. You have to specify the directory on either "
                         "the global level, group level or track list level.");
}

int MusicManager::volume() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_volume;
}

std::optional<CurrentlyPlaying> MusicManager::currentlyPlaying() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_currentlyPlaying;
}

bool MusicManager::isPlaying() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_currentlyPlaying.has_value();
}

std::optional<SessionOutcome> MusicManager::lastOutcome() const {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    return m_lastOutcome;
}

void MusicManager::setSessionListener(SessionListener listener) {
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_listener = std::move(listener);
}

std::shared_ptr<MediaHandle> MusicManager::openPlayer(const std::string& path) {
    std::shared_ptr<MediaHandle> player = m_engine->createPlayer(path);
    if (!player) {
        throw EngineStartError("Failed to play " + path);
    }
    std::lock_guard<std::mutex> lock(m_stateMutex);
    m_currentPlayer = player;
    return player;
}

void MusicManager::releasePlayer() {
    std::shared_ptr<MediaHandle> player;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        player.swap(m_currentPlayer);
    }
    // Dropped outside the lock; the handle may close the device here
}

void MusicManager::finishSession(const PlaybackSession& session, SessionOutcome outcome,
                                 const std::string& message) {
    std::shared_ptr<MediaHandle> player;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        player.swap(m_currentPlayer);
    }
    if (player) {
        try {
            player->setVolume(0);
            player->stop();
        } catch (const std::exception& e) {
            Log::error(std::string("[MusicManager] Failed to stop player: ") + e.what());
        }
        // Close the handle before the session is reported as gone
        player.reset();
    }

    switch (outcome) {
        case SessionOutcome::Failed:
            Log::error("[PlaybackSession] " + message);
            break;
        case SessionOutcome::Cancelled:
        case SessionOutcome::Completed:
            Log::info("[PlaybackSession] " + message);
            break;
    }

    SessionListener listener;
    {
        std::lock_guard<std::mutex> lock(m_stateMutex);
        m_currentToken.reset();
        if (m_currentlyPlaying && m_currentlyPlaying->session == &session) {
            m_currentlyPlaying.reset();
        }
        m_lastOutcome = outcome;
        listener = m_listener;
    }

    if (listener) {
        try {
            listener(session.trackList().name(), outcome, message);
        } catch (const std::exception& e) {
            Log::error(std::string("[MusicManager] Session listener threw: ") + e.what());
        }
    }
}

} // namespace Jukebox
