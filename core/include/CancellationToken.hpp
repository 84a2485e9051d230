#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace Jukebox {

/**
 * Cooperative stop flag shared between a playback session and whoever
 * controls it. Every suspension point of a session waits on the token,
 * so a cancel wakes the session immediately instead of after the sleep.
 */
class CancellationToken {
public:
    void cancel();
    bool isCancelled() const;

    // Returns false if cancelled before or during the wait
    bool sleepFor(std::chrono::steady_clock::duration duration);

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_cancelled = false;
};

} // namespace Jukebox
