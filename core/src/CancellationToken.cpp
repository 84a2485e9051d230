#include "CancellationToken.hpp"

namespace Jukebox {

void CancellationToken::cancel() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_cancelled = true;
    }
    m_cv.notify_all();
}

bool CancellationToken::isCancelled() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_cancelled;
}

bool CancellationToken::sleepFor(std::chrono::steady_clock::duration duration) {
    std::unique_lock<std::mutex> lock(m_mutex);
    if (m_cancelled) return false;
    m_cv.wait_for(lock, duration, [this]() { return m_cancelled; });
    return !m_cancelled;
}

} // namespace Jukebox
