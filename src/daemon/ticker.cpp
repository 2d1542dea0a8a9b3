#include "daemon/ticker.hpp"

namespace ccmonitor {

Ticker::Ticker(std::chrono::milliseconds period)
    : m_period(period)
{
}

bool Ticker::waitForTick()
{
    return waitFor(m_period);
}

bool Ticker::waitFor(std::chrono::milliseconds duration)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_cancelled.wait_for(lock, duration, [this] { return m_isCancelled; });
    return !m_isCancelled;
}

void Ticker::cancel()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_isCancelled = true;
    }
    m_cancelled.notify_all();
}

bool Ticker::isCancelled() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_isCancelled;
}

std::chrono::milliseconds Ticker::period() const
{
    return m_period;
}

} // namespace ccmonitor
