#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace ccmonitor {

// Periodic wait that can be cancelled from any thread. Once cancelled it stays
// cancelled; waiters return immediately.
class Ticker
{
public:
    explicit Ticker(std::chrono::milliseconds period);

    // Sleep one period. Returns false when cancelled.
    bool waitForTick();
    bool waitFor(std::chrono::milliseconds duration);

    void cancel();
    bool isCancelled() const;

    std::chrono::milliseconds period() const;

private:
    const std::chrono::milliseconds m_period;

    mutable std::mutex m_mutex;
    std::condition_variable m_cancelled;
    bool m_isCancelled = false;
};

} // namespace ccmonitor
