#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <set>

#include <QByteArray>
#include <QString>
#include <QStringList>

namespace ccmonitor {

struct ProcessResult {
    int exitCode = -1;
    QByteArray standardOutput;
    QByteArray standardError;
};

/**
 * SubprocessPool runs external commands for the daemon with a bounded wait.
 *
 * At most maxConcurrent children run at once; further callers block until a
 * slot frees. shutdown() kills every child still running so that a caller
 * stuck on a hung command returns promptly, and rejects later runs.
 */
class SubprocessPool
{
public:
    explicit SubprocessPool(int maxConcurrent = 4);
    ~SubprocessPool();

    SubprocessPool(const SubprocessPool &) = delete;
    SubprocessPool &operator=(const SubprocessPool &) = delete;

    // Throws SubprocessError on start failure, timeout, crash or shutdown.
    ProcessResult run(const QString &program,
                      const QStringList &arguments,
                      std::chrono::milliseconds timeout);

    void shutdown();
    // Accept runs again after a shutdown (daemon restarted).
    void reopen();
    bool isShutdown() const;
    int activeCount() const;

private:
    void acquireSlot();
    void releaseSlot(qint64 pid);

    const int m_maxConcurrent;

    mutable std::mutex m_mutex;
    std::condition_variable m_slotFreed;
    int m_running = 0;
    bool m_shutdown = false;
    std::set<qint64> m_pids;
};

} // namespace ccmonitor
