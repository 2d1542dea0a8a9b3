#include "daemon/subprocess_pool.hpp"

#include <QProcess>

#include <signal.h>
#include <sys/types.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace ccmonitor {

namespace {

constexpr int kKillGraceMs = 1000;

} // namespace

SubprocessPool::SubprocessPool(int maxConcurrent)
    : m_maxConcurrent(maxConcurrent > 0 ? maxConcurrent : 1)
{
}

SubprocessPool::~SubprocessPool()
{
    shutdown();
}

void SubprocessPool::acquireSlot()
{
    std::unique_lock<std::mutex> lock(m_mutex);
    m_slotFreed.wait(lock, [this] {
        return m_shutdown || m_running < m_maxConcurrent;
    });
    if (m_shutdown) {
        throw SubprocessError("subprocess pool is shut down");
    }
    ++m_running;
}

void SubprocessPool::releaseSlot(qint64 pid)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pids.erase(pid);
        --m_running;
    }
    m_slotFreed.notify_one();
}

ProcessResult SubprocessPool::run(const QString &program,
                                  const QStringList &arguments,
                                  std::chrono::milliseconds timeout)
{
    acquireSlot();

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted()) {
        releaseSlot(0);
        throw SubprocessError("failed to start " + program.toStdString() + ": "
                              + process.errorString().toStdString());
    }

    const qint64 pid = process.processId();
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            process.kill();
        } else {
            m_pids.insert(pid);
        }
    }

    process.closeWriteChannel();

    const bool finished = process.waitForFinished(static_cast<int>(timeout.count()));
    if (!finished) {
        process.kill();
        process.waitForFinished(kKillGraceMs);
        releaseSlot(pid);

        CMLOG_WARN(QStringLiteral("SubprocessPool"),
                   QStringLiteral("run"),
                   QStringLiteral("subprocess_timeout"),
                   QStringLiteral("bounded_wait"),
                   QStringLiteral("kill"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"program", program.toStdString()},
                                  {"timeoutMs", timeout.count()}});
        throw SubprocessError(program.toStdString() + " timed out after "
                              + std::to_string(timeout.count()) + " ms");
    }

    releaseSlot(pid);

    if (isShutdown()) {
        throw SubprocessError("subprocess pool shut down while running "
                              + program.toStdString());
    }

    if (process.exitStatus() != QProcess::NormalExit) {
        throw SubprocessError(program.toStdString() + " crashed");
    }

    ProcessResult result;
    result.exitCode = process.exitCode();
    result.standardOutput = process.readAllStandardOutput();
    result.standardError = process.readAllStandardError();
    return result;
}

void SubprocessPool::shutdown()
{
    std::set<qint64> pids;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutdown) {
            return;
        }
        m_shutdown = true;
        pids.swap(m_pids);
    }
    m_slotFreed.notify_all();

    // QProcess objects belong to the calling threads; signal the children directly.
    for (const qint64 pid : pids) {
        if (pid > 0) {
            ::kill(static_cast<pid_t>(pid), SIGKILL);
        }
    }

    if (!pids.empty()) {
        CMLOG_INFO(QStringLiteral("SubprocessPool"),
                   QStringLiteral("shutdown"),
                   QStringLiteral("subprocess_pool_killed_children"),
                   QStringLiteral("daemon_stop"),
                   QStringLiteral("sigkill"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"children", pids.size()}});
    }
}

void SubprocessPool::reopen()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_shutdown = false;
}

bool SubprocessPool::isShutdown() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_shutdown;
}

int SubprocessPool::activeCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_running;
}

} // namespace ccmonitor
