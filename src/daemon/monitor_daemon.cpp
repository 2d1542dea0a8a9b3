#include "daemon/monitor_daemon.hpp"

#include <cerrno>
#include <optional>

#include <QCoreApplication>
#include <QSocketNotifier>
#include <QThread>

#include <fcntl.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/alert_rules.hpp"
#include "daemon/notifier.hpp"
#include "daemon/session_activity_tracker.hpp"
#include "daemon/snapshot_writer.hpp"
#include "daemon/subprocess_pool.hpp"
#include "daemon/ticker.hpp"
#include "daemon/usage_collector.hpp"
#include "daemon/usage_store.hpp"

namespace ccmonitor {

namespace {

// The handler only writes to g_signalSockets[0]; the event loop reads [1].
int g_signalSockets[2] = {-1, -1};
std::once_flag g_signalHandlersOnce;
QSocketNotifier *g_signalNotifier = nullptr;

extern "C" void onTerminationSignal(int)
{
    if (g_signalSockets[0] >= 0) {
        const char byte = 1;
        // A full socket buffer already holds a pending wakeup.
        [[maybe_unused]] const ssize_t written = ::write(g_signalSockets[0], &byte, 1);
    }
}

bool installSignalHandlers()
{
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, g_signalSockets) != 0) {
        g_signalSockets[0] = -1;
        g_signalSockets[1] = -1;
        // Without a wakeup channel the default signal action stays in place.
        CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("installSignalHandlers"),
                   QStringLiteral("signal_socketpair_failed"),
                   QStringLiteral("daemon_init"),
                   QStringLiteral("socketpair"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"errno", errno}});
        return false;
    }
    for (const int fd : g_signalSockets) {
        const int flags = ::fcntl(fd, F_GETFL, 0);
        if (flags >= 0) {
            ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
        }
    }

    struct sigaction action {};
    action.sa_handler = onTerminationSignal;
    sigemptyset(&action.sa_mask);
    action.sa_flags = SA_RESTART;

    const bool installed = ::sigaction(SIGINT, &action, nullptr) == 0
        && ::sigaction(SIGTERM, &action, nullptr) == 0;

    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("installSignalHandlers"),
               installed ? QStringLiteral("signal_handlers_installed")
                         : QStringLiteral("signal_handlers_failed"),
               QStringLiteral("daemon_init"),
               QStringLiteral("sigaction"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json{{"signals", {"SIGINT", "SIGTERM"}}});
    return installed;
}

// One notifier per process; every daemon listens on it.
QSocketNotifier *signalNotifier()
{
    if (g_signalNotifier || g_signalSockets[1] < 0 || !QCoreApplication::instance()) {
        return g_signalNotifier;
    }

    g_signalNotifier = new QSocketNotifier(g_signalSockets[1], QSocketNotifier::Read,
                                           QCoreApplication::instance());
    QObject::connect(g_signalNotifier, &QSocketNotifier::activated,
                     g_signalNotifier, [] {
                         char buffer[16];
                         while (::read(g_signalSockets[1], buffer, sizeof(buffer)) > 0) {
                         }
                     });
    return g_signalNotifier;
}

} // namespace

MonitorDaemon::MonitorDaemon(MonitorConfig config, DaemonComponents components,
                             QObject *parent)
    : QObject(parent)
    , m_config(std::move(config))
    , m_components(std::move(components))
{
    std::call_once(g_signalHandlersOnce, [] { installSignalHandlers(); });
    if (QSocketNotifier *notifier = signalNotifier()) {
        connect(notifier, &QSocketNotifier::activated,
                this, &MonitorDaemon::handleTerminationSignal);
    }

    if (m_components.store) {
        std::string integrityMessage;
        if (!m_components.store->integrityCheck(&integrityMessage)) {
            CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                       QStringLiteral("MonitorDaemon"),
                       QStringLiteral("store_integrity_failed"),
                       QStringLiteral("daemon_init"),
                       QStringLiteral("pragma_integrity_check"),
                       ccmonitor::logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"message", integrityMessage}});
        }
    }

    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("MonitorDaemon"),
               QStringLiteral("daemon_initialized"),
               QStringLiteral("daemon_init"),
               QStringLiteral("config"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json{{"fetchIntervalMs", m_config.fetchInterval.count()},
                              {"timeRemainingAlertMinutes", m_config.timeRemainingAlertMinutes},
                              {"inactivityAlertMinutes", m_config.inactivityAlertMinutes},
                              {"hookLogDir", m_config.hookLogDir}});
}

MonitorDaemon::~MonitorDaemon()
{
    stop();

    std::lock_guard<std::mutex> lock(m_lifecycle.mutex);
    for (auto &worker : m_lifecycle.unfinished) {
        if (worker->wait(static_cast<unsigned long>(kStopTimeout.count()))) {
            continue;
        }
        // The worker refers to this daemon; it must return before teardown.
        CMLOG_ERROR(QStringLiteral("MonitorDaemon"),
                    QStringLiteral("~MonitorDaemon"),
                    QStringLiteral("worker_still_running"),
                    QStringLiteral("daemon_destroyed"),
                    QStringLiteral("unbounded_join"),
                    ccmonitor::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"waitedMs", kStopTimeout.count()}});
        worker->wait();
    }
}

void MonitorDaemon::start()
{
    std::lock_guard<std::mutex> lock(m_lifecycle.mutex);
    if (m_lifecycle.running) {
        CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("start"),
                   QStringLiteral("daemon_already_running"),
                   QStringLiteral("start_requested"),
                   QStringLiteral("noop"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
        return;
    }

    std::erase_if(m_lifecycle.unfinished,
                  [](const std::unique_ptr<QThread> &worker) { return worker->isFinished(); });

    if (m_components.pool) {
        m_components.pool->reopen();
    }

    ++m_lifecycle.generation;
    auto ticker = std::make_shared<Ticker>(kTickInterval);
    m_lifecycle.ticker = ticker;
    m_lifecycle.worker.reset(QThread::create([this, ticker] { runLoop(ticker); }));
    m_lifecycle.worker->setObjectName(QStringLiteral("ccmonitor-worker"));
    m_lifecycle.worker->start();
    m_lifecycle.running = true;

    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("start"),
               QStringLiteral("daemon_started"),
               QStringLiteral("start_requested"),
               QStringLiteral("worker_thread"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
}

void MonitorDaemon::stop()
{
    std::unique_ptr<QThread> worker;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(m_lifecycle.mutex);
        if (!m_lifecycle.running) {
            return;
        }
        m_lifecycle.running = false;
        if (m_lifecycle.ticker) {
            m_lifecycle.ticker->cancel();
        }
        worker = std::move(m_lifecycle.worker);
        generation = m_lifecycle.generation;
        std::erase_if(m_lifecycle.unfinished,
                      [](const std::unique_ptr<QThread> &stale) { return stale->isFinished(); });
    }

    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("stop"),
               QStringLiteral("daemon_stopping"),
               QStringLiteral("stop_requested"),
               QStringLiteral("cancel_ticker"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json::object());

    if (worker && !worker->wait(static_cast<unsigned long>(kStopTimeout.count()))) {
        CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("stop"),
                   QStringLiteral("worker_stop_timeout"),
                   QStringLiteral("stop_requested"),
                   QStringLiteral("bounded_join"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"timeoutMs", kStopTimeout.count()}});
        std::lock_guard<std::mutex> lock(m_lifecycle.mutex);
        m_lifecycle.unfinished.push_back(std::move(worker));
    } else {
        CMLOG_INFO(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("stop"),
                   QStringLiteral("daemon_stopped"),
                   QStringLiteral("stop_requested"),
                   QStringLiteral("bounded_join"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }

    // A start() during the join owns the pool now.
    std::lock_guard<std::mutex> lock(m_lifecycle.mutex);
    if (m_lifecycle.running || m_lifecycle.generation != generation) {
        CMLOG_INFO(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("stop"),
                   QStringLiteral("subprocess_pool_kept"),
                   QStringLiteral("restarted_during_stop"),
                   QStringLiteral("generation_check"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"stoppedGeneration", generation},
                                  {"currentGeneration", m_lifecycle.generation}});
        return;
    }
    shutdownPool();
}

void MonitorDaemon::shutdownPool()
{
    if (!m_components.pool) {
        return;
    }
    try {
        m_components.pool->shutdown();
    } catch (const std::exception &ex) {
        CMLOG_ERROR(QStringLiteral("MonitorDaemon"),
                    QStringLiteral("stop"),
                    QStringLiteral("subprocess_pool_shutdown_failed"),
                    QStringLiteral("stop_requested"),
                    QStringLiteral("pool_shutdown"),
                    ccmonitor::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
    }
}

bool MonitorDaemon::isRunning() const
{
    std::lock_guard<std::mutex> lock(m_lifecycle.mutex);
    return m_lifecycle.running;
}

int MonitorDaemon::unfinishedWorkers() const
{
    std::lock_guard<std::mutex> lock(m_lifecycle.mutex);
    return static_cast<int>(m_lifecycle.unfinished.size());
}

int MonitorDaemon::completedCycles() const
{
    return m_completedCycles.load();
}

const MonitorConfig &MonitorDaemon::config() const
{
    return m_config;
}

SessionActivityTracker &MonitorDaemon::tracker()
{
    return *m_components.tracker;
}

void MonitorDaemon::handleTerminationSignal()
{
    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("handleTerminationSignal"),
               QStringLiteral("termination_signal"),
               QStringLiteral("os_signal"),
               QStringLiteral("graceful_stop"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    stop();
    emit shutdownRequested();
}

void MonitorDaemon::runLoop(const std::shared_ptr<Ticker> &ticker)
{
    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("runLoop"),
               QStringLiteral("worker_loop_started"),
               QStringLiteral("daemon_start"),
               QStringLiteral("tick_poll"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json{{"tickMs", ticker->period().count()}});

    std::optional<std::chrono::steady_clock::time_point> lastCycleStart;

    while (!ticker->isCancelled()) {
        try {
            const auto now = std::chrono::steady_clock::now();
            if (!lastCycleStart.has_value()
                || now - *lastCycleStart >= m_config.fetchInterval) {
                runCollectionCycle();
                lastCycleStart = now;
            }
            ticker->waitForTick();
        } catch (const std::exception &ex) {
            CMLOG_ERROR(QStringLiteral("MonitorDaemon"),
                        QStringLiteral("runLoop"),
                        QStringLiteral("collection_cycle_crashed"),
                        QStringLiteral("uncaught_exception"),
                        QStringLiteral("backoff_and_continue"),
                        ccmonitor::logging::defaultWho(),
                        QString(),
                        nlohmann::json{{"error", ex.what()},
                                       {"backoffMs", kErrorBackoff.count()}});
            ticker->waitFor(kErrorBackoff);
        }
    }

    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("runLoop"),
               QStringLiteral("worker_loop_stopped"),
               QStringLiteral("cancelled"),
               QStringLiteral("tick_poll"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
}

void MonitorDaemon::runCollectionCycle()
{
    // A worker left over from an earlier stop() may still be finishing its cycle.
    std::lock_guard<std::mutex> cycleLock(m_cycleMutex);
    const int cycle = ++m_cycleSequence;
    logging::CorrelationScope correlation(QStringLiteral("cycle-%1").arg(cycle));

    MonitoringSnapshot collected;
    try {
        collected = m_components.collector->collect();
    } catch (const CollectionError &ex) {
        const ErrorStatus status = m_components.collector->errorStatus();
        if (AlertRules::shouldSendErrorNotification(status.consecutiveFailures)) {
            CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                       QStringLiteral("runCollectionCycle"),
                       QStringLiteral("collection_failing_repeatedly"),
                       QStringLiteral("collection_error"),
                       QStringLiteral("notify"),
                       ccmonitor::logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"consecutiveFailures", status.consecutiveFailures},
                                      {"error", ex.what()}});
            sendErrorNotification(status);
        } else {
            CMLOG_ERROR(QStringLiteral("MonitorDaemon"),
                        QStringLiteral("runCollectionCycle"),
                        QStringLiteral("collection_failed"),
                        QStringLiteral("collection_error"),
                        QStringLiteral("retry_next_tick"),
                        ccmonitor::logging::defaultWho(),
                        QString(),
                        nlohmann::json{{"consecutiveFailures", status.consecutiveFailures},
                                       {"error", ex.what()}});
        }
        return;
    }

    const MonitoringSnapshot snapshot = attachActivitySessions(std::move(collected));

    CMLOG_INFO(QStringLiteral("MonitorDaemon"),
               QStringLiteral("runCollectionCycle"),
               QStringLiteral("usage_collected"),
               QStringLiteral("collection_interval"),
               QStringLiteral("collector"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json{{"sessions", snapshot.currentSessions.size()},
                              {"activitySessions", snapshot.activitySessions.size()},
                              {"totalCostThisMonth", snapshot.totalCostThisMonth}});

    persistSnapshot(snapshot);
    cleanupActivitySessions();
    checkNotificationConditions(snapshot);

    ++m_completedCycles;
}

MonitoringSnapshot MonitorDaemon::attachActivitySessions(MonitoringSnapshot snapshot)
{
    if (!m_components.tracker) {
        return snapshot;
    }

    if (!m_components.tracker->updateFromLogFiles()) {
        CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("attachActivitySessions"),
                   QStringLiteral("activity_refresh_failed"),
                   QStringLiteral("collection_cycle"),
                   QStringLiteral("keep_previous_sessions"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
    snapshot.activitySessions = m_components.tracker->activeSessions();
    return snapshot;
}

void MonitorDaemon::persistSnapshot(const MonitoringSnapshot &snapshot)
{
    if (!m_components.writer) {
        return;
    }

    bool saved = false;
    try {
        saved = m_components.writer->write(nlohmann::json(snapshot));
    } catch (const std::exception &ex) {
        CMLOG_ERROR(QStringLiteral("MonitorDaemon"),
                    QStringLiteral("persistSnapshot"),
                    QStringLiteral("snapshot_write_error"),
                    QStringLiteral("collection_cycle"),
                    QStringLiteral("writer"),
                    ccmonitor::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
        return;
    }

    if (saved) {
        CMLOG_DEBUG(QStringLiteral("MonitorDaemon"),
                    QStringLiteral("persistSnapshot"),
                    QStringLiteral("snapshot_saved"),
                    QStringLiteral("collection_cycle"),
                    QStringLiteral("writer"),
                    ccmonitor::logging::defaultWho(),
                    QString(),
                    nlohmann::json::object());
    } else {
        CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                   QStringLiteral("persistSnapshot"),
                   QStringLiteral("snapshot_not_saved"),
                   QStringLiteral("collection_cycle"),
                   QStringLiteral("writer"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json::object());
    }
}

void MonitorDaemon::cleanupActivitySessions()
{
    if (!m_components.tracker) {
        return;
    }

    try {
        m_components.tracker->cleanupCompletedBillingSessions();
    } catch (const std::exception &ex) {
        CMLOG_ERROR(QStringLiteral("MonitorDaemon"),
                    QStringLiteral("cleanupActivitySessions"),
                    QStringLiteral("activity_cleanup_failed"),
                    QStringLiteral("collection_cycle"),
                    QStringLiteral("billing_window"),
                    ccmonitor::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
    }
}

void MonitorDaemon::checkNotificationConditions(const MonitoringSnapshot &snapshot)
{
    try {
        const auto now = std::chrono::system_clock::now();

        for (const auto &session : snapshot.currentSessions) {
            if (!session.isActive || !session.endTime.has_value()) {
                continue;
            }

            if (m_components.collector->updateMaxTokensIfHigher(session.totalTokens)) {
                CMLOG_INFO(QStringLiteral("MonitorDaemon"),
                           QStringLiteral("checkNotificationConditions"),
                           QStringLiteral("new_max_tokens"),
                           QStringLiteral("active_session_usage"),
                           QStringLiteral("collector_max"),
                           ccmonitor::logging::defaultWho(),
                           QString(),
                           nlohmann::json{{"sessionId", session.sessionId},
                                          {"totalTokens", session.totalTokens}});
            }

            if (!m_components.notifier) {
                continue;
            }

            const int minutesRemaining = AlertRules::minutesUntil(*session.endTime, now);
            if (AlertRules::shouldSendTimeWarning(minutesRemaining,
                                                  m_config.timeRemainingAlertMinutes)
                && !m_components.notifier->sendTimeWarning(minutesRemaining)) {
                CMLOG_DEBUG(QStringLiteral("MonitorDaemon"),
                            QStringLiteral("checkNotificationConditions"),
                            QStringLiteral("time_warning_not_delivered"),
                            QStringLiteral("time_remaining"),
                            QStringLiteral("notifier"),
                            ccmonitor::logging::defaultWho(),
                            QString(),
                            nlohmann::json{{"minutesRemaining", minutesRemaining}});
            }

            const int minutesSinceStart = AlertRules::minutesSince(session.startTime, now);
            if (AlertRules::shouldSendInactivityAlert(minutesSinceStart,
                                                      m_config.inactivityAlertMinutes)
                && !m_components.notifier->sendInactivityAlert(
                    AlertRules::inactivityMinutes(minutesSinceStart))) {
                CMLOG_DEBUG(QStringLiteral("MonitorDaemon"),
                            QStringLiteral("checkNotificationConditions"),
                            QStringLiteral("inactivity_alert_not_delivered"),
                            QStringLiteral("long_running_session"),
                            QStringLiteral("notifier"),
                            ccmonitor::logging::defaultWho(),
                            QString(),
                            nlohmann::json{{"minutesSinceStart", minutesSinceStart}});
            }
        }
    } catch (const std::exception &ex) {
        CMLOG_ERROR(QStringLiteral("MonitorDaemon"),
                    QStringLiteral("checkNotificationConditions"),
                    QStringLiteral("notification_check_failed"),
                    QStringLiteral("collection_cycle"),
                    QStringLiteral("notifier"),
                    ccmonitor::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
    }
}

void MonitorDaemon::sendErrorNotification(const ErrorStatus &status)
{
    if (!m_components.notifier) {
        return;
    }

    const std::string message = std::to_string(status.consecutiveFailures)
        + " consecutive failures: " + status.errorMessage;
    try {
        if (!m_components.notifier->sendErrorNotification(message)) {
            CMLOG_WARN(QStringLiteral("MonitorDaemon"),
                       QStringLiteral("sendErrorNotification"),
                       QStringLiteral("error_notification_not_delivered"),
                       QStringLiteral("collection_error"),
                       QStringLiteral("notifier"),
                       ccmonitor::logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"message", message}});
        }
    } catch (const std::exception &ex) {
        CMLOG_ERROR(QStringLiteral("MonitorDaemon"),
                    QStringLiteral("sendErrorNotification"),
                    QStringLiteral("error_notification_failed"),
                    QStringLiteral("collection_error"),
                    QStringLiteral("notifier"),
                    ccmonitor::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"error", ex.what()}});
    }
}

} // namespace ccmonitor
