#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include <QObject>

#include "common/config.hpp"
#include "common/models.hpp"

class QThread;

namespace ccmonitor {

class Notifier;
class SessionActivityTracker;
class SnapshotWriter;
class SubprocessPool;
class Ticker;
class UsageCollector;
class UsageStore;

// Collaborators owned by the daemon. Declaration order is destruction order in
// reverse: the collector goes before the pool and store it refers to.
struct DaemonComponents {
    std::unique_ptr<UsageStore> store;
    std::shared_ptr<SubprocessPool> pool;
    std::unique_ptr<UsageCollector> collector;
    std::unique_ptr<SnapshotWriter> writer;
    std::unique_ptr<Notifier> notifier;
    std::unique_ptr<SessionActivityTracker> tracker;
};

/**
 * MonitorDaemon runs the periodic collection cycle on one worker thread:
 * - fetch a usage snapshot from the collector
 * - refresh activity sessions and persist the snapshot
 * - billing-window cleanup of activity sessions
 * - time-remaining, inactivity and error notifications
 *
 * start() and stop() are the only synchronized entry points. SIGINT and SIGTERM
 * are routed to stop() through the Qt event loop of the constructing thread,
 * and emit shutdownRequested() afterwards. Until that loop handles the signal
 * the daemon keeps running.
 */
class MonitorDaemon : public QObject
{
    Q_OBJECT
public:
    static constexpr auto kTickInterval = std::chrono::milliseconds(100);
    static constexpr auto kErrorBackoff = std::chrono::milliseconds(1000);
    static constexpr auto kStopTimeout = std::chrono::milliseconds(5000);

    MonitorDaemon(MonitorConfig config, DaemonComponents components,
                  QObject *parent = nullptr);
    ~MonitorDaemon() override;

    // No-op when already running.
    void start();
    // No-op when not running. Waits at most kStopTimeout for the worker.
    void stop();
    bool isRunning() const;
    // Workers from earlier stop() calls that missed the join timeout. Entries
    // are dropped by the next start() or stop() once they have returned.
    int unfinishedWorkers() const;

    // One collection cycle on the calling thread. The worker calls this once
    // per elapsed fetch interval.
    void runCollectionCycle();

    int completedCycles() const;
    const MonitorConfig &config() const;
    SessionActivityTracker &tracker();

signals:
    void shutdownRequested();

private slots:
    void handleTerminationSignal();

private:
    void runLoop(const std::shared_ptr<Ticker> &ticker);

    MonitoringSnapshot attachActivitySessions(MonitoringSnapshot snapshot);
    void persistSnapshot(const MonitoringSnapshot &snapshot);
    void cleanupActivitySessions();
    void checkNotificationConditions(const MonitoringSnapshot &snapshot);
    void sendErrorNotification(const ErrorStatus &status);
    void shutdownPool();

    struct Lifecycle {
        mutable std::mutex mutex;
        bool running = false;
        // Bumped by every start().
        std::uint64_t generation = 0;
        std::shared_ptr<Ticker> ticker;
        std::unique_ptr<QThread> worker;
        // Workers that outlived stop(). Finished entries are pruned on the
        // next start() or stop(); the destructor joins the rest.
        std::vector<std::unique_ptr<QThread>> unfinished;
    };

    MonitorConfig m_config;
    DaemonComponents m_components;
    Lifecycle m_lifecycle;
    // One collection cycle at a time across old and new workers.
    std::mutex m_cycleMutex;

    std::atomic<int> m_completedCycles{0};
    std::atomic<int> m_cycleSequence{0};
};

} // namespace ccmonitor
