#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>

#include <unistd.h>

#include <nlohmann/json.hpp>

#include "common/ccmonitor_version.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "daemon/monitor_daemon.hpp"
#include "daemon/notifier.hpp"
#include "daemon/session_activity_tracker.hpp"
#include "daemon/snapshot_writer.hpp"
#include "daemon/subprocess_pool.hpp"
#include "daemon/usage_collector.hpp"
#include "daemon/usage_store.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    QCoreApplication::setApplicationName(QStringLiteral("ccmonitor-daemon"));
    QCoreApplication::setApplicationVersion(QStringLiteral(CCMONITOR_VERSION));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Background collector for Claude usage and session activity."));
    parser.addHelpOption();
    parser.addVersionOption();
    const QCommandLineOption configOption(
        QStringLiteral("config"),
        QStringLiteral("Path to the JSON configuration file."),
        QStringLiteral("path"));
    const QCommandLineOption intervalOption(
        QStringLiteral("interval"),
        QStringLiteral("Override the collection interval in seconds."),
        QStringLiteral("seconds"));
    const QCommandLineOption traceOption(
        QStringLiteral("trace"),
        QStringLiteral("Write verbose trace logs."));
    const QCommandLineOption logLevelOption(
        QStringLiteral("log-level"),
        QStringLiteral("Minimum log level: debug, info, warn or error."),
        QStringLiteral("level"),
        QStringLiteral("info"));
    parser.addOption(configOption);
    parser.addOption(intervalOption);
    parser.addOption(traceOption);
    parser.addOption(logLevelOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("CCMONITOR_TRACE") == 1;

    QString levelName = parser.value(logLevelOption);
    if (!parser.isSet(logLevelOption) && qEnvironmentVariableIsSet("CCMONITOR_LOG_LEVEL")) {
        levelName = qEnvironmentVariable("CCMONITOR_LOG_LEVEL");
    }
    const auto level = ccmonitor::logging::parseLogLevel(levelName);
    if (!level.has_value()) {
        qCritical() << "Invalid log level:" << levelName;
        return 2;
    }

    ccmonitor::logging::LogOptions logOptions;
    logOptions.processName = QStringLiteral("ccmonitor-daemon");
    logOptions.traceEnabled = trace;
    logOptions.minimumLevel = *level;
    logOptions.mirrorToStderr = ::isatty(STDERR_FILENO) == 1;
    ccmonitor::logging::initLogging(logOptions);
    qInfo() << "ccmonitor daemon starting...";

    const std::string configPath = parser.isSet(configOption)
        ? parser.value(configOption).toStdString()
        : ccmonitor::defaultConfigPath();
    ccmonitor::MonitorConfig config = ccmonitor::loadConfig(configPath);

    if (parser.isSet(intervalOption)) {
        bool ok = false;
        const double seconds = parser.value(intervalOption).toDouble(&ok);
        const auto interval = ok ? ccmonitor::fetchIntervalFromSeconds(seconds)
                                 : std::nullopt;
        if (!interval.has_value()) {
            qCritical() << "Invalid --interval value:" << parser.value(intervalOption);
            return 2;
        }
        config.fetchInterval = *interval;
    }

    CMLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("daemon_start"),
               QStringLiteral("user_start"),
               QStringLiteral("config_file"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json{{"config", configPath},
                              {"version", CCMONITOR_VERSION},
                              {"trace", trace}});

    ccmonitor::DaemonComponents components;
    try {
        components.store = std::make_unique<ccmonitor::UsageStore>();
    } catch (const std::exception &ex) {
        // The meta store only carries the max-token record; run without it.
        CMLOG_WARN(QStringLiteral("main"),
                   QStringLiteral("main"),
                   QStringLiteral("store_open_failed"),
                   QStringLiteral("user_start"),
                   QStringLiteral("sqlite_open"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()},
                                  {"path", ccmonitor::UsageStore::databasePath()}});
    }

    components.pool = std::make_shared<ccmonitor::SubprocessPool>();
    components.collector = std::make_unique<ccmonitor::CcusageCollector>(
        config, *components.pool, components.store.get());
    components.writer = std::make_unique<ccmonitor::DataFileWriter>(config.dataFilePath);
    components.notifier =
        std::make_unique<ccmonitor::DesktopNotifier>(config.notificationCooldown);
    components.tracker =
        std::make_unique<ccmonitor::SessionActivityTracker>(config.hookLogDir);

    // The daemon lives for the lifetime of the process.
    ccmonitor::MonitorDaemon daemon(config, std::move(components));
    QObject::connect(&daemon, &ccmonitor::MonitorDaemon::shutdownRequested,
                     &app, &QCoreApplication::quit);
    daemon.start();

    const int status = app.exec();
    daemon.stop();
    qInfo() << "ccmonitor daemon stopped";
    return status;
}
