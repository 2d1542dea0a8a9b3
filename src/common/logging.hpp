#pragma once

#include <optional>

#include <QString>

#include <nlohmann/json.hpp>

namespace ccmonitor::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    QString processName;
    // Enables DEBUG lines and the <process>-trace.log mirror.
    bool traceEnabled = false;
    // Lines below this level are dropped (trace mode lowers it to Debug).
    LogLevel minimumLevel = LogLevel::Info;
    // Also print WARN and ERROR lines to stderr, for foreground runs.
    bool mirrorToStderr = false;
};

// Initialize logging for the current process. Call early in main().
void initLogging(const LogOptions &options);
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();
LogLevel minimumLevel();

// "debug", "info", "warn"/"warning", "error"; case-insensitive.
std::optional<LogLevel> parseLogLevel(const QString &value);
QString logLevelName(LogLevel level);

// $HOME/.local/share/ccmonitor/logs, or $CCMONITOR_LOG_DIR when set.
QString logsDirPath();

// Thread-local correlation support for linking the log lines of one cycle.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace ccmonitor::logging

#define CMLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::ccmonitor::logging::logEvent(::ccmonitor::logging::LogLevel::Debug, \
                                   ::ccmonitor::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CMLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::ccmonitor::logging::logEvent(::ccmonitor::logging::LogLevel::Info, \
                                   ::ccmonitor::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CMLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::ccmonitor::logging::logEvent(::ccmonitor::logging::LogLevel::Warn, \
                                   ::ccmonitor::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CMLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::ccmonitor::logging::logEvent(::ccmonitor::logging::LogLevel::Error, \
                                   ::ccmonitor::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
