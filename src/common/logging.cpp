#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace ccmonitor::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;
constexpr int kRotatedGenerations = 3;

struct SinkState {
    std::mutex mutex;
    LogOptions options;
};

SinkState &sink()
{
    static SinkState state;
    return state;
}

thread_local QString t_corrId;

int severity(LogLevel level)
{
    return static_cast<int>(level);
}

QString logFilePath(const QString &processName, const QString &suffix)
{
    const QString base = processName.isEmpty()
        ? QStringLiteral("ccmonitor")
        : processName;
    return logsDirPath() + QDir::separator() + base + suffix;
}

// <file> -> <file>.1 -> ... -> <file>.N, oldest dropped.
void rotateIfNeeded(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kMaxLogSizeBytes) {
        return;
    }

    QFile::remove(path + QStringLiteral(".%1").arg(kRotatedGenerations));
    for (int generation = kRotatedGenerations - 1; generation >= 1; --generation) {
        const QString from = path + QStringLiteral(".%1").arg(generation);
        if (QFile::exists(from)) {
            QFile::rename(from, path + QStringLiteral(".%1").arg(generation + 1));
        }
    }
    QFile::rename(path, path + QStringLiteral(".1"));
}

void appendLine(const QString &path, const QByteArray &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        std::fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

// Short human form for a terminal: "WARN Component/what: why".
void printToStderr(LogLevel level, const QString &component,
                   const QString &what, const QString &why)
{
    const QByteArray text = QStringLiteral("%1 %2/%3: %4")
                                .arg(logLevelName(level).toUpper(), component, what, why)
                                .toLocal8Bit();
    std::fprintf(stderr, "%s\n", text.constData());
}

QString threadIdString()
{
    return QStringLiteral("0x%1")
        .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16);
}

} // namespace

void initLogging(const LogOptions &options)
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.options = options;
    if (state.options.traceEnabled) {
        state.options.minimumLevel = LogLevel::Debug;
    }
}

void initLogging(const QString &processName, bool traceEnabled)
{
    LogOptions options;
    options.processName = processName;
    options.traceEnabled = traceEnabled;
    initLogging(options);
}

bool isTraceEnabled()
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.options.traceEnabled;
}

LogLevel minimumLevel()
{
    SinkState &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    return state.options.minimumLevel;
}

std::optional<LogLevel> parseLogLevel(const QString &value)
{
    const QString lowered = value.trimmed().toLower();
    if (lowered == QLatin1String("debug")) {
        return LogLevel::Debug;
    }
    if (lowered == QLatin1String("info")) {
        return LogLevel::Info;
    }
    if (lowered == QLatin1String("warn") || lowered == QLatin1String("warning")) {
        return LogLevel::Warn;
    }
    if (lowered == QLatin1String("error")) {
        return LogLevel::Error;
    }
    return std::nullopt;
}

QString logLevelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return QStringLiteral("DEBUG");
    case LogLevel::Info:
        return QStringLiteral("INFO");
    case LogLevel::Warn:
        return QStringLiteral("WARN");
    case LogLevel::Error:
        return QStringLiteral("ERROR");
    }
    return QStringLiteral("INFO");
}

QString logsDirPath()
{
    const QString overrideDir = qEnvironmentVariable("CCMONITOR_LOG_DIR");
    if (!overrideDir.isEmpty()) {
        return overrideDir;
    }
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/ccmonitor/logs");
    }
    return home + QStringLiteral("/.local/share/ccmonitor/logs");
}

void setCorrelationId(const QString &corrId)
{
    t_corrId = corrId;
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultProcessName()
{
    {
        SinkState &state = sink();
        std::lock_guard<std::mutex> lock(state.mutex);
        if (!state.options.processName.isEmpty()) {
            return state.options.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("ccmonitor");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    SinkState &state = sink();
    LogOptions options;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        options = state.options;
    }
    if (severity(level) < severity(options.minimumLevel)) {
        return;
    }

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", logLevelName(level).toStdString()},
        {"process", processName.toStdString()},
        {"thread", threadIdString().toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? currentCorrelationId() : correlationId).toStdString()},
        {"context", context}
    };

    // Context may carry text from hook logs or ccusage output.
    const QByteArray line = QByteArray::fromStdString(
        payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));

    const QString process = processName.isEmpty() ? defaultProcessName() : processName;

    std::lock_guard<std::mutex> lock(state.mutex);
    appendLine(logFilePath(process, QStringLiteral(".log")), line);
    if (options.traceEnabled) {
        appendLine(logFilePath(process, QStringLiteral("-trace.log")), line);
    }
    if (options.mirrorToStderr && severity(level) >= severity(LogLevel::Warn)) {
        printToStderr(level, component, what, why);
    }
}

} // namespace ccmonitor::logging
