#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

class LoggingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testLogEventWrites();
    void testDebugOnlyWithTrace();
    void testTraceWrites();
    void testCorrelationScope();
    void testInvalidUtf8Context();
    void testMinimumLevel();
    void testParseLogLevel();
    void testRotation();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString logPath(const QString &suffix) const
    {
        return m_tempDir.path() + "/.local/share/ccmonitor/logs/ccmonitor-test" + suffix;
    }
    static QList<nlohmann::json> readLines(const QString &path);
};

QList<nlohmann::json> LoggingTests::readLines(const QString &path)
{
    QList<nlohmann::json> lines;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return lines;
    }
    while (!file.atEnd()) {
        const QByteArray line = file.readLine().trimmed();
        if (!line.isEmpty()) {
            lines.append(nlohmann::json::parse(line.toStdString()));
        }
    }
    return lines;
}

void LoggingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void LoggingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void LoggingTests::testLogEventWrites()
{
    ccmonitor::logging::initLogging(QStringLiteral("ccmonitor-test"), false);
    QFile::remove(logPath(".log"));

    ccmonitor::logging::logEvent(ccmonitor::logging::LogLevel::Info,
                                 QStringLiteral("ccmonitor-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testLogEventWrites"),
                                 QStringLiteral("test_log"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 ccmonitor::logging::defaultWho(),
                                 QStringLiteral("corr-1"),
                                 nlohmann::json{{"key", "value"}});

    const auto lines = readLines(logPath(".log"));
    QCOMPARE(lines.size(), 1);
    const auto &parsed = lines.front();
    QCOMPARE(QString::fromStdString(parsed.value("what", "")), QStringLiteral("test_log"));
    QCOMPARE(QString::fromStdString(parsed.value("corr", "")), QStringLiteral("corr-1"));
    QCOMPARE(QString::fromStdString(parsed.value("level", "")), QStringLiteral("INFO"));
    QCOMPARE(QString::fromStdString(parsed.at("context").value("key", "")),
             QStringLiteral("value"));
}

void LoggingTests::testDebugOnlyWithTrace()
{
    ccmonitor::logging::initLogging(QStringLiteral("ccmonitor-test"), false);
    QFile::remove(logPath(".log"));

    CMLOG_DEBUG(QStringLiteral("Test"),
                QStringLiteral("testDebugOnlyWithTrace"),
                QStringLiteral("hidden_debug"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                ccmonitor::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    QVERIFY(readLines(logPath(".log")).isEmpty());
}

void LoggingTests::testTraceWrites()
{
    ccmonitor::logging::initLogging(QStringLiteral("ccmonitor-test"), true);
    QVERIFY(ccmonitor::logging::isTraceEnabled());

    ccmonitor::logging::logEvent(ccmonitor::logging::LogLevel::Debug,
                                 QStringLiteral("ccmonitor-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testTraceWrites"),
                                 QStringLiteral("test_trace"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 ccmonitor::logging::defaultWho(),
                                 QStringLiteral("corr-2"),
                                 nlohmann::json::object());

    QFile file(logPath("-trace.log"));
    QVERIFY(file.exists());
    QVERIFY(file.open(QIODevice::ReadOnly));
    const QByteArray line = file.readLine();
    QVERIFY(!line.trimmed().isEmpty());

    ccmonitor::logging::initLogging(QStringLiteral("ccmonitor-test"), false);
}

void LoggingTests::testCorrelationScope()
{
    ccmonitor::logging::setCorrelationId(QString());
    {
        ccmonitor::logging::CorrelationScope outer(QStringLiteral("cycle-1"));
        QCOMPARE(ccmonitor::logging::currentCorrelationId(), QStringLiteral("cycle-1"));
        {
            ccmonitor::logging::CorrelationScope inner(QStringLiteral("cycle-2"));
            QCOMPARE(ccmonitor::logging::currentCorrelationId(), QStringLiteral("cycle-2"));
        }
        QCOMPARE(ccmonitor::logging::currentCorrelationId(), QStringLiteral("cycle-1"));

        QFile::remove(logPath(".log"));
        ccmonitor::logging::logEvent(ccmonitor::logging::LogLevel::Warn,
                                     QStringLiteral("ccmonitor-test"),
                                     QStringLiteral("Test"),
                                     QStringLiteral("testCorrelationScope"),
                                     QStringLiteral("scoped"),
                                     QStringLiteral("unit_test"),
                                     QStringLiteral("direct_call"),
                                     ccmonitor::logging::defaultWho(),
                                     QString(),
                                     nlohmann::json::object());
        const auto lines = readLines(logPath(".log"));
        QCOMPARE(lines.size(), 1);
        QCOMPARE(QString::fromStdString(lines.front().value("corr", "")),
                 QStringLiteral("cycle-1"));
    }
    QVERIFY(ccmonitor::logging::currentCorrelationId().isEmpty());
}

void LoggingTests::testInvalidUtf8Context()
{
    QFile::remove(logPath(".log"));
    ccmonitor::logging::logEvent(ccmonitor::logging::LogLevel::Error,
                                 QStringLiteral("ccmonitor-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testInvalidUtf8Context"),
                                 QStringLiteral("bad_bytes"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 ccmonitor::logging::defaultWho(),
                                 QString(),
                                 nlohmann::json{{"raw", std::string("ab\xff\xfe")}});
    QCOMPARE(readLines(logPath(".log")).size(), 1);
}

void LoggingTests::testMinimumLevel()
{
    ccmonitor::logging::LogOptions options;
    options.processName = QStringLiteral("ccmonitor-test");
    options.minimumLevel = ccmonitor::logging::LogLevel::Warn;
    ccmonitor::logging::initLogging(options);
    QFile::remove(logPath(".log"));

    CMLOG_INFO(QStringLiteral("Test"),
               QStringLiteral("testMinimumLevel"),
               QStringLiteral("dropped_info"),
               QStringLiteral("unit_test"),
               QStringLiteral("macro"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json::object());
    CMLOG_ERROR(QStringLiteral("Test"),
                QStringLiteral("testMinimumLevel"),
                QStringLiteral("kept_error"),
                QStringLiteral("unit_test"),
                QStringLiteral("macro"),
                ccmonitor::logging::defaultWho(),
                QString(),
                nlohmann::json::object());

    const auto lines = readLines(logPath(".log"));
    QCOMPARE(lines.size(), 1);
    QCOMPARE(QString::fromStdString(lines.front().value("what", "")),
             QStringLiteral("kept_error"));

    // Trace always lowers the threshold to DEBUG.
    options.traceEnabled = true;
    ccmonitor::logging::initLogging(options);
    QCOMPARE(ccmonitor::logging::minimumLevel(), ccmonitor::logging::LogLevel::Debug);

    ccmonitor::logging::initLogging(QStringLiteral("ccmonitor-test"), false);
    QCOMPARE(ccmonitor::logging::minimumLevel(), ccmonitor::logging::LogLevel::Info);
}

void LoggingTests::testParseLogLevel()
{
    using ccmonitor::logging::LogLevel;
    QCOMPARE(ccmonitor::logging::parseLogLevel(QStringLiteral("debug")).value(), LogLevel::Debug);
    QCOMPARE(ccmonitor::logging::parseLogLevel(QStringLiteral(" INFO ")).value(), LogLevel::Info);
    QCOMPARE(ccmonitor::logging::parseLogLevel(QStringLiteral("warning")).value(), LogLevel::Warn);
    QCOMPARE(ccmonitor::logging::parseLogLevel(QStringLiteral("Error")).value(), LogLevel::Error);
    QVERIFY(!ccmonitor::logging::parseLogLevel(QStringLiteral("verbose")).has_value());
    QCOMPARE(ccmonitor::logging::logLevelName(LogLevel::Warn), QStringLiteral("WARN"));
}

void LoggingTests::testRotation()
{
    ccmonitor::logging::initLogging(QStringLiteral("ccmonitor-test"), false);
    const QString path = logPath(".log");
    for (const QString &suffix : {QString(), QStringLiteral(".1"), QStringLiteral(".2"),
                                  QStringLiteral(".3")}) {
        QFile::remove(path + suffix);
    }

    {
        QFile old(path + ".1");
        QVERIFY(old.open(QIODevice::WriteOnly));
        old.write("previous generation\n");
    }
    {
        QFile full(path);
        QVERIFY(full.open(QIODevice::WriteOnly));
        full.write(QByteArray(5 * 1024 * 1024, 'x'));
    }

    ccmonitor::logging::logEvent(ccmonitor::logging::LogLevel::Info,
                                 QStringLiteral("ccmonitor-test"),
                                 QStringLiteral("Test"),
                                 QStringLiteral("testRotation"),
                                 QStringLiteral("after_rotation"),
                                 QStringLiteral("unit_test"),
                                 QStringLiteral("direct_call"),
                                 ccmonitor::logging::defaultWho(),
                                 QString(),
                                 nlohmann::json::object());

    QCOMPARE(QFileInfo(path + ".1").size(), static_cast<qint64>(5 * 1024 * 1024));
    QVERIFY(QFileInfo::exists(path + ".2"));
    QCOMPARE(readLines(path).size(), 1);
}

QTEST_MAIN(LoggingTests)
#include "test_logging.moc"
