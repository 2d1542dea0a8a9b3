#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>

#include <ctime>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "daemon/subprocess_pool.hpp"
#include "daemon/usage_collector.hpp"
#include "daemon/usage_store.hpp"

using namespace std::chrono_literals;

namespace {

ccmonitor::TimePoint localTime(int year, int month, int day, int hour)
{
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
}

std::tm toLocal(ccmonitor::TimePoint t)
{
    const std::time_t time = std::chrono::system_clock::to_time_t(t);
    std::tm tm{};
    localtime_r(&time, &tm);
    return tm;
}

} // namespace

class CcusageParserTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testBillingPeriodDefaultDay();
    void testBillingPeriodBeforeStartDay();
    void testSnapshotFromBlocks();
    void testTotalTokensFallback();
    void testMissingBlocksThrows();
    void testCollectorSuccess();
    void testCollectorFailuresCount();
    void testCollectorMissingProgram();
    void testMaxTokensPersisted();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;

    QString writeScript(const QString &name, const QByteArray &body);
};

void CcusageParserTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void CcusageParserTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

QString CcusageParserTests::writeScript(const QString &name, const QByteArray &body)
{
    const QString path = m_tempDir.path() + "/" + name;
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "Failed to open file:" << path << file.errorString();
        return QString();
    }
    file.write("#!/bin/sh\n");
    file.write(body);
    file.close();
    file.setPermissions(QFile::ReadOwner | QFile::WriteOwner | QFile::ExeOwner);
    return path;
}

void CcusageParserTests::testBillingPeriodDefaultDay()
{
    const auto period = ccmonitor::billingPeriodFor(localTime(2026, 10, 19, 12), 1);
    const std::tm start = toLocal(period.start);
    const std::tm end = toLocal(period.end);

    QCOMPARE(start.tm_mon, 9);
    QCOMPARE(start.tm_mday, 1);
    QCOMPARE(start.tm_hour, 0);
    QCOMPARE(end.tm_mon, 10);
    QCOMPARE(end.tm_mday, 1);
}

void CcusageParserTests::testBillingPeriodBeforeStartDay()
{
    const auto period = ccmonitor::billingPeriodFor(localTime(2026, 1, 10, 12), 15);
    const std::tm start = toLocal(period.start);
    const std::tm end = toLocal(period.end);

    QCOMPARE(start.tm_year, 2025 - 1900);
    QCOMPARE(start.tm_mon, 11);
    QCOMPARE(start.tm_mday, 15);
    QCOMPARE(end.tm_year, 2026 - 1900);
    QCOMPARE(end.tm_mon, 0);
    QCOMPARE(end.tm_mday, 15);

    // Out-of-range start days are clamped.
    const auto clamped = ccmonitor::billingPeriodFor(localTime(2026, 3, 30, 12), 31);
    QCOMPARE(toLocal(clamped.start).tm_mday, 28);
}

void CcusageParserTests::testSnapshotFromBlocks()
{
    ccmonitor::BillingPeriod period;
    period.start = ccmonitor::fromIso8601Utc("2026-10-01T00:00:00Z");
    period.end = ccmonitor::fromIso8601Utc("2026-11-01T00:00:00Z");
    const auto now = ccmonitor::fromIso8601Utc("2026-10-19T12:00:00Z");

    const nlohmann::json document = {
        {"blocks", {
            {{"id", "2026-09-30T20:00:00.000Z"},
             {"startTime", "2026-09-30T20:00:00.000Z"},
             {"endTime", "2026-10-01T01:00:00.000Z"},
             {"isActive", false},
             {"totalTokens", 999999},
             {"costUSD", 9.0}},
            {{"id", "2026-10-18T08:00:00.000Z"},
             {"startTime", "2026-10-18T08:00:00.000Z"},
             {"endTime", "2026-10-18T13:00:00.000Z"},
             {"isActive", false},
             {"totalTokens", 42000},
             {"costUSD", 1.5}},
            {{"id", "gap"}, {"startTime", "2026-10-18T13:00:00.000Z"}, {"isGap", true}},
            {{"id", "broken"}},
            {{"id", "2026-10-19T10:00:00.000Z"},
             {"startTime", "2026-10-19T10:00:00.000Z"},
             {"endTime", "2026-10-19T15:00:00.000Z"},
             {"isActive", true},
             {"totalTokens", 90000},
             {"costUSD", 0.5}},
        }}
    };

    const auto snapshot = ccmonitor::snapshotFromCcusageBlocks(document, period, now);
    QCOMPARE(snapshot.totalSessionsThisMonth, 2);
    QCOMPARE(snapshot.totalCostThisMonth, 2.0);
    QCOMPARE(snapshot.maxTokensPerSession, 42000LL);
    QCOMPARE(snapshot.currentSessions.size(), static_cast<size_t>(2));
    QVERIFY(snapshot.lastUpdate == now);
    QVERIFY(snapshot.billingPeriodStart == period.start);

    const auto &active = snapshot.currentSessions.back();
    QVERIFY(active.isActive);
    QVERIFY(active.endTime.has_value());
    QCOMPARE(QString::fromStdString(ccmonitor::toIso8601Utc(*active.endTime)),
             QStringLiteral("2026-10-19T15:00:00Z"));
}

void CcusageParserTests::testTotalTokensFallback()
{
    ccmonitor::BillingPeriod period;
    period.start = ccmonitor::fromIso8601Utc("2026-10-01T00:00:00Z");
    period.end = ccmonitor::fromIso8601Utc("2026-11-01T00:00:00Z");

    const nlohmann::json document = {
        {"blocks", {
            {{"startTime", "2026-10-02T00:00:00Z"},
             {"tokenCounts", {{"inputTokens", 10},
                              {"outputTokens", 20},
                              {"cacheCreationInputTokens", 30},
                              {"cacheReadInputTokens", 40}}}},
        }}
    };

    const auto snapshot =
        ccmonitor::snapshotFromCcusageBlocks(document, period, period.start + 48h);
    QCOMPARE(snapshot.currentSessions.size(), static_cast<size_t>(1));
    QCOMPARE(snapshot.currentSessions.front().inputTokens, 10LL);
    QCOMPARE(snapshot.currentSessions.front().totalTokens, 100LL);
    QCOMPARE(QString::fromStdString(snapshot.currentSessions.front().sessionId),
             QStringLiteral("2026-10-02T00:00:00Z"));
}

void CcusageParserTests::testMissingBlocksThrows()
{
    ccmonitor::BillingPeriod period;
    bool thrown = false;
    try {
        ccmonitor::snapshotFromCcusageBlocks(nlohmann::json{{"sessions", 1}}, period,
                                             std::chrono::system_clock::now());
    } catch (const ccmonitor::CollectionError &) {
        thrown = true;
    }
    QVERIFY(thrown);
}

void CcusageParserTests::testCollectorSuccess()
{
    const std::string start = ccmonitor::toIso8601Utc(std::chrono::system_clock::now());
    const QString script = writeScript(
        "ccusage-ok",
        QByteArray("cat <<'JSON'\n{\"blocks\": [{\"id\": \"b1\", \"startTime\": \"")
            + QByteArray::fromStdString(start)
            + "\", \"isActive\": true, \"totalTokens\": 1234, \"costUSD\": 0.25}]}\nJSON\n");
    QVERIFY(!script.isEmpty());

    ccmonitor::MonitorConfig config = ccmonitor::defaultConfig();
    config.ccusageCommand = script.toStdString();
    ccmonitor::SubprocessPool pool;
    ccmonitor::CcusageCollector collector(config, pool, nullptr);

    const auto snapshot = collector.collect();
    QCOMPARE(snapshot.totalSessionsThisMonth, 1);
    QCOMPARE(snapshot.currentSessions.front().totalTokens, 1234LL);
    QCOMPARE(collector.errorStatus().consecutiveFailures, 0);
}

void CcusageParserTests::testCollectorFailuresCount()
{
    const QString failing = writeScript("ccusage-fail", "echo 'boom' >&2\nexit 3\n");
    const QString garbage = writeScript("ccusage-garbage", "echo 'not json'\n");
    const QString ok = writeScript("ccusage-empty", "echo '{\"blocks\": []}'\n");

    ccmonitor::MonitorConfig config = ccmonitor::defaultConfig();
    config.ccusageCommand = failing.toStdString();
    ccmonitor::SubprocessPool pool;
    auto collector = std::make_unique<ccmonitor::CcusageCollector>(config, pool, nullptr);

    for (int attempt = 1; attempt <= 3; ++attempt) {
        bool thrown = false;
        try {
            collector->collect();
        } catch (const ccmonitor::CollectionError &ex) {
            thrown = true;
            QVERIFY(QString::fromUtf8(ex.what()).contains(QStringLiteral("boom")));
        }
        QVERIFY(thrown);
        QCOMPARE(collector->errorStatus().consecutiveFailures, attempt);
    }
    QVERIFY(collector->errorStatus().lastFailure.has_value());

    config.ccusageCommand = garbage.toStdString();
    collector = std::make_unique<ccmonitor::CcusageCollector>(config, pool, nullptr);
    bool thrown = false;
    try {
        collector->collect();
    } catch (const ccmonitor::CollectionError &) {
        thrown = true;
    }
    QVERIFY(thrown);

    config.ccusageCommand = ok.toStdString();
    collector = std::make_unique<ccmonitor::CcusageCollector>(config, pool, nullptr);
    const auto snapshot = collector->collect();
    QVERIFY(snapshot.currentSessions.empty());
    QCOMPARE(collector->errorStatus().consecutiveFailures, 0);
}

void CcusageParserTests::testCollectorMissingProgram()
{
    ccmonitor::MonitorConfig config = ccmonitor::defaultConfig();
    config.ccusageCommand = (m_tempDir.path() + "/no-such-ccusage").toStdString();
    ccmonitor::SubprocessPool pool;
    ccmonitor::CcusageCollector collector(config, pool, nullptr);

    bool thrown = false;
    try {
        collector.collect();
    } catch (const ccmonitor::CollectionError &) {
        thrown = true;
    }
    QVERIFY(thrown);
    QCOMPARE(collector.errorStatus().consecutiveFailures, 1);
    QVERIFY(!collector.errorStatus().errorMessage.empty());
}

void CcusageParserTests::testMaxTokensPersisted()
{
    ccmonitor::MonitorConfig config = ccmonitor::defaultConfig();
    ccmonitor::SubprocessPool pool;

    {
        ccmonitor::UsageStore store;
        ccmonitor::CcusageCollector collector(config, pool, &store);
        QVERIFY(collector.updateMaxTokensIfHigher(5000));
        QVERIFY(!collector.updateMaxTokensIfHigher(4000));
        QVERIFY(!collector.updateMaxTokensIfHigher(5000));
    }

    ccmonitor::UsageStore store;
    const auto stored = store.getMeta("max_tokens_per_session");
    QVERIFY(stored.has_value());
    QCOMPARE(QString::fromStdString(*stored), QStringLiteral("5000"));

    ccmonitor::CcusageCollector reloaded(config, pool, &store);
    QVERIFY(!reloaded.updateMaxTokensIfHigher(4999));
    QVERIFY(reloaded.updateMaxTokensIfHigher(6000));
}

QTEST_MAIN(CcusageParserTests)
#include "test_ccusage_parser.moc"
