#include "daemon/usage_collector.hpp"

#include <algorithm>
#include <ctime>
#include <stdexcept>

#include <QDateTime>
#include <QString>
#include <QStringList>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/subprocess_pool.hpp"
#include "daemon/usage_store.hpp"

namespace ccmonitor {

namespace {

constexpr const char *kMaxTokensMetaKey = "max_tokens_per_session";

std::optional<TimePoint> parseBlockTime(const nlohmann::json &block, const char *key)
{
    if (!block.contains(key) || !block.at(key).is_string()) {
        return std::nullopt;
    }

    // ccusage emits millisecond precision UTC, e.g. 2026-10-19T10:00:00.000Z
    const QString value = QString::fromStdString(block.at(key).get<std::string>());
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    if (!dt.isValid()) {
        return std::nullopt;
    }
    return TimePoint{std::chrono::milliseconds{dt.toMSecsSinceEpoch()}};
}

long long tokenCount(const nlohmann::json &counts, const char *key)
{
    if (!counts.is_object() || !counts.contains(key) || !counts.at(key).is_number()) {
        return 0;
    }
    return counts.at(key).get<long long>();
}

std::optional<UsageSession> sessionFromBlock(const nlohmann::json &block)
{
    if (!block.is_object() || block.value("isGap", false)) {
        return std::nullopt;
    }

    const auto start = parseBlockTime(block, "startTime");
    if (!start.has_value()) {
        return std::nullopt;
    }

    UsageSession session;
    session.sessionId = block.value("id", toIso8601Utc(*start));
    session.startTime = *start;
    session.endTime = parseBlockTime(block, "endTime");
    session.isActive = block.value("isActive", false);

    const nlohmann::json counts = block.value("tokenCounts", nlohmann::json::object());
    session.inputTokens = tokenCount(counts, "inputTokens");
    session.outputTokens = tokenCount(counts, "outputTokens");

    if (block.contains("totalTokens") && block.at("totalTokens").is_number()) {
        session.totalTokens = block.at("totalTokens").get<long long>();
    } else {
        session.totalTokens = session.inputTokens + session.outputTokens
            + tokenCount(counts, "cacheCreationInputTokens")
            + tokenCount(counts, "cacheReadInputTokens");
    }

    if (block.contains("costUSD") && block.at("costUSD").is_number()) {
        session.costUsd = block.at("costUSD").get<double>();
    }
    return session;
}

} // namespace

BillingPeriod billingPeriodFor(TimePoint now, int billingStartDay)
{
    const int startDay = std::clamp(billingStartDay, 1, 28);

    std::time_t nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm local{};
    localtime_r(&nowTime, &local);

    std::tm start = local;
    if (local.tm_mday < startDay) {
        start.tm_mon -= 1;
    }
    start.tm_mday = startDay;
    start.tm_hour = 0;
    start.tm_min = 0;
    start.tm_sec = 0;
    start.tm_isdst = -1;

    std::tm end = start;
    end.tm_mon += 1;
    end.tm_isdst = -1;

    BillingPeriod period;
    period.start = std::chrono::system_clock::from_time_t(std::mktime(&start));
    period.end = std::chrono::system_clock::from_time_t(std::mktime(&end));
    return period;
}

MonitoringSnapshot snapshotFromCcusageBlocks(const nlohmann::json &document,
                                             const BillingPeriod &period,
                                             TimePoint now)
{
    if (!document.is_object() || !document.contains("blocks")
        || !document.at("blocks").is_array()) {
        throw CollectionError("ccusage output has no blocks array");
    }

    MonitoringSnapshot snapshot;
    snapshot.lastUpdate = now;
    snapshot.billingPeriodStart = period.start;
    snapshot.billingPeriodEnd = period.end;

    for (const auto &block : document.at("blocks")) {
        auto session = sessionFromBlock(block);
        if (!session.has_value()) {
            continue;
        }
        if (session->startTime < period.start || session->startTime >= period.end) {
            continue;
        }

        snapshot.totalSessionsThisMonth += 1;
        snapshot.totalCostThisMonth += session->costUsd;
        if (!session->isActive) {
            snapshot.maxTokensPerSession =
                std::max(snapshot.maxTokensPerSession, session->totalTokens);
        }
        snapshot.currentSessions.push_back(std::move(*session));
    }

    return snapshot;
}

CcusageCollector::CcusageCollector(MonitorConfig config, SubprocessPool &pool,
                                   UsageStore *store)
    : m_config(std::move(config))
    , m_pool(pool)
    , m_store(store)
{
    if (!m_store) {
        return;
    }

    try {
        if (const auto stored = m_store->getMeta(kMaxTokensMetaKey)) {
            m_maxTokens = std::max(0LL, std::stoll(*stored));
        }
    } catch (const std::exception &ex) {
        CMLOG_WARN(QStringLiteral("CcusageCollector"),
                   QStringLiteral("CcusageCollector"),
                   QStringLiteral("max_tokens_load_failed"),
                   QStringLiteral("startup"),
                   QStringLiteral("meta_store"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()}});
        m_maxTokens = 0;
    }
}

void CcusageCollector::fail(const std::string &message)
{
    m_errorStatus.consecutiveFailures += 1;
    m_errorStatus.errorMessage = message;
    m_errorStatus.lastFailure = std::chrono::system_clock::now();
    throw CollectionError(message);
}

MonitoringSnapshot CcusageCollector::collect()
{
    const QStringList arguments = {QStringLiteral("blocks"), QStringLiteral("--json")};
    const auto timeout =
        std::chrono::duration_cast<std::chrono::milliseconds>(m_config.ccusageTimeout);

    ProcessResult result;
    try {
        result = m_pool.run(QString::fromStdString(m_config.ccusageCommand),
                            arguments, timeout);
    } catch (const SubprocessError &ex) {
        fail(ex.what());
    }

    if (result.exitCode != 0) {
        const std::string stderrText =
            QString::fromUtf8(result.standardError).trimmed().toStdString();
        fail("ccusage exited with code " + std::to_string(result.exitCode)
             + (stderrText.empty() ? std::string() : ": " + stderrText));
    }

    if (result.standardOutput.trimmed().isEmpty()) {
        fail("ccusage produced no output");
    }

    const nlohmann::json document =
        nlohmann::json::parse(result.standardOutput.toStdString(), nullptr, false);
    if (document.is_discarded()) {
        fail("ccusage output is not valid JSON");
    }

    const auto now = std::chrono::system_clock::now();
    MonitoringSnapshot snapshot;
    try {
        snapshot = snapshotFromCcusageBlocks(
            document, billingPeriodFor(now, m_config.billingStartDay), now);
    } catch (const CollectionError &ex) {
        fail(ex.what());
    } catch (const nlohmann::json::exception &ex) {
        fail(std::string("unexpected ccusage block layout: ") + ex.what());
    }

    updateMaxTokensIfHigher(snapshot.maxTokensPerSession);
    snapshot.maxTokensPerSession = m_maxTokens;

    m_errorStatus.consecutiveFailures = 0;
    m_errorStatus.errorMessage.clear();
    return snapshot;
}

ErrorStatus CcusageCollector::errorStatus() const
{
    return m_errorStatus;
}

bool CcusageCollector::updateMaxTokensIfHigher(long long tokens)
{
    if (tokens <= m_maxTokens) {
        return false;
    }
    m_maxTokens = tokens;
    persistMaxTokens();
    return true;
}

void CcusageCollector::persistMaxTokens()
{
    if (!m_store) {
        return;
    }
    try {
        m_store->setMeta(kMaxTokensMetaKey, std::to_string(m_maxTokens));
    } catch (const std::exception &ex) {
        CMLOG_WARN(QStringLiteral("CcusageCollector"),
                   QStringLiteral("persistMaxTokens"),
                   QStringLiteral("max_tokens_persist_failed"),
                   QStringLiteral("new_maximum"),
                   QStringLiteral("meta_store"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()}, {"maxTokens", m_maxTokens}});
    }
}

} // namespace ccmonitor
