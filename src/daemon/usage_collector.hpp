#pragma once

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/models.hpp"

namespace ccmonitor {

class SubprocessPool;
class UsageStore;

// Source of usage snapshots for the collection cycle.
class UsageCollector
{
public:
    virtual ~UsageCollector() = default;

    // Throws CollectionError on a retryable failure.
    virtual MonitoringSnapshot collect() = 0;

    // consecutiveFailures resets to 0 on every successful collect().
    virtual ErrorStatus errorStatus() const = 0;

    // Returns true when tokens exceeded the recorded maximum (which is updated).
    virtual bool updateMaxTokensIfHigher(long long tokens) = 0;
};

struct BillingPeriod {
    TimePoint start;
    TimePoint end;
};

// Billing period containing now, starting at local midnight on billingStartDay.
BillingPeriod billingPeriodFor(TimePoint now, int billingStartDay);

// Build a snapshot from `ccusage blocks --json` output. Throws CollectionError
// when the document has no blocks array. maxTokensPerSession holds the largest
// completed block in the period.
MonitoringSnapshot snapshotFromCcusageBlocks(const nlohmann::json &document,
                                             const BillingPeriod &period,
                                             TimePoint now);

/**
 * CcusageCollector shells out to the ccusage CLI through the shared pool.
 *
 * The command is bounded by MonitorConfig::ccusageTimeout; a timeout, a
 * non-zero exit or unparseable output is a CollectionError. The largest token
 * count seen in one session is kept in the UsageStore when one is given.
 */
class CcusageCollector : public UsageCollector
{
public:
    CcusageCollector(MonitorConfig config, SubprocessPool &pool, UsageStore *store);

    MonitoringSnapshot collect() override;
    ErrorStatus errorStatus() const override;
    bool updateMaxTokensIfHigher(long long tokens) override;

private:
    [[noreturn]] void fail(const std::string &message);
    void persistMaxTokens();

    MonitorConfig m_config;
    SubprocessPool &m_pool;
    UsageStore *m_store = nullptr;

    ErrorStatus m_errorStatus;
    long long m_maxTokens = 0;
};

} // namespace ccmonitor
