#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace ccmonitor {

using TimePoint = std::chrono::system_clock::time_point;

// One activity session. Raw parser output carries one of these per log record;
// after merging there is exactly one per session id.
struct ActivitySession {
    std::string projectName;
    std::string sessionId;
    TimePoint startTime;
    std::optional<TimePoint> endTime;
    ActivitySessionStatus status = ActivitySessionStatus::Active;
    std::optional<std::string> eventType;
    std::map<std::string, std::string> metadata;
};

// A usage billing block as reported by the usage collector.
struct UsageSession {
    std::string sessionId;
    TimePoint startTime;
    std::optional<TimePoint> endTime;
    long long inputTokens = 0;
    long long outputTokens = 0;
    long long totalTokens = 0;
    double costUsd = 0.0;
    bool isActive = false;
};

// Everything one collection cycle publishes for the display client.
struct MonitoringSnapshot {
    std::vector<UsageSession> currentSessions;
    int totalSessionsThisMonth = 0;
    double totalCostThisMonth = 0.0;
    long long maxTokensPerSession = 0;
    TimePoint lastUpdate;
    TimePoint billingPeriodStart;
    TimePoint billingPeriodEnd;
    // Empty unless the activity tracker contributed sessions this cycle.
    std::vector<ActivitySession> activitySessions;
};

struct ErrorStatus {
    int consecutiveFailures = 0;
    std::string errorMessage;
    std::optional<TimePoint> lastFailure;
};

} // namespace ccmonitor
