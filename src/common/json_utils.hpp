#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace ccmonitor {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::chrono::system_clock::time_point fromIso8601Utc(const std::string &value)
{
    std::tm tm{};
    std::istringstream in(value);
    in >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    if (in.fail()) {
        return std::chrono::system_clock::time_point{};
    }
    std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::chrono::system_clock::time_point{};
    }
    return std::chrono::system_clock::from_time_t(time);
}

inline std::string toStatusString(ActivitySessionStatus status)
{
    switch (status) {
    case ActivitySessionStatus::Active:
        return "ACTIVE";
    case ActivitySessionStatus::WaitingForUser:
        return "WAITING_FOR_USER";
    case ActivitySessionStatus::Idle:
        return "IDLE";
    case ActivitySessionStatus::Inactive:
        return "INACTIVE";
    case ActivitySessionStatus::Stopped:
        return "STOPPED";
    }
    return "ACTIVE";
}

inline std::optional<ActivitySessionStatus> parseStatusString(const std::string &value)
{
    if (value == "ACTIVE") {
        return ActivitySessionStatus::Active;
    }
    if (value == "WAITING_FOR_USER") {
        return ActivitySessionStatus::WaitingForUser;
    }
    if (value == "IDLE") {
        return ActivitySessionStatus::Idle;
    }
    if (value == "INACTIVE") {
        return ActivitySessionStatus::Inactive;
    }
    if (value == "STOPPED") {
        return ActivitySessionStatus::Stopped;
    }
    return std::nullopt;
}

inline nlohmann::json optionalTimeToJson(const std::optional<TimePoint> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return toIso8601Utc(*value);
}

inline std::optional<TimePoint> optionalTimeFromJson(const nlohmann::json &j,
                                                     const char *key)
{
    if (!j.contains(key) || !j.at(key).is_string()) {
        return std::nullopt;
    }
    return fromIso8601Utc(j.at(key).get<std::string>());
}

inline void to_json(nlohmann::json &j, const ActivitySessionStatus &status)
{
    j = toStatusString(status);
}

inline void from_json(const nlohmann::json &j, ActivitySessionStatus &status)
{
    if (j.is_string()) {
        status = parseStatusString(j.get<std::string>())
                     .value_or(ActivitySessionStatus::Active);
    } else {
        status = ActivitySessionStatus::Active;
    }
}

inline void to_json(nlohmann::json &j, const ActivitySession &session)
{
    j = nlohmann::json{
        {"project_name", session.projectName},
        {"session_id", session.sessionId},
        {"start_time", toIso8601Utc(session.startTime)},
        {"end_time", optionalTimeToJson(session.endTime)},
        {"status", session.status},
        {"event_type", session.eventType.has_value()
                           ? nlohmann::json(*session.eventType)
                           : nlohmann::json(nullptr)},
        {"metadata", session.metadata}
    };
}

inline void from_json(const nlohmann::json &j, ActivitySession &session)
{
    session.projectName = j.value("project_name", "");
    session.sessionId = j.value("session_id", "");
    session.startTime = fromIso8601Utc(j.value("start_time", ""));
    session.endTime = optionalTimeFromJson(j, "end_time");
    if (j.contains("status")) {
        session.status = j.at("status").get<ActivitySessionStatus>();
    } else {
        session.status = ActivitySessionStatus::Active;
    }
    if (j.contains("event_type") && j.at("event_type").is_string()) {
        session.eventType = j.at("event_type").get<std::string>();
    } else {
        session.eventType.reset();
    }
    session.metadata.clear();
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        for (const auto &item : j.at("metadata").items()) {
            session.metadata[item.key()] = item.value().is_string()
                ? item.value().get<std::string>()
                : item.value().dump();
        }
    }
}

inline void to_json(nlohmann::json &j, const UsageSession &session)
{
    j = nlohmann::json{
        {"session_id", session.sessionId},
        {"start_time", toIso8601Utc(session.startTime)},
        {"end_time", optionalTimeToJson(session.endTime)},
        {"input_tokens", session.inputTokens},
        {"output_tokens", session.outputTokens},
        {"total_tokens", session.totalTokens},
        {"cost_usd", session.costUsd},
        {"is_active", session.isActive}
    };
}

inline void from_json(const nlohmann::json &j, UsageSession &session)
{
    session.sessionId = j.value("session_id", "");
    session.startTime = fromIso8601Utc(j.value("start_time", ""));
    session.endTime = optionalTimeFromJson(j, "end_time");
    session.inputTokens = j.value("input_tokens", 0LL);
    session.outputTokens = j.value("output_tokens", 0LL);
    session.totalTokens = j.value("total_tokens", 0LL);
    session.costUsd = j.value("cost_usd", 0.0);
    session.isActive = j.value("is_active", false);
}

inline void to_json(nlohmann::json &j, const MonitoringSnapshot &snapshot)
{
    j = nlohmann::json{
        {"current_sessions", snapshot.currentSessions},
        {"total_sessions_this_month", snapshot.totalSessionsThisMonth},
        {"total_cost_this_month", snapshot.totalCostThisMonth},
        {"max_tokens_per_session", snapshot.maxTokensPerSession},
        {"last_update", toIso8601Utc(snapshot.lastUpdate)},
        {"billing_period_start", toIso8601Utc(snapshot.billingPeriodStart)},
        {"billing_period_end", toIso8601Utc(snapshot.billingPeriodEnd)},
        {"activity_sessions", snapshot.activitySessions}
    };
}

inline void from_json(const nlohmann::json &j, MonitoringSnapshot &snapshot)
{
    if (j.contains("current_sessions") && j.at("current_sessions").is_array()) {
        snapshot.currentSessions =
            j.at("current_sessions").get<std::vector<UsageSession>>();
    } else {
        snapshot.currentSessions.clear();
    }
    snapshot.totalSessionsThisMonth = j.value("total_sessions_this_month", 0);
    snapshot.totalCostThisMonth = j.value("total_cost_this_month", 0.0);
    snapshot.maxTokensPerSession = j.value("max_tokens_per_session", 0LL);
    snapshot.lastUpdate = fromIso8601Utc(j.value("last_update", ""));
    snapshot.billingPeriodStart = fromIso8601Utc(j.value("billing_period_start", ""));
    snapshot.billingPeriodEnd = fromIso8601Utc(j.value("billing_period_end", ""));
    // Older data files predate activity tracking.
    if (j.contains("activity_sessions") && j.at("activity_sessions").is_array()) {
        snapshot.activitySessions =
            j.at("activity_sessions").get<std::vector<ActivitySession>>();
    } else {
        snapshot.activitySessions.clear();
    }
}

inline void to_json(nlohmann::json &j, const ErrorStatus &status)
{
    j = nlohmann::json{
        {"consecutive_failures", status.consecutiveFailures},
        {"error_message", status.errorMessage},
        {"last_failure", optionalTimeToJson(status.lastFailure)}
    };
}

} // namespace ccmonitor
