#include "daemon/hook_log_parser.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace ccmonitor {

namespace {

std::string toLower(std::string value)
{
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

// Hooks write ISO-8601 with or without fractional seconds and offset.
std::optional<TimePoint> parseTimestamp(const std::string &raw)
{
    const QString value = QString::fromStdString(raw);
    QDateTime dt = QDateTime::fromString(value, Qt::ISODateWithMs);
    if (!dt.isValid()) {
        dt = QDateTime::fromString(value, Qt::ISODate);
    }
    if (!dt.isValid()) {
        return std::nullopt;
    }
    // Naive timestamps are written by the hooks in UTC.
    if (dt.timeSpec() == Qt::LocalTime) {
        dt.setTimeSpec(Qt::UTC);
    }

    return TimePoint{std::chrono::milliseconds{dt.toMSecsSinceEpoch()}};
}

std::string projectNameFor(const nlohmann::json &record)
{
    const std::string explicitName = record.value("project_name", "");
    if (!explicitName.empty()) {
        return explicitName;
    }

    if (record.contains("data") && record.at("data").is_object()) {
        const std::string cwd = record.at("data").value("cwd", "");
        if (!cwd.empty()) {
            std::filesystem::path path(cwd);
            if (!path.has_filename()) {
                path = path.parent_path();
            }
            const std::string name = path.filename().string();
            if (!name.empty()) {
                return name;
            }
        }
    }
    return "unknown";
}

} // namespace

bool isStopEventType(const std::string &eventType)
{
    const std::string lowered = toLower(eventType);
    return lowered == "stop" || lowered == "subagent_stop";
}

std::optional<ActivitySession> parseHookLogLine(const std::string &line)
{
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    const nlohmann::json record = nlohmann::json::parse(line, nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        return std::nullopt;
    }

    if (!record.contains("session_id") || !record.at("session_id").is_string()
        || !record.contains("timestamp") || !record.at("timestamp").is_string()) {
        return std::nullopt;
    }

    const auto timestamp = parseTimestamp(record.at("timestamp").get<std::string>());
    if (!timestamp.has_value()) {
        return std::nullopt;
    }

    ActivitySession session;
    session.sessionId = record.at("session_id").get<std::string>();
    if (session.sessionId.empty()) {
        return std::nullopt;
    }
    session.projectName = projectNameFor(record);
    session.startTime = *timestamp;

    if (record.contains("event_type") && record.at("event_type").is_string()) {
        session.eventType = toLower(record.at("event_type").get<std::string>());
    }

    if (session.eventType.has_value() && isStopEventType(*session.eventType)) {
        session.status = ActivitySessionStatus::Stopped;
        session.endTime = *timestamp;
    } else {
        session.status = ActivitySessionStatus::Active;
    }

    if (record.contains("data") && record.at("data").is_object()) {
        for (const auto &item : record.at("data").items()) {
            session.metadata[item.key()] = item.value().is_string()
                ? item.value().get<std::string>()
                : item.value().dump();
        }
    }

    return session;
}

std::vector<ActivitySession> HookLogParser::parseLogFile(const std::string &path)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ParseError("cannot open activity log: " + path);
    }

    std::vector<ActivitySession> sessions;
    std::string line;
    int lineNumber = 0;
    int skipped = 0;
    while (std::getline(file, line)) {
        ++lineNumber;
        auto session = parseHookLogLine(line);
        if (!session.has_value()) {
            if (line.find_first_not_of(" \t\r\n") != std::string::npos) {
                ++skipped;
            }
            continue;
        }
        sessions.push_back(std::move(*session));
    }

    if (file.bad()) {
        throw ParseError("read error in activity log: " + path);
    }

    CMLOG_DEBUG(QStringLiteral("HookLogParser"),
                QStringLiteral("parseLogFile"),
                QStringLiteral("parse_hook_log_complete"),
                QStringLiteral("activity_refresh"),
                QStringLiteral("jsonl_scan"),
                ccmonitor::logging::defaultWho(),
                QString(),
                nlohmann::json{{"path", path},
                               {"lines", lineNumber},
                               {"events", sessions.size()},
                               {"skipped", skipped}});
    return sessions;
}

} // namespace ccmonitor
