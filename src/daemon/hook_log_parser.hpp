#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"

namespace ccmonitor {

// Turns one activity log source into raw per-event sessions.
class ActivityEventParser
{
public:
    virtual ~ActivityEventParser() = default;

    // Throws ParseError when the source cannot be read.
    virtual std::vector<ActivitySession> parseLogFile(const std::string &path) = 0;
};

/**
 * Parser for the newline-delimited JSON log written by the editor hooks.
 *
 * Each record looks like
 *   {"timestamp": "2026-10-19T09:15:02Z", "session_id": "...",
 *    "event_type": "notification", "project_name": "...", "data": {...}}
 *
 * Records that are not valid JSON or lack a session id or timestamp are skipped.
 */
class HookLogParser : public ActivityEventParser
{
public:
    std::vector<ActivitySession> parseLogFile(const std::string &path) override;
};

// Parse a single log record. Returns std::nullopt for records that carry no event.
std::optional<ActivitySession> parseHookLogLine(const std::string &line);

// True for the event types that end a session turn ("stop", "subagent_stop").
bool isStopEventType(const std::string &eventType);

} // namespace ccmonitor
