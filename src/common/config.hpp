#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace ccmonitor {

// Name of the single append-only activity log written by the editor hooks.
inline constexpr const char *kHookLogFileName = "claude_activity.log";

struct MonitorConfig {
    std::chrono::milliseconds fetchInterval{std::chrono::seconds(10)};
    int timeRemainingAlertMinutes = 30;
    int inactivityAlertMinutes = 10;
    std::chrono::seconds notificationCooldown{300};

    std::string ccusageCommand = "ccusage";
    std::chrono::seconds ccusageTimeout{30};
    int billingStartDay = 1;

    std::string hookLogDir = "/tmp/claude-monitor";
    std::string dataFilePath;
};

// $HOME/.config/claude-monitor/config.json
std::string defaultConfigPath();

// $HOME/.config/claude-monitor/monitoring_data.json
std::string defaultDataFilePath();

MonitorConfig defaultConfig();

// Fetch interval for a duration in seconds; fractions are kept to the
// millisecond. nullopt for negative or non-finite input.
std::optional<std::chrono::milliseconds> fetchIntervalFromSeconds(double seconds);

/**
 * Load the monitor configuration from a JSON file.
 *
 * A missing file yields the defaults. A malformed file yields the defaults and
 * logs a warning. Values outside their valid range are clamped and logged.
 */
MonitorConfig loadConfig(const std::string &path);

} // namespace ccmonitor
