#include "common/config.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace ccmonitor {

namespace {

std::filesystem::path configDir()
{
    const char *home = std::getenv("HOME");
    std::filesystem::path base = home ? home : ".";
    return base / ".config/claude-monitor";
}

void warnClamped(const std::string &key, const nlohmann::json &given,
                 const nlohmann::json &used)
{
    CMLOG_WARN(QStringLiteral("Config"),
               QStringLiteral("loadConfig"),
               QStringLiteral("config_value_clamped"),
               QStringLiteral("out_of_range"),
               QStringLiteral("clamp"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json{{"key", key}, {"given", given}, {"used", used}});
}

int clampInt(const nlohmann::json &j, const std::string &key, int fallback,
             int low, int high)
{
    const int value = j.value(key, fallback);
    const int clamped = std::clamp(value, low, high);
    if (clamped != value) {
        warnClamped(key, value, clamped);
    }
    return clamped;
}

void applyJson(const nlohmann::json &j, MonitorConfig &config)
{
    const double intervalSeconds = j.value(
        "ccusage_fetch_interval_seconds",
        std::chrono::duration<double>(config.fetchInterval).count());
    if (const auto interval = fetchIntervalFromSeconds(intervalSeconds)) {
        config.fetchInterval = *interval;
    } else {
        warnClamped("ccusage_fetch_interval_seconds", intervalSeconds, 0);
        config.fetchInterval = std::chrono::milliseconds(0);
    }

    config.timeRemainingAlertMinutes = clampInt(
        j, "time_remaining_alert_minutes", config.timeRemainingAlertMinutes, 0, 300);
    config.inactivityAlertMinutes = clampInt(
        j, "inactivity_alert_minutes", config.inactivityAlertMinutes, 1, 1440);
    config.notificationCooldown = std::chrono::seconds(clampInt(
        j, "notification_cooldown_seconds",
        static_cast<int>(config.notificationCooldown.count()), 0, 86400));
    config.ccusageTimeout = std::chrono::seconds(clampInt(
        j, "ccusage_timeout_seconds",
        static_cast<int>(config.ccusageTimeout.count()), 1, 600));
    config.billingStartDay =
        clampInt(j, "billing_start_day", config.billingStartDay, 1, 28);

    config.ccusageCommand = j.value("ccusage_command", config.ccusageCommand);
    config.hookLogDir = j.value("hook_log_dir", config.hookLogDir);
    config.dataFilePath = j.value("data_file_path", config.dataFilePath);
}

} // namespace

std::string defaultConfigPath()
{
    return (configDir() / "config.json").string();
}

std::string defaultDataFilePath()
{
    return (configDir() / "monitoring_data.json").string();
}

MonitorConfig defaultConfig()
{
    MonitorConfig config;
    config.dataFilePath = defaultDataFilePath();
    return config;
}

std::optional<std::chrono::milliseconds> fetchIntervalFromSeconds(double seconds)
{
    if (!std::isfinite(seconds) || seconds < 0.0) {
        return std::nullopt;
    }
    return std::chrono::milliseconds(static_cast<long long>(std::llround(seconds * 1000.0)));
}

MonitorConfig loadConfig(const std::string &path)
{
    MonitorConfig config = defaultConfig();

    std::ifstream file(path);
    if (!file.is_open()) {
        CMLOG_INFO(QStringLiteral("Config"),
                   QStringLiteral("loadConfig"),
                   QStringLiteral("config_defaults"),
                   QStringLiteral("config_missing"),
                   QStringLiteral("builtin_defaults"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path}});
        return config;
    }

    try {
        const nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_object()) {
            throw std::runtime_error("config root is not an object");
        }
        applyJson(j, config);
    } catch (const std::exception &ex) {
        CMLOG_WARN(QStringLiteral("Config"),
                   QStringLiteral("loadConfig"),
                   QStringLiteral("config_malformed"),
                   QStringLiteral("parse_error"),
                   QStringLiteral("builtin_defaults"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path}, {"error", ex.what()}});
        return defaultConfig();
    }

    return config;
}

} // namespace ccmonitor
