#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "common/models.hpp"
#include "daemon/hook_log_parser.hpp"

namespace ccmonitor {

/**
 * SessionActivityTracker turns the editor hook log into one consolidated
 * ActivitySession per session id and decides when sessions (and the log that
 * backs them) may be discarded.
 *
 * - discovery of the configured log source(s)
 * - re-parse only when a source's modification time changed
 * - merge of raw events into one session with an inferred status
 * - 30 day retention cleanup and 5 hour billing-window cleanup
 *
 * Not thread-safe. The daemon worker is the only writer and the only reader.
 */
class SessionActivityTracker
{
public:
    static constexpr auto kRetentionWindow = std::chrono::hours(24 * 30);
    static constexpr auto kBillingWindow = std::chrono::hours(5);
    static constexpr auto kWaitingForUserThreshold = std::chrono::seconds(60);

    explicit SessionActivityTracker(
        std::string hookLogDir,
        std::unique_ptr<ActivityEventParser> parser = std::make_unique<HookLogParser>());

    // Existing log sources. Missing sources are skipped.
    std::vector<std::string> discoverLogFiles() const;

    // Re-reads the log sources when the cache is stale, then merges and applies
    // retention. Returns false only on an unexpected filesystem error.
    bool updateFromLogFiles(TimePoint now = std::chrono::system_clock::now());

    // Consolidate raw events into exactly one session per session id.
    static std::vector<ActivitySession> mergeSessions(
        const std::vector<ActivitySession> &events,
        TimePoint now = std::chrono::system_clock::now());

    void cleanupOldSessions(TimePoint now = std::chrono::system_clock::now());

    // Drops sessions that started before the billing window. When nothing is
    // left the log sources are truncated and the cache is reset. A source
    // written after the last parse is left alone.
    void cleanupCompletedBillingSessions(TimePoint now = std::chrono::system_clock::now());

    const std::vector<ActivitySession> &activeSessions() const;
    std::vector<ActivitySession> sessionsForPeriod(
        TimePoint start, TimePoint end,
        TimePoint now = std::chrono::system_clock::now()) const;
    std::optional<ActivitySession> sessionById(const std::string &sessionId) const;

    // Cache state; valid only when every source's mtime matches and a refresh happened.
    bool isCacheValid(const std::vector<std::string> &sources) const;
    void refreshCache(const std::vector<std::string> &sources,
                      TimePoint now = std::chrono::system_clock::now());
    std::size_t cachedSourceCount() const;
    std::optional<TimePoint> lastCacheRefresh() const;

    const std::string &hookLogDir() const;

private:
    std::vector<ActivitySession> processLogFile(const std::string &path);
    void reinferStatuses(TimePoint now);
    // Returns the number of sources left untouched.
    std::size_t truncateLogFiles();
    void resetCache();

    std::string m_hookLogDir;
    std::unique_ptr<ActivityEventParser> m_parser;

    std::vector<ActivitySession> m_sessions;
    // Parsed events behind m_sessions, from the last full parse.
    std::vector<ActivitySession> m_rawEvents;

    std::map<std::string, std::filesystem::file_time_type> m_fileModificationTimes;
    std::optional<TimePoint> m_lastCacheRefresh;
};

} // namespace ccmonitor
