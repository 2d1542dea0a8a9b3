#include "daemon/session_activity_tracker.hpp"

#include <algorithm>
#include <set>
#include <system_error>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace ccmonitor {

namespace {

ActivitySession consolidate(std::vector<const ActivitySession *> events, TimePoint now)
{
    // Stable so that events sharing a timestamp keep their log order (last wins).
    std::stable_sort(events.begin(), events.end(),
                     [](const ActivitySession *a, const ActivitySession *b) {
                         return a->startTime < b->startTime;
                     });

    const ActivitySession &earliest = *events.front();
    const ActivitySession &latest = *events.back();

    ActivitySession merged;
    merged.sessionId = latest.sessionId;
    merged.projectName = latest.projectName;
    merged.metadata = latest.metadata;
    merged.eventType = latest.eventType;
    merged.startTime = earliest.startTime;

    for (auto it = events.rbegin(); it != events.rend(); ++it) {
        if ((*it)->endTime.has_value()) {
            merged.endTime = (*it)->endTime;
            break;
        }
    }

    if (latest.eventType.has_value() && isStopEventType(*latest.eventType)) {
        const auto age = now - latest.startTime;
        merged.status = age <= SessionActivityTracker::kWaitingForUserThreshold
            ? ActivitySessionStatus::WaitingForUser
            : ActivitySessionStatus::Inactive;
    } else {
        merged.status = latest.status;
    }

    return merged;
}

} // namespace

SessionActivityTracker::SessionActivityTracker(std::string hookLogDir,
                                               std::unique_ptr<ActivityEventParser> parser)
    : m_hookLogDir(std::move(hookLogDir))
    , m_parser(std::move(parser))
{
}

const std::string &SessionActivityTracker::hookLogDir() const
{
    return m_hookLogDir;
}

std::vector<std::string> SessionActivityTracker::discoverLogFiles() const
{
    std::vector<std::string> files;

    const std::filesystem::path candidate =
        std::filesystem::path(m_hookLogDir) / kHookLogFileName;
    std::error_code error;
    if (std::filesystem::is_regular_file(candidate, error)) {
        files.push_back(candidate.string());
    }
    return files;
}

bool SessionActivityTracker::updateFromLogFiles(TimePoint now)
{
    try {
        const std::vector<std::string> sources = discoverLogFiles();
        if (isCacheValid(sources)) {
            reinferStatuses(now);
            CMLOG_DEBUG(QStringLiteral("SessionActivityTracker"),
                        QStringLiteral("updateFromLogFiles"),
                        QStringLiteral("activity_cache_hit"),
                        QStringLiteral("activity_refresh"),
                        QStringLiteral("mtime_cache"),
                        ccmonitor::logging::defaultWho(),
                        QString(),
                        nlohmann::json{{"sources", sources.size()},
                                       {"sessions", m_sessions.size()}});
            return true;
        }

        std::vector<ActivitySession> events;
        for (const auto &source : sources) {
            auto parsed = processLogFile(source);
            events.insert(events.end(),
                          std::make_move_iterator(parsed.begin()),
                          std::make_move_iterator(parsed.end()));
        }

        m_sessions = mergeSessions(events, now);
        m_rawEvents = std::move(events);
        refreshCache(sources, now);
        cleanupOldSessions(now);

        CMLOG_INFO(QStringLiteral("SessionActivityTracker"),
                   QStringLiteral("updateFromLogFiles"),
                   QStringLiteral("activity_sessions_refreshed"),
                   QStringLiteral("activity_refresh"),
                   QStringLiteral("full_reparse"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"sources", sources.size()},
                                  {"events", m_rawEvents.size()},
                                  {"sessions", m_sessions.size()}});
        return true;
    } catch (const std::filesystem::filesystem_error &ex) {
        CMLOG_WARN(QStringLiteral("SessionActivityTracker"),
                   QStringLiteral("updateFromLogFiles"),
                   QStringLiteral("activity_refresh_failed"),
                   QStringLiteral("filesystem_error"),
                   QStringLiteral("full_reparse"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"error", ex.what()}});
        return false;
    }
}

// Status depends on the current time, so a cache hit merges the cached events
// again. Sessions dropped by cleanup stay dropped.
void SessionActivityTracker::reinferStatuses(TimePoint now)
{
    std::set<std::string> kept;
    for (const auto &session : m_sessions) {
        kept.insert(session.sessionId);
    }

    std::vector<ActivitySession> merged = mergeSessions(m_rawEvents, now);
    std::erase_if(merged, [&kept](const ActivitySession &session) {
        return !kept.contains(session.sessionId);
    });
    m_sessions = std::move(merged);
}

std::vector<ActivitySession> SessionActivityTracker::processLogFile(const std::string &path)
{
    try {
        return m_parser->parseLogFile(path);
    } catch (const ParseError &ex) {
        CMLOG_WARN(QStringLiteral("SessionActivityTracker"),
                   QStringLiteral("processLogFile"),
                   QStringLiteral("activity_log_unreadable"),
                   QStringLiteral("parse_error"),
                   QStringLiteral("skip_source"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"path", path}, {"error", ex.what()}});
        return {};
    }
}

std::vector<ActivitySession> SessionActivityTracker::mergeSessions(
    const std::vector<ActivitySession> &events, TimePoint now)
{
    std::vector<std::string> order;
    std::unordered_map<std::string, std::vector<const ActivitySession *>> groups;

    for (const auto &event : events) {
        auto &group = groups[event.sessionId];
        if (group.empty()) {
            order.push_back(event.sessionId);
        }
        group.push_back(&event);
    }

    std::vector<ActivitySession> merged;
    merged.reserve(order.size());
    for (const auto &sessionId : order) {
        merged.push_back(consolidate(groups.at(sessionId), now));
    }
    return merged;
}

void SessionActivityTracker::cleanupOldSessions(TimePoint now)
{
    const TimePoint cutoff = now - kRetentionWindow;
    const auto removed = std::erase_if(m_sessions, [cutoff](const ActivitySession &session) {
        return session.startTime < cutoff;
    });

    if (removed > 0) {
        CMLOG_INFO(QStringLiteral("SessionActivityTracker"),
                   QStringLiteral("cleanupOldSessions"),
                   QStringLiteral("activity_sessions_expired"),
                   QStringLiteral("retention_window"),
                   QStringLiteral("start_time_filter"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"removed", removed},
                                  {"remaining", m_sessions.size()}});
    }
}

void SessionActivityTracker::cleanupCompletedBillingSessions(TimePoint now)
{
    const TimePoint cutoff = now - kBillingWindow;
    const auto removed = std::erase_if(m_sessions, [cutoff](const ActivitySession &session) {
        return session.startTime < cutoff;
    });

    // Only a fully closed billing window may destroy log evidence.
    if (m_sessions.empty()) {
        const std::size_t skipped = truncateLogFiles();
        resetCache();

        CMLOG_INFO(QStringLiteral("SessionActivityTracker"),
                   QStringLiteral("cleanupCompletedBillingSessions"),
                   QStringLiteral("billing_window_closed"),
                   QStringLiteral("billing_window"),
                   QStringLiteral("truncate_log"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"removed", removed},
                                  {"skippedSources", skipped},
                                  {"cutoff", toIso8601Utc(cutoff)}});
        return;
    }

    if (removed > 0) {
        CMLOG_INFO(QStringLiteral("SessionActivityTracker"),
                   QStringLiteral("cleanupCompletedBillingSessions"),
                   QStringLiteral("billing_sessions_removed"),
                   QStringLiteral("billing_window"),
                   QStringLiteral("keep_log"),
                   ccmonitor::logging::defaultWho(),
                   QString(),
                   nlohmann::json{{"removed", removed},
                                  {"remaining", m_sessions.size()}});
    }
}

std::size_t SessionActivityTracker::truncateLogFiles()
{
    std::size_t skipped = 0;
    for (const auto &source : discoverLogFiles()) {
        std::error_code error;
        if (m_lastCacheRefresh.has_value()) {
            // Events appended since the last parse have not been seen yet.
            const auto current = std::filesystem::last_write_time(source, error);
            const auto cached = m_fileModificationTimes.find(source);
            if (error || cached == m_fileModificationTimes.end()
                || cached->second != current) {
                CMLOG_INFO(QStringLiteral("SessionActivityTracker"),
                           QStringLiteral("truncateLogFiles"),
                           QStringLiteral("activity_log_changed_since_parse"),
                           QStringLiteral("billing_window"),
                           QStringLiteral("keep_log"),
                           ccmonitor::logging::defaultWho(),
                           QString(),
                           nlohmann::json{{"path", source}});
                ++skipped;
                continue;
            }
        }

        std::filesystem::resize_file(source, 0, error);
        if (error) {
            CMLOG_WARN(QStringLiteral("SessionActivityTracker"),
                       QStringLiteral("truncateLogFiles"),
                       QStringLiteral("activity_log_truncate_failed"),
                       QStringLiteral("billing_window"),
                       QStringLiteral("resize_file"),
                       ccmonitor::logging::defaultWho(),
                       QString(),
                       nlohmann::json{{"path", source}, {"error", error.message()}});
        }
    }
    return skipped;
}

void SessionActivityTracker::resetCache()
{
    m_rawEvents.clear();
    m_fileModificationTimes.clear();
    m_lastCacheRefresh.reset();
}

const std::vector<ActivitySession> &SessionActivityTracker::activeSessions() const
{
    return m_sessions;
}

std::vector<ActivitySession> SessionActivityTracker::sessionsForPeriod(
    TimePoint start, TimePoint end, TimePoint now) const
{
    std::vector<ActivitySession> result;
    for (const auto &session : m_sessions) {
        const TimePoint sessionEnd = session.endTime.value_or(now);
        if (session.startTime <= end && sessionEnd >= start) {
            result.push_back(session);
        }
    }
    return result;
}

std::optional<ActivitySession> SessionActivityTracker::sessionById(
    const std::string &sessionId) const
{
    auto it = std::find_if(m_sessions.begin(), m_sessions.end(),
                           [&sessionId](const ActivitySession &session) {
                               return session.sessionId == sessionId;
                           });
    if (it == m_sessions.end()) {
        return std::nullopt;
    }
    return *it;
}

bool SessionActivityTracker::isCacheValid(const std::vector<std::string> &sources) const
{
    if (!m_lastCacheRefresh.has_value()) {
        return false;
    }

    for (const auto &source : sources) {
        std::error_code error;
        const auto current = std::filesystem::last_write_time(source, error);
        if (error) {
            return false;
        }
        auto it = m_fileModificationTimes.find(source);
        if (it == m_fileModificationTimes.end() || it->second != current) {
            return false;
        }
    }
    return true;
}

void SessionActivityTracker::refreshCache(const std::vector<std::string> &sources,
                                          TimePoint now)
{
    m_fileModificationTimes.clear();
    for (const auto &source : sources) {
        std::error_code error;
        const auto modified = std::filesystem::last_write_time(source, error);
        if (!error) {
            m_fileModificationTimes[source] = modified;
        }
    }
    m_lastCacheRefresh = now;
}

std::size_t SessionActivityTracker::cachedSourceCount() const
{
    return m_fileModificationTimes.size();
}

std::optional<TimePoint> SessionActivityTracker::lastCacheRefresh() const
{
    return m_lastCacheRefresh;
}

} // namespace ccmonitor
