#include "daemon/notifier.hpp"

#include <QProcess>
#include <QString>
#include <QStringList>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace ccmonitor {

namespace {

std::string kindName(NotificationKind kind)
{
    switch (kind) {
    case NotificationKind::TimeWarning:
        return "time_warning";
    case NotificationKind::Inactivity:
        return "inactivity";
    case NotificationKind::Error:
        return "error";
    }
    return "unknown";
}

} // namespace

DesktopNotifier::DesktopNotifier(std::chrono::seconds cooldown, std::string program)
    : m_cooldown(cooldown)
    , m_program(std::move(program))
{
}

bool DesktopNotifier::inCooldown(NotificationKind kind,
                                 std::chrono::steady_clock::time_point now) const
{
    const auto it = m_lastSent.find(kind);
    return it != m_lastSent.end() && now - it->second < m_cooldown;
}

bool DesktopNotifier::deliver(NotificationKind kind, const std::string &urgency,
                              const std::string &title, const std::string &body)
{
    const auto now = std::chrono::steady_clock::now();
    std::lock_guard<std::mutex> lock(m_mutex);

    if (inCooldown(kind, now)) {
        CMLOG_DEBUG(QStringLiteral("DesktopNotifier"),
                    QStringLiteral("deliver"),
                    QStringLiteral("notification_suppressed"),
                    QStringLiteral("cooldown"),
                    QStringLiteral("per_kind_window"),
                    ccmonitor::logging::defaultWho(),
                    QString(),
                    nlohmann::json{{"kind", kindName(kind)}});
        return false;
    }

    const QStringList arguments = {
        QStringLiteral("--app-name=ccmonitor"),
        QStringLiteral("--urgency=%1").arg(QString::fromStdString(urgency)),
        QString::fromStdString(title),
        QString::fromStdString(body),
    };

    const bool started =
        QProcess::startDetached(QString::fromStdString(m_program), arguments);

    // Only a delivered notification starts the cooldown.
    if (started) {
        m_lastSent[kind] = now;
    }

    CMLOG_INFO(QStringLiteral("DesktopNotifier"),
               QStringLiteral("deliver"),
               started ? QStringLiteral("notification_sent")
                       : QStringLiteral("notification_failed"),
               QStringLiteral("alert_condition"),
               QStringLiteral("notify_send"),
               ccmonitor::logging::defaultWho(),
               QString(),
               nlohmann::json{{"kind", kindName(kind)}, {"body", body}});
    return started;
}

bool DesktopNotifier::sendTimeWarning(int minutesRemaining)
{
    return deliver(NotificationKind::TimeWarning, "normal",
                   "Usage session ending soon",
                   std::to_string(minutesRemaining)
                       + " minutes left in the current usage session.");
}

bool DesktopNotifier::sendInactivityAlert(int minutesInactive)
{
    return deliver(NotificationKind::Inactivity, "low",
                   "Usage session idle",
                   "No new activity for about " + std::to_string(minutesInactive)
                       + " minutes.");
}

bool DesktopNotifier::sendErrorNotification(const std::string &message)
{
    return deliver(NotificationKind::Error, "critical",
                   "Usage monitor error", message);
}

} // namespace ccmonitor
