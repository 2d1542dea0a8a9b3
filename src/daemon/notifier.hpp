#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <string>

#include "common/enums.hpp"

namespace ccmonitor {

// Fire-and-forget alert delivery. false means suppressed or not delivered.
class Notifier
{
public:
    virtual ~Notifier() = default;

    virtual bool sendTimeWarning(int minutesRemaining) = 0;
    virtual bool sendInactivityAlert(int minutesInactive) = 0;
    virtual bool sendErrorNotification(const std::string &message) = 0;
};

/**
 * DesktopNotifier posts freedesktop notifications through notify-send.
 *
 * Each notification kind has its own cooldown; a second notification of the
 * same kind inside the cooldown is dropped. A failed delivery does not start
 * the cooldown.
 */
class DesktopNotifier : public Notifier
{
public:
    explicit DesktopNotifier(std::chrono::seconds cooldown,
                             std::string program = "notify-send");

    bool sendTimeWarning(int minutesRemaining) override;
    bool sendInactivityAlert(int minutesInactive) override;
    bool sendErrorNotification(const std::string &message) override;

private:
    bool deliver(NotificationKind kind, const std::string &urgency,
                 const std::string &title, const std::string &body);
    bool inCooldown(NotificationKind kind,
                    std::chrono::steady_clock::time_point now) const;

    std::chrono::seconds m_cooldown;
    std::string m_program;

    std::mutex m_mutex;
    std::map<NotificationKind, std::chrono::steady_clock::time_point> m_lastSent;
};

} // namespace ccmonitor
