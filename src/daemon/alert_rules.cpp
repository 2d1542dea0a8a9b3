#include "daemon/alert_rules.hpp"

#include <chrono>

namespace ccmonitor {

int AlertRules::minutesUntil(TimePoint end, TimePoint now)
{
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::minutes>(end - now).count());
}

int AlertRules::minutesSince(TimePoint start, TimePoint now)
{
    return static_cast<int>(
        std::chrono::duration_cast<std::chrono::minutes>(now - start).count());
}

bool AlertRules::shouldSendTimeWarning(int minutesRemaining, int thresholdMinutes)
{
    return minutesRemaining > 0 && minutesRemaining <= thresholdMinutes;
}

bool AlertRules::shouldSendInactivityAlert(int minutesSinceStart, int intervalMinutes)
{
    if (intervalMinutes <= 0) {
        return false;
    }
    if (minutesSinceStart < kLongRunningMinutes) {
        return false;
    }
    if (minutesSinceStart % intervalMinutes != 0) {
        return false;
    }
    return minutesSinceStart >= intervalMinutes * kInactivityGateIntervals;
}

int AlertRules::inactivityMinutes(int minutesSinceStart)
{
    return minutesSinceStart - kLongRunningMinutes;
}

bool AlertRules::shouldSendErrorNotification(int consecutiveFailures)
{
    return consecutiveFailures > kErrorNotificationThreshold;
}

} // namespace ccmonitor
