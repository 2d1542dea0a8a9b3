#pragma once

#include "common/models.hpp"

namespace ccmonitor {

class AlertRules
{
public:
    static constexpr int kErrorNotificationThreshold = 5;
    static constexpr int kLongRunningMinutes = 60;
    static constexpr int kInactivityGateIntervals = 6;

    // Whole minutes, truncated toward zero.
    static int minutesUntil(TimePoint end, TimePoint now);
    static int minutesSince(TimePoint start, TimePoint now);

    // 0 < minutesRemaining <= threshold
    static bool shouldSendTimeWarning(int minutesRemaining, int thresholdMinutes);

    // Session start is the only activity signal available, so a long-running
    // session is treated as possibly inactive. Fires on exact multiples of the
    // interval once the session is an hour old and six intervals have elapsed.
    static bool shouldSendInactivityAlert(int minutesSinceStart, int intervalMinutes);
    static int inactivityMinutes(int minutesSinceStart);

    static bool shouldSendErrorNotification(int consecutiveFailures);
};

} // namespace ccmonitor
