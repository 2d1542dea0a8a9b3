#pragma once

namespace ccmonitor {

enum class ActivitySessionStatus {
    Active,
    WaitingForUser,
    Idle,
    Inactive,
    Stopped
};

enum class NotificationKind {
    TimeWarning,
    Inactivity,
    Error
};

} // namespace ccmonitor
