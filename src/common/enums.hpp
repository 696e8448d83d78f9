#pragma once

namespace daybreak {

enum class TodoPriority {
    Low,
    Medium,
    High
};

enum class ResetType {
    Automatic,
    Manual
};

enum class ResetReason {
    None,
    Bootstrap,
    SessionGap,
    DayRolled,
    CatchUp,
    TimeChanged,
    Manual
};

enum class ResetPhase {
    Idle,
    Archiving,
    ChecklistMaterialization,
    TodoCarryforward,
    MeetingReset,
    RetentionCleanup,
    BookkeepingUpdate,
    NotifyComplete
};

enum class ResetTrigger {
    Startup,
    Interval,
    PreciseTimer,
    Visibility,
    Focus,
    TimezoneChange,
    Manual
};

} // namespace daybreak
