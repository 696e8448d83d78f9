#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/models.hpp"

namespace daybreak {

constexpr auto kSessionGapThreshold = std::chrono::hours(2);

// Activity cached by the previous session: when it was last active and the
// tracker day it was on at that moment.
struct SessionGapInfo {
    TimePoint lastActiveTime;
    std::string currentDate;
};

struct ResetDecision {
    bool needed = false;
    ResetReason reason = ResetReason::None;
    std::string today;
};

// Decides whether a daily reset is due. Pure: the result depends only on the
// arguments. Rules are evaluated in order and the first match wins:
//   1. no readable lastResetDate                         -> bootstrap
//   2. >2h inactivity and the cached day is not today    -> session-gap
//   3. last reset yesterday, today's reset time passed   -> day-rolled
//   4. last reset older than yesterday, reset time passed -> catch-up
//   5. reset time changed after today's reset and passed -> time-changed
// A lastResetDate later than today never triggers a reset.
ResetDecision shouldReset(TimePoint now,
                          const std::string &timeZoneId,
                          const std::string &resetTime,
                          const ResetBookkeeping &bookkeeping,
                          const std::optional<SessionGapInfo> &session);

// The first reset instant strictly after 'now'.
std::optional<TimePoint> nextResetInstant(TimePoint now,
                                          const std::string &timeZoneId,
                                          const std::string &resetTime);

} // namespace daybreak
