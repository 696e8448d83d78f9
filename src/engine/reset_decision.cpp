#include "engine/reset_decision.hpp"

#include "common/time_utils.hpp"

namespace daybreak {

namespace {

ResetDecision needed(ResetReason reason, const std::string &today)
{
    return ResetDecision{true, reason, today};
}

} // namespace

ResetDecision shouldReset(TimePoint now,
                          const std::string &timeZoneId,
                          const std::string &resetTime,
                          const ResetBookkeeping &bookkeeping,
                          const std::optional<SessionGapInfo> &session)
{
    const std::string today = localDateString(now, timeZoneId);
    const auto todayReset = resetDateTime(today, resetTime, timeZoneId);

    // Unreadable bookkeeping counts as a first run.
    const auto staleDays = daysBetween(bookkeeping.lastResetDate, today);
    if (!staleDays.has_value() || !todayReset.has_value()) {
        return needed(ResetReason::Bootstrap, today);
    }

    if (*staleDays < 0) {
        return ResetDecision{false, ResetReason::None, today};
    }

    if (session.has_value() && *staleDays > 0
        && now - session->lastActiveTime > kSessionGapThreshold
        && session->currentDate != today) {
        return needed(ResetReason::SessionGap, today);
    }

    const bool resetTimePassed = now >= *todayReset;

    if (*staleDays == 1 && resetTimePassed) {
        return needed(ResetReason::DayRolled, today);
    }

    if (*staleDays > 1 && resetTimePassed) {
        return needed(ResetReason::CatchUp, today);
    }

    if (*staleDays == 0 && resetTimePassed
        && bookkeeping.lastResetTimestamp.has_value()
        && bookkeeping.resetTimeChangedAt.has_value()
        && *bookkeeping.resetTimeChangedAt > *bookkeeping.lastResetTimestamp
        && *bookkeeping.lastResetTimestamp < *todayReset) {
        return needed(ResetReason::TimeChanged, today);
    }

    return ResetDecision{false, ResetReason::None, today};
}

std::optional<TimePoint> nextResetInstant(TimePoint now,
                                          const std::string &timeZoneId,
                                          const std::string &resetTime)
{
    const std::string today = localDateString(now, timeZoneId);
    const auto todayReset = resetDateTime(today, resetTime, timeZoneId);
    if (todayReset.has_value() && now < *todayReset) {
        return todayReset;
    }
    return resetDateTime(addDays(today, 1), resetTime, timeZoneId);
}

} // namespace daybreak
