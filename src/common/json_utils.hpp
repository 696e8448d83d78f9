#pragma once

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"
#include "common/time_utils.hpp"

namespace daybreak {

inline nlohmann::json optionalTimestampToJson(const std::optional<TimePoint> &value)
{
    if (!value.has_value()) {
        return nullptr;
    }
    return toIso8601Utc(*value);
}

inline std::optional<TimePoint> optionalTimestampFromJson(const nlohmann::json &j,
                                                          const char *key)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return parseIso8601Utc(it->get<std::string>());
}

// Records written by other collaborators may carry nulls where a string is
// expected; treat those like missing keys.
inline std::string stringField(const nlohmann::json &j, const char *key,
                               const std::string &fallback = {})
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

inline bool boolField(const nlohmann::json &j, const char *key, bool fallback)
{
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

// Integers outside the int range are clamped; fractional numbers are
// truncated, and ones that do not fit an int read as 'fallback'.
inline int intField(const nlohmann::json &j, const char *key, int fallback)
{
    constexpr int kMin = std::numeric_limits<int>::min();
    constexpr int kMax = std::numeric_limits<int>::max();

    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return fallback;
    }
    if (it->is_number_unsigned()) {
        const std::uint64_t value = it->get<std::uint64_t>();
        return value > static_cast<std::uint64_t>(kMax) ? kMax : static_cast<int>(value);
    }
    if (it->is_number_integer()) {
        const std::int64_t value = it->get<std::int64_t>();
        return static_cast<int>(std::clamp<std::int64_t>(value, kMin, kMax));
    }
    const double value = it->get<double>();
    if (!std::isfinite(value) || value < static_cast<double>(kMin)
        || value > static_cast<double>(kMax)) {
        return fallback;
    }
    return static_cast<int>(value);
}

inline std::string toPriorityString(TodoPriority priority)
{
    switch (priority) {
    case TodoPriority::Low:
        return "low";
    case TodoPriority::Medium:
        return "medium";
    case TodoPriority::High:
        return "high";
    }
    return "medium";
}

inline TodoPriority parsePriorityString(const std::string &value)
{
    if (value == "low") {
        return TodoPriority::Low;
    }
    if (value == "high") {
        return TodoPriority::High;
    }
    return TodoPriority::Medium;
}

inline std::string toResetTypeString(ResetType type)
{
    switch (type) {
    case ResetType::Automatic:
        return "automatic";
    case ResetType::Manual:
        return "manual";
    }
    return "automatic";
}

inline ResetType parseResetTypeString(const std::string &value)
{
    if (value == "manual") {
        return ResetType::Manual;
    }
    return ResetType::Automatic;
}

inline std::string toResetReasonString(ResetReason reason)
{
    switch (reason) {
    case ResetReason::None:
        return "none";
    case ResetReason::Bootstrap:
        return "bootstrap";
    case ResetReason::SessionGap:
        return "session-gap";
    case ResetReason::DayRolled:
        return "day-rolled";
    case ResetReason::CatchUp:
        return "catch-up";
    case ResetReason::TimeChanged:
        return "time-changed";
    case ResetReason::Manual:
        return "manual";
    }
    return "none";
}

inline ResetReason parseResetReasonString(const std::string &value)
{
    if (value == "bootstrap") {
        return ResetReason::Bootstrap;
    }
    if (value == "session-gap") {
        return ResetReason::SessionGap;
    }
    if (value == "day-rolled") {
        return ResetReason::DayRolled;
    }
    if (value == "catch-up") {
        return ResetReason::CatchUp;
    }
    if (value == "time-changed") {
        return ResetReason::TimeChanged;
    }
    if (value == "manual") {
        return ResetReason::Manual;
    }
    return ResetReason::None;
}

inline std::string toResetPhaseString(ResetPhase phase)
{
    switch (phase) {
    case ResetPhase::Idle:
        return "idle";
    case ResetPhase::Archiving:
        return "archiving";
    case ResetPhase::ChecklistMaterialization:
        return "checklist_materialization";
    case ResetPhase::TodoCarryforward:
        return "todo_carryforward";
    case ResetPhase::MeetingReset:
        return "meeting_reset";
    case ResetPhase::RetentionCleanup:
        return "retention_cleanup";
    case ResetPhase::BookkeepingUpdate:
        return "bookkeeping_update";
    case ResetPhase::NotifyComplete:
        return "notify_complete";
    }
    return "idle";
}

inline std::string toResetTriggerString(ResetTrigger trigger)
{
    switch (trigger) {
    case ResetTrigger::Startup:
        return "startup";
    case ResetTrigger::Interval:
        return "interval";
    case ResetTrigger::PreciseTimer:
        return "precise_timer";
    case ResetTrigger::Visibility:
        return "visibility";
    case ResetTrigger::Focus:
        return "focus";
    case ResetTrigger::TimezoneChange:
        return "timezone_change";
    case ResetTrigger::Manual:
        return "manual";
    }
    return "interval";
}

inline void to_json(nlohmann::json &j, const TodoPriority &priority)
{
    j = toPriorityString(priority);
}

inline void from_json(const nlohmann::json &j, TodoPriority &priority)
{
    if (j.is_string()) {
        priority = parsePriorityString(j.get<std::string>());
    } else {
        priority = TodoPriority::Medium;
    }
}

inline void to_json(nlohmann::json &j, const ChecklistTemplate &item)
{
    j = nlohmann::json{
        {"id", item.id},
        {"text", item.text},
        {"category", item.category},
        {"order", item.order},
        {"active", item.active},
        {"isTemplate", true}
    };
}

inline void from_json(const nlohmann::json &j, ChecklistTemplate &item)
{
    item.id = stringField(j, "id");
    item.text = stringField(j, "text");
    item.category = stringField(j, "category", "general");
    if (item.category.empty()) {
        item.category = "general";
    }
    item.order = intField(j, "order", 0);
    item.active = boolField(j, "active", true);
}

inline void to_json(nlohmann::json &j, const CustomChecklistItem &item)
{
    j = nlohmann::json{
        {"id", item.id},
        {"text", item.text},
        {"category", item.category},
        {"order", item.order},
        {"recurring", item.recurring}
    };
}

inline void from_json(const nlohmann::json &j, CustomChecklistItem &item)
{
    item.id = stringField(j, "id");
    item.text = stringField(j, "text");
    item.category = stringField(j, "category", "general");
    if (item.category.empty()) {
        item.category = "general";
    }
    item.order = intField(j, "order", 0);
    item.recurring = boolField(j, "recurring", false);
}

inline void to_json(nlohmann::json &j, const ChecklistItem &item)
{
    j = nlohmann::json{
        {"id", item.id},
        {"text", item.text},
        {"category", item.category},
        {"date", item.date},
        {"completed", item.completed},
        {"completedAt", optionalTimestampToJson(item.completedAt)},
        {"order", item.order},
        {"isTemplate", item.isTemplate},
        {"isCustom", item.isCustom},
        {"recurring", item.recurring},
        {"createdAt", optionalTimestampToJson(item.createdAt)},
        {"updatedAt", optionalTimestampToJson(item.updatedAt)}
    };
    if (!item.templateId.empty()) {
        j["templateId"] = item.templateId;
    }
}

inline void from_json(const nlohmann::json &j, ChecklistItem &item)
{
    item.id = stringField(j, "id");
    item.text = stringField(j, "text");
    item.category = stringField(j, "category", "general");
    item.date = stringField(j, "date");
    item.completed = boolField(j, "completed", false);
    item.completedAt = optionalTimestampFromJson(j, "completedAt");
    item.templateId = stringField(j, "templateId");
    item.order = intField(j, "order", 0);
    item.isTemplate = boolField(j, "isTemplate", false);
    item.isCustom = boolField(j, "isCustom", false);
    item.recurring = boolField(j, "recurring", false);
    item.createdAt = optionalTimestampFromJson(j, "createdAt");
    item.updatedAt = optionalTimestampFromJson(j, "updatedAt");
}

inline void to_json(nlohmann::json &j, const TodoItem &todo)
{
    j = todo.extra.is_object() ? todo.extra : nlohmann::json::object();
    j["id"] = todo.id;
    j["text"] = todo.text;
    j["date"] = todo.date;
    j["completed"] = todo.completed;
    j["priority"] = todo.priority;
    j["carryForward"] = todo.carryForward;
    j["carriedFrom"] = todo.carriedFrom.empty()
        ? nlohmann::json(nullptr)
        : nlohmann::json(todo.carriedFrom);
    j["carryCount"] = todo.carryCount;
    j["autoPromoted"] = todo.autoPromoted;
    j["completedAt"] = optionalTimestampToJson(todo.completedAt);
    j["createdAt"] = optionalTimestampToJson(todo.createdAt);
    j["updatedAt"] = optionalTimestampToJson(todo.updatedAt);
}

inline void from_json(const nlohmann::json &j, TodoItem &todo)
{
    todo.extra = j.is_object() ? j : nlohmann::json::object();
    todo.id = stringField(j, "id");
    todo.text = stringField(j, "text");
    todo.date = stringField(j, "date");
    todo.completed = boolField(j, "completed", false);
    if (j.contains("priority")) {
        todo.priority = j.at("priority").get<TodoPriority>();
    } else {
        todo.priority = TodoPriority::Medium;
    }
    todo.carryForward = boolField(j, "carryForward", true);
    todo.carriedFrom = stringField(j, "carriedFrom");
    todo.carryCount = intField(j, "carryCount", 0);
    todo.autoPromoted = boolField(j, "autoPromoted", false);
    todo.completedAt = optionalTimestampFromJson(j, "completedAt");
    todo.createdAt = optionalTimestampFromJson(j, "createdAt");
    todo.updatedAt = optionalTimestampFromJson(j, "updatedAt");
}

inline void to_json(nlohmann::json &j, const Meeting &meeting)
{
    j = meeting.extra.is_object() ? meeting.extra : nlohmann::json::object();
    j["id"] = meeting.id;
    j["title"] = meeting.title;
    j["time"] = meeting.time;
    j["date"] = meeting.date;
    j["completed"] = meeting.completed;
    j["completedAt"] = optionalTimestampToJson(meeting.completedAt);
    j["notes"] = meeting.notes;
    j["updatedAt"] = optionalTimestampToJson(meeting.updatedAt);
}

inline void from_json(const nlohmann::json &j, Meeting &meeting)
{
    meeting.extra = j.is_object() ? j : nlohmann::json::object();
    meeting.id = stringField(j, "id");
    meeting.title = stringField(j, "title");
    meeting.time = stringField(j, "time");
    meeting.date = stringField(j, "date");
    meeting.completed = boolField(j, "completed", false);
    meeting.completedAt = optionalTimestampFromJson(j, "completedAt");
    meeting.notes = stringField(j, "notes");
    meeting.updatedAt = optionalTimestampFromJson(j, "updatedAt");
}

inline void to_json(nlohmann::json &j, const ArchiveRecord &record)
{
    j = nlohmann::json{
        {"id", record.id},
        {"date", record.date},
        {"type", record.type},
        {"checklist", record.checklist},
        {"createdAt", toIso8601Utc(record.createdAt)}
    };
}

inline void from_json(const nlohmann::json &j, ArchiveRecord &record)
{
    record.id = stringField(j, "id");
    record.date = stringField(j, "date");
    record.type = stringField(j, "type", "daily_archive");
    if (j.contains("checklist") && j.at("checklist").is_array()) {
        record.checklist = j.at("checklist").get<std::vector<ChecklistItem>>();
    } else {
        record.checklist.clear();
    }
    record.createdAt = optionalTimestampFromJson(j, "createdAt").value_or(TimePoint{});
}

inline void to_json(nlohmann::json &j, const ResetHistoryEntry &entry)
{
    j = nlohmann::json{
        {"date", entry.date},
        {"timestamp", toIso8601Utc(entry.timestamp)},
        {"type", toResetTypeString(entry.type)},
        {"reason", toResetReasonString(entry.reason)}
    };
}

inline void from_json(const nlohmann::json &j, ResetHistoryEntry &entry)
{
    entry.date = stringField(j, "date");
    entry.timestamp = optionalTimestampFromJson(j, "timestamp").value_or(TimePoint{});
    entry.type = parseResetTypeString(stringField(j, "type", "automatic"));
    entry.reason = parseResetReasonString(stringField(j, "reason", "none"));
}

inline void to_json(nlohmann::json &j, const ResetBookkeeping &bookkeeping)
{
    j = nlohmann::json{
        {"lastResetDate", bookkeeping.lastResetDate.empty()
                              ? nlohmann::json(nullptr)
                              : nlohmann::json(bookkeeping.lastResetDate)},
        {"lastResetTimestamp", optionalTimestampToJson(bookkeeping.lastResetTimestamp)},
        {"resetTimeChangedAt", optionalTimestampToJson(bookkeeping.resetTimeChangedAt)},
        {"history", bookkeeping.history}
    };
}

inline void from_json(const nlohmann::json &j, ResetBookkeeping &bookkeeping)
{
    bookkeeping.lastResetDate = stringField(j, "lastResetDate");
    bookkeeping.lastResetTimestamp = optionalTimestampFromJson(j, "lastResetTimestamp");
    bookkeeping.resetTimeChangedAt = optionalTimestampFromJson(j, "resetTimeChangedAt");
    if (j.contains("history") && j.at("history").is_array()) {
        bookkeeping.history = j.at("history").get<std::vector<ResetHistoryEntry>>();
    } else {
        bookkeeping.history.clear();
    }
}

inline void to_json(nlohmann::json &j, const SessionState &state)
{
    j = nlohmann::json{
        {"lastActiveTime", toIso8601Utc(state.lastActiveTime)},
        {"currentDate", state.currentDate},
        {"timeZone", state.timeZone}
    };
}

inline void from_json(const nlohmann::json &j, SessionState &state)
{
    state.lastActiveTime = optionalTimestampFromJson(j, "lastActiveTime").value_or(TimePoint{});
    state.currentDate = stringField(j, "currentDate");
    state.timeZone = stringField(j, "timeZone");
}

inline void to_json(nlohmann::json &j, const PhaseOutcome &outcome)
{
    j = nlohmann::json{
        {"phase", toResetPhaseString(outcome.phase)},
        {"ok", outcome.ok},
        {"count", outcome.count},
        {"failures", outcome.failures}
    };
    if (!outcome.error.empty()) {
        j["error"] = outcome.error;
    }
}

inline void to_json(nlohmann::json &j, const ResetReport &report)
{
    j = nlohmann::json{
        {"date", report.date},
        {"timestamp", toIso8601Utc(report.timestamp)},
        {"type", toResetTypeString(report.type)},
        {"reason", toResetReasonString(report.reason)},
        {"corr", report.correlationId},
        {"phases", report.phases},
        {"bookkeepingCommitted", report.bookkeepingCommitted}
    };
}

inline void to_json(nlohmann::json &j, const ResetStats &stats)
{
    j = nlohmann::json{
        {"lastResetDate", stats.lastResetDate.empty()
                              ? nlohmann::json(nullptr)
                              : nlohmann::json(stats.lastResetDate)},
        {"nextResetTime", optionalTimestampToJson(stats.nextResetTime)},
        {"totalResets", stats.totalResets},
        {"recentResets", stats.recentResets},
        {"resetTime", stats.resetTime},
        {"isResetDue", stats.isResetDue},
        {"dueReason", toResetReasonString(stats.dueReason)}
    };
}

} // namespace daybreak
