#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/enums.hpp"

namespace daybreak {

using TimePoint = std::chrono::system_clock::time_point;

// Calendar dates are stored as "yyyy-MM-dd" strings throughout.

struct ChecklistTemplate {
    std::string id;
    std::string text;
    std::string category = "general";
    int order = 0;
    bool active = true;
};

struct CustomChecklistItem {
    std::string id;
    std::string text;
    std::string category = "general";
    int order = 0;
    bool recurring = false;
};

struct ChecklistItem {
    std::string id;
    std::string text;
    std::string category = "general";
    std::string date;
    bool completed = false;
    std::optional<TimePoint> completedAt;
    std::string templateId;
    int order = 0;
    bool isTemplate = false;
    bool isCustom = false;
    bool recurring = false;
    std::optional<TimePoint> createdAt;
    std::optional<TimePoint> updatedAt;
};

struct TodoItem {
    std::string id;
    std::string text;
    std::string date;
    bool completed = false;
    TodoPriority priority = TodoPriority::Medium;
    bool carryForward = true;
    std::string carriedFrom;
    int carryCount = 0;
    bool autoPromoted = false;
    std::optional<TimePoint> completedAt;
    std::optional<TimePoint> createdAt;
    std::optional<TimePoint> updatedAt;

    // Fields owned by other collaborators, kept verbatim on save.
    nlohmann::json extra = nlohmann::json::object();
};

struct Meeting {
    std::string id;
    std::string title;
    std::string time;
    std::string date;
    bool completed = false;
    std::optional<TimePoint> completedAt;
    std::string notes;
    std::optional<TimePoint> updatedAt;

    nlohmann::json extra = nlohmann::json::object();
};

struct ArchiveRecord {
    std::string id;
    std::string date;
    std::string type = "daily_archive";
    std::vector<ChecklistItem> checklist;
    TimePoint createdAt;
};

struct ResetHistoryEntry {
    std::string date;
    TimePoint timestamp;
    ResetType type = ResetType::Automatic;
    ResetReason reason = ResetReason::None;
};

struct ResetBookkeeping {
    std::string lastResetDate;
    std::optional<TimePoint> lastResetTimestamp;
    std::optional<TimePoint> resetTimeChangedAt;
    std::vector<ResetHistoryEntry> history;
};

struct SessionState {
    TimePoint lastActiveTime;
    std::string currentDate;
    std::string timeZone;
};

struct EngineSettings {
    std::string resetTime = "00:00";
    int dataRetentionDays = 30;
    bool autoReset = true;
};

struct PhaseOutcome {
    ResetPhase phase = ResetPhase::Idle;
    bool ok = true;
    int count = 0;
    int failures = 0;
    std::string error;
};

// Result of one reset executor run, phase by phase.
struct ResetReport {
    std::string date;
    TimePoint timestamp;
    ResetType type = ResetType::Automatic;
    ResetReason reason = ResetReason::None;
    std::string correlationId;
    std::vector<PhaseOutcome> phases;
    bool bookkeepingCommitted = false;

    const PhaseOutcome *outcome(ResetPhase phase) const
    {
        for (const auto &entry : phases) {
            if (entry.phase == phase) {
                return &entry;
            }
        }
        return nullptr;
    }

    bool hasFailures() const
    {
        for (const auto &entry : phases) {
            if (!entry.ok || entry.failures > 0) {
                return true;
            }
        }
        return false;
    }
};

struct ResetStats {
    std::string lastResetDate;
    std::optional<TimePoint> nextResetTime;
    std::size_t totalResets = 0;
    std::vector<ResetHistoryEntry> recentResets;
    std::string resetTime;
    bool isResetDue = false;
    ResetReason dueReason = ResetReason::None;
};

} // namespace daybreak
