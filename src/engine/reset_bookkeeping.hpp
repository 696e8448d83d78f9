#pragma once

#include <cstddef>
#include <string>

#include "common/models.hpp"
#include "daemon/document_store.hpp"

namespace daybreak {

constexpr std::size_t kMaxResetHistory = 30;

// Reads the single bookkeeping record. A missing or unreadable record yields
// an empty one (no lastResetDate), which the decision engine treats as a
// bootstrap. Records written under the older per-key layout
// (last_reset_date, last_reset_timestamp, reset_history) are imported.
// Store failures propagate as std::runtime_error.
ResetBookkeeping loadBookkeeping(const DocumentStore &store);

void saveBookkeeping(DocumentStore &store, const ResetBookkeeping &bookkeeping);

// Moves lastResetDate forward to 'date' (never backward), stamps the reset
// time and appends one history entry, keeping the newest kMaxResetHistory.
void recordReset(ResetBookkeeping &bookkeeping,
                 const std::string &date,
                 TimePoint timestamp,
                 ResetType type,
                 ResetReason reason);

} // namespace daybreak
