#pragma once

#include <string>

#include "common/clock.hpp"
#include "daemon/document_store.hpp"

namespace daybreak {

// DayArchiver snapshots a day's completed checklist into the journals store
// before the checklist is regenerated. One record per day, never rewritten.
class DayArchiver {
public:
    DayArchiver(DocumentStore &store, const Clock &clock);

    // Returns the number of items archived (0 when the day had no completed
    // items or was already archived).
    int archive(const std::string &day, int *failures = nullptr);

    static std::string archiveId(const std::string &day);

    // The day a reset run archives: the last reset date when it precedes
    // today, otherwise yesterday.
    static std::string archiveDayFor(const std::string &lastResetDate,
                                     const std::string &today);

private:
    DocumentStore &m_store;
    const Clock &m_clock;
};

} // namespace daybreak
