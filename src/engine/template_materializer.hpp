#pragma once

#include <string>

#include "common/clock.hpp"
#include "daemon/document_store.hpp"

namespace daybreak {

// TemplateMaterializer regenerates a day's checklist from the active
// templates and the recurring custom items.
class TemplateMaterializer {
public:
    TemplateMaterializer(DocumentStore &store, const Clock &clock);

    // Clears the day's non-template items, then creates one incomplete item
    // per source. Returns the number of items created; per-item persistence
    // failures are logged and counted in 'failures'.
    int materializeToday(const std::string &today, int *failures = nullptr);

    // Item ids are derived from the day and the source, so a re-run
    // overwrites instead of duplicating.
    static std::string dailyItemId(const std::string &today, const std::string &sourceId);

private:
    DocumentStore &m_store;
    const Clock &m_clock;
};

} // namespace daybreak
