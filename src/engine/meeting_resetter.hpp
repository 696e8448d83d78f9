#pragma once

#include <string>

#include "common/clock.hpp"
#include "daemon/document_store.hpp"

namespace daybreak {

// Clears completion on today's meetings so they can be checked off again.
// Meetings on other days and meeting notes are left as they are.
class MeetingResetter {
public:
    MeetingResetter(DocumentStore &store, const Clock &clock);

    int resetMeetings(const std::string &today, int *failures = nullptr);

private:
    DocumentStore &m_store;
    const Clock &m_clock;
};

} // namespace daybreak
