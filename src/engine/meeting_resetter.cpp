#include "engine/meeting_resetter.hpp"

#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace daybreak {

MeetingResetter::MeetingResetter(DocumentStore &store, const Clock &clock)
    : m_store(store)
    , m_clock(clock)
{
}

int MeetingResetter::resetMeetings(const std::string &today, int *failures)
{
    const TimePoint now = m_clock.now();
    int reset = 0;
    int failed = 0;

    for (const auto &record : m_store.getAllFromStore(stores::kMeetings, "date", today)) {
        Meeting meeting = record.get<Meeting>();
        if (!meeting.completed) {
            continue;
        }
        meeting.completed = false;
        meeting.completedAt.reset();
        meeting.updatedAt = now;

        try {
            m_store.saveToStore(stores::kMeetings, nlohmann::json(meeting));
            ++reset;
        } catch (const std::exception &ex) {
            ++failed;
            DLOG_ERROR(QStringLiteral("MeetingResetter"),
                       QStringLiteral("resetMeetings"),
                       QStringLiteral("meeting_reset_failed"),
                       QStringLiteral("persistence_error"),
                       QStringLiteral("skip_item"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"meetingId", meeting.id}, {"error", ex.what()}}));
        }
    }

    DLOG_INFO(QStringLiteral("MeetingResetter"),
              QStringLiteral("resetMeetings"),
              QStringLiteral("meetings_reset"),
              QStringLiteral("daily_reset"),
              QStringLiteral("clear_completed"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"today", today}, {"reset", reset}, {"failed", failed}}));

    if (failures) {
        *failures = failed;
    }
    return reset;
}

} // namespace daybreak
