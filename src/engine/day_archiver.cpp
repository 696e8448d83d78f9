#include "engine/day_archiver.hpp"

#include <algorithm>
#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace daybreak {

DayArchiver::DayArchiver(DocumentStore &store, const Clock &clock)
    : m_store(store)
    , m_clock(clock)
{
}

std::string DayArchiver::archiveId(const std::string &day)
{
    return "archive-" + day;
}

std::string DayArchiver::archiveDayFor(const std::string &lastResetDate,
                                       const std::string &today)
{
    const auto delta = daysBetween(lastResetDate, today);
    if (delta.has_value() && *delta > 0) {
        return lastResetDate;
    }
    return addDays(today, -1);
}

int DayArchiver::archive(const std::string &day, int *failures)
{
    if (failures) {
        *failures = 0;
    }
    if (!parseCalendarDate(day).has_value()) {
        return 0;
    }

    const std::string id = archiveId(day);
    if (!m_store.getAllFromStore(stores::kJournals, "id", id).empty()) {
        DLOG_DEBUG(QStringLiteral("DayArchiver"),
                   QStringLiteral("archive"),
                   QStringLiteral("archive_exists"),
                   QStringLiteral("already_archived"),
                   QStringLiteral("skip"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"day", day}}));
        return 0;
    }

    ArchiveRecord record;
    record.id = id;
    record.date = day;
    record.createdAt = m_clock.now();
    for (const auto &raw : m_store.getAllFromStore(stores::kChecklistItems, "date", day)) {
        ChecklistItem item = raw.get<ChecklistItem>();
        if (!item.isTemplate && item.completed) {
            record.checklist.push_back(std::move(item));
        }
    }
    if (record.checklist.empty()) {
        return 0;
    }
    std::stable_sort(record.checklist.begin(), record.checklist.end(),
                     [](const ChecklistItem &a, const ChecklistItem &b) {
                         return a.order < b.order;
                     });

    try {
        m_store.saveToStore(stores::kJournals, nlohmann::json(record));
    } catch (const std::exception &ex) {
        if (failures) {
            *failures = 1;
        }
        DLOG_ERROR(QStringLiteral("DayArchiver"),
                   QStringLiteral("archive"),
                   QStringLiteral("archive_write_failed"),
                   QStringLiteral("persistence_error"),
                   QStringLiteral("skip_archive"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"day", day}, {"error", ex.what()}}));
        return 0;
    }

    DLOG_INFO(QStringLiteral("DayArchiver"),
              QStringLiteral("archive"),
              QStringLiteral("day_archived"),
              QStringLiteral("daily_reset"),
              QStringLiteral("journal_record"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"day", day}, {"items", record.checklist.size()}}));
    return static_cast<int>(record.checklist.size());
}

} // namespace daybreak
