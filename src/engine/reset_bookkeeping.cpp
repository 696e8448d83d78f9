#include "engine/reset_bookkeeping.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace daybreak {

namespace {

constexpr const char *kLegacyLastResetDate = "last_reset_date";
constexpr const char *kLegacyLastResetTimestamp = "last_reset_timestamp";
constexpr const char *kLegacyResetHistory = "reset_history";

ResetBookkeeping importLegacyBookkeeping(const DocumentStore &store)
{
    ResetBookkeeping bookkeeping;

    const auto lastDate = store.get(kLegacyLastResetDate);
    if (!lastDate.has_value() || !lastDate->is_string()) {
        return bookkeeping;
    }
    bookkeeping.lastResetDate = lastDate->get<std::string>();

    const auto lastTimestamp = store.get(kLegacyLastResetTimestamp);
    if (lastTimestamp.has_value() && lastTimestamp->is_string()) {
        bookkeeping.lastResetTimestamp = parseIso8601Utc(lastTimestamp->get<std::string>());
    }

    const auto history = store.get(kLegacyResetHistory);
    if (history.has_value() && history->is_array()) {
        bookkeeping.history = history->get<std::vector<ResetHistoryEntry>>();
    }

    DLOG_INFO(QStringLiteral("ResetBookkeeping"),
              QStringLiteral("loadBookkeeping"),
              QStringLiteral("legacy_bookkeeping_imported"),
              QStringLiteral("per_key_layout_found"),
              QStringLiteral("kv_read"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"lastResetDate", bookkeeping.lastResetDate},
                              {"historyEntries", bookkeeping.history.size()}}));
    return bookkeeping;
}

} // namespace

ResetBookkeeping loadBookkeeping(const DocumentStore &store)
{
    const auto record = store.get(keys::kResetBookkeeping);
    if (!record.has_value()) {
        return importLegacyBookkeeping(store);
    }
    if (!record->is_object()) {
        DLOG_WARN(QStringLiteral("ResetBookkeeping"),
                  QStringLiteral("loadBookkeeping"),
                  QStringLiteral("bookkeeping_unreadable"),
                  QStringLiteral("not_an_object"),
                  QStringLiteral("treat_as_bootstrap"),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        return ResetBookkeeping{};
    }
    return record->get<ResetBookkeeping>();
}

void saveBookkeeping(DocumentStore &store, const ResetBookkeeping &bookkeeping)
{
    store.set(keys::kResetBookkeeping, nlohmann::json(bookkeeping));
}

void recordReset(ResetBookkeeping &bookkeeping,
                 const std::string &date,
                 TimePoint timestamp,
                 ResetType type,
                 ResetReason reason)
{
    const auto delta = daysBetween(bookkeeping.lastResetDate, date);
    if (!delta.has_value() || *delta >= 0) {
        bookkeeping.lastResetDate = date;
    } else {
        DLOG_WARN(QStringLiteral("ResetBookkeeping"),
                  QStringLiteral("recordReset"),
                  QStringLiteral("reset_date_not_advanced"),
                  QStringLiteral("date_before_last_reset"),
                  QStringLiteral("keep_last_reset_date"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"lastResetDate", bookkeeping.lastResetDate},
                                  {"date", date}}));
    }
    bookkeeping.lastResetTimestamp = timestamp;

    ResetHistoryEntry entry;
    entry.date = date;
    entry.timestamp = timestamp;
    entry.type = type;
    entry.reason = reason;
    bookkeeping.history.push_back(entry);

    if (bookkeeping.history.size() > kMaxResetHistory) {
        bookkeeping.history.erase(
            bookkeeping.history.begin(),
            bookkeeping.history.end() - static_cast<std::ptrdiff_t>(kMaxResetHistory));
    }
}

} // namespace daybreak
