#include "engine/retention_pruner.hpp"

#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/settings.hpp"
#include "common/time_utils.hpp"

namespace daybreak {

namespace {

// A record is prunable only when its date parses and lies before the cutoff.
bool datedBefore(const std::string &date, const std::string &cutoff)
{
    const auto delta = daysBetween(date, cutoff);
    return delta.has_value() && *delta > 0;
}

bool deleteRecord(DocumentStore &store,
                  const char *storeName,
                  const std::string &id,
                  int *failures)
{
    try {
        store.deleteFromStore(storeName, id);
        return true;
    } catch (const std::exception &ex) {
        ++(*failures);
        DLOG_ERROR(QStringLiteral("RetentionPruner"),
                   QStringLiteral("prune"),
                   QStringLiteral("record_delete_failed"),
                   QStringLiteral("persistence_error"),
                   QStringLiteral("skip_item"),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"store", storeName}, {"id", id}, {"error", ex.what()}}));
        return false;
    }
}

} // namespace

RetentionPruner::RetentionPruner(DocumentStore &store)
    : m_store(store)
{
}

std::string RetentionPruner::cutoffFor(const std::string &today, int retentionDays)
{
    return addDays(today, -clampRetentionDays(retentionDays));
}

std::string RetentionPruner::archiveCutoffFor(const std::string &today)
{
    return addDays(today, -kArchiveRetentionDays);
}

PruneResult RetentionPruner::prune(const std::string &cutoff, const std::string &archiveCutoff)
{
    PruneResult result;

    if (!parseCalendarDate(cutoff).has_value()) {
        DLOG_WARN(QStringLiteral("RetentionPruner"),
                  QStringLiteral("prune"),
                  QStringLiteral("prune_skipped"),
                  QStringLiteral("invalid_cutoff"),
                  QStringLiteral("no_deletion"),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"cutoff", cutoff}}));
        return result;
    }

    for (const auto &record : m_store.getAllFromStore(stores::kChecklistItems)) {
        const ChecklistItem item = record.get<ChecklistItem>();
        if (item.isTemplate || item.id.empty() || !datedBefore(item.date, cutoff)) {
            continue;
        }
        if (deleteRecord(m_store, stores::kChecklistItems, item.id, &result.failures)) {
            ++result.deletedChecklist;
        }
    }

    for (const auto &record : m_store.getAllFromStore(stores::kTodos)) {
        const TodoItem todo = record.get<TodoItem>();
        if (!todo.completed || todo.id.empty() || !datedBefore(todo.date, cutoff)) {
            continue;
        }
        if (deleteRecord(m_store, stores::kTodos, todo.id, &result.failures)) {
            ++result.deletedTodos;
        }
    }

    if (parseCalendarDate(archiveCutoff).has_value()) {
        for (const auto &record : m_store.getAllFromStore(stores::kJournals)) {
            const std::string id = stringField(record, "id");
            if (id.empty() || !datedBefore(stringField(record, "date"), archiveCutoff)) {
                continue;
            }
            if (deleteRecord(m_store, stores::kJournals, id, &result.failures)) {
                ++result.deletedArchives;
            }
        }
    }

    DLOG_INFO(QStringLiteral("RetentionPruner"),
              QStringLiteral("prune"),
              QStringLiteral("retention_cleanup"),
              QStringLiteral("data_retention"),
              QStringLiteral("delete_before_cutoff"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"cutoff", cutoff},
                              {"archiveCutoff", archiveCutoff},
                              {"deletedChecklist", result.deletedChecklist},
                              {"deletedTodos", result.deletedTodos},
                              {"deletedArchives", result.deletedArchives},
                              {"failed", result.failures}}));
    return result;
}

} // namespace daybreak
