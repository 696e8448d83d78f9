#include "engine/template_materializer.hpp"

#include <algorithm>
#include <exception>
#include <vector>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace daybreak {

namespace {

std::vector<ChecklistTemplate> activeTemplates(const DocumentStore &store)
{
    std::vector<ChecklistTemplate> templates;
    for (const auto &record : store.getAllFromStore(stores::kChecklistItems,
                                                    "isTemplate", true)) {
        ChecklistTemplate item = record.get<ChecklistTemplate>();
        if (item.active) {
            templates.push_back(std::move(item));
        }
    }
    std::stable_sort(templates.begin(), templates.end(),
                     [](const ChecklistTemplate &a, const ChecklistTemplate &b) {
                         return a.order < b.order;
                     });
    return templates;
}

std::vector<CustomChecklistItem> recurringCustomItems(const DocumentStore &store)
{
    std::vector<CustomChecklistItem> items;
    const auto stored = store.get(keys::kCustomChecklistItems);
    if (!stored.has_value() || !stored->is_array()) {
        return items;
    }
    for (const auto &entry : *stored) {
        if (!entry.is_object()) {
            continue;
        }
        CustomChecklistItem item = entry.get<CustomChecklistItem>();
        if (item.recurring) {
            items.push_back(std::move(item));
        }
    }
    return items;
}

void logItemFailure(const QString &what, const std::string &itemId, const std::exception &ex)
{
    DLOG_ERROR(QStringLiteral("TemplateMaterializer"),
               QStringLiteral("materializeToday"),
               what,
               QStringLiteral("persistence_error"),
               QStringLiteral("skip_item"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"itemId", itemId}, {"error", ex.what()}}));
}

} // namespace

TemplateMaterializer::TemplateMaterializer(DocumentStore &store, const Clock &clock)
    : m_store(store)
    , m_clock(clock)
{
}

std::string TemplateMaterializer::dailyItemId(const std::string &today,
                                              const std::string &sourceId)
{
    if (sourceId.empty()) {
        return {};
    }
    return "daily-" + today + "-" + sourceId;
}

int TemplateMaterializer::materializeToday(const std::string &today, int *failures)
{
    int failed = 0;

    // Step 1: drop whatever a previous (possibly partial) run left for today.
    int removed = 0;
    for (const auto &record : m_store.getAllFromStore(stores::kChecklistItems,
                                                      "date", today)) {
        const ChecklistItem existing = record.get<ChecklistItem>();
        if (existing.isTemplate) {
            continue;
        }
        try {
            m_store.deleteFromStore(stores::kChecklistItems, existing.id);
            ++removed;
        } catch (const std::exception &ex) {
            ++failed;
            logItemFailure(QStringLiteral("checklist_item_delete_failed"), existing.id, ex);
        }
    }

    // Step 2: gather the sources.
    const auto templates = activeTemplates(m_store);
    const auto customItems = recurringCustomItems(m_store);

    // Step 3: one fresh instance per source.
    const TimePoint now = m_clock.now();
    std::vector<ChecklistItem> items;
    items.reserve(templates.size() + customItems.size());

    for (const auto &source : templates) {
        ChecklistItem item;
        item.id = dailyItemId(today, source.id);
        item.text = source.text;
        item.category = source.category;
        item.date = today;
        item.templateId = source.id;
        item.order = source.order;
        item.createdAt = now;
        item.updatedAt = now;
        items.push_back(std::move(item));
    }

    for (const auto &source : customItems) {
        ChecklistItem item;
        item.id = dailyItemId(today, source.id);
        item.text = source.text;
        item.category = source.category;
        item.date = today;
        item.templateId = source.id;
        item.order = source.order;
        item.isCustom = true;
        item.recurring = true;
        item.createdAt = now;
        item.updatedAt = now;
        items.push_back(std::move(item));
    }

    int created = 0;
    for (const auto &item : items) {
        try {
            m_store.saveToStore(stores::kChecklistItems, nlohmann::json(item));
            ++created;
        } catch (const std::exception &ex) {
            ++failed;
            logItemFailure(QStringLiteral("checklist_item_create_failed"), item.id, ex);
        }
    }

    DLOG_INFO(QStringLiteral("TemplateMaterializer"),
              QStringLiteral("materializeToday"),
              QStringLiteral("checklist_materialized"),
              QStringLiteral("daily_reset"),
              QStringLiteral("templates_and_recurring_items"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"today", today},
                              {"removed", removed},
                              {"templates", templates.size()},
                              {"recurringCustom", customItems.size()},
                              {"created", created},
                              {"failed", failed}}));

    if (failures) {
        *failures = failed;
    }
    return created;
}

} // namespace daybreak
