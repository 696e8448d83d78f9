#include "engine/carryforward_policy.hpp"

#include <exception>
#include <limits>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"

namespace daybreak {

bool isCarryCandidate(const TodoItem &todo,
                      const std::string &today,
                      const std::string &cutoff)
{
    if (todo.completed || !todo.carryForward || todo.date == today) {
        return false;
    }

    const auto ageDays = daysBetween(todo.date, today);
    const auto sinceCutoff = daysBetween(cutoff, todo.date);
    if (!ageDays.has_value() || !sinceCutoff.has_value()) {
        return false;
    }
    return *ageDays > 0 && *sinceCutoff >= 0;
}

void applyCarry(TodoItem &todo, const std::string &today, TimePoint now)
{
    const std::string previousDate = todo.date;
    todo.date = today;
    if (todo.carriedFrom.empty()) {
        todo.carriedFrom = previousDate;
    }
    if (todo.carryCount < std::numeric_limits<int>::max()) {
        todo.carryCount += 1;
    }
    todo.updatedAt = now;

    if (todo.carryCount >= kEscalationThreshold && todo.priority != TodoPriority::High) {
        todo.priority = TodoPriority::High;
        todo.autoPromoted = true;
    }
}

CarryforwardPolicy::CarryforwardPolicy(DocumentStore &store, const Clock &clock)
    : m_store(store)
    , m_clock(clock)
{
}

int CarryforwardPolicy::carryForward(const std::string &today, int *failures)
{
    return carryForward(today, addDays(today, -kCarryLookbackDays), failures);
}

int CarryforwardPolicy::carryForward(const std::string &today,
                                     const std::string &cutoff,
                                     int *failures)
{
    const auto records = m_store.getAllFromStore(stores::kTodos);
    const TimePoint now = m_clock.now();

    int moved = 0;
    int failed = 0;
    int promoted = 0;
    for (const auto &record : records) {
        TodoItem todo = record.get<TodoItem>();
        if (!isCarryCandidate(todo, today, cutoff)) {
            continue;
        }

        const bool wasHigh = todo.priority == TodoPriority::High;
        applyCarry(todo, today, now);

        try {
            m_store.saveToStore(stores::kTodos, nlohmann::json(todo));
        } catch (const std::exception &ex) {
            ++failed;
            DLOG_ERROR(QStringLiteral("CarryforwardPolicy"),
                       QStringLiteral("carryForward"),
                       QStringLiteral("todo_carry_failed"),
                       QStringLiteral("persistence_error"),
                       QStringLiteral("skip_item"),
                       logging::defaultWho(),
                       QString(),
                       (nlohmann::json{{"todoId", todo.id}, {"error", ex.what()}}));
            continue;
        }

        ++moved;
        if (!wasHigh && todo.autoPromoted && todo.priority == TodoPriority::High) {
            ++promoted;
            DLOG_INFO(QStringLiteral("CarryforwardPolicy"),
                      QStringLiteral("carryForward"),
                      QStringLiteral("todo_auto_promoted"),
                      QStringLiteral("carry_threshold_reached"),
                      QStringLiteral("priority_high"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"todoId", todo.id},
                                      {"carryCount", todo.carryCount}}));
        }
    }

    DLOG_INFO(QStringLiteral("CarryforwardPolicy"),
              QStringLiteral("carryForward"),
              QStringLiteral("todos_carried"),
              QStringLiteral("daily_reset"),
              QStringLiteral("per_item_save"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"today", today},
                              {"cutoff", cutoff},
                              {"moved", moved},
                              {"promoted", promoted},
                              {"failed", failed}}));

    if (failures) {
        *failures = failed;
    }
    return moved;
}

} // namespace daybreak
