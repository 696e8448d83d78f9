#pragma once

#include <string>

#include "common/clock.hpp"
#include "common/models.hpp"
#include "daemon/document_store.hpp"

namespace daybreak {

constexpr int kCarryLookbackDays = 7;
constexpr int kEscalationThreshold = 3;

// True when an unfinished todo from [cutoff, today) should move to today.
// Todos that opted out (carryForward == false) or carry an unreadable date
// are never selected.
bool isCarryCandidate(const TodoItem &todo,
                      const std::string &today,
                      const std::string &cutoff);

// Moves one todo to 'today'. carriedFrom keeps the first origin date;
// reaching kEscalationThreshold carries promotes it to high priority for good.
void applyCarry(TodoItem &todo, const std::string &today, TimePoint now);

// CarryforwardPolicy rolls unfinished todos into the new day.
class CarryforwardPolicy {
public:
    CarryforwardPolicy(DocumentStore &store, const Clock &clock);

    // Returns the number of todos moved. Each todo is saved on its own; a
    // failed save is logged, counted in 'failures' and the rest continue.
    int carryForward(const std::string &today,
                     const std::string &cutoff,
                     int *failures = nullptr);

    // Uses today - kCarryLookbackDays as the cutoff.
    int carryForward(const std::string &today, int *failures = nullptr);

private:
    DocumentStore &m_store;
    const Clock &m_clock;
};

} // namespace daybreak
