#pragma once

#include <string>

#include <QDateTime>
#include <QObject>
#include <QString>

#include "common/clock.hpp"
#include "common/models.hpp"
#include "common/settings.hpp"
#include "daemon/document_store.hpp"

namespace daybreak {

struct ResetRequest {
    ResetType type = ResetType::Automatic;
    ResetReason reason = ResetReason::None;
    int retentionDays = kDefaultRetentionDays;
};

/**
 * ResetExecutor runs one daily reset as a fixed sequence of phases:
 *   Archiving -> ChecklistMaterialization -> TodoCarryforward ->
 *   MeetingReset -> RetentionCleanup -> BookkeepingUpdate -> NotifyComplete
 *
 * Each phase handles its own errors; a failed phase is logged and recorded
 * in the report, and the remaining phases still run. Bookkeeping is only
 * committed by the BookkeepingUpdate phase, so an interrupted run is retried
 * by the next check.
 */
class ResetExecutor : public QObject
{
    Q_OBJECT
public:
    ResetExecutor(DocumentStore &store, const Clock &clock, QObject *parent = nullptr);

    ResetReport execute(const ResetRequest &request);

    ResetPhase currentPhase() const { return m_phase; }

signals:
    void phaseStarted(const QString &phase);
    void dailyResetComplete(const QString &date, const QDateTime &timestamp);
    void resetFailed(const QString &message);

private:
    template <typename Fn>
    void runPhase(ResetReport &report, ResetPhase phase, Fn &&body);

    DocumentStore &m_store;
    const Clock &m_clock;
    ResetPhase m_phase = ResetPhase::Idle;
};

} // namespace daybreak
