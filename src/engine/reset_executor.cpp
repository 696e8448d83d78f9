#include "engine/reset_executor.hpp"

#include <exception>
#include <utility>

#include <QStringList>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/carryforward_policy.hpp"
#include "engine/day_archiver.hpp"
#include "engine/meeting_resetter.hpp"
#include "engine/reset_bookkeeping.hpp"
#include "engine/retention_pruner.hpp"
#include "engine/template_materializer.hpp"

namespace daybreak {

ResetExecutor::ResetExecutor(DocumentStore &store, const Clock &clock, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_clock(clock)
{
}

template <typename Fn>
void ResetExecutor::runPhase(ResetReport &report, ResetPhase phase, Fn &&body)
{
    m_phase = phase;
    const QString phaseName = QString::fromStdString(toResetPhaseString(phase));
    emit phaseStarted(phaseName);

    PhaseOutcome outcome;
    outcome.phase = phase;
    try {
        body(outcome);
    } catch (const std::exception &ex) {
        outcome.ok = false;
        outcome.error = ex.what();
        DLOG_ERROR(QStringLiteral("ResetExecutor"),
                   QStringLiteral("runPhase"),
                   QStringLiteral("reset_phase_failed"),
                   QStringLiteral("phase_exception"),
                   QStringLiteral("continue_with_next_phase"),
                   logging::defaultWho(),
                   logging::currentCorrelationId(),
                   (nlohmann::json{{"phase", toResetPhaseString(phase)},
                                   {"error", ex.what()}}));
    }

    DLOG_DEBUG(QStringLiteral("ResetExecutor"),
               QStringLiteral("runPhase"),
               QStringLiteral("reset_phase_done"),
               QStringLiteral("daily_reset"),
               phaseName,
               logging::defaultWho(),
               logging::currentCorrelationId(),
               nlohmann::json(outcome));
    report.phases.push_back(std::move(outcome));
}

ResetReport ResetExecutor::execute(const ResetRequest &request)
{
    const QString corrId = logging::newCorrelationId(QStringLiteral("reset"));
    logging::CorrelationScope scope(corrId);

    const TimePoint now = m_clock.now();
    const std::string today = localDateString(now, m_clock.timeZoneId());

    ResetReport report;
    report.date = today;
    report.timestamp = now;
    report.type = request.type;
    report.reason = request.reason;
    report.correlationId = corrId.toStdString();

    DLOG_INFO(QStringLiteral("ResetExecutor"),
              QStringLiteral("execute"),
              QStringLiteral("daily_reset_start"),
              QString::fromStdString(toResetReasonString(request.reason)),
              QString::fromStdString(toResetTypeString(request.type)),
              logging::defaultWho(),
              corrId,
              (nlohmann::json{{"today", today},
                              {"retentionDays", request.retentionDays}}));

    runPhase(report, ResetPhase::Archiving, [&](PhaseOutcome &outcome) {
        const ResetBookkeeping before = loadBookkeeping(m_store);
        const std::string day = DayArchiver::archiveDayFor(before.lastResetDate, today);
        DayArchiver archiver(m_store, m_clock);
        outcome.count = archiver.archive(day, &outcome.failures);
    });

    runPhase(report, ResetPhase::ChecklistMaterialization, [&](PhaseOutcome &outcome) {
        TemplateMaterializer materializer(m_store, m_clock);
        outcome.count = materializer.materializeToday(today, &outcome.failures);
    });

    runPhase(report, ResetPhase::TodoCarryforward, [&](PhaseOutcome &outcome) {
        CarryforwardPolicy policy(m_store, m_clock);
        outcome.count = policy.carryForward(today, &outcome.failures);
    });

    runPhase(report, ResetPhase::MeetingReset, [&](PhaseOutcome &outcome) {
        MeetingResetter resetter(m_store, m_clock);
        outcome.count = resetter.resetMeetings(today, &outcome.failures);
    });

    runPhase(report, ResetPhase::RetentionCleanup, [&](PhaseOutcome &outcome) {
        RetentionPruner pruner(m_store);
        const PruneResult result = pruner.prune(
            RetentionPruner::cutoffFor(today, request.retentionDays),
            RetentionPruner::archiveCutoffFor(today));
        outcome.count = result.total();
        outcome.failures = result.failures;
    });

    runPhase(report, ResetPhase::BookkeepingUpdate, [&](PhaseOutcome &outcome) {
        ResetBookkeeping bookkeeping = loadBookkeeping(m_store);
        recordReset(bookkeeping, today, now, request.type, request.reason);
        saveBookkeeping(m_store, bookkeeping);
        report.bookkeepingCommitted = true;
        outcome.count = 1;
    });

    runPhase(report, ResetPhase::NotifyComplete, [&](PhaseOutcome &outcome) {
        outcome.count = 1;
        emit dailyResetComplete(QString::fromStdString(today), toQDateTime(now));
    });

    m_phase = ResetPhase::Idle;

    if (report.hasFailures()) {
        QStringList failed;
        for (const auto &outcome : report.phases) {
            if (!outcome.ok || outcome.failures > 0) {
                failed << QString::fromStdString(toResetPhaseString(outcome.phase));
            }
        }
        const QString message = QStringLiteral("Daily reset for %1 finished with failures in: %2")
                                    .arg(QString::fromStdString(today), failed.join(QStringLiteral(", ")));
        DLOG_WARN(QStringLiteral("ResetExecutor"),
                  QStringLiteral("execute"),
                  QStringLiteral("daily_reset_partial"),
                  QStringLiteral("phase_failures"),
                  QStringLiteral("report_failed_phases"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json(report));
        emit resetFailed(message);
    } else {
        DLOG_INFO(QStringLiteral("ResetExecutor"),
                  QStringLiteral("execute"),
                  QStringLiteral("daily_reset_complete"),
                  QStringLiteral("daily_reset"),
                  QStringLiteral("all_phases_ok"),
                  logging::defaultWho(),
                  corrId,
                  nlohmann::json(report));
    }

    return report;
}

} // namespace daybreak
