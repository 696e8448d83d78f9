#include "daemon/reset_scheduler.hpp"

#include <algorithm>
#include <exception>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/settings.hpp"
#include "common/time_utils.hpp"
#include "engine/reset_bookkeeping.hpp"

namespace daybreak {

namespace {

constexpr auto kPreciseTimerHorizon = std::chrono::hours(24);

QString triggerName(ResetTrigger trigger)
{
    return QString::fromStdString(toResetTriggerString(trigger));
}

void logSchedulerError(const QString &where, const QString &what, const std::exception &ex)
{
    DLOG_ERROR(QStringLiteral("ResetScheduler"),
               where,
               what,
               QStringLiteral("store_error"),
               QStringLiteral("skip"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"error", ex.what()}}));
}

// Clears the in-progress flag however the run ends.
class InProgressGuard {
public:
    explicit InProgressGuard(bool &flag)
        : m_flag(flag)
    {
        m_flag = true;
    }
    ~InProgressGuard() { m_flag = false; }

private:
    bool &m_flag;
};

} // namespace

ResetScheduler::ResetScheduler(DocumentStore &store, const Clock &clock, QObject *parent)
    : QObject(parent)
    , m_store(store)
    , m_clock(clock)
    , m_executor(store, clock)
{
    m_intervalTimer.setInterval(kCheckIntervalMs);
    connect(&m_intervalTimer, &QTimer::timeout, this, &ResetScheduler::onIntervalTimeout);

    m_preciseTimer.setSingleShot(true);
    m_preciseTimer.setTimerType(Qt::PreciseTimer);
    connect(&m_preciseTimer, &QTimer::timeout, this, &ResetScheduler::onPreciseTimeout);

    connect(&m_executor, &ResetExecutor::dailyResetComplete,
            this, &ResetScheduler::dailyResetComplete);
    connect(&m_executor, &ResetExecutor::resetFailed,
            this, &ResetScheduler::resetFailed);
}

ResetScheduler::~ResetScheduler() = default;

void ResetScheduler::start()
{
    if (m_running) {
        return;
    }
    m_running = true;

    DLOG_INFO(QStringLiteral("ResetScheduler"),
              QStringLiteral("start"),
              QStringLiteral("scheduler_start"),
              QStringLiteral("host_start"),
              QStringLiteral("interval_and_precise_timers"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"intervalMs", kCheckIntervalMs},
                              {"timeZone", m_clock.timeZoneId()}}));

    m_intervalTimer.start();

    bool timeZoneChanged = false;
    try {
        const std::string current = m_clock.timeZoneId();
        const auto saved = m_store.get(keys::kTimeZone);
        if (saved.has_value() && saved->is_string() && saved->get<std::string>() != current) {
            timeZoneChanged = true;
            DLOG_INFO(QStringLiteral("ResetScheduler"),
                      QStringLiteral("start"),
                      QStringLiteral("timezone_changed"),
                      QStringLiteral("saved_zone_differs"),
                      QStringLiteral("force_check"),
                      logging::defaultWho(),
                      QString(),
                      (nlohmann::json{{"from", saved->get<std::string>()}, {"to", current}}));
        }
        m_store.set(keys::kTimeZone, current);
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("start"), QStringLiteral("timezone_check_failed"), ex);
    }

    checkAndReset(timeZoneChanged ? ResetTrigger::TimezoneChange : ResetTrigger::Startup);
}

void ResetScheduler::stop()
{
    if (!m_running) {
        return;
    }
    m_running = false;
    m_intervalTimer.stop();
    m_preciseTimer.stop();
    saveSessionState();

    DLOG_INFO(QStringLiteral("ResetScheduler"),
              QStringLiteral("stop"),
              QStringLiteral("scheduler_stop"),
              QStringLiteral("host_stop"),
              QStringLiteral("timers_stopped"),
              logging::defaultWho(),
              QString(),
              nlohmann::json::object());
}

EngineSettings ResetScheduler::settings() const
{
    const auto record = m_store.get(keys::kAppSettings);
    if (!record.has_value()) {
        return EngineSettings{};
    }
    return settingsFromJson(*record);
}

std::optional<SessionGapInfo> ResetScheduler::loadSessionGap() const
{
    const auto record = m_store.get(keys::kSessionState);
    if (!record.has_value() || !record->is_object()) {
        return std::nullopt;
    }
    const SessionState state = record->get<SessionState>();
    if (state.currentDate.empty() || state.lastActiveTime == TimePoint{}) {
        return std::nullopt;
    }
    return SessionGapInfo{state.lastActiveTime, state.currentDate};
}

void ResetScheduler::saveSessionState()
{
    SessionState state;
    state.lastActiveTime = m_clock.now();
    state.timeZone = m_clock.timeZoneId();
    state.currentDate = localDateString(state.lastActiveTime, state.timeZone);
    try {
        m_store.set(keys::kSessionState, nlohmann::json(state));
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("saveSessionState"),
                          QStringLiteral("session_save_failed"), ex);
    }
}

ResetDecision ResetScheduler::evaluate() const
{
    return shouldReset(m_clock.now(),
                       m_clock.timeZoneId(),
                       settings().resetTime,
                       loadBookkeeping(m_store),
                       loadSessionGap());
}

ResetScheduler::CheckOutcome ResetScheduler::checkAndReset(ResetTrigger trigger)
{
    if (m_resetInProgress) {
        ++m_droppedTriggers;
        DLOG_DEBUG(QStringLiteral("ResetScheduler"),
                   QStringLiteral("checkAndReset"),
                   QStringLiteral("trigger_dropped"),
                   QStringLiteral("reset_in_progress"),
                   triggerName(trigger),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"dropped", m_droppedTriggers}}));
        return CheckOutcome::Skipped;
    }

    EngineSettings current;
    ResetDecision decision;
    try {
        current = settings();
        decision = evaluate();
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("checkAndReset"), QStringLiteral("reset_check_failed"), ex);
        scheduleNextReset();
        return CheckOutcome::Failed;
    }

    CheckOutcome outcome = CheckOutcome::NotNeeded;
    if (!decision.needed) {
        DLOG_DEBUG(QStringLiteral("ResetScheduler"),
                   QStringLiteral("checkAndReset"),
                   QStringLiteral("reset_not_needed"),
                   QStringLiteral("decision_none"),
                   triggerName(trigger),
                   logging::defaultWho(),
                   QString(),
                   (nlohmann::json{{"today", decision.today}}));
    } else if (!current.autoReset) {
        outcome = CheckOutcome::Disabled;
        DLOG_INFO(QStringLiteral("ResetScheduler"),
                  QStringLiteral("checkAndReset"),
                  QStringLiteral("reset_suppressed"),
                  QStringLiteral("auto_reset_disabled"),
                  triggerName(trigger),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"reason", toResetReasonString(decision.reason)}}));
    } else {
        DLOG_INFO(QStringLiteral("ResetScheduler"),
                  QStringLiteral("checkAndReset"),
                  QStringLiteral("reset_due"),
                  QString::fromStdString(toResetReasonString(decision.reason)),
                  triggerName(trigger),
                  logging::defaultWho(),
                  QString(),
                  (nlohmann::json{{"today", decision.today}}));
        runReset(ResetType::Automatic, decision.reason);
        outcome = CheckOutcome::Performed;
    }

    saveSessionState();
    scheduleNextReset();
    return outcome;
}

std::optional<ResetReport> ResetScheduler::performManualReset()
{
    if (m_resetInProgress) {
        ++m_droppedTriggers;
        DLOG_WARN(QStringLiteral("ResetScheduler"),
                  QStringLiteral("performManualReset"),
                  QStringLiteral("manual_reset_rejected"),
                  QStringLiteral("reset_in_progress"),
                  triggerName(ResetTrigger::Manual),
                  logging::defaultWho(),
                  QString(),
                  nlohmann::json::object());
        return std::nullopt;
    }

    ResetReport report = runReset(ResetType::Manual, ResetReason::Manual);
    saveSessionState();
    scheduleNextReset();
    return report;
}

ResetReport ResetScheduler::runReset(ResetType type, ResetReason reason)
{
    int retentionDays = kDefaultRetentionDays;
    try {
        retentionDays = settings().dataRetentionDays;
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("runReset"), QStringLiteral("settings_read_failed"), ex);
    }

    InProgressGuard guard(m_resetInProgress);
    ResetRequest request;
    request.type = type;
    request.reason = reason;
    request.retentionDays = retentionDays;
    return m_executor.execute(request);
}

std::optional<TimePoint> ResetScheduler::nextResetTime() const
{
    try {
        return nextResetInstant(m_clock.now(), m_clock.timeZoneId(), settings().resetTime);
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("nextResetTime"), QStringLiteral("settings_read_failed"), ex);
        return std::nullopt;
    }
}

std::optional<std::chrono::milliseconds> ResetScheduler::timeUntilNextReset() const
{
    const auto next = nextResetTime();
    if (!next.has_value()) {
        return std::nullopt;
    }
    const auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(*next - m_clock.now());
    return std::max(delta, std::chrono::milliseconds(0));
}

void ResetScheduler::scheduleNextReset()
{
    m_preciseTimer.stop();
    if (!m_running) {
        return;
    }

    const auto remaining = timeUntilNextReset();
    if (!remaining.has_value() || *remaining > kPreciseTimerHorizon) {
        return;
    }
    m_preciseTimer.start(static_cast<int>(remaining->count()));

    DLOG_DEBUG(QStringLiteral("ResetScheduler"),
               QStringLiteral("scheduleNextReset"),
               QStringLiteral("precise_timer_armed"),
               QStringLiteral("next_reset_within_horizon"),
               QStringLiteral("single_shot_timer"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"remainingMs", remaining->count()}}));
}

ResetStats ResetScheduler::resetStats() const
{
    ResetStats stats;
    try {
        const ResetBookkeeping bookkeeping = loadBookkeeping(m_store);
        stats.lastResetDate = bookkeeping.lastResetDate;
        stats.totalResets = bookkeeping.history.size();
        const std::size_t recent = std::min<std::size_t>(bookkeeping.history.size(),
                                                         kRecentResetCount);
        stats.recentResets.assign(bookkeeping.history.end() - static_cast<std::ptrdiff_t>(recent),
                                  bookkeeping.history.end());
        stats.resetTime = settings().resetTime;
        const ResetDecision decision = evaluate();
        stats.isResetDue = decision.needed;
        stats.dueReason = decision.reason;
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("resetStats"), QStringLiteral("stats_read_failed"), ex);
    }
    stats.nextResetTime = nextResetTime();
    return stats;
}

bool ResetScheduler::saveSettings(const EngineSettings &updated, std::string *error)
{
    try {
        nlohmann::json record = m_store.get(keys::kAppSettings).value_or(nlohmann::json::object());
        mergeSettingsInto(record, updated);
        m_store.set(keys::kAppSettings, record);
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("saveSettings"), QStringLiteral("settings_save_failed"), ex);
        if (error) {
            *error = ex.what();
        }
        return false;
    }
    return true;
}

bool ResetScheduler::updateResetTime(const std::string &resetTime, std::string *error)
{
    if (!validateResetTime(resetTime, error)) {
        return false;
    }

    EngineSettings updated;
    try {
        updated = settings();
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("updateResetTime"), QStringLiteral("settings_read_failed"), ex);
        if (error) {
            *error = ex.what();
        }
        return false;
    }
    const std::string previous = updated.resetTime;
    updated.resetTime = resetTime;
    if (!saveSettings(updated, error)) {
        return false;
    }

    if (previous != resetTime) {
        try {
            ResetBookkeeping bookkeeping = loadBookkeeping(m_store);
            bookkeeping.resetTimeChangedAt = m_clock.now();
            saveBookkeeping(m_store, bookkeeping);
        } catch (const std::exception &ex) {
            logSchedulerError(QStringLiteral("updateResetTime"),
                              QStringLiteral("bookkeeping_save_failed"), ex);
            if (error) {
                *error = ex.what();
            }
            return false;
        }
    }

    DLOG_INFO(QStringLiteral("ResetScheduler"),
              QStringLiteral("updateResetTime"),
              QStringLiteral("reset_time_updated"),
              QStringLiteral("user_setting"),
              QStringLiteral("rearm_precise_timer"),
              logging::defaultWho(),
              QString(),
              (nlohmann::json{{"from", previous}, {"to", resetTime}}));

    scheduleNextReset();
    return true;
}

bool ResetScheduler::updateRetentionDays(int days, std::string *error)
{
    if (!validateRetentionDays(days, error)) {
        return false;
    }
    try {
        EngineSettings updated = settings();
        updated.dataRetentionDays = days;
        return saveSettings(updated, error);
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("updateRetentionDays"),
                          QStringLiteral("settings_read_failed"), ex);
        if (error) {
            *error = ex.what();
        }
        return false;
    }
}

bool ResetScheduler::setAutoReset(bool enabled, std::string *error)
{
    try {
        EngineSettings updated = settings();
        updated.autoReset = enabled;
        return saveSettings(updated, error);
    } catch (const std::exception &ex) {
        logSchedulerError(QStringLiteral("setAutoReset"),
                          QStringLiteral("settings_read_failed"), ex);
        if (error) {
            *error = ex.what();
        }
        return false;
    }
}

void ResetScheduler::onVisibilityChanged(bool visible)
{
    if (!m_running || !visible) {
        return;
    }
    checkAndReset(ResetTrigger::Visibility);
}

void ResetScheduler::onFocusGained()
{
    if (!m_running) {
        return;
    }
    checkAndReset(ResetTrigger::Focus);
}

void ResetScheduler::onIntervalTimeout()
{
    checkAndReset(ResetTrigger::Interval);
}

void ResetScheduler::onPreciseTimeout()
{
    checkAndReset(ResetTrigger::PreciseTimer);
}

} // namespace daybreak
