#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <QDateTime>
#include <QObject>
#include <QString>
#include <QTimer>

#include "common/clock.hpp"
#include "common/models.hpp"
#include "daemon/document_store.hpp"
#include "engine/reset_decision.hpp"
#include "engine/reset_executor.hpp"

namespace daybreak {

/**
 * ResetScheduler decides when to run the daily reset. It is owned from main()
 * (or a test) and driven by Qt's event loop:
 * - a 60s interval timer,
 * - a single-shot timer armed for the next reset instant when it is less
 *   than 24h away,
 * - lifecycle notifications (visibility, focus) forwarded by the host.
 *
 * Every trigger goes through checkAndReset(); a trigger that arrives while a
 * reset is running is dropped and counted.
 */
class ResetScheduler : public QObject
{
    Q_OBJECT
public:
    enum class CheckOutcome {
        Performed,
        NotNeeded,
        Skipped,
        Disabled,
        Failed
    };

    static constexpr int kCheckIntervalMs = 60000;
    static constexpr int kRecentResetCount = 7;

    ResetScheduler(DocumentStore &store, const Clock &clock, QObject *parent = nullptr);
    ~ResetScheduler() override;

    // Sets up the timers and runs the startup check.
    void start();
    // Stops the timers and saves the session state.
    void stop();
    bool isRunning() const { return m_running; }

    CheckOutcome checkAndReset(ResetTrigger trigger);
    std::optional<ResetReport> performManualReset();

    ResetDecision evaluate() const;
    ResetStats resetStats() const;
    std::optional<TimePoint> nextResetTime() const;
    std::optional<std::chrono::milliseconds> timeUntilNextReset() const;

    EngineSettings settings() const;
    bool updateResetTime(const std::string &resetTime, std::string *error = nullptr);
    bool updateRetentionDays(int days, std::string *error = nullptr);
    bool setAutoReset(bool enabled, std::string *error = nullptr);

    void saveSessionState();

    bool isResetInProgress() const { return m_resetInProgress; }
    int droppedTriggerCount() const { return m_droppedTriggers; }
    bool isPreciseTimerArmed() const { return m_preciseTimer.isActive(); }

    ResetExecutor &executor() { return m_executor; }

public slots:
    void onVisibilityChanged(bool visible);
    void onFocusGained();

signals:
    void dailyResetComplete(const QString &date, const QDateTime &timestamp);
    void resetFailed(const QString &message);

private slots:
    void onIntervalTimeout();
    void onPreciseTimeout();

private:
    ResetReport runReset(ResetType type, ResetReason reason);
    std::optional<SessionGapInfo> loadSessionGap() const;
    bool saveSettings(const EngineSettings &settings, std::string *error);
    void scheduleNextReset();

    DocumentStore &m_store;
    const Clock &m_clock;
    ResetExecutor m_executor;

    QTimer m_intervalTimer;
    QTimer m_preciseTimer;

    bool m_running = false;
    bool m_resetInProgress = false;
    int m_droppedTriggers = 0;
};

} // namespace daybreak
