#include <QtTest/QtTest>

#include "common/time_utils.hpp"
#include "engine/reset_decision.hpp"

using namespace daybreak;

namespace {

TimePoint at(const char *iso)
{
    return *parseIso8601Utc(iso);
}

ResetBookkeeping lastResetOn(const std::string &date, const char *timestamp = nullptr)
{
    ResetBookkeeping bookkeeping;
    bookkeeping.lastResetDate = date;
    if (timestamp) {
        bookkeeping.lastResetTimestamp = at(timestamp);
    }
    return bookkeeping;
}

} // namespace

class ResetDecisionTests : public QObject
{
    Q_OBJECT
private slots:
    void testBootstrap();
    void testDayRolledAfterResetTime();
    void testNotDueBeforeResetTime();
    void testCatchUpCollapsesMissedDays();
    void testSameDayNotDue();
    void testTimeChanged();
    void testFutureLastResetNeverResets();
    void testSessionGap();
    void testDeterministic();
    void testTimezoneDefinesToday();
    void testNextResetInstant();
};

void ResetDecisionTests::testBootstrap()
{
    const auto decision = shouldReset(at("2024-01-03T10:00:00Z"), "UTC", "00:00",
                                      ResetBookkeeping{}, std::nullopt);
    QVERIFY(decision.needed);
    QCOMPARE(decision.reason, ResetReason::Bootstrap);
    QCOMPARE(QString::fromStdString(decision.today), QStringLiteral("2024-01-03"));

    const auto garbage = shouldReset(at("2024-01-03T10:00:00Z"), "UTC", "00:00",
                                     lastResetOn("last tuesday"), std::nullopt);
    QVERIFY(garbage.needed);
    QCOMPARE(garbage.reason, ResetReason::Bootstrap);
}

void ResetDecisionTests::testDayRolledAfterResetTime()
{
    const auto decision = shouldReset(at("2024-01-03T01:00:00Z"), "UTC", "00:00",
                                      lastResetOn("2024-01-02"), std::nullopt);
    QVERIFY(decision.needed);
    QCOMPARE(decision.reason, ResetReason::DayRolled);
}

void ResetDecisionTests::testNotDueBeforeResetTime()
{
    const auto decision = shouldReset(at("2024-01-03T05:00:00Z"), "UTC", "06:00",
                                      lastResetOn("2024-01-02"), std::nullopt);
    QVERIFY(!decision.needed);
    QCOMPARE(decision.reason, ResetReason::None);

    const auto later = shouldReset(at("2024-01-03T06:00:00Z"), "UTC", "06:00",
                                   lastResetOn("2024-01-02"), std::nullopt);
    QVERIFY(later.needed);
}

void ResetDecisionTests::testCatchUpCollapsesMissedDays()
{
    const auto decision = shouldReset(at("2024-01-10T09:00:00Z"), "UTC", "00:00",
                                      lastResetOn("2024-01-05"), std::nullopt);
    QVERIFY(decision.needed);
    QCOMPARE(decision.reason, ResetReason::CatchUp);
    QCOMPARE(QString::fromStdString(decision.today), QStringLiteral("2024-01-10"));
}

void ResetDecisionTests::testSameDayNotDue()
{
    const auto decision = shouldReset(at("2024-01-03T23:00:00Z"), "UTC", "00:00",
                                      lastResetOn("2024-01-03", "2024-01-03T00:00:05Z"),
                                      std::nullopt);
    QVERIFY(!decision.needed);
}

void ResetDecisionTests::testTimeChanged()
{
    // Reset ran at 00:00:05, then the user moved the reset time to 09:00.
    ResetBookkeeping bookkeeping = lastResetOn("2024-01-03", "2024-01-03T00:00:05Z");
    bookkeeping.resetTimeChangedAt = at("2024-01-03T08:00:00Z");

    const auto before = shouldReset(at("2024-01-03T08:30:00Z"), "UTC", "09:00",
                                    bookkeeping, std::nullopt);
    QVERIFY(!before.needed);

    const auto after = shouldReset(at("2024-01-03T09:00:00Z"), "UTC", "09:00",
                                   bookkeeping, std::nullopt);
    QVERIFY(after.needed);
    QCOMPARE(after.reason, ResetReason::TimeChanged);

    // Without a recorded change the same situation is not a reset.
    bookkeeping.resetTimeChangedAt.reset();
    const auto unchanged = shouldReset(at("2024-01-03T09:00:00Z"), "UTC", "09:00",
                                       bookkeeping, std::nullopt);
    QVERIFY(!unchanged.needed);

    // A change recorded before the last reset is already accounted for.
    bookkeeping.resetTimeChangedAt = at("2024-01-02T20:00:00Z");
    const auto stale = shouldReset(at("2024-01-03T09:00:00Z"), "UTC", "09:00",
                                   bookkeeping, std::nullopt);
    QVERIFY(!stale.needed);
}

void ResetDecisionTests::testFutureLastResetNeverResets()
{
    const SessionGapInfo session{at("2024-01-01T00:00:00Z"), "2024-01-01"};
    const auto decision = shouldReset(at("2024-01-03T10:00:00Z"), "UTC", "00:00",
                                      lastResetOn("2024-01-05"), session);
    QVERIFY(!decision.needed);
    QCOMPARE(decision.reason, ResetReason::None);
}

void ResetDecisionTests::testSessionGap()
{
    // Last reset yesterday but the reset time (06:00) has not passed yet: only
    // the session gap rule can fire.
    const SessionGapInfo session{at("2024-01-02T18:00:00Z"), "2024-01-02"};
    const auto decision = shouldReset(at("2024-01-03T05:00:00Z"), "UTC", "06:00",
                                      lastResetOn("2024-01-02"), session);
    QVERIFY(decision.needed);
    QCOMPARE(decision.reason, ResetReason::SessionGap);

    // Short gap: not a reason.
    const SessionGapInfo recent{at("2024-01-03T04:00:00Z"), "2024-01-02"};
    QVERIFY(!shouldReset(at("2024-01-03T05:00:00Z"), "UTC", "06:00",
                         lastResetOn("2024-01-02"), recent).needed);

    // Same cached day: not a reason.
    const SessionGapInfo sameDay{at("2024-01-03T00:30:00Z"), "2024-01-03"};
    QVERIFY(!shouldReset(at("2024-01-03T05:00:00Z"), "UTC", "06:00",
                         lastResetOn("2024-01-02"), sameDay).needed);

    // Already reset today: a long idle gap does not reset again.
    QVERIFY(!shouldReset(at("2024-01-03T05:00:00Z"), "UTC", "00:00",
                         lastResetOn("2024-01-03", "2024-01-03T00:00:01Z"), session).needed);
}

void ResetDecisionTests::testDeterministic()
{
    const SessionGapInfo session{at("2024-01-02T18:00:00Z"), "2024-01-02"};
    const auto first = shouldReset(at("2024-01-04T07:00:00Z"), "Europe/Berlin", "08:00",
                                   lastResetOn("2024-01-02"), session);
    for (int i = 0; i < 5; ++i) {
        const auto again = shouldReset(at("2024-01-04T07:00:00Z"), "Europe/Berlin", "08:00",
                                       lastResetOn("2024-01-02"), session);
        QCOMPARE(again.needed, first.needed);
        QCOMPARE(again.reason, first.reason);
        QCOMPARE(again.today, first.today);
    }
}

void ResetDecisionTests::testTimezoneDefinesToday()
{
    // 2024-01-03T01:00Z is still Jan 2 in New York.
    const auto decision = shouldReset(at("2024-01-03T01:00:00Z"), "America/New_York", "00:00",
                                      lastResetOn("2024-01-02"), std::nullopt);
    QVERIFY(!decision.needed);
    QCOMPARE(QString::fromStdString(decision.today), QStringLiteral("2024-01-02"));
}

void ResetDecisionTests::testNextResetInstant()
{
    const auto beforeReset = nextResetInstant(at("2024-01-03T05:00:00Z"), "UTC", "06:00");
    QVERIFY(beforeReset.has_value());
    QCOMPARE(QString::fromStdString(toIso8601Utc(*beforeReset)),
             QStringLiteral("2024-01-03T06:00:00Z"));

    const auto afterReset = nextResetInstant(at("2024-01-03T06:00:00Z"), "UTC", "06:00");
    QVERIFY(afterReset.has_value());
    QCOMPARE(QString::fromStdString(toIso8601Utc(*afterReset)),
             QStringLiteral("2024-01-04T06:00:00Z"));
}

QTEST_MAIN(ResetDecisionTests)
#include "test_reset_decision.moc"
