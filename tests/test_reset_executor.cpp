#include <QtTest/QtTest>

#include <QSignalSpy>
#include <QTemporaryDir>

#include <filesystem>

#include "common/json_utils.hpp"
#include "daemon/daybreak_store.hpp"
#include "engine/reset_bookkeeping.hpp"
#include "engine/reset_executor.hpp"
#include "test_support.hpp"

using namespace daybreak;

class ResetExecutorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testCatchUpResetEndToEnd();
    void testPhaseOrder();
    void testPartialFailureContinues();
    void testFailedBookkeepingLeavesDateUnchanged();
    void testUnreadableBookkeepingKeepsHistory();
    void testManualResetRecorded();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::filesystem::path m_dbPath;

    void seedDay(DocumentStore &store) const;
};

void ResetExecutorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    m_dbPath = std::filesystem::path(m_tempDir.path().toStdString()) / "executor.db";
}

void ResetExecutorTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ResetExecutorTests::init()
{
    std::error_code error;
    std::filesystem::remove(m_dbPath, error);
}

void ResetExecutorTests::seedDay(DocumentStore &store) const
{
    ResetBookkeeping bookkeeping;
    bookkeeping.lastResetDate = "2024-01-01";
    bookkeeping.lastResetTimestamp = *parseIso8601Utc("2024-01-01T00:00:03Z");
    saveBookkeeping(store, bookkeeping);

    ChecklistTemplate plan;
    plan.id = "tpl-plan";
    plan.text = "Plan the day";
    store.saveToStore(stores::kChecklistItems, nlohmann::json(plan));

    ChecklistItem done;
    done.id = "daily-2024-01-01-tpl-plan";
    done.text = plan.text;
    done.date = "2024-01-01";
    done.templateId = plan.id;
    done.completed = true;
    store.saveToStore(stores::kChecklistItems, nlohmann::json(done));

    TodoItem todo;
    todo.id = "todo-1";
    todo.text = "Draft proposal";
    todo.date = "2024-01-01";
    todo.carryCount = 2;
    store.saveToStore(stores::kTodos, nlohmann::json(todo));

    Meeting sync;
    sync.id = "m-sync";
    sync.date = "2024-01-03";
    sync.completed = true;
    sync.notes = "Agenda drafted";
    store.saveToStore(stores::kMeetings, nlohmann::json(sync));
}

void ResetExecutorTests::testCatchUpResetEndToEnd()
{
    DaybreakStore store(m_dbPath);
    testing::FakeClock clock("2024-01-03T01:00:00Z");
    seedDay(store);

    ResetExecutor executor(store, clock);
    QSignalSpy completeSpy(&executor, &ResetExecutor::dailyResetComplete);
    QSignalSpy failedSpy(&executor, &ResetExecutor::resetFailed);

    ResetRequest request;
    request.reason = ResetReason::CatchUp;
    const ResetReport report = executor.execute(request);

    QVERIFY(!report.hasFailures());
    QVERIFY(report.bookkeepingCommitted);
    QCOMPARE(QString::fromStdString(report.date), QStringLiteral("2024-01-03"));
    QVERIFY(!report.correlationId.empty());
    QCOMPARE(executor.currentPhase(), ResetPhase::Idle);

    // Two missed days collapse into one reset and one history entry.
    const ResetBookkeeping bookkeeping = loadBookkeeping(store);
    QCOMPARE(QString::fromStdString(bookkeeping.lastResetDate), QStringLiteral("2024-01-03"));
    QCOMPARE(bookkeeping.history.size(), static_cast<size_t>(1));
    QCOMPARE(bookkeeping.history.front().reason, ResetReason::CatchUp);

    QCOMPARE(completeSpy.count(), 1);
    QCOMPARE(completeSpy.at(0).at(0).toString(), QStringLiteral("2024-01-03"));
    QCOMPARE(completeSpy.at(0).at(1).toDateTime(), toQDateTime(clock.now()));
    QCOMPARE(failedSpy.count(), 0);

    // The last reset day was archived.
    QCOMPARE(report.outcome(ResetPhase::Archiving)->count, 1);
    QCOMPARE(store.getAllFromStore(stores::kJournals, "id", std::string("archive-2024-01-01")).size(),
             static_cast<size_t>(1));

    // Today's checklist exists and is fresh.
    const auto today = store.getAllFromStore(stores::kChecklistItems, "date", std::string("2024-01-03"));
    QCOMPARE(today.size(), static_cast<size_t>(1));
    QVERIFY(!today.front().at("completed").get<bool>());

    const TodoItem todo = store.getAllFromStore(stores::kTodos).front().get<TodoItem>();
    QCOMPARE(QString::fromStdString(todo.date), QStringLiteral("2024-01-03"));
    QCOMPARE(todo.priority, TodoPriority::High);

    const Meeting meeting = store.getAllFromStore(stores::kMeetings).front().get<Meeting>();
    QVERIFY(!meeting.completed);
    QCOMPARE(QString::fromStdString(meeting.notes), QStringLiteral("Agenda drafted"));
}

void ResetExecutorTests::testPhaseOrder()
{
    DaybreakStore store(m_dbPath);
    testing::FakeClock clock("2024-01-03T01:00:00Z");

    ResetExecutor executor(store, clock);
    QSignalSpy phaseSpy(&executor, &ResetExecutor::phaseStarted);
    const ResetReport report = executor.execute(ResetRequest{});

    const QStringList expected = {
        QStringLiteral("archiving"),
        QStringLiteral("checklist_materialization"),
        QStringLiteral("todo_carryforward"),
        QStringLiteral("meeting_reset"),
        QStringLiteral("retention_cleanup"),
        QStringLiteral("bookkeeping_update"),
        QStringLiteral("notify_complete"),
    };
    QCOMPARE(phaseSpy.count(), expected.size());
    for (int i = 0; i < expected.size(); ++i) {
        QCOMPARE(phaseSpy.at(i).at(0).toString(), expected.at(i));
    }
    QCOMPARE(report.phases.size(), static_cast<size_t>(expected.size()));
}

void ResetExecutorTests::testPartialFailureContinues()
{
    DaybreakStore inner(m_dbPath);
    testing::FailingDocumentStore store(inner);
    testing::FakeClock clock("2024-01-03T01:00:00Z");
    seedDay(inner);
    store.failSavesTo(stores::kTodos);
    store.failReadsOf(stores::kMeetings);

    ResetExecutor executor(store, clock);
    QSignalSpy completeSpy(&executor, &ResetExecutor::dailyResetComplete);
    QSignalSpy failedSpy(&executor, &ResetExecutor::resetFailed);

    ResetRequest request;
    request.reason = ResetReason::CatchUp;
    const ResetReport report = executor.execute(request);

    QVERIFY(report.hasFailures());
    QCOMPARE(report.outcome(ResetPhase::TodoCarryforward)->failures, 1);
    QVERIFY(report.outcome(ResetPhase::TodoCarryforward)->ok);
    QVERIFY(!report.outcome(ResetPhase::MeetingReset)->ok);
    QVERIFY(!report.outcome(ResetPhase::MeetingReset)->error.empty());
    QVERIFY(report.outcome(ResetPhase::ChecklistMaterialization)->ok);
    QVERIFY(report.outcome(ResetPhase::RetentionCleanup)->ok);

    // Later phases still ran.
    QVERIFY(report.bookkeepingCommitted);
    QCOMPARE(QString::fromStdString(loadBookkeeping(inner).lastResetDate),
             QStringLiteral("2024-01-03"));
    QCOMPARE(completeSpy.count(), 1);
    QCOMPARE(failedSpy.count(), 1);
    QVERIFY(failedSpy.at(0).at(0).toString().contains(QStringLiteral("meeting_reset")));
}

void ResetExecutorTests::testFailedBookkeepingLeavesDateUnchanged()
{
    DaybreakStore inner(m_dbPath);
    testing::FailingDocumentStore store(inner);
    testing::FakeClock clock("2024-01-03T01:00:00Z");
    seedDay(inner);
    store.failSetOf(keys::kResetBookkeeping);

    ResetExecutor executor(store, clock);
    const ResetReport report = executor.execute(ResetRequest{});

    QVERIFY(!report.bookkeepingCommitted);
    QVERIFY(!report.outcome(ResetPhase::BookkeepingUpdate)->ok);
    QCOMPARE(QString::fromStdString(loadBookkeeping(inner).lastResetDate),
             QStringLiteral("2024-01-01"));
}

void ResetExecutorTests::testUnreadableBookkeepingKeepsHistory()
{
    DaybreakStore inner(m_dbPath);
    testing::FailingDocumentStore store(inner);
    testing::FakeClock clock("2024-01-03T01:00:00Z");
    seedDay(inner);
    ResetBookkeeping seeded = loadBookkeeping(inner);
    recordReset(seeded, "2024-01-01", *parseIso8601Utc("2024-01-01T00:00:03Z"),
                ResetType::Automatic, ResetReason::DayRolled);
    saveBookkeeping(inner, seeded);
    store.failGetOf(keys::kResetBookkeeping);

    ResetExecutor executor(store, clock);
    const ResetReport report = executor.execute(ResetRequest{});

    QVERIFY(!report.bookkeepingCommitted);
    QVERIFY(!report.outcome(ResetPhase::Archiving)->ok);
    QVERIFY(!report.outcome(ResetPhase::BookkeepingUpdate)->ok);
    const ResetBookkeeping kept = loadBookkeeping(inner);
    QCOMPARE(QString::fromStdString(kept.lastResetDate), QStringLiteral("2024-01-01"));
    QCOMPARE(kept.history.size(), static_cast<size_t>(1));
}

void ResetExecutorTests::testManualResetRecorded()
{
    DaybreakStore store(m_dbPath);
    testing::FakeClock clock("2024-01-03T15:00:00Z");

    ResetRequest request;
    request.type = ResetType::Manual;
    request.reason = ResetReason::Manual;
    ResetExecutor executor(store, clock);
    executor.execute(request);

    const ResetBookkeeping bookkeeping = loadBookkeeping(store);
    QCOMPARE(bookkeeping.history.size(), static_cast<size_t>(1));
    QCOMPARE(bookkeeping.history.front().type, ResetType::Manual);
    QCOMPARE(bookkeeping.history.front().reason, ResetReason::Manual);
}

QTEST_MAIN(ResetExecutorTests)
#include "test_reset_executor.moc"
