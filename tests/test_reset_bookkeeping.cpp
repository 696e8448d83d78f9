#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <filesystem>

#include "common/json_utils.hpp"
#include "daemon/daybreak_store.hpp"
#include "engine/reset_bookkeeping.hpp"

using namespace daybreak;

class ResetBookkeepingTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void init();
    void testMissingRecordIsBootstrap();
    void testRoundTripThroughStore();
    void testDateNeverMovesBackward();
    void testHistoryCapped();
    void testLegacyImport();
    void testUnreadableRecord();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
    std::filesystem::path m_dbPath;
};

void ResetBookkeepingTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
    m_dbPath = std::filesystem::path(m_tempDir.path().toStdString()) / "bookkeeping.db";
}

void ResetBookkeepingTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void ResetBookkeepingTests::init()
{
    std::error_code error;
    std::filesystem::remove(m_dbPath, error);
}

void ResetBookkeepingTests::testMissingRecordIsBootstrap()
{
    DaybreakStore store(m_dbPath);
    const ResetBookkeeping bookkeeping = loadBookkeeping(store);
    QVERIFY(bookkeeping.lastResetDate.empty());
    QVERIFY(!bookkeeping.lastResetTimestamp.has_value());
    QVERIFY(bookkeeping.history.empty());
}

void ResetBookkeepingTests::testRoundTripThroughStore()
{
    const auto stamp = *parseIso8601Utc("2024-01-03T01:00:00Z");
    {
        DaybreakStore store(m_dbPath);
        ResetBookkeeping bookkeeping;
        recordReset(bookkeeping, "2024-01-03", stamp, ResetType::Automatic, ResetReason::CatchUp);
        saveBookkeeping(store, bookkeeping);
    }

    DaybreakStore store(m_dbPath);
    const ResetBookkeeping loaded = loadBookkeeping(store);
    QCOMPARE(QString::fromStdString(loaded.lastResetDate), QStringLiteral("2024-01-03"));
    QVERIFY(loaded.lastResetTimestamp.has_value());
    QVERIFY(*loaded.lastResetTimestamp == stamp);
    QCOMPARE(loaded.history.size(), static_cast<size_t>(1));
    QCOMPARE(loaded.history.front().reason, ResetReason::CatchUp);
    QCOMPARE(loaded.history.front().type, ResetType::Automatic);

    const auto raw = store.get(keys::kResetBookkeeping);
    QVERIFY(raw.has_value());
    QCOMPARE(QString::fromStdString(raw->at("history").at(0).at("reason").get<std::string>()),
             QStringLiteral("catch-up"));
}

void ResetBookkeepingTests::testDateNeverMovesBackward()
{
    ResetBookkeeping bookkeeping;
    bookkeeping.lastResetDate = "2024-01-05";
    const auto stamp = *parseIso8601Utc("2024-01-03T01:00:00Z");
    recordReset(bookkeeping, "2024-01-03", stamp, ResetType::Manual, ResetReason::Manual);
    QCOMPARE(QString::fromStdString(bookkeeping.lastResetDate), QStringLiteral("2024-01-05"));
    QCOMPARE(bookkeeping.history.size(), static_cast<size_t>(1));

    recordReset(bookkeeping, "2024-01-09", stamp, ResetType::Automatic, ResetReason::CatchUp);
    QCOMPARE(QString::fromStdString(bookkeeping.lastResetDate), QStringLiteral("2024-01-09"));
}

void ResetBookkeepingTests::testHistoryCapped()
{
    ResetBookkeeping bookkeeping;
    auto stamp = *parseIso8601Utc("2024-01-01T00:00:00Z");
    for (int day = 0; day < 40; ++day) {
        recordReset(bookkeeping, addDays("2024-01-01", day), stamp,
                    ResetType::Automatic, ResetReason::DayRolled);
        stamp += std::chrono::hours(24);
    }
    QCOMPARE(bookkeeping.history.size(), kMaxResetHistory);
    QCOMPARE(QString::fromStdString(bookkeeping.history.front().date), QStringLiteral("2024-01-11"));
    QCOMPARE(QString::fromStdString(bookkeeping.history.back().date), QStringLiteral("2024-02-09"));
}

void ResetBookkeepingTests::testLegacyImport()
{
    DaybreakStore store(m_dbPath);
    store.set("last_reset_date", "2023-12-30");
    store.set("last_reset_timestamp", "2023-12-30T00:00:02.000Z");
    store.set("reset_history", nlohmann::json::array({
        {{"date", "2023-12-30"}, {"timestamp", "2023-12-30T00:00:02.000Z"}, {"type", "automatic"}}
    }));

    const ResetBookkeeping bookkeeping = loadBookkeeping(store);
    QCOMPARE(QString::fromStdString(bookkeeping.lastResetDate), QStringLiteral("2023-12-30"));
    QVERIFY(bookkeeping.lastResetTimestamp.has_value());
    QCOMPARE(bookkeeping.history.size(), static_cast<size_t>(1));

    // Once the single record exists the legacy keys are no longer consulted.
    ResetBookkeeping updated = bookkeeping;
    recordReset(updated, "2024-01-02", std::chrono::system_clock::now(),
                ResetType::Automatic, ResetReason::CatchUp);
    saveBookkeeping(store, updated);
    QCOMPARE(QString::fromStdString(loadBookkeeping(store).lastResetDate),
             QStringLiteral("2024-01-02"));
}

void ResetBookkeepingTests::testUnreadableRecord()
{
    DaybreakStore store(m_dbPath);
    store.set(keys::kResetBookkeeping, "corrupted");
    QVERIFY(loadBookkeeping(store).lastResetDate.empty());
}

QTEST_MAIN(ResetBookkeepingTests)
#include "test_reset_bookkeeping.moc"
