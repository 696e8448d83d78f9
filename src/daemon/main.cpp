#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QObject>

#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>

#include <nlohmann/json.hpp>

#include "common/clock.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "daemon/daybreak_store.hpp"
#include "daemon/reset_scheduler.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("daybreak-daemon"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Runs the daily reset and carryforward engine for the work tracker."));
    parser.addHelpOption();

    const QCommandLineOption traceOption(QStringLiteral("trace"),
                                         QStringLiteral("Write debug events and the trace log."));
    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("Database path."),
                                      QStringLiteral("path"));
    const QCommandLineOption resetNowOption(QStringLiteral("reset-now"),
                                            QStringLiteral("Run a manual reset, print the report and exit."));
    const QCommandLineOption statsOption(QStringLiteral("stats"),
                                         QStringLiteral("Print reset statistics and exit."));
    const QCommandLineOption resetTimeOption(QStringLiteral("reset-time"),
                                             QStringLiteral("Set the daily reset time (HH:MM)."),
                                             QStringLiteral("time"));
    const QCommandLineOption retentionOption(QStringLiteral("retention-days"),
                                             QStringLiteral("Set data retention in days (7-365)."),
                                             QStringLiteral("days"));
    parser.addOption(traceOption);
    parser.addOption(dbOption);
    parser.addOption(resetNowOption);
    parser.addOption(statsOption);
    parser.addOption(resetTimeOption);
    parser.addOption(retentionOption);
    parser.process(app);

    const bool trace = parser.isSet(traceOption)
        || qEnvironmentVariableIntValue("DAYBREAK_TRACE") == 1;
    daybreak::logging::initLogging(QStringLiteral("daybreak-daemon"), trace);
    DLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("daemon_start"),
              QStringLiteral("user_start"),
              QStringLiteral("cli"),
              daybreak::logging::defaultWho(),
              QString(),
              (nlohmann::json{{"args", app.arguments().size()}}));

    QString dbPath = parser.value(dbOption);
    if (dbPath.isEmpty()) {
        dbPath = qEnvironmentVariable("DAYBREAK_DB_PATH");
    }

    std::unique_ptr<daybreak::DaybreakStore> store;
    try {
        store = dbPath.isEmpty()
            ? std::make_unique<daybreak::DaybreakStore>()
            : std::make_unique<daybreak::DaybreakStore>(
                  std::filesystem::path(dbPath.toStdString()));
    } catch (const std::exception &ex) {
        std::cerr << "daybreak-daemon: cannot open database: " << ex.what() << std::endl;
        return 1;
    }

    std::string integrityMessage;
    if (!store->integrityCheck(&integrityMessage)) {
        qWarning() << "Daybreak: SQLite integrity check failed, database may be corrupt:"
                   << QString::fromStdString(integrityMessage);
        return 1;
    }

    daybreak::SystemClock clock;
    daybreak::ResetScheduler scheduler(*store, clock);

    bool oneShot = false;
    if (parser.isSet(resetTimeOption)) {
        oneShot = true;
        std::string error;
        if (!scheduler.updateResetTime(parser.value(resetTimeOption).toStdString(), &error)) {
            std::cerr << "daybreak-daemon: " << error << std::endl;
            return 2;
        }
    }
    if (parser.isSet(retentionOption)) {
        oneShot = true;
        bool ok = false;
        const int days = parser.value(retentionOption).toInt(&ok);
        std::string error = "Data retention must be a number of days";
        if (!ok || !scheduler.updateRetentionDays(days, &error)) {
            std::cerr << "daybreak-daemon: " << error << std::endl;
            return 2;
        }
    }
    if (parser.isSet(resetNowOption)) {
        oneShot = true;
        const auto report = scheduler.performManualReset();
        if (!report.has_value()) {
            std::cerr << "daybreak-daemon: a reset is already running" << std::endl;
            return 1;
        }
        std::cout << nlohmann::json(*report).dump(2) << std::endl;
        if (report->hasFailures()) {
            return 1;
        }
    }
    if (parser.isSet(statsOption)) {
        oneShot = true;
        std::cout << nlohmann::json(scheduler.resetStats()).dump(2) << std::endl;
    }
    if (oneShot) {
        return 0;
    }

    QObject::connect(&app, &QCoreApplication::aboutToQuit,
                     &scheduler, &daybreak::ResetScheduler::stop);

    // The scheduler lives for the lifetime of the process.
    scheduler.start();
    return app.exec();
}
