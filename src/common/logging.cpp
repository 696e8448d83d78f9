#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QThread>
#include <QUuid>

#include <unistd.h>

#include <cstdio>
#include <mutex>

namespace daybreak::logging {

namespace {

constexpr qint64 kMaxLogSizeBytes = 5 * 1024 * 1024;

struct LogSink {
    std::mutex mutex;
    QString processName;
    bool trace = false;
};

LogSink &sink()
{
    static LogSink instance;
    return instance;
}

thread_local QString t_corrId;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

QString logsDir()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString relative = QStringLiteral(".local/share/daybreak/logs");
    return home.isEmpty() ? relative : home + QLatin1Char('/') + relative;
}

// Caller holds the sink mutex.
QString processNameLocked(const LogSink &state)
{
    if (!state.processName.isEmpty()) {
        return state.processName;
    }
    if (QCoreApplication::instance() && !QCoreApplication::applicationName().isEmpty()) {
        return QCoreApplication::applicationName();
    }
    return QStringLiteral("daybreak");
}

// Keeps one previous generation as <file>.1.
void appendLine(const QString &path, const QByteArray &line)
{
    const QFileInfo info(path);
    if (info.exists() && info.size() >= kMaxLogSizeBytes) {
        const QString previous = path + QStringLiteral(".1");
        QFile::remove(previous);
        QFile::rename(path, previous);
    }

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        fprintf(stderr, "%s\n", line.constData());
        return;
    }
    file.write(line);
    file.write("\n");
}

} // namespace

void initLogging(const QString &processName, bool traceEnabled)
{
    LogSink &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.processName = processName;
    state.trace = traceEnabled;
}

QString newCorrelationId(const QString &prefix)
{
    return prefix + QLatin1Char('-')
        + QUuid::createUuid().toString(QUuid::WithoutBraces).left(8);
}

QString currentCorrelationId()
{
    return t_corrId;
}

CorrelationScope::CorrelationScope(const QString &corrId)
    : m_prev(t_corrId)
{
    t_corrId = corrId;
}

CorrelationScope::~CorrelationScope()
{
    t_corrId = m_prev;
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context)
{
    LogSink &state = sink();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (level == LogLevel::Debug && !state.trace) {
        return;
    }

    const QString process = processNameLocked(state);
    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"thread", QStringLiteral("0x%1")
                       .arg(reinterpret_cast<quintptr>(QThread::currentThreadId()), 0, 16)
                       .toStdString()},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"corr", (correlationId.isEmpty() ? t_corrId : correlationId).toStdString()},
        {"context", context}
    };
    const QByteArray line = QByteArray::fromStdString(payload.dump());

    const QString dir = logsDir();
    QDir().mkpath(dir);
    appendLine(dir + QLatin1Char('/') + process + QStringLiteral(".log"), line);
    if (state.trace) {
        appendLine(dir + QLatin1Char('/') + process + QStringLiteral("-trace.log"), line);
    }
}

} // namespace daybreak::logging
