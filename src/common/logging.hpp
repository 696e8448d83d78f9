#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace daybreak::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Call early in main(). Events go to $HOME/.local/share/daybreak/logs/<process>.log;
// with trace on, debug events are kept and everything is mirrored into
// <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

// A reset run tags every event it logs with one id. Events logged with an
// empty correlation id pick up the innermost scope's id.
QString newCorrelationId(const QString &prefix);
QString currentCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

void logEvent(LogLevel level,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultWho();

} // namespace daybreak::logging

#define DLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::daybreak::logging::logEvent(::daybreak::logging::LogLevel::Debug, \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define DLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::daybreak::logging::logEvent(::daybreak::logging::LogLevel::Info, \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define DLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::daybreak::logging::logEvent(::daybreak::logging::LogLevel::Warn, \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define DLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::daybreak::logging::logEvent(::daybreak::logging::LogLevel::Error, \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
