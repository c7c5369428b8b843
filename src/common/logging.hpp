#pragma once

#include <exception>

#include <QString>

#include <nlohmann/json.hpp>

namespace worklog::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Tracing writes debug events and mirrors everything to <process>-trace.log.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Events below this level are dropped. Debug is still gated by tracing.
void setMinimumLevel(LogLevel level);
LogLevel minimumLevel();
LogLevel parseLogLevel(const QString &value, LogLevel fallback = LogLevel::Info);

// Thread-local correlation support for linking related log events.
// One CLI invocation or one sync run shares a correlation id.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();
QString newCorrelationId();

class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

private:
    QString m_prev;
};

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const QString &correlationId,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

// Context payload for a caught exception: {"error": what(), ...extra}.
nlohmann::json errorContext(const std::exception &ex,
                            nlohmann::json extra = nlohmann::json::object());

} // namespace worklog::logging

#define WLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::worklog::logging::logEvent(::worklog::logging::LogLevel::Debug, \
                                 ::worklog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define WLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::worklog::logging::logEvent(::worklog::logging::LogLevel::Info, \
                                 ::worklog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define WLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::worklog::logging::logEvent(::worklog::logging::LogLevel::Warn, \
                                 ::worklog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define WLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::worklog::logging::logEvent(::worklog::logging::LogLevel::Error, \
                                 ::worklog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
