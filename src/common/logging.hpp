#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace pctoolkit::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// Trace mode is also switched on by PCTOOLKIT_TRACE=1.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding <process>.log and <process>-trace.log.
QString logsDirectory();

// Correlation ids are thread-local. newCorrelationId() returns a fresh id
// without installing it.
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

// One JSON line per event. Pass empty strings for fields that do not apply.
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

} // namespace pctoolkit::logging

// Debug events are dropped unless trace mode is on. In trace mode every
// event is also copied to <process>-trace.log.
#define PTLOG_EVENT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::pctoolkit::logging::logEvent((level), ::pctoolkit::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), \
                                   (corr), (ctxJson))

#define PTLOG_DEBUG(...) PTLOG_EVENT(::pctoolkit::logging::LogLevel::Debug, __VA_ARGS__)
#define PTLOG_INFO(...) PTLOG_EVENT(::pctoolkit::logging::LogLevel::Info, __VA_ARGS__)
#define PTLOG_WARN(...) PTLOG_EVENT(::pctoolkit::logging::LogLevel::Warn, __VA_ARGS__)
#define PTLOG_ERROR(...) PTLOG_EVENT(::pctoolkit::logging::LogLevel::Error, __VA_ARGS__)
