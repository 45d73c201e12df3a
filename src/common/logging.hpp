#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace fluxsync::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
// FLUXSYNC_TRACE=1 in the environment also turns trace mode on.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking a dispatch with its worker.
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
// "host:<name>,uid:<n>", looked up once per process.
QString defaultWho();

} // namespace fluxsync::logging

#define FSLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::fluxsync::logging::logEvent(::fluxsync::logging::LogLevel::Debug, \
                                  ::fluxsync::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FSLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::fluxsync::logging::logEvent(::fluxsync::logging::LogLevel::Info, \
                                  ::fluxsync::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FSLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::fluxsync::logging::logEvent(::fluxsync::logging::LogLevel::Warn, \
                                  ::fluxsync::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define FSLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::fluxsync::logging::logEvent(::fluxsync::logging::LogLevel::Error, \
                                  ::fluxsync::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
