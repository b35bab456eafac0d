#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace timekeep::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

// Thread-local correlation support for linking related log events.
QString currentCorrelationId();
QString newCorrelationId();

class CorrelationScope {
public:
    // Joins the id already active on this thread, or opens a fresh one.
    CorrelationScope();
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    const QString &id() const { return m_id; }

private:
    QString m_prev;
    QString m_id;
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

} // namespace timekeep::logging

#define TIMEKEEP_LOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::timekeep::logging::logEvent(::timekeep::logging::LogLevel::Debug, \
                                  ::timekeep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TIMEKEEP_LOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::timekeep::logging::logEvent(::timekeep::logging::LogLevel::Info, \
                                  ::timekeep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TIMEKEEP_LOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::timekeep::logging::logEvent(::timekeep::logging::LogLevel::Warn, \
                                  ::timekeep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define TIMEKEEP_LOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::timekeep::logging::logEvent(::timekeep::logging::LogLevel::Error, \
                                  ::timekeep::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
