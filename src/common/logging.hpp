#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace hoststate::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Thread-local correlation support for linking related log events.
void setCorrelationId(const QString &corrId);
QString currentCorrelationId();

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

// $HOSTSTATE_LOG_DIR, else $HOME/.local/share/hoststate/logs.
QString logsDirPath();

} // namespace hoststate::logging

#define HSLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::hoststate::logging::logEvent(::hoststate::logging::LogLevel::Debug, \
                                   ::hoststate::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HSLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::hoststate::logging::logEvent(::hoststate::logging::LogLevel::Info, \
                                   ::hoststate::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HSLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::hoststate::logging::logEvent(::hoststate::logging::LogLevel::Warn, \
                                   ::hoststate::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define HSLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::hoststate::logging::logEvent(::hoststate::logging::LogLevel::Error, \
                                   ::hoststate::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
