#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace lspbridge::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Initialize logging for the current process. Call early in main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Correlation support for linking the events of one invocation.
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
QString logsDirPath();

} // namespace lspbridge::logging

#define LBLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::lspbridge::logging::logEvent(::lspbridge::logging::LogLevel::Debug, \
                                   ::lspbridge::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define LBLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::lspbridge::logging::logEvent(::lspbridge::logging::LogLevel::Info, \
                                   ::lspbridge::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define LBLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::lspbridge::logging::logEvent(::lspbridge::logging::LogLevel::Warn, \
                                   ::lspbridge::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define LBLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::lspbridge::logging::logEvent(::lspbridge::logging::LogLevel::Error, \
                                   ::lspbridge::logging::defaultProcessName(), \
                                   (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
