#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace crystalbuild::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

/**
 * Initialize logging for the current process. Call early in main().
 *
 * Events go to <logs>/<process>.log as JSON lines. With trace enabled,
 * debug events are kept as well and every event is also written to
 * <process>-trace.log.
 *
 * <logs> is ~/.local/share/crystalbuild/logs of the user who started the
 * build: under sudo/doas that is the invoking user, not root, and the files
 * created there are handed to that user.
 */
void initLogging(const QString &processName, bool traceEnabled);

// "corr" of every event logged while the scope is alive; one per build run.
class CorrelationScope {
public:
    explicit CorrelationScope(const QString &corrId);
    ~CorrelationScope();

    CorrelationScope(const CorrelationScope &) = delete;
    CorrelationScope &operator=(const CorrelationScope &) = delete;

private:
    QString m_prev;
};

QString currentCorrelationId();

// "stage" of every event logged while the scope is alive, e.g. "finalize".
class StageScope {
public:
    explicit StageScope(const QString &stage);
    ~StageScope();

    StageScope(const StageScope &) = delete;
    StageScope &operator=(const StageScope &) = delete;

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

// host, real and effective uid, plus the sudo/doas caller when there is one.
QString defaultWho();

} // namespace crystalbuild::logging

#define CBLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::crystalbuild::logging::logEvent(::crystalbuild::logging::LogLevel::Debug, \
                                      ::crystalbuild::logging::defaultProcessName(), \
                                      (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CBLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::crystalbuild::logging::logEvent(::crystalbuild::logging::LogLevel::Info, \
                                      ::crystalbuild::logging::defaultProcessName(), \
                                      (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CBLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::crystalbuild::logging::logEvent(::crystalbuild::logging::LogLevel::Warn, \
                                      ::crystalbuild::logging::defaultProcessName(), \
                                      (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define CBLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::crystalbuild::logging::logEvent(::crystalbuild::logging::LogLevel::Error, \
                                      ::crystalbuild::logging::defaultProcessName(), \
                                      (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
