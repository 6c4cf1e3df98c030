#pragma once

#include <QString>

#include <cstddef>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace snapfreeze::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Set the process name used for the log file names and whether debug events
// (and the -trace.log copy) are recorded. Call once from main().
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// SNAPFREEZE_LOG_DIR, else $HOME/.local/share/snapfreeze/logs.
QString logsDirPath();

// While filesystems are frozen a write to one of them blocks until it is
// thawed, so file output is held in memory from freeze to thaw.
// releaseFileOutput() writes the held events; the log directory is treated as
// unwritable for the rest of the process when it lies under one of
// stillFrozen, and its events go to stderr instead.
void holdFileOutput();
void releaseFileOutput(const std::vector<std::string> &stillFrozen = {});
bool isFileOutputHeld();
std::size_t heldEventCount();

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

// One JSON line per event. Empty strings are fine for unknown fields; an
// empty correlationId falls back to the current correlation scope.
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

} // namespace snapfreeze::logging

#define SFLOG_AT(level, component, where, what, why, how, who, corr, ctxJson) \
    ::snapfreeze::logging::logEvent(::snapfreeze::logging::LogLevel::level, \
                                    ::snapfreeze::logging::defaultProcessName(), \
                                    (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define SFLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    SFLOG_AT(Debug, component, where, what, why, how, who, corr, ctxJson)
#define SFLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    SFLOG_AT(Info, component, where, what, why, how, who, corr, ctxJson)
#define SFLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    SFLOG_AT(Warn, component, where, what, why, how, who, corr, ctxJson)
#define SFLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    SFLOG_AT(Error, component, where, what, why, how, who, corr, ctxJson)
