#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace apptrail::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

// Selects <logsDirPath>/<processName>.log and, with traceEnabled, the
// <processName>-trace.log mirror that also receives Debug records. Calling it
// again closes the files opened so far.
void initLogging(const QString &processName, bool traceEnabled);

bool isTraceEnabled();

// Directory holding the diagnostic logs. APPTRAIL_LOG_DIR overrides the
// default under $HOME.
QString logsDirPath();

// Labels every record written from the current thread while alive: "thread"
// becomes the monitor name and an empty correlation id falls back to the run id.
class MonitorScope {
public:
    MonitorScope(const QString &monitorName, const QString &runId);
    ~MonitorScope();

    MonitorScope(const MonitorScope &) = delete;
    MonitorScope &operator=(const MonitorScope &) = delete;

private:
    QString m_prevMonitor;
    QString m_prevRunId;
};

QString currentMonitor();
QString currentRunId();

// Structured diagnostic record. All fields are required; use empty strings where unknown.
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

} // namespace apptrail::logging

#define ATLOG_DEBUG(component, where, what, why, how, who, corr, ctxJson) \
    ::apptrail::logging::logEvent(::apptrail::logging::LogLevel::Debug, \
                                  ::apptrail::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ATLOG_INFO(component, where, what, why, how, who, corr, ctxJson) \
    ::apptrail::logging::logEvent(::apptrail::logging::LogLevel::Info, \
                                  ::apptrail::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ATLOG_WARN(component, where, what, why, how, who, corr, ctxJson) \
    ::apptrail::logging::logEvent(::apptrail::logging::LogLevel::Warn, \
                                  ::apptrail::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))

#define ATLOG_ERROR(component, where, what, why, how, who, corr, ctxJson) \
    ::apptrail::logging::logEvent(::apptrail::logging::LogLevel::Error, \
                                  ::apptrail::logging::defaultProcessName(), \
                                  (component), (where), (what), (why), (how), (who), (corr), (ctxJson))
