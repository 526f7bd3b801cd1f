#pragma once

#include <QString>

#include <nlohmann/json.hpp>

namespace worklog::logging {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

struct LogOptions {
    QString processName;
    // --trace: Debug events are kept and every event is echoed to stderr.
    bool traceEnabled = false;
    // Empty means logsDirPath().
    QString directory;
};

// Call once from main() after the configuration is known.
void initLogging(const LogOptions &options);

bool isTraceEnabled();

// $HOME/.local/share/worklog/logs
QString logsDirPath();

// Path of the JSON-lines file events for processName are appended to.
QString logFilePath(const QString &processName);

// Structured log event. All fields are required; use empty strings where unknown.
void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const nlohmann::json &context = nlohmann::json::object());

QString defaultProcessName();
QString defaultWho();

} // namespace worklog::logging

#define WLOG_EVENT_(level, component, where, what, why, how, ctxJson) \
    ::worklog::logging::logEvent((level), \
                                 ::worklog::logging::defaultProcessName(), \
                                 (component), (where), (what), (why), (how), \
                                 ::worklog::logging::defaultWho(), (ctxJson))

#define WLOG_DEBUG(component, where, what, why, how, ctxJson) \
    WLOG_EVENT_(::worklog::logging::LogLevel::Debug, component, where, what, why, how, ctxJson)

#define WLOG_INFO(component, where, what, why, how, ctxJson) \
    WLOG_EVENT_(::worklog::logging::LogLevel::Info, component, where, what, why, how, ctxJson)

#define WLOG_WARN(component, where, what, why, how, ctxJson) \
    WLOG_EVENT_(::worklog::logging::LogLevel::Warn, component, where, what, why, how, ctxJson)

#define WLOG_ERROR(component, where, what, why, how, ctxJson) \
    WLOG_EVENT_(::worklog::logging::LogLevel::Error, component, where, what, why, how, ctxJson)
