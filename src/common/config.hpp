#pragma once

#include <QString>
#include <QStringList>

namespace worklog {

// Resolved runtime configuration. Precedence for the storage path is
// --data, then WORKLOG_DATA_FILE, then the per-user default.
struct WorklogConfig {
    QString dataFile;
    bool traceEnabled = false;

    // Arguments left after the global flags were consumed; args[0] is kept.
    QStringList remainingArgs;

    // Non-empty when a global flag was malformed (e.g. --data without a value).
    QString error;
};

QString defaultDataFilePath();

WorklogConfig loadConfig(const QStringList &args);

} // namespace worklog
