#include "common/config.hpp"

#include <QDir>

namespace worklog {

namespace {

const QString kDataFlag = QStringLiteral("--data");
const QString kTraceFlag = QStringLiteral("--trace");

} // namespace

QString defaultDataFilePath()
{
    const QString home = qEnvironmentVariable("HOME");
    const QString base = home.isEmpty()
        ? QStringLiteral(".local/share/worklog")
        : home + QStringLiteral("/.local/share/worklog");
    return base + QDir::separator() + QStringLiteral("time_records.json");
}

WorklogConfig loadConfig(const QStringList &args)
{
    WorklogConfig config;
    config.traceEnabled = qEnvironmentVariableIntValue("WORKLOG_TRACE") == 1;

    QString dataOverride;
    for (int i = 0; i < args.size(); ++i) {
        const QString &arg = args.at(i);
        if (i == 0) {
            config.remainingArgs.push_back(arg);
            continue;
        }
        if (arg == kTraceFlag) {
            config.traceEnabled = true;
            continue;
        }
        if (arg == kDataFlag) {
            if (i + 1 >= args.size()) {
                config.error = QStringLiteral("--data requires a path");
                continue;
            }
            dataOverride = args.at(++i);
            continue;
        }
        if (arg.startsWith(kDataFlag + QLatin1Char('='))) {
            dataOverride = arg.mid(kDataFlag.size() + 1);
            continue;
        }
        config.remainingArgs.push_back(arg);
    }

    if (!dataOverride.isEmpty()) {
        config.dataFile = dataOverride;
    } else {
        const QString fromEnv = qEnvironmentVariable("WORKLOG_DATA_FILE");
        config.dataFile = fromEnv.isEmpty() ? defaultDataFilePath() : fromEnv;
    }

    return config;
}

} // namespace worklog
