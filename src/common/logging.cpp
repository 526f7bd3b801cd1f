#include "common/logging.hpp"

#include <QCoreApplication>
#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>

#include <unistd.h>

#include <cstdio>
#include <iostream>
#include <mutex>

namespace worklog::logging {

namespace {

constexpr qint64 kRotateAtBytes = 5 * 1024 * 1024;

std::mutex g_logMutex;
LogOptions g_options;

const char *levelName(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    }
    return "INFO";
}

bool keepEvent(LogLevel level)
{
    return level != LogLevel::Debug || g_options.traceEnabled;
}

QString logsDirectory()
{
    return g_options.directory.isEmpty() ? logsDirPath() : g_options.directory;
}

// One generation is kept: <file>.1 is replaced on every rotation.
void rotateIfNeeded(const QString &path)
{
    const QFileInfo info(path);
    if (!info.exists() || info.size() < kRotateAtBytes) {
        return;
    }
    const QString rotated = path + QStringLiteral(".1");
    QFile::remove(rotated);
    QFile::rename(path, rotated);
}

void appendLine(const QString &path, const std::string &line)
{
    QDir().mkpath(QFileInfo(path).absolutePath());
    rotateIfNeeded(path);

    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
        // Logging must never take the tracker down; fall back to stderr.
        std::fprintf(stderr, "%s\n", line.c_str());
        return;
    }
    file.write(line.data(), static_cast<qint64>(line.size()));
    file.write("\n", 1);
}

// "worklog DEBUG ExportFilter.selectRange malformed_records_skipped {"skipped":1}"
std::string traceLine(LogLevel level,
                      const QString &process,
                      const QString &component,
                      const QString &where,
                      const QString &what,
                      const std::string &context)
{
    return process.toStdString() + " " + levelName(level) + " "
        + component.toStdString() + "." + where.toStdString() + " "
        + what.toStdString() + " " + context;
}

} // namespace

void initLogging(const LogOptions &options)
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_options = options;
}

bool isTraceEnabled()
{
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_options.traceEnabled;
}

QString logsDirPath()
{
    const QString home = qEnvironmentVariable("HOME");
    if (home.isEmpty()) {
        return QStringLiteral(".local/share/worklog/logs");
    }
    return home + QStringLiteral("/.local/share/worklog/logs");
}

QString logFilePath(const QString &processName)
{
    const QString base = processName.isEmpty() ? QStringLiteral("worklog") : processName;
    std::lock_guard<std::mutex> lock(g_logMutex);
    return logsDirectory() + QLatin1Char('/') + base + QStringLiteral(".log");
}

QString defaultProcessName()
{
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        if (!g_options.processName.isEmpty()) {
            return g_options.processName;
        }
    }
    if (QCoreApplication::instance()) {
        const QString appName = QCoreApplication::applicationName();
        if (!appName.isEmpty()) {
            return appName;
        }
    }
    return QStringLiteral("worklog");
}

QString defaultWho()
{
    char hostname[256] = {};
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        hostname[0] = '\0';
    }
    return QStringLiteral("host:%1,uid:%2")
        .arg(QString::fromUtf8(hostname))
        .arg(static_cast<int>(getuid()));
}

void logEvent(LogLevel level,
              const QString &processName,
              const QString &component,
              const QString &where,
              const QString &what,
              const QString &why,
              const QString &how,
              const QString &who,
              const nlohmann::json &context)
{
    const QString process = processName.isEmpty() ? defaultProcessName() : processName;
    const QString path = logFilePath(process);

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (!keepEvent(level)) {
        return;
    }

    const nlohmann::json payload = {
        {"ts", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs).toStdString()},
        {"level", levelName(level)},
        {"process", process.toStdString()},
        {"pid", static_cast<long long>(getpid())},
        {"component", component.toStdString()},
        {"where", where.toStdString()},
        {"what", what.toStdString()},
        {"why", why.toStdString()},
        {"how", how.toStdString()},
        {"who", who.toStdString()},
        {"context", context}
    };

    // Context may carry user text that is not valid UTF-8.
    constexpr auto kReplace = nlohmann::json::error_handler_t::replace;
    appendLine(path, payload.dump(-1, ' ', false, kReplace));

    if (g_options.traceEnabled) {
        std::cerr << traceLine(level, process, component, where, what,
                               context.dump(-1, ' ', false, kReplace))
                  << std::endl;
    }
}

} // namespace worklog::logging
