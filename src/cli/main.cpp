#include <QCoreApplication>

#include "cli/WorklogCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("worklog"));

    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    const worklog::WorklogConfig config = worklog::loadConfig(args);

    worklog::logging::LogOptions logOptions;
    logOptions.processName = QStringLiteral("worklog");
    logOptions.traceEnabled = config.traceEnabled;
    worklog::logging::initLogging(logOptions);
    WLOG_INFO(QStringLiteral("main"),
              QStringLiteral("main"),
              QStringLiteral("worklog_start"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              (nlohmann::json{{"args", config.remainingArgs.size()},
                              {"trace", config.traceEnabled}}));

    worklog::WorklogCli cli;
    return cli.run(config);
}
