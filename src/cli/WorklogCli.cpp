#include "cli/WorklogCli.hpp"

#include <iostream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "tracker/export_filter.hpp"
#include "tracker/record_editor.hpp"
#include "tracker/record_store.hpp"
#include "tracker/session_timer.hpp"
#include "tracker/table_writer.hpp"

namespace worklog {

namespace {

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  worklog [--data PATH] [--trace] session\n"
        "  worklog [--data PATH] list [--format text|json]\n"
        "  worklog [--data PATH] edit --index N [--start TEXT] [--end TEXT] [--comment TEXT]\n"
        "  worklog [--data PATH] delete --index N\n"
        "  worklog [--data PATH] export --from YYYY-MM-DD --to YYYY-MM-DD --out PATH\n"
        "\n"
        "Times for edit use YYYY-MM-DD HH:MM:SS.\n");
}

std::string sessionHelpText()
{
    return "Commands: start, pause, resume, stop [comment], status, help, quit\n";
}

std::optional<QString> findArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return std::nullopt;
    }
    return args.at(idx + 1);
}

QString getArgValue(const QStringList &args, const QString &key)
{
    return findArgValue(args, key).value_or(QString());
}

QString getFormat(const QStringList &args)
{
    const QString value = getArgValue(args, QStringLiteral("--format"));
    if (value.isEmpty()) {
        return QStringLiteral("text");
    }
    return value.toLower();
}

std::string trim(const std::string &value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

void reportFailure(const QString &where, const WorklogError &error)
{
    WLOG_WARN(QStringLiteral("WorklogCli"),
              where,
              QStringLiteral("command_failed"),
              QString::fromStdString(toErrorCodeString(error.code())),
              QStringLiteral("cli"),
              (nlohmann::json{{"message", error.what()}}));
    std::cerr << "Error: " << error.what() << std::endl;
}

} // namespace

int WorklogCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }
    return run(loadConfig(args));
}

int WorklogCli::run(const WorklogConfig &config)
{
    const QStringList &args = config.remainingArgs;
    if (!config.error.isEmpty()) {
        std::cerr << config.error.toStdString() << "\n" << usageText().toStdString();
        return 1;
    }
    if (args.size() < 2) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    const QString command = args.at(1);
    WLOG_INFO(QStringLiteral("WorklogCli"),
              QStringLiteral("run"),
              QStringLiteral("cli_command"),
              QStringLiteral("user_invocation"),
              QStringLiteral("cli"),
              (nlohmann::json{{"command", command.toStdString()},
                              {"data", config.dataFile.toStdString()}}));

    if (command == QStringLiteral("session")) {
        return runSession(config, std::cin, std::cout);
    }
    if (command == QStringLiteral("list")) {
        return runListCommand(config, args);
    }
    if (command == QStringLiteral("edit")) {
        return runEditCommand(config, args);
    }
    if (command == QStringLiteral("delete")) {
        return runDeleteCommand(config, args);
    }
    if (command == QStringLiteral("export")) {
        return runExportCommand(config, args);
    }

    std::cerr << usageText().toStdString();
    return 1;
}

int WorklogCli::runSession(const WorklogConfig &config,
                           std::istream &input,
                           std::ostream &output)
{
    RecordStore store(config.dataFile);
    SessionTimer timer;

    output << sessionHelpText();

    std::string line;
    while (std::getline(input, line)) {
        // Terminal input is in the locale encoding; records are stored as UTF-8.
        const std::string decoded =
            QString::fromLocal8Bit(QByteArray::fromStdString(line)).toStdString();
        const std::string trimmed = trim(decoded);
        if (trimmed.empty()) {
            continue;
        }
        const auto split = trimmed.find_first_of(" \t");
        const std::string verb = trimmed.substr(0, split);
        const std::string rest = split == std::string::npos ? std::string() : trim(trimmed.substr(split));

        if (verb == "quit" || verb == "exit") {
            break;
        }
        if (verb == "help") {
            output << sessionHelpText();
            continue;
        }

        try {
            if (verb == "start") {
                timer.start();
                output << "Timer started at "
                       << toDisplay(toLocalIso(*timer.sessionStart())) << "\n";
            } else if (verb == "pause") {
                timer.pause();
                output << "Timer paused at " << formatElapsed(timer.currentElapsed()) << "\n";
            } else if (verb == "resume") {
                timer.resume();
                output << "Timer resumed\n";
            } else if (verb == "status") {
                output << toTimerStateString(timer.state()) << " "
                       << formatElapsed(timer.currentElapsed()) << "\n";
            } else if (verb == "stop") {
                const FinalizedSession session = timer.stop();
                const Record record = makeRecord(session, rest);
                try {
                    store.append(record);
                } catch (const WorklogError &error) {
                    // The timer is already reset; hand the record back so it is not lost.
                    output << "Error: " << error.what() << "\n"
                           << "Unsaved session: "
                           << nlohmann::json(record).dump(-1, ' ', false,
                                                          nlohmann::json::error_handler_t::replace)
                           << "\n";
                    continue;
                }
                output << "Session recorded: " << describe(record)
                       << " | Elapsed: " << formatElapsed(record.elapsedSeconds) << "\n";
            } else {
                output << "Unknown command: " << verb << "\n" << sessionHelpText();
            }
        } catch (const WorklogError &error) {
            output << "Error: " << error.what() << "\n";
        }
    }

    if (timer.state() != TimerState::Idle) {
        WLOG_WARN(QStringLiteral("WorklogCli"),
                  QStringLiteral("runSession"),
                  QStringLiteral("session_discarded"),
                  QStringLiteral("input_closed"),
                  QStringLiteral("cli"),
                  (nlohmann::json{{"elapsed", timer.currentElapsed()}}));
        output << "Active session discarded without saving ("
               << formatElapsed(timer.currentElapsed()) << ").\n";
    }
    return 0;
}

int WorklogCli::runListCommand(const WorklogConfig &config, const QStringList &args)
{
    const QString format = getFormat(args);
    if (format != QStringLiteral("text") && format != QStringLiteral("json")) {
        std::cerr << "Invalid format. Use text or json." << std::endl;
        return 1;
    }

    try {
        const RecordStore store(config.dataFile);
        const auto records = store.load();

        if (format == QStringLiteral("json")) {
            std::cout << nlohmann::json(records).dump(2) << std::endl;
            return 0;
        }

        if (records.empty()) {
            std::cout << "No time records available." << std::endl;
            return 0;
        }
        for (std::size_t i = 0; i < records.size(); ++i) {
            std::cout << "[" << i << "] " << describe(records[i]) << "\n";
        }
        std::cout.flush();
    } catch (const WorklogError &error) {
        reportFailure(QStringLiteral("runListCommand"), error);
        return 1;
    }
    return 0;
}

int WorklogCli::runEditCommand(const WorklogConfig &config, const QStringList &args)
{
    const auto index = parseIndex(args);
    if (!index.has_value()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        RecordStore store(config.dataFile);
        auto snapshot = store.load();
        checkIndex(*index, snapshot.size());

        const Record &current = snapshot[*index];
        const auto startText = findArgValue(args, QStringLiteral("--start"));
        const auto endText = findArgValue(args, QStringLiteral("--end"));
        const auto commentText = findArgValue(args, QStringLiteral("--comment"));

        const Record updated = validateAndBuild(
            startText ? startText->toStdString() : toDisplay(current.startTime),
            endText ? endText->toStdString() : toDisplay(current.endTime),
            commentText ? commentText->toStdString() : current.comment);

        applyEdit(store, snapshot, *index, updated);
        std::cout << "Record updated: " << describe(updated) << std::endl;
    } catch (const WorklogError &error) {
        reportFailure(QStringLiteral("runEditCommand"), error);
        return 1;
    }
    return 0;
}

int WorklogCli::runDeleteCommand(const WorklogConfig &config, const QStringList &args)
{
    const auto index = parseIndex(args);
    if (!index.has_value()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        RecordStore store(config.dataFile);
        auto snapshot = store.load();
        store.deleteAt(snapshot, *index);
        std::cout << "Record deleted successfully." << std::endl;
    } catch (const WorklogError &error) {
        reportFailure(QStringLiteral("runDeleteCommand"), error);
        return 1;
    }
    return 0;
}

int WorklogCli::runExportCommand(const WorklogConfig &config, const QStringList &args)
{
    const QString fromValue = getArgValue(args, QStringLiteral("--from"));
    const QString toValue = getArgValue(args, QStringLiteral("--to"));
    const QString outPath = getArgValue(args, QStringLiteral("--out"));

    if (fromValue.isEmpty() || toValue.isEmpty() || outPath.isEmpty()) {
        std::cerr << usageText().toStdString();
        return 1;
    }

    try {
        const RecordStore store(config.dataFile);
        CsvTableWriter writer;
        const ExportSummary summary = exportRange(store,
                                                  fromValue.toStdString(),
                                                  toValue.toStdString(),
                                                  writer,
                                                  outPath);
        std::cout << "Data exported to " << outPath.toStdString() << "\n"
                  << "Records: " << summary.rows << "\n"
                  << "Total seconds: "
                  << CsvTableWriter::formatCell(summary.totals.totalSeconds) << "\n"
                  << "Total hours: " << formatHours(summary.totals.totalHours)
                  << std::endl;
    } catch (const WorklogError &error) {
        reportFailure(QStringLiteral("runExportCommand"), error);
        return 1;
    }
    return 0;
}

std::optional<int> WorklogCli::parseIndex(const QStringList &args) const
{
    const auto value = findArgValue(args, QStringLiteral("--index"));
    if (!value.has_value()) {
        return std::nullopt;
    }
    bool ok = false;
    const int index = value->toInt(&ok);
    if (!ok) {
        return std::nullopt;
    }
    return index;
}

} // namespace worklog
