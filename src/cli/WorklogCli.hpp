#pragma once

#include <iosfwd>
#include <optional>

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace worklog {

class WorklogCli
{
public:
    // CLI dispatcher for timing sessions, record maintenance and export.
    // returns exit code
    int run(int argc, char *argv[]);
    int run(const WorklogConfig &config);

    // Line-oriented timing session: start, pause, resume, stop [comment],
    // status, help, quit. Runs until quit or end of input.
    int runSession(const WorklogConfig &config, std::istream &input, std::ostream &output);

private:
    // Each subcommand opens the configured store and reports on stdout/stderr.
    int runListCommand(const WorklogConfig &config, const QStringList &args);
    int runEditCommand(const WorklogConfig &config, const QStringList &args);
    int runDeleteCommand(const WorklogConfig &config, const QStringList &args);
    int runExportCommand(const WorklogConfig &config, const QStringList &args);

    std::optional<int> parseIndex(const QStringList &args) const;
};

} // namespace worklog
