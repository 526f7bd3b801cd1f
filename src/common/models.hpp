#pragma once

#include <string>
#include <variant>
#include <vector>

#include <QDateTime>

namespace worklog {

// One completed work session as kept on disk. Times are local ISO 8601
// strings; they are kept as text so that legacy entries survive a
// load/save cycle byte for byte even when they no longer parse.
struct Record {
    std::string startTime;
    std::string endTime;
    double elapsedSeconds = 0.0;
    std::string comment;
};

inline bool operator==(const Record &a, const Record &b)
{
    return a.startTime == b.startTime
        && a.endTime == b.endTime
        && a.elapsedSeconds == b.elapsedSeconds
        && a.comment == b.comment;
}

inline bool operator!=(const Record &a, const Record &b)
{
    return !(a == b);
}

struct FinalizedSession {
    QDateTime startTimestamp;
    QDateTime endTimestamp;
    double accumulatedSeconds = 0.0;
};

struct ExportTotals {
    double totalSeconds = 0.0;
    double totalHours = 0.0;
};

using TableCell = std::variant<std::string, double>;
using TableRow = std::vector<TableCell>;
using TabularData = std::vector<TableRow>;

} // namespace worklog
