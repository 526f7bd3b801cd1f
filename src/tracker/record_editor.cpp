#include "tracker/record_editor.hpp"

#include <optional>

#include <QDate>
#include <QStringList>
#include <QTime>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace worklog {

namespace {

const QString kDateFormat = QStringLiteral("yyyy-MM-dd");
const QString kTimeFormat = QStringLiteral("HH:mm:ss");

std::optional<WallClockReading> parseReading(const std::string &text)
{
    const QStringList parts = QString::fromStdString(text).split(QLatin1Char(' '));
    if (parts.size() != 2) {
        return std::nullopt;
    }
    WallClockReading reading;
    reading.date = QDate::fromString(parts.at(0), kDateFormat);
    reading.time = QTime::fromString(parts.at(1), kTimeFormat);
    if (!reading.date.isValid() || !reading.time.isValid()) {
        return std::nullopt;
    }
    return reading;
}

std::string toIso(const WallClockReading &reading)
{
    return (reading.date.toString(kDateFormat) + QLatin1Char('T')
            + reading.time.toString(kTimeFormat))
        .toStdString();
}

qint64 secondsBetween(const WallClockReading &from, const WallClockReading &to)
{
    return from.date.daysTo(to.date) * 86400 + from.time.secsTo(to.time);
}

[[noreturn]] void rejectEdit(ErrorCode code, const std::string &message)
{
    WLOG_WARN(QStringLiteral("RecordEditor"),
              QStringLiteral("validateAndBuild"),
              QStringLiteral("edit_rejected"),
              QString::fromStdString(toErrorCodeString(code)),
              QStringLiteral("input_validation"),
              nlohmann::json::object());
    throw WorklogError(code, message);
}

} // namespace

Record validateAndBuild(const std::string &startText,
                        const std::string &endText,
                        const std::string &comment)
{
    const auto start = parseReading(startText);
    const auto end = parseReading(endText);
    if (!start.has_value() || !end.has_value()) {
        rejectEdit(ErrorCode::InvalidFormat,
                   "Invalid date/time. Use YYYY-MM-DD HH:MM:SS format.");
    }

    const qint64 elapsed = secondsBetween(*start, *end);
    if (elapsed < 0) {
        rejectEdit(ErrorCode::EndBeforeStart, "End time cannot be before start time.");
    }

    Record record;
    record.startTime = toIso(*start);
    record.endTime = toIso(*end);
    record.elapsedSeconds = static_cast<double>(elapsed);
    record.comment = comment;
    return record;
}

void applyEdit(RecordStore &store,
               std::vector<Record> &snapshot,
               int index,
               const Record &newRecord)
{
    checkIndex(index, snapshot.size());

    std::vector<Record> updated = snapshot;
    updated[index] = newRecord;
    store.save(updated);
    snapshot = std::move(updated);

    WLOG_INFO(QStringLiteral("RecordEditor"),
              QStringLiteral("applyEdit"),
              QStringLiteral("record_updated"),
              QStringLiteral("user_action"),
              QStringLiteral("positional"),
              (nlohmann::json{{"index", index},
                              {"elapsed", newRecord.elapsedSeconds}}));
}

std::string toDisplay(const std::string &isoText)
{
    const auto parsed = parseLocalIso(isoText);
    if (!parsed.has_value()) {
        return isoText;
    }
    return (parsed->date.toString(kDateFormat) + QLatin1Char(' ')
            + parsed->time.toString(kTimeFormat))
        .toStdString();
}

std::string describe(const Record &record)
{
    return "Start: " + record.startTime
        + " | End: " + record.endTime
        + " | Comment: " + record.comment;
}

} // namespace worklog
