#pragma once

#include <algorithm>
#include <cmath>
#include <optional>
#include <string>

#include <QDate>
#include <QDateTime>
#include <QString>
#include <QTime>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/models.hpp"

namespace worklog {

// Local wall-clock ISO 8601 without offset. Milliseconds are only written
// when non-zero so whole-second edits stay as "2025-01-01T09:00:00".
inline std::string toLocalIso(const QDateTime &timestamp)
{
    const QString format = timestamp.time().msec() == 0
        ? QStringLiteral("yyyy-MM-dd'T'HH:mm:ss")
        : QStringLiteral("yyyy-MM-dd'T'HH:mm:ss.zzz");
    return timestamp.toString(format).toStdString();
}

// Date and time are kept apart so that readings inside a DST gap or
// overlap still parse and compare like plain calendar values.
struct WallClockReading {
    QDate date;
    QTime time;
};

// Reads "YYYY-MM-DD[(T| )HH:MM[:SS[.fraction]]]". Fractions beyond
// milliseconds are truncated; a trailing "Z" or "+HH:MM" offset is ignored.
inline std::optional<WallClockReading> parseLocalIso(const std::string &value)
{
    const QString text = QString::fromStdString(value);
    WallClockReading reading;
    reading.date = QDate::fromString(text.left(10), QStringLiteral("yyyy-MM-dd"));
    if (!reading.date.isValid()) {
        return std::nullopt;
    }
    if (text.size() == 10) {
        reading.time = QTime(0, 0);
        return reading;
    }
    if (text.at(10) != QLatin1Char('T') && text.at(10) != QLatin1Char(' ')) {
        return std::nullopt;
    }

    QString timeText = text.mid(11);
    if (timeText.endsWith(QLatin1Char('Z'))) {
        timeText.chop(1);
    } else {
        const int offset = std::max(timeText.lastIndexOf(QLatin1Char('+')),
                                    timeText.lastIndexOf(QLatin1Char('-')));
        if (offset >= 5) {
            timeText.truncate(offset);
        }
    }

    QString fraction;
    const int dot = timeText.indexOf(QLatin1Char('.'));
    if (dot >= 0) {
        fraction = timeText.mid(dot + 1);
        timeText.truncate(dot);
        if (fraction.isEmpty()) {
            return std::nullopt;
        }
        for (const QChar c : fraction) {
            if (!c.isDigit()) {
                return std::nullopt;
            }
        }
    }

    const QTime whole = QTime::fromString(
        timeText, timeText.size() == 5 ? QStringLiteral("HH:mm") : QStringLiteral("HH:mm:ss"));
    if (!whole.isValid()) {
        return std::nullopt;
    }
    const int msec = fraction.isEmpty()
        ? 0
        : fraction.left(3).leftJustified(3, QLatin1Char('0')).toInt();
    reading.time = QTime(whole.hour(), whole.minute(), whole.second(), msec);
    return reading;
}

// H:MM:SS rendering used by the live elapsed display.
inline std::string formatElapsed(double seconds)
{
    if (!(seconds > 0.0)) {
        seconds = 0.0;
    }
    const long long whole = static_cast<long long>(std::floor(seconds));
    const long long hours = whole / 3600;
    const long long minutes = (whole % 3600) / 60;
    const long long secs = whole % 60;
    return QStringLiteral("%1:%2:%3")
        .arg(hours, 2, 10, QLatin1Char('0'))
        .arg(minutes, 2, 10, QLatin1Char('0'))
        .arg(secs, 2, 10, QLatin1Char('0'))
        .toStdString();
}

inline void to_json(nlohmann::json &j, const Record &record)
{
    j = nlohmann::json{
        {"start_time", record.startTime},
        {"end_time", record.endTime},
        {"elapsed", record.elapsedSeconds},
        {"comment", record.comment}
    };
}

inline void from_json(const nlohmann::json &j, Record &record)
{
    if (!j.is_object()) {
        throw WorklogError(ErrorCode::CorruptStorage, "record entry is not an object");
    }

    const auto start = j.find("start_time");
    const auto end = j.find("end_time");
    const auto elapsed = j.find("elapsed");
    if (start == j.end() || !start->is_string()) {
        throw WorklogError(ErrorCode::CorruptStorage, "record is missing a string start_time");
    }
    if (end == j.end() || !end->is_string()) {
        throw WorklogError(ErrorCode::CorruptStorage, "record is missing a string end_time");
    }
    if (elapsed == j.end() || !elapsed->is_number()) {
        throw WorklogError(ErrorCode::CorruptStorage, "record is missing a numeric elapsed");
    }

    record.startTime = start->get<std::string>();
    record.endTime = end->get<std::string>();
    record.elapsedSeconds = elapsed->get<double>();

    const auto comment = j.find("comment");
    if (comment == j.end()) {
        record.comment.clear();
    } else if (comment->is_string()) {
        record.comment = comment->get<std::string>();
    } else {
        throw WorklogError(ErrorCode::CorruptStorage, "record comment is not a string");
    }
}

} // namespace worklog
