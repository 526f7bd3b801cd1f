#include "tracker/export_filter.hpp"

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace worklog {

namespace {

constexpr double kSecondsPerHour = 3600.0;

const char *const kHeaders[] = {"Start Time", "End Time", "Elapsed (seconds)", "Comment"};

} // namespace

QDate parseDate(const std::string &text)
{
    const QDate date = QDate::fromString(QString::fromStdString(text),
                                         QStringLiteral("yyyy-MM-dd"));
    if (!date.isValid()) {
        WLOG_WARN(QStringLiteral("ExportFilter"),
                  QStringLiteral("parseDate"),
                  QStringLiteral("date_rejected"),
                  QStringLiteral("invalid_format"),
                  QStringLiteral("input_validation"),
                  (nlohmann::json{{"input", text}}));
        throw WorklogError(ErrorCode::InvalidFormat, "Dates must be in YYYY-MM-DD format.");
    }
    return date;
}

std::vector<Record> selectRange(const std::vector<Record> &records,
                                const QDate &startDate,
                                const QDate &endDate)
{
    if (endDate < startDate) {
        WLOG_WARN(QStringLiteral("ExportFilter"),
                  QStringLiteral("selectRange"),
                  QStringLiteral("range_rejected"),
                  QStringLiteral("invalid_date_range"),
                  QStringLiteral("input_validation"),
                  (nlohmann::json{{"from", startDate.toString(Qt::ISODate).toStdString()},
                                  {"to", endDate.toString(Qt::ISODate).toStdString()}}));
        throw WorklogError(ErrorCode::InvalidDateRange,
                           "End date cannot be before start date.");
    }

    std::vector<Record> selected;
    std::size_t skipped = 0;
    for (const auto &record : records) {
        const auto start = parseLocalIso(record.startTime);
        if (!start.has_value()) {
            ++skipped;
            continue;
        }
        const QDate day = start->date;
        if (day >= startDate && day <= endDate) {
            selected.push_back(record);
        }
    }

    if (skipped > 0) {
        WLOG_DEBUG(QStringLiteral("ExportFilter"),
                   QStringLiteral("selectRange"),
                   QStringLiteral("malformed_records_skipped"),
                   QStringLiteral("unparseable_start_time"),
                   QStringLiteral("iso_parse"),
                   (nlohmann::json{{"skipped", skipped}}));
    }
    return selected;
}

ExportTotals aggregate(const std::vector<Record> &records)
{
    ExportTotals totals;
    for (const auto &record : records) {
        totals.totalSeconds += record.elapsedSeconds;
    }
    totals.totalHours = totals.totalSeconds / kSecondsPerHour;
    return totals;
}

std::string formatHours(double hours)
{
    return QString::number(hours, 'f', 2).toStdString();
}

TabularData buildExportTable(const std::vector<Record> &records,
                             const ExportTotals &totals)
{
    TabularData table;
    table.reserve(records.size() + 4);

    TableRow header;
    for (const char *title : kHeaders) {
        header.emplace_back(std::string(title));
    }
    table.push_back(header);

    for (const auto &record : records) {
        table.push_back(TableRow{record.startTime,
                                 record.endTime,
                                 record.elapsedSeconds,
                                 record.comment});
    }

    table.push_back(TableRow(header.size(), TableCell(std::string())));
    table.push_back(TableRow{std::string(), std::string(),
                             totals.totalSeconds, std::string("TOTAL SECONDS")});
    table.push_back(TableRow{std::string(), std::string(),
                             formatHours(totals.totalHours), std::string("TOTAL HOURS")});
    return table;
}

ExportSummary exportRange(const RecordStore &store,
                          const std::string &startDateText,
                          const std::string &endDateText,
                          TableWriter &writer,
                          const QString &destination)
{
    const QDate startDate = parseDate(startDateText);
    const QDate endDate = parseDate(endDateText);

    const auto records = store.load();
    const auto selected = selectRange(records, startDate, endDate);
    if (selected.empty()) {
        WLOG_WARN(QStringLiteral("ExportFilter"),
                  QStringLiteral("exportRange"),
                  QStringLiteral("export_empty"),
                  QStringLiteral("no_records_in_range"),
                  QStringLiteral("date_filter"),
                  (nlohmann::json{{"from", startDateText},
                                  {"to", endDateText},
                                  {"records", records.size()}}));
        throw WorklogError(ErrorCode::NoRecordsInRange,
                           "No records found in the specified date range.");
    }

    ExportSummary summary;
    summary.rows = selected.size();
    summary.totals = aggregate(selected);
    writer.write(buildExportTable(selected, summary.totals), destination);

    WLOG_INFO(QStringLiteral("ExportFilter"),
              QStringLiteral("exportRange"),
              QStringLiteral("export_completed"),
              QStringLiteral("user_action"),
              QStringLiteral("table_writer"),
              (nlohmann::json{{"from", startDateText},
                              {"to", endDateText},
                              {"rows", summary.rows},
                              {"totalSeconds", summary.totals.totalSeconds},
                              {"out", destination.toStdString()}}));
    return summary;
}

} // namespace worklog
