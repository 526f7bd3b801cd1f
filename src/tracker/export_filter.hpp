#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <QDate>
#include <QString>

#include "common/models.hpp"
#include "tracker/record_store.hpp"
#include "tracker/table_writer.hpp"

namespace worklog {

struct ExportSummary {
    std::size_t rows = 0;
    ExportTotals totals;
};

// Strict YYYY-MM-DD. Throws InvalidFormat.
QDate parseDate(const std::string &text);

// Inclusive on the calendar date of each record's start time; time of day is
// ignored. Records whose start time does not parse are skipped. Throws
// InvalidDateRange when endDate < startDate. An empty result is not an error.
std::vector<Record> selectRange(const std::vector<Record> &records,
                                const QDate &startDate,
                                const QDate &endDate);

ExportTotals aggregate(const std::vector<Record> &records);

std::string formatHours(double hours);

// Header, one row per record in stored order, a blank row, then the
// TOTAL SECONDS and TOTAL HOURS rows.
TabularData buildExportTable(const std::vector<Record> &records,
                             const ExportTotals &totals);

// Full export: parse dates, select, total, build and write the table.
// An empty selection throws NoRecordsInRange and nothing is written.
ExportSummary exportRange(const RecordStore &store,
                          const std::string &startDateText,
                          const std::string &endDateText,
                          TableWriter &writer,
                          const QString &destination);

} // namespace worklog
