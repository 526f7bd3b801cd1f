#pragma once

#include <string>

#include <QString>

#include "common/models.hpp"

namespace worklog {

// Spreadsheet collaborator: persists a table of string/number cells as a
// single sheet at the given path. Throws ExportWriteFailed on I/O failure.
class TableWriter {
public:
    virtual ~TableWriter() = default;

    virtual void write(const TabularData &table, const QString &path) = 0;
};

// Comma-separated values, RFC 4180 quoting, CRLF line endings, UTF-8.
class CsvTableWriter : public TableWriter {
public:
    void write(const TabularData &table, const QString &path) override;

    static std::string formatCell(const TableCell &cell);
    static std::string formatRow(const TableRow &row);
};

} // namespace worklog
