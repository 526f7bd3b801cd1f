#include "tracker/table_writer.hpp"

#include <QDir>
#include <QFileInfo>
#include <QLocale>
#include <QSaveFile>

#include "common/errors.hpp"
#include "common/logging.hpp"

namespace worklog {

namespace {

std::string quoteIfNeeded(const std::string &value)
{
    if (value.find_first_of(",\"\r\n") == std::string::npos) {
        return value;
    }
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

[[noreturn]] void failWrite(const QString &path, const QString &reason)
{
    WLOG_ERROR(QStringLiteral("CsvTableWriter"),
               QStringLiteral("write"),
               QStringLiteral("export_write_failed"),
               reason,
               QStringLiteral("qsavefile"),
               (nlohmann::json{{"path", path.toStdString()}}));
    throw WorklogError(ErrorCode::ExportWriteFailed,
                       "Failed to write export " + path.toStdString() + ": "
                           + reason.toStdString());
}

} // namespace

std::string CsvTableWriter::formatCell(const TableCell &cell)
{
    if (const auto *number = std::get_if<double>(&cell)) {
        return QString::number(*number, 'f', QLocale::FloatingPointShortest).toStdString();
    }
    return quoteIfNeeded(std::get<std::string>(cell));
}

std::string CsvTableWriter::formatRow(const TableRow &row)
{
    std::string line;
    for (std::size_t i = 0; i < row.size(); ++i) {
        if (i > 0) {
            line += ',';
        }
        line += formatCell(row[i]);
    }
    return line;
}

void CsvTableWriter::write(const TabularData &table, const QString &path)
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        failWrite(path, QStringLiteral("cannot create directory ") + info.absolutePath());
    }

    QByteArray data;
    for (const auto &row : table) {
        data += QByteArray::fromStdString(formatRow(row));
        data += "\r\n";
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        failWrite(path, file.errorString());
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        failWrite(path, file.errorString());
    }
    if (!file.commit()) {
        failWrite(path, file.errorString());
    }

    WLOG_INFO(QStringLiteral("CsvTableWriter"),
              QStringLiteral("write"),
              QStringLiteral("table_written"),
              QStringLiteral("export_request"),
              QStringLiteral("csv"),
              (nlohmann::json{{"path", path.toStdString()},
                              {"rows", table.size()}}));
}

} // namespace worklog
