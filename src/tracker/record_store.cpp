#include "tracker/record_store.hpp"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace worklog {

namespace {

constexpr int kJsonIndent = 4;

[[noreturn]] void failLoad(const QString &path, const std::string &reason)
{
    WLOG_ERROR(QStringLiteral("RecordStore"),
               QStringLiteral("load"),
               QStringLiteral("storage_corrupt"),
               QString::fromStdString(reason),
               QStringLiteral("json_parse"),
               (nlohmann::json{{"path", path.toStdString()}}));
    throw WorklogError(ErrorCode::CorruptStorage,
                       "Record file " + path.toStdString() + " is unreadable: " + reason);
}

[[noreturn]] void failSave(const QString &path, const QString &reason)
{
    WLOG_ERROR(QStringLiteral("RecordStore"),
               QStringLiteral("save"),
               QStringLiteral("storage_write_failed"),
               reason,
               QStringLiteral("qsavefile"),
               (nlohmann::json{{"path", path.toStdString()}}));
    throw WorklogError(ErrorCode::StorageWriteFailed,
                       "Failed to write " + path.toStdString() + ": " + reason.toStdString());
}

} // namespace

void checkIndex(int index, std::size_t size)
{
    if (index < 0 || static_cast<std::size_t>(index) >= size) {
        WLOG_WARN(QStringLiteral("RecordStore"),
                  QStringLiteral("checkIndex"),
                  QStringLiteral("index_out_of_range"),
                  QStringLiteral("stale_or_invalid_position"),
                  QStringLiteral("bounds_check"),
                  (nlohmann::json{{"index", index}, {"size", size}}));
        throw WorklogError(ErrorCode::IndexOutOfRange,
                           "Record index " + std::to_string(index)
                               + " is out of range (" + std::to_string(size)
                               + " records).");
    }
}

RecordStore::RecordStore(const QString &path)
    : m_path(path)
{
}

const QString &RecordStore::path() const
{
    return m_path;
}

std::vector<Record> RecordStore::load() const
{
    QFile file(m_path);
    if (!file.exists()) {
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        failLoad(m_path, file.errorString().toStdString());
    }
    const QByteArray data = file.readAll();

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        failLoad(m_path, ex.what());
    }

    if (!document.is_array()) {
        failLoad(m_path, "top-level value is not an array");
    }

    std::vector<Record> records;
    records.reserve(document.size());
    for (std::size_t i = 0; i < document.size(); ++i) {
        try {
            records.push_back(document.at(i).get<Record>());
        } catch (const WorklogError &ex) {
            failLoad(m_path, "entry " + std::to_string(i) + ": " + ex.what());
        }
    }

    WLOG_DEBUG(QStringLiteral("RecordStore"),
               QStringLiteral("load"),
               QStringLiteral("records_loaded"),
               QStringLiteral("caller_request"),
               QStringLiteral("json_file"),
               (nlohmann::json{{"path", m_path.toStdString()},
                               {"records", records.size()}}));
    return records;
}

void RecordStore::save(const std::vector<Record> &records)
{
    const QFileInfo info(m_path);
    if (!QDir().mkpath(info.absolutePath())) {
        failSave(m_path, QStringLiteral("cannot create directory ") + info.absolutePath());
    }

    const nlohmann::json document = records;
    QByteArray data;
    try {
        data = QByteArray::fromStdString(document.dump(kJsonIndent));
    } catch (const nlohmann::json::exception &error) {
        // Invalid UTF-8 in a field; nothing has been written yet.
        failSave(m_path, QString::fromStdString(error.what()));
    }

    QSaveFile file(m_path);
    if (!file.open(QIODevice::WriteOnly)) {
        failSave(m_path, file.errorString());
    }
    if (file.write(data) != data.size()) {
        file.cancelWriting();
        failSave(m_path, file.errorString());
    }
    if (!file.commit()) {
        failSave(m_path, file.errorString());
    }

    WLOG_INFO(QStringLiteral("RecordStore"),
              QStringLiteral("save"),
              QStringLiteral("records_saved"),
              QStringLiteral("caller_request"),
              QStringLiteral("atomic_rename"),
              (nlohmann::json{{"path", m_path.toStdString()},
                              {"records", records.size()}}));
}

void RecordStore::append(const Record &record)
{
    std::vector<Record> records = load();
    records.push_back(record);
    save(records);
}

void RecordStore::deleteAt(std::vector<Record> &snapshot, int index)
{
    checkIndex(index, snapshot.size());

    std::vector<Record> updated = snapshot;
    updated.erase(updated.begin() + index);
    save(updated);
    snapshot = std::move(updated);

    WLOG_INFO(QStringLiteral("RecordStore"),
              QStringLiteral("deleteAt"),
              QStringLiteral("record_deleted"),
              QStringLiteral("user_action"),
              QStringLiteral("positional"),
              (nlohmann::json{{"index", index}}));
}

} // namespace worklog
