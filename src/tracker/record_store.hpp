#pragma once

#include <cstddef>
#include <vector>

#include <QString>

#include "common/models.hpp"

namespace worklog {

// RecordStore owns the JSON file holding every completed session, in
// insertion order. Every mutation rewrites the whole file atomically.
// Records are addressed by their position in a snapshot returned by load();
// callers must not reuse a snapshot after another writer touched the file.
class RecordStore {
public:
    explicit RecordStore(const QString &path);

    const QString &path() const;

    // Missing file reads as an empty list. Anything that is not an array of
    // well-formed record objects throws CorruptStorage.
    std::vector<Record> load() const;

    void save(const std::vector<Record> &records);
    void append(const Record &record);

    // Removes snapshot[index] and persists the result. On failure neither
    // the snapshot nor the file is touched.
    void deleteAt(std::vector<Record> &snapshot, int index);

private:
    QString m_path;
};

// Throws IndexOutOfRange when index does not address an element of a
// sequence of the given size.
void checkIndex(int index, std::size_t size);

} // namespace worklog
