#pragma once

#include <QString>
#include <QStringList>

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace rw {

// What the engine knows about one indexed file.
//
// fragmentIds are the identifiers stored for syncedFingerprint.
// pendingIds are identifiers written by a synchronization that was
// superseded before it could commit; the next commit for the path deletes
// them unless they belong to its own fragment set.
struct FileRecord {
    QString path;
    QString syncedFingerprint;
    QStringList fragmentIds;
    QStringList pendingIds;
    double mtime = 0.0;
    uint64_t version = 0;       // bumped on every change of the record
};

// FileRecordTable - the FileRecords of one folder.
//
// Every accessor copies in or out under the table's mutex; records of
// different folders live in different tables and never contend.
class FileRecordTable {
public:
    FileRecordTable() = default;

    // Non-copyable, non-movable
    FileRecordTable(const FileRecordTable&) = delete;
    FileRecordTable& operator=(const FileRecordTable&) = delete;
    FileRecordTable(FileRecordTable&&) = delete;
    FileRecordTable& operator=(FileRecordTable&&) = delete;

    std::optional<FileRecord> get(const QString& path) const;

    // Inserts or replaces, bumping the stored version.
    void put(FileRecord record);

    // Stores replacement only if the committed state of the path (synced
    // fingerprint and fragment ids) still equals that of `expected`. A
    // missing expectation matches a path with nothing committed.
    bool commitIfUnchanged(const std::optional<FileRecord>& expected, FileRecord replacement);

    std::optional<FileRecord> take(const QString& path);
    bool erase(const QString& path);

    // Paths equal to dirPath or below it.
    std::vector<QString> pathsUnder(const QString& dirPath) const;
    std::vector<QString> paths() const;

    // Adds ids to the record's pendingIds, creating an empty record if
    // the path has none.
    void addPendingIds(const QString& path, const QStringList& ids);

    // Records other than exceptPath whose committed or pending ids
    // intersect ids.
    std::vector<FileRecord> holdersOf(const QStringList& ids, const QString& exceptPath) const;

    // Replaces the committed ids of path with newIds if they still equal
    // expectedIds. newIds and released are dropped from pendingIds either
    // way.
    bool rekey(const QString& path, const QStringList& expectedIds, const QStringList& newIds,
               const QStringList& released);

    size_t size() const;
    size_t fragmentCount() const;
    void clear();

private:
    mutable std::mutex m_mutex;
    std::unordered_map<std::string, FileRecord> m_records;
    uint64_t m_nextVersion = 1;
};

} // namespace rw
