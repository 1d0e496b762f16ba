#include "core/indexing/file_record.h"

namespace rw {

namespace {

bool isUnder(const std::string& path, const std::string& dir)
{
    if (path == dir) {
        return true;
    }
    if (path.size() <= dir.size() || path.compare(0, dir.size(), dir) != 0) {
        return false;
    }
    return dir.back() == '/' || path[dir.size()] == '/';
}

} // namespace

std::optional<FileRecord> FileRecordTable::get(const QString& path) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(path.toStdString());
    if (it == m_records.end()) {
        return std::nullopt;
    }
    return it->second;
}

void FileRecordTable::put(FileRecord record)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    record.version = m_nextVersion++;
    const std::string key = record.path.toStdString();
    m_records[key] = std::move(record);
}

bool FileRecordTable::commitIfUnchanged(const std::optional<FileRecord>& expected,
                                        FileRecord replacement)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    const std::string key = replacement.path.toStdString();
    auto it = m_records.find(key);

    const QString expectedFingerprint = expected ? expected->syncedFingerprint : QString();
    const QStringList expectedIds = expected ? expected->fragmentIds : QStringList();
    const QString currentFingerprint = it != m_records.end() ? it->second.syncedFingerprint : QString();
    const QStringList currentIds = it != m_records.end() ? it->second.fragmentIds : QStringList();

    if (expectedFingerprint != currentFingerprint || expectedIds != currentIds) {
        return false;
    }

    replacement.version = m_nextVersion++;
    m_records[key] = std::move(replacement);
    return true;
}

std::optional<FileRecord> FileRecordTable::take(const QString& path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(path.toStdString());
    if (it == m_records.end()) {
        return std::nullopt;
    }
    FileRecord record = std::move(it->second);
    m_records.erase(it);
    return record;
}

bool FileRecordTable::erase(const QString& path)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.erase(path.toStdString()) > 0;
}

std::vector<QString> FileRecordTable::pathsUnder(const QString& dirPath) const
{
    const std::string dir = dirPath.toStdString();
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<QString> out;
    for (const auto& [key, record] : m_records) {
        if (isUnder(key, dir)) {
            out.push_back(record.path);
        }
    }
    return out;
}

std::vector<QString> FileRecordTable::paths() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<QString> out;
    out.reserve(m_records.size());
    for (const auto& [_, record] : m_records) {
        out.push_back(record.path);
    }
    return out;
}

void FileRecordTable::addPendingIds(const QString& path, const QStringList& ids)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    FileRecord& record = m_records[path.toStdString()];
    record.path = path;
    for (const QString& id : ids) {
        if (!record.pendingIds.contains(id) && !record.fragmentIds.contains(id)) {
            record.pendingIds.append(id);
        }
    }
    record.version = m_nextVersion++;
}

std::vector<FileRecord> FileRecordTable::holdersOf(const QStringList& ids,
                                                   const QString& exceptPath) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<FileRecord> out;
    for (const auto& [_, record] : m_records) {
        if (record.path == exceptPath) {
            continue;
        }
        for (const QString& id : ids) {
            if (record.fragmentIds.contains(id) || record.pendingIds.contains(id)) {
                out.push_back(record);
                break;
            }
        }
    }
    return out;
}

bool FileRecordTable::rekey(const QString& path, const QStringList& expectedIds,
                            const QStringList& newIds, const QStringList& released)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_records.find(path.toStdString());
    if (it == m_records.end()) {
        return false;
    }
    FileRecord& record = it->second;
    QStringList pending;
    for (const QString& id : record.pendingIds) {
        if (!newIds.contains(id) && !released.contains(id)) {
            pending.append(id);
        }
    }
    const bool matches = record.fragmentIds == expectedIds;
    if (matches) {
        record.fragmentIds = newIds;
        record.pendingIds = pending;
    } else {
        for (const QString& id : released) {
            record.pendingIds.removeAll(id);
        }
    }
    record.version = m_nextVersion++;
    return matches;
}

size_t FileRecordTable::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_records.size();
}

size_t FileRecordTable::fragmentCount() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    size_t count = 0;
    for (const auto& [_, record] : m_records) {
        count += static_cast<size_t>(record.fragmentIds.size());
    }
    return count;
}

void FileRecordTable::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_records.clear();
}

} // namespace rw
