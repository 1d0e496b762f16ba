#pragma once

#include "core/vector/vector_index.h"
#include "core/vector/vector_store.h"

#include <QString>

#include <map>
#include <memory>
#include <mutex>

#include <sqlite3.h>

namespace rw {

// SqliteVectorStore - local VectorStore on SQLite plus hnswlib.
//
// SQLite holds collections, fragments (payload and the normalized vector
// as a float blob) and metadata records. Each collection has an in-memory
// VectorIndex keyed by fragment rowid, rebuilt from SQLite on open.
// One connection guarded by a mutex serves every thread.
class SqliteVectorStore : public VectorStore {
public:
    ~SqliteVectorStore() override;

    // Non-copyable, non-movable (owns sqlite3* handle and indexes)
    SqliteVectorStore(const SqliteVectorStore&) = delete;
    SqliteVectorStore& operator=(const SqliteVectorStore&) = delete;
    SqliteVectorStore(SqliteVectorStore&&) = delete;
    SqliteVectorStore& operator=(SqliteVectorStore&&) = delete;

    // Open or create the database. ":memory:" gives a private in-memory store.
    static std::unique_ptr<SqliteVectorStore> open(const QString& dbPath,
                                                   QString* error = nullptr);

    bool createCollection(const QString& name, int dimensions, Metric metric,
                          QString* error = nullptr) override;
    bool deleteCollection(const QString& name, QString* error = nullptr) override;
    bool listCollections(QStringList* out, QString* error = nullptr) override;

    bool upsert(const QString& collection, const std::vector<FragmentPoint>& points,
                QString* error = nullptr) override;
    bool remove(const QString& collection, const QStringList& ids,
                QString* error = nullptr) override;
    bool setFragmentPath(const QString& collection, const QStringList& ids,
                         const QString& path, QString* error = nullptr) override;
    bool fetchFragments(const QString& collection, const QStringList& ids,
                        std::vector<FragmentPoint>* out, QString* error = nullptr) override;
    bool listFragments(const QString& collection, std::vector<FragmentListing>* out,
                       QString* error = nullptr) override;
    bool countFragments(const QString& collection, int64_t* out,
                        QString* error = nullptr) override;
    bool search(const QString& collection, const std::vector<float>& vector, int limit,
                std::vector<ScoredFragment>* out, QString* error = nullptr) override;

    bool getMetadata(const QString& recordId, std::optional<QByteArray>* out,
                     QString* error = nullptr) override;
    bool putMetadata(const QString& recordId, const QByteArray& payload,
                     QString* error = nullptr) override;

private:
    SqliteVectorStore() = default;

    bool init(const QString& dbPath, QString* error);
    bool execSql(const char* sql, QString* error);
    bool loadIndexes(QString* error);

    // Caller holds m_mutex.
    VectorIndex* indexFor(const QString& collection, QString* error);

    sqlite3* m_db = nullptr;
    std::mutex m_mutex;
    std::map<QString, std::unique_ptr<VectorIndex>> m_indexes;
};

} // namespace rw
