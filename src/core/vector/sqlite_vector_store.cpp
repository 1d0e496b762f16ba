#include "core/vector/sqlite_vector_store.h"
#include "core/shared/logging.h"
#include "core/vector/schema.h"

#include <QDateTime>

#include <algorithm>
#include <cmath>
#include <utility>

namespace rw {

namespace {

// Finalizes on scope exit.
class Statement {
public:
    Statement(sqlite3* db, const char* sql)
    {
        m_rc = sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr);
    }
    ~Statement() { sqlite3_finalize(m_stmt); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return m_rc == SQLITE_OK; }
    sqlite3_stmt* get() const { return m_stmt; }

    void bindText(int index, const QByteArray& utf8)
    {
        sqlite3_bind_text(m_stmt, index, utf8.constData(), utf8.size(), SQLITE_TRANSIENT);
    }

    void reset()
    {
        sqlite3_reset(m_stmt);
        sqlite3_clear_bindings(m_stmt);
    }

private:
    sqlite3_stmt* m_stmt = nullptr;
    int m_rc = SQLITE_ERROR;
};

QString columnText(sqlite3_stmt* stmt, int column)
{
    const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, column));
    return text ? QString::fromUtf8(text) : QString();
}

void setError(QString* error, const QString& message)
{
    if (error) {
        *error = message;
    }
}

QString sqliteError(sqlite3* db, const char* operation)
{
    return QStringLiteral("%1: %2").arg(QString::fromLatin1(operation),
                                        QString::fromUtf8(sqlite3_errmsg(db)));
}

std::vector<float> normalized(const std::vector<float>& vector)
{
    double norm = 0.0;
    for (float v : vector) {
        norm += static_cast<double>(v) * static_cast<double>(v);
    }
    norm = std::sqrt(norm);
    std::vector<float> out(vector);
    if (norm > 0.0) {
        for (float& v : out) {
            v = static_cast<float>(v / norm);
        }
    }
    return out;
}

// Rolls back unless committed.
class Transaction {
public:
    explicit Transaction(sqlite3* db)
        : m_db(db)
    {
        m_active = sqlite3_exec(m_db, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) == SQLITE_OK;
    }
    ~Transaction()
    {
        if (m_active) {
            sqlite3_exec(m_db, "ROLLBACK", nullptr, nullptr, nullptr);
        }
    }

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    bool isActive() const { return m_active; }

    bool commit()
    {
        if (!m_active) {
            return false;
        }
        const bool ok = sqlite3_exec(m_db, "COMMIT", nullptr, nullptr, nullptr) == SQLITE_OK;
        m_active = !ok;
        return ok;
    }

private:
    sqlite3* m_db;
    bool m_active = false;
};

} // namespace

// ── Open ────────────────────────────────────────────────────

SqliteVectorStore::~SqliteVectorStore()
{
    if (m_db) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
}

std::unique_ptr<SqliteVectorStore> SqliteVectorStore::open(const QString& dbPath, QString* error)
{
    std::unique_ptr<SqliteVectorStore> store(new SqliteVectorStore());
    if (!store->init(dbPath, error)) {
        return nullptr;
    }
    return store;
}

bool SqliteVectorStore::init(const QString& dbPath, QString* error)
{
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(dbPath.toUtf8().constData(), &m_db, flags, nullptr);
    if (rc != SQLITE_OK) {
        setError(error, sqliteError(m_db, "open"));
        LOG_ERROR(rwStore, "Failed to open database %s: %s", qUtf8Printable(dbPath),
                  sqlite3_errmsg(m_db));
        return false;
    }

    sqlite3_busy_timeout(m_db, 30000);

    if (!execSql(kConnectionPragmas, error)) {
        return false;
    }

    bool schemaExists = false;
    {
        Statement stmt(m_db,
            "SELECT count(*) FROM sqlite_master WHERE type='table' AND name='fragments'");
        if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            schemaExists = sqlite3_column_int(stmt.get(), 0) > 0;
        }
    }

    if (!schemaExists) {
        if (!execSql(kDatabasePragmas, error) || !execSql(kSchemaV1, error)) {
            LOG_ERROR(rwStore, "Failed to create schema in %s", qUtf8Printable(dbPath));
            return false;
        }
    } else {
        Statement stmt(m_db, "PRAGMA user_version");
        int version = 0;
        if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            version = sqlite3_column_int(stmt.get(), 0);
        }
        if (version > kCurrentSchemaVersion) {
            setError(error, QStringLiteral("database schema version %1 is newer than %2")
                                .arg(version)
                                .arg(kCurrentSchemaVersion));
            LOG_ERROR(rwStore, "Unsupported schema version %d in %s", version,
                      qUtf8Printable(dbPath));
            return false;
        }
    }

    if (!loadIndexes(error)) {
        return false;
    }

    LOG_INFO(rwStore, "Vector store opened: %s (%d collections)", qUtf8Printable(dbPath),
             static_cast<int>(m_indexes.size()));
    return true;
}

bool SqliteVectorStore::execSql(const char* sql, QString* error)
{
    char* errMsg = nullptr;
    const int rc = sqlite3_exec(m_db, sql, nullptr, nullptr, &errMsg);
    if (rc != SQLITE_OK) {
        const QString message = QString::fromUtf8(errMsg ? errMsg : "unknown");
        LOG_ERROR(rwStore, "SQL error: %s", qUtf8Printable(message));
        sqlite3_free(errMsg);
        setError(error, message);
        return false;
    }
    return true;
}

bool SqliteVectorStore::loadIndexes(QString* error)
{
    std::vector<std::pair<QString, int>> collections;
    {
        Statement stmt(m_db, "SELECT name, dimensions FROM collections");
        if (!stmt.ok()) {
            setError(error, sqliteError(m_db, "list collections"));
            return false;
        }
        while (sqlite3_step(stmt.get()) == SQLITE_ROW) {
            collections.emplace_back(columnText(stmt.get(), 0),
                                     sqlite3_column_int(stmt.get(), 1));
        }
    }

    for (const auto& [name, dimensions] : collections) {
        int64_t count = 0;
        {
            Statement stmt(m_db, "SELECT count(*) FROM fragments WHERE collection = ?1");
            stmt.bindText(1, name.toUtf8());
            if (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
                count = sqlite3_column_int64(stmt.get(), 0);
            }
        }

        auto index = std::make_unique<VectorIndex>(dimensions);
        const int capacity = static_cast<int>(
            std::max<int64_t>(VectorIndex::kInitialCapacity, count + count / 4 + 1));
        if (!index->create(capacity)) {
            setError(error, QStringLiteral("cannot create index for %1").arg(name));
            return false;
        }

        Statement stmt(m_db, "SELECT rowid, vector FROM fragments WHERE collection = ?1");
        stmt.bindText(1, name.toUtf8());
        int loaded = 0;
        while (stmt.ok() && sqlite3_step(stmt.get()) == SQLITE_ROW) {
            const int bytes = sqlite3_column_bytes(stmt.get(), 1);
            if (bytes != dimensions * static_cast<int>(sizeof(float))) {
                LOG_WARN(rwStore, "Skipping fragment with %d-byte vector in %s", bytes,
                         qUtf8Printable(name));
                continue;
            }
            const auto* data = static_cast<const float*>(sqlite3_column_blob(stmt.get(), 1));
            if (index->addVector(static_cast<uint64_t>(sqlite3_column_int64(stmt.get(), 0)),
                                 data)) {
                ++loaded;
            }
        }
        LOG_DEBUG(rwStore, "Loaded %d vectors into %s", loaded, qUtf8Printable(name));
        m_indexes[name] = std::move(index);
    }
    return true;
}

VectorIndex* SqliteVectorStore::indexFor(const QString& collection, QString* error)
{
    auto it = m_indexes.find(collection);
    if (it == m_indexes.end()) {
        setError(error, QStringLiteral("collection not found: %1").arg(collection));
        return nullptr;
    }
    return it->second.get();
}

// ── Collections ─────────────────────────────────────────────

bool SqliteVectorStore::createCollection(const QString& name, int dimensions, Metric metric,
                                         QString* error)
{
    Q_UNUSED(metric);
    if (name.isEmpty() || dimensions <= 0) {
        setError(error, QStringLiteral("invalid collection %1 with %2 dimensions")
                            .arg(name)
                            .arg(dimensions));
        return false;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    auto existing = m_indexes.find(name);
    if (existing != m_indexes.end()) {
        if (existing->second->dimensions() != dimensions) {
            setError(error, QStringLiteral("collection %1 exists with %2 dimensions")
                                .arg(name)
                                .arg(existing->second->dimensions()));
            return false;
        }
        return true;
    }

    auto index = std::make_unique<VectorIndex>(dimensions);
    if (!index->create()) {
        setError(error, QStringLiteral("cannot create index for %1").arg(name));
        return false;
    }

    Statement stmt(m_db,
        "INSERT INTO collections (name, dimensions, metric, created_at) VALUES (?1, ?2, 'cosine', ?3)");
    if (!stmt.ok()) {
        setError(error, sqliteError(m_db, "create collection"));
        return false;
    }
    stmt.bindText(1, name.toUtf8());
    sqlite3_bind_int(stmt.get(), 2, dimensions);
    sqlite3_bind_double(stmt.get(), 3, QDateTime::currentMSecsSinceEpoch() / 1000.0);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        setError(error, sqliteError(m_db, "create collection"));
        return false;
    }

    m_indexes[name] = std::move(index);
    LOG_INFO(rwStore, "Created collection %s (%d dims, cosine)", qUtf8Printable(name), dimensions);
    return true;
}

bool SqliteVectorStore::deleteCollection(const QString& name, QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Transaction tx(m_db);
    if (!tx.isActive()) {
        setError(error, sqliteError(m_db, "begin"));
        return false;
    }

    const QByteArray nameUtf8 = name.toUtf8();
    for (const char* sql : {"DELETE FROM fragments WHERE collection = ?1",
                            "DELETE FROM collections WHERE name = ?1"}) {
        Statement stmt(m_db, sql);
        if (!stmt.ok()) {
            setError(error, sqliteError(m_db, "delete collection"));
            return false;
        }
        stmt.bindText(1, nameUtf8);
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            setError(error, sqliteError(m_db, "delete collection"));
            return false;
        }
    }
    if (!tx.commit()) {
        setError(error, sqliteError(m_db, "commit"));
        return false;
    }

    if (m_indexes.erase(name) > 0) {
        LOG_INFO(rwStore, "Deleted collection %s", qUtf8Printable(name));
    }
    return true;
}

bool SqliteVectorStore::listCollections(QStringList* out, QString* error)
{
    Q_UNUSED(error);
    std::lock_guard<std::mutex> lock(m_mutex);
    out->clear();
    for (const auto& [name, _] : m_indexes) {
        out->append(name);
    }
    return true;
}

// ── Fragments ───────────────────────────────────────────────

bool SqliteVectorStore::upsert(const QString& collection, const std::vector<FragmentPoint>& points,
                               QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    VectorIndex* index = indexFor(collection, error);
    if (!index) {
        return false;
    }
    for (const FragmentPoint& point : points) {
        if (static_cast<int>(point.vector.size()) != index->dimensions()) {
            setError(error, QStringLiteral("vector of %1 has %2 dimensions, expected %3")
                                .arg(point.id)
                                .arg(point.vector.size())
                                .arg(index->dimensions()));
            return false;
        }
    }

    Transaction tx(m_db);
    if (!tx.isActive()) {
        setError(error, sqliteError(m_db, "begin"));
        return false;
    }

    Statement select(m_db, "SELECT rowid FROM fragments WHERE collection = ?1 AND id = ?2");
    Statement update(m_db,
        "UPDATE fragments SET path = ?2, chunk_index = ?3, total_chunks = ?4, fingerprint = ?5, "
        "preview = ?6, mtime = ?7, vector = ?8 WHERE rowid = ?1");
    Statement insert(m_db,
        "INSERT INTO fragments (collection, id, path, chunk_index, total_chunks, fingerprint, "
        "preview, mtime, vector) VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9)");
    if (!select.ok() || !update.ok() || !insert.ok()) {
        setError(error, sqliteError(m_db, "prepare upsert"));
        return false;
    }

    const QByteArray collectionUtf8 = collection.toUtf8();
    std::vector<std::pair<uint64_t, std::vector<float>>> added;
    added.reserve(points.size());

    for (const FragmentPoint& point : points) {
        const FragmentPayload& p = point.payload;
        std::vector<float> unit = normalized(point.vector);
        const int blobBytes = static_cast<int>(unit.size() * sizeof(float));

        select.reset();
        select.bindText(1, collectionUtf8);
        select.bindText(2, point.id.toUtf8());
        int64_t rowid = -1;
        if (sqlite3_step(select.get()) == SQLITE_ROW) {
            rowid = sqlite3_column_int64(select.get(), 0);
        }

        if (rowid >= 0) {
            update.reset();
            sqlite3_bind_int64(update.get(), 1, rowid);
            update.bindText(2, p.path.toUtf8());
            sqlite3_bind_int(update.get(), 3, p.chunkIndex);
            sqlite3_bind_int(update.get(), 4, p.totalChunks);
            update.bindText(5, p.fingerprint.toUtf8());
            update.bindText(6, p.contentPreview.toUtf8());
            sqlite3_bind_double(update.get(), 7, p.mtime);
            sqlite3_bind_blob(update.get(), 8, unit.data(), blobBytes, SQLITE_TRANSIENT);
            if (sqlite3_step(update.get()) != SQLITE_DONE) {
                setError(error, sqliteError(m_db, "update fragment"));
                return false;
            }
        } else {
            insert.reset();
            insert.bindText(1, collectionUtf8);
            insert.bindText(2, point.id.toUtf8());
            insert.bindText(3, p.path.toUtf8());
            sqlite3_bind_int(insert.get(), 4, p.chunkIndex);
            sqlite3_bind_int(insert.get(), 5, p.totalChunks);
            insert.bindText(6, p.fingerprint.toUtf8());
            insert.bindText(7, p.contentPreview.toUtf8());
            sqlite3_bind_double(insert.get(), 8, p.mtime);
            sqlite3_bind_blob(insert.get(), 9, unit.data(), blobBytes, SQLITE_TRANSIENT);
            if (sqlite3_step(insert.get()) != SQLITE_DONE) {
                setError(error, sqliteError(m_db, "insert fragment"));
                return false;
            }
            rowid = sqlite3_last_insert_rowid(m_db);
        }
        added.emplace_back(static_cast<uint64_t>(rowid), std::move(unit));
    }

    if (!tx.commit()) {
        setError(error, sqliteError(m_db, "commit upsert"));
        return false;
    }

    for (const auto& [label, unit] : added) {
        if (!index->addVector(label, unit.data())) {
            // SQLite already has the row; the index catches up on reopen.
            LOG_WARN(rwStore, "Fragment %llu stored but not indexed in %s",
                     static_cast<unsigned long long>(label), qUtf8Printable(collection));
        }
    }
    return true;
}

bool SqliteVectorStore::remove(const QString& collection, const QStringList& ids, QString* error)
{
    if (ids.isEmpty()) {
        return true;
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    VectorIndex* index = indexFor(collection, error);
    if (!index) {
        return false;
    }

    Transaction tx(m_db);
    if (!tx.isActive()) {
        setError(error, sqliteError(m_db, "begin"));
        return false;
    }

    Statement select(m_db, "SELECT rowid FROM fragments WHERE collection = ?1 AND id = ?2");
    Statement erase(m_db, "DELETE FROM fragments WHERE rowid = ?1");
    if (!select.ok() || !erase.ok()) {
        setError(error, sqliteError(m_db, "prepare delete"));
        return false;
    }

    const QByteArray collectionUtf8 = collection.toUtf8();
    std::vector<uint64_t> removed;
    for (const QString& id : ids) {
        select.reset();
        select.bindText(1, collectionUtf8);
        select.bindText(2, id.toUtf8());
        if (sqlite3_step(select.get()) != SQLITE_ROW) {
            continue;
        }
        const int64_t rowid = sqlite3_column_int64(select.get(), 0);
        erase.reset();
        sqlite3_bind_int64(erase.get(), 1, rowid);
        if (sqlite3_step(erase.get()) != SQLITE_DONE) {
            setError(error, sqliteError(m_db, "delete fragment"));
            return false;
        }
        removed.push_back(static_cast<uint64_t>(rowid));
    }

    if (!tx.commit()) {
        setError(error, sqliteError(m_db, "commit delete"));
        return false;
    }
    for (uint64_t label : removed) {
        if (!index->deleteVector(label)) {
            LOG_WARN(rwStore, "Fragment %llu deleted but still indexed in %s",
                     static_cast<unsigned long long>(label), qUtf8Printable(collection));
        }
    }
    return true;
}

bool SqliteVectorStore::setFragmentPath(const QString& collection, const QStringList& ids,
                                        const QString& path, QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!indexFor(collection, error)) {
        return false;
    }

    Transaction tx(m_db);
    if (!tx.isActive()) {
        setError(error, sqliteError(m_db, "begin"));
        return false;
    }
    Statement stmt(m_db, "UPDATE fragments SET path = ?1 WHERE collection = ?2 AND id = ?3");
    if (!stmt.ok()) {
        setError(error, sqliteError(m_db, "prepare rename"));
        return false;
    }
    const QByteArray pathUtf8 = path.toUtf8();
    const QByteArray collectionUtf8 = collection.toUtf8();
    for (const QString& id : ids) {
        stmt.reset();
        stmt.bindText(1, pathUtf8);
        stmt.bindText(2, collectionUtf8);
        stmt.bindText(3, id.toUtf8());
        if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
            setError(error, sqliteError(m_db, "rename fragment"));
            return false;
        }
    }
    if (!tx.commit()) {
        setError(error, sqliteError(m_db, "commit rename"));
        return false;
    }
    return true;
}

bool SqliteVectorStore::fetchFragments(const QString& collection, const QStringList& ids,
                                       std::vector<FragmentPoint>* out, QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    VectorIndex* index = indexFor(collection, error);
    if (!index) {
        return false;
    }
    Statement stmt(m_db,
        "SELECT path, chunk_index, total_chunks, preview, fingerprint, mtime, vector "
        "FROM fragments WHERE collection = ?1 AND id = ?2");
    if (!stmt.ok()) {
        setError(error, sqliteError(m_db, "fetch fragments"));
        return false;
    }
    const QByteArray collectionUtf8 = collection.toUtf8();
    const int expectedBytes = index->dimensions() * static_cast<int>(sizeof(float));

    out->clear();
    for (const QString& id : ids) {
        stmt.reset();
        stmt.bindText(1, collectionUtf8);
        stmt.bindText(2, id.toUtf8());
        const int rc = sqlite3_step(stmt.get());
        if (rc == SQLITE_DONE) {
            continue;
        }
        if (rc != SQLITE_ROW) {
            setError(error, sqliteError(m_db, "fetch fragments"));
            return false;
        }
        if (sqlite3_column_bytes(stmt.get(), 6) != expectedBytes) {
            setError(error, QStringLiteral("fragment %1 has a malformed vector").arg(id));
            return false;
        }
        FragmentPoint point;
        point.id = id;
        point.payload.path = columnText(stmt.get(), 0);
        point.payload.chunkIndex = sqlite3_column_int(stmt.get(), 1);
        point.payload.totalChunks = sqlite3_column_int(stmt.get(), 2);
        point.payload.contentPreview = columnText(stmt.get(), 3);
        point.payload.fingerprint = columnText(stmt.get(), 4);
        point.payload.mtime = sqlite3_column_double(stmt.get(), 5);
        const auto* data = static_cast<const float*>(sqlite3_column_blob(stmt.get(), 6));
        point.vector.assign(data, data + index->dimensions());
        out->push_back(std::move(point));
    }
    return true;
}

bool SqliteVectorStore::listFragments(const QString& collection, std::vector<FragmentListing>* out,
                                      QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!indexFor(collection, error)) {
        return false;
    }
    Statement stmt(m_db,
        "SELECT id, path, chunk_index, fingerprint FROM fragments WHERE collection = ?1 "
        "ORDER BY path, chunk_index");
    if (!stmt.ok()) {
        setError(error, sqliteError(m_db, "list fragments"));
        return false;
    }
    stmt.bindText(1, collection.toUtf8());

    out->clear();
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        FragmentListing listing;
        listing.id = columnText(stmt.get(), 0);
        listing.path = columnText(stmt.get(), 1);
        listing.chunkIndex = sqlite3_column_int(stmt.get(), 2);
        listing.fingerprint = columnText(stmt.get(), 3);
        out->push_back(std::move(listing));
    }
    if (rc != SQLITE_DONE) {
        setError(error, sqliteError(m_db, "list fragments"));
        return false;
    }
    return true;
}

bool SqliteVectorStore::countFragments(const QString& collection, int64_t* out, QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!indexFor(collection, error)) {
        return false;
    }
    Statement stmt(m_db, "SELECT count(*) FROM fragments WHERE collection = ?1");
    if (!stmt.ok()) {
        setError(error, sqliteError(m_db, "count fragments"));
        return false;
    }
    stmt.bindText(1, collection.toUtf8());
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        setError(error, sqliteError(m_db, "count fragments"));
        return false;
    }
    *out = sqlite3_column_int64(stmt.get(), 0);
    return true;
}

bool SqliteVectorStore::search(const QString& collection, const std::vector<float>& vector,
                               int limit, std::vector<ScoredFragment>* out, QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    VectorIndex* index = indexFor(collection, error);
    if (!index) {
        return false;
    }
    if (static_cast<int>(vector.size()) != index->dimensions()) {
        setError(error, QStringLiteral("query has %1 dimensions, expected %2")
                            .arg(vector.size())
                            .arg(index->dimensions()));
        return false;
    }

    const std::vector<float> unit = normalized(vector);
    const std::vector<VectorIndex::KnnResult> hits = index->search(unit.data(), limit);

    Statement stmt(m_db,
        "SELECT id, path, chunk_index, total_chunks, preview, fingerprint, mtime "
        "FROM fragments WHERE rowid = ?1");
    if (!stmt.ok()) {
        setError(error, sqliteError(m_db, "search"));
        return false;
    }

    out->clear();
    for (const VectorIndex::KnnResult& hit : hits) {
        stmt.reset();
        sqlite3_bind_int64(stmt.get(), 1, static_cast<int64_t>(hit.label));
        if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
            continue;
        }
        ScoredFragment fragment;
        fragment.id = columnText(stmt.get(), 0);
        fragment.payload.path = columnText(stmt.get(), 1);
        fragment.payload.chunkIndex = sqlite3_column_int(stmt.get(), 2);
        fragment.payload.totalChunks = sqlite3_column_int(stmt.get(), 3);
        fragment.payload.contentPreview = columnText(stmt.get(), 4);
        fragment.payload.fingerprint = columnText(stmt.get(), 5);
        fragment.payload.mtime = sqlite3_column_double(stmt.get(), 6);
        fragment.score = 1.0f - hit.distance;
        out->push_back(std::move(fragment));
    }
    return true;
}

// ── Metadata records ────────────────────────────────────────

bool SqliteVectorStore::getMetadata(const QString& recordId, std::optional<QByteArray>* out,
                                    QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db, "SELECT payload FROM metadata_records WHERE id = ?1");
    if (!stmt.ok()) {
        setError(error, sqliteError(m_db, "read metadata"));
        return false;
    }
    stmt.bindText(1, recordId.toUtf8());
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        *out = std::nullopt;
        return true;
    }
    if (rc != SQLITE_ROW) {
        setError(error, sqliteError(m_db, "read metadata"));
        return false;
    }
    const auto* data = static_cast<const char*>(sqlite3_column_blob(stmt.get(), 0));
    *out = QByteArray(data, sqlite3_column_bytes(stmt.get(), 0));
    return true;
}

bool SqliteVectorStore::putMetadata(const QString& recordId, const QByteArray& payload,
                                    QString* error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    Statement stmt(m_db,
        "INSERT INTO metadata_records (id, payload, updated_at) VALUES (?1, ?2, ?3) "
        "ON CONFLICT(id) DO UPDATE SET payload = excluded.payload, updated_at = excluded.updated_at");
    if (!stmt.ok()) {
        setError(error, sqliteError(m_db, "write metadata"));
        return false;
    }
    stmt.bindText(1, recordId.toUtf8());
    sqlite3_bind_blob(stmt.get(), 2, payload.constData(), payload.size(), SQLITE_TRANSIENT);
    sqlite3_bind_double(stmt.get(), 3, QDateTime::currentMSecsSinceEpoch() / 1000.0);
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        setError(error, sqliteError(m_db, "write metadata"));
        return false;
    }
    return true;
}

} // namespace rw
