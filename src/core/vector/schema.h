#pragma once

namespace rw {

// Per-connection pragmas, safe on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -65536;
PRAGMA journal_size_limit = 33554432;
)";

// Database-level pragmas, run once when creating the database.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x5257;
PRAGMA user_version = 1;
)";

constexpr int kCurrentSchemaVersion = 1;

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS collections (
    name TEXT PRIMARY KEY,
    dimensions INTEGER NOT NULL,
    metric TEXT NOT NULL DEFAULT 'cosine',
    created_at REAL NOT NULL
);

CREATE TABLE IF NOT EXISTS fragments (
    rowid INTEGER PRIMARY KEY AUTOINCREMENT,
    collection TEXT NOT NULL REFERENCES collections(name) ON DELETE CASCADE,
    id TEXT NOT NULL,
    path TEXT NOT NULL,
    chunk_index INTEGER NOT NULL,
    total_chunks INTEGER NOT NULL,
    fingerprint TEXT NOT NULL,
    preview TEXT NOT NULL DEFAULT '',
    mtime REAL NOT NULL DEFAULT 0,
    vector BLOB NOT NULL,
    UNIQUE (collection, id)
);

CREATE INDEX IF NOT EXISTS idx_fragments_path ON fragments(collection, path);

CREATE TABLE IF NOT EXISTS metadata_records (
    id TEXT PRIMARY KEY,
    payload BLOB NOT NULL,
    updated_at REAL NOT NULL
);
)";

} // namespace rw
