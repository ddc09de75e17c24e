#pragma once

namespace gt {

constexpr int kCurrentSchemaVersion = 1;

// Per-connection pragmas — no write lock required, safe on every open.
// A navigation query waits out an indexer's batch transaction rather than
// failing with SQLITE_BUSY.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 10000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA cache_size = -8192;
)";

// Database-level pragmas — require write lock, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x474f544f;
PRAGMA user_version = 1;
)";

// embedding is a packed little-endian float32 array; NULL when absent.
// tech_tags is a comma-separated list.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS projects (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    path TEXT NOT NULL UNIQUE,
    name TEXT NOT NULL,
    description_text TEXT NOT NULL DEFAULT '',
    tech_tags TEXT NOT NULL DEFAULT '',
    embedding BLOB,
    model_id TEXT,
    source TEXT NOT NULL DEFAULT 'scan',
    access_count INTEGER NOT NULL DEFAULT 0,
    last_accessed REAL,
    indexed_at REAL NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_projects_name ON projects(name);
CREATE INDEX IF NOT EXISTS idx_projects_last_accessed ON projects(last_accessed DESC);

CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
)";

} // namespace gt
