#pragma once

namespace mm {

// Per-connection pragmas, applied on every open.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 5000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
)";

// Database-level pragmas, applied once when the schema is created.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA user_version = 1;
)";

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS preferences (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL,
    updated_at REAL NOT NULL
);

CREATE TABLE IF NOT EXISTS event_log (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    kind TEXT NOT NULL,
    sender TEXT NOT NULL DEFAULT '',
    message_id TEXT NOT NULL DEFAULT '',
    timestamp REAL NOT NULL,
    payload TEXT NOT NULL DEFAULT '{}'
);

CREATE INDEX IF NOT EXISTS idx_event_log_kind_ts ON event_log(kind, timestamp);
CREATE INDEX IF NOT EXISTS idx_event_log_sender_ts ON event_log(sender, timestamp);
)";

} // namespace mm
