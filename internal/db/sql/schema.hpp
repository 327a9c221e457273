#pragma once

#include <string>
#include <vector>

namespace songqueue::db::sql {

/*
  Schema bootstrap, applied in order at start-up.

  Status is stored as its numeric value (1 pending .. 4 cancelled).
  The partial unique index backs the "one outstanding request per
  patron and track" rule at the storage level.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS venue (id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', active INTEGER NOT NULL, "
      "max_requests_per_patron INTEGER NOT NULL, queue_limit INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS track (id TEXT PRIMARY KEY, venue_id TEXT NOT NULL REFERENCES venue(id), active INTEGER NOT NULL, "
      "title TEXT NOT NULL DEFAULT '', artist TEXT NOT NULL DEFAULT '', duration_sec INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS patron (id TEXT PRIMARY KEY, venue_id TEXT NOT NULL REFERENCES venue(id), account_id TEXT NOT NULL DEFAULT '', "
      "table_tag TEXT NOT NULL DEFAULT '', client_address TEXT NOT NULL DEFAULT '', created_at_ms INTEGER NOT NULL, last_seen_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS song_request (id TEXT PRIMARY KEY, venue_id TEXT NOT NULL REFERENCES venue(id), "
      "patron_id TEXT NOT NULL REFERENCES patron(id), track_id TEXT NOT NULL REFERENCES track(id), status INTEGER NOT NULL, "
      "queue_position INTEGER NOT NULL DEFAULT 0, display_tag TEXT NOT NULL DEFAULT '', submitted_at_ms INTEGER NOT NULL, "
      "started_at_ms INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0, cancelled_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS song_request_queue_idx ON song_request(venue_id, status, queue_position);",
      "CREATE INDEX IF NOT EXISTS song_request_patron_idx ON song_request(patron_id, submitted_at_ms);",
      "CREATE UNIQUE INDEX IF NOT EXISTS song_request_outstanding_uq ON song_request(venue_id, patron_id, track_id) WHERE status IN (1,2);",
      "CREATE UNIQUE INDEX IF NOT EXISTS patron_account_uq ON patron(venue_id, account_id) WHERE account_id <> '';",
      "CREATE INDEX IF NOT EXISTS patron_session_idx ON patron(venue_id, table_tag, client_address);"};
  return kSql;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSql = {
      "CREATE TABLE IF NOT EXISTS venue (id TEXT PRIMARY KEY, name TEXT NOT NULL DEFAULT '', active BOOLEAN NOT NULL, "
      "max_requests_per_patron INTEGER NOT NULL, queue_limit INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS track (id TEXT PRIMARY KEY, venue_id TEXT NOT NULL REFERENCES venue(id), active BOOLEAN NOT NULL, "
      "title TEXT NOT NULL DEFAULT '', artist TEXT NOT NULL DEFAULT '', duration_sec INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS patron (id TEXT PRIMARY KEY, venue_id TEXT NOT NULL REFERENCES venue(id), account_id TEXT NOT NULL DEFAULT '', "
      "table_tag TEXT NOT NULL DEFAULT '', client_address TEXT NOT NULL DEFAULT '', created_at_ms BIGINT NOT NULL, last_seen_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS song_request (id TEXT PRIMARY KEY, venue_id TEXT NOT NULL REFERENCES venue(id), "
      "patron_id TEXT NOT NULL REFERENCES patron(id), track_id TEXT NOT NULL REFERENCES track(id), status SMALLINT NOT NULL, "
      "queue_position INTEGER NOT NULL DEFAULT 0, display_tag TEXT NOT NULL DEFAULT '', submitted_at_ms BIGINT NOT NULL, "
      "started_at_ms BIGINT NOT NULL DEFAULT 0, completed_at_ms BIGINT NOT NULL DEFAULT 0, cancelled_at_ms BIGINT NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS song_request_queue_idx ON song_request(venue_id, status, queue_position);",
      "CREATE INDEX IF NOT EXISTS song_request_patron_idx ON song_request(patron_id, submitted_at_ms);",
      "CREATE UNIQUE INDEX IF NOT EXISTS song_request_outstanding_uq ON song_request(venue_id, patron_id, track_id) WHERE status IN (1,2);",
      "CREATE UNIQUE INDEX IF NOT EXISTS patron_account_uq ON patron(venue_id, account_id) WHERE account_id <> '';",
      "CREATE INDEX IF NOT EXISTS patron_session_idx ON patron(venue_id, table_tag, client_address);"};
  return kSql;
}

} // namespace songqueue::db::sql
