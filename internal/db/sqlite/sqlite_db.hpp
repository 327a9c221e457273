#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace songqueue::db::sqlite {

/*
  Thin RAII wrapper around a single sqlite3* connection.

  The connection runs one transaction at a time; SqliteTransaction holds
  TxMutex() for its whole lifetime.
*/
class SqliteDB {
 public:
  struct Options {
    bool     wal_mode        = true;
    uint32_t busy_timeout_ms = 5000;
  };

  explicit SqliteDB(std::string path);
  SqliteDB(std::string path, Options options);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  Options     options_;
  std::mutex  tx_mutex_;
};

} // namespace songqueue::db::sqlite
