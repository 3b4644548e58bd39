#pragma once

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace netorch::db::sqlite {

/*
  Thin RAII wrapper around a single sqlite3* connection.

  Every transaction runs on this one connection, so transactions are
  serialized through TxMutex(): a SqliteTransaction holds it from BEGIN to
  COMMIT/ROLLBACK.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace netorch::db::sqlite
