#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace schedstore::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One handle is shared by every transaction; TxMutex() serializes them
  because a sqlite connection carries at most one open transaction.
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

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  tx_mutex_;
};

} // namespace schedstore::db::sqlite
