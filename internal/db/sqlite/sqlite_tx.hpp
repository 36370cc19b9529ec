#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace schedstore::db::sqlite {

/*
  SQLite transaction wrapper.

  Primary uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
  Replica uses a deferred BEGIN.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::shared_ptr<SqliteDB> db, ConnectionRole role);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
  bool committed_ = false;
};

}
