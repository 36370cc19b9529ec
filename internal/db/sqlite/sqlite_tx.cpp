#include "sqlite_tx.hpp"

namespace schedstore::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db, ConnectionRole role)
    : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec(role == ConnectionRole::Primary ? "BEGIN IMMEDIATE;" : "BEGIN;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!committed_) {
    try {
      db_->Exec("ROLLBACK;");
    } catch (const std::exception&) {
      // already rolled back by sqlite (e.g. after SQLITE_FULL)
    }
  }
}

void SqliteTransaction::Commit() {
  db_->Exec("COMMIT;");
  committed_ = true;
}

void SqliteTransaction::Rollback() {
  db_->Exec("ROLLBACK;");
  committed_ = true;
}

} // namespace schedstore::db::sqlite
