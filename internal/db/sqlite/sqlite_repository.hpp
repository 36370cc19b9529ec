#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace schedstore::db::sqlite {

/*
  Single-file backend.

  Used for embedded deployments and tests. Both connection roles map to
  the same handle, so "latest" reads are trivially consistent.
*/
class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin(ConnectionRole role) override;

  Result InsertProcess(Transaction&, const model::ProcessRecord&) override;
  std::optional<model::ProcessRecord> GetProcess(Transaction&, const std::string&) override;

  Result InsertMessage(Transaction&, model::MessageRecord&) override;
  std::optional<model::MessageRecord> FindMessage(Transaction&, const std::string&) override;
  std::optional<model::MessageRecord> FindMessageExact(Transaction&, const std::string&,
                                                       const std::optional<std::string>&) override;
  std::optional<model::MessageRecord> GetLatestMessage(Transaction&, const std::string&) override;
  std::vector<model::MessageRecord> ListMessages(Transaction&, const MessageQuery&) override;
  int64_t CountMessages(Transaction&) override;
  std::vector<model::MessageRecord> ListMessagesByOffset(Transaction&, int64_t, std::optional<int64_t>) override;
  std::optional<model::MessageRecord> GetMessageFromEnd(Transaction&, int64_t) override;

  Result InsertScheduler(Transaction&, const model::SchedulerRecord&) override;
  Result UpdateScheduler(Transaction&, const model::SchedulerRecord&) override;
  std::optional<model::SchedulerRecord> GetScheduler(Transaction&, int32_t) override;
  std::optional<model::SchedulerRecord> GetSchedulerByUrl(Transaction&, const std::string&) override;
  std::vector<model::SchedulerRecord> ListSchedulers(Transaction&) override;

  Result InsertProcessScheduler(Transaction&, const model::ProcessSchedulerRecord&) override;
  std::optional<model::ProcessSchedulerRecord> GetProcessScheduler(Transaction&, const std::string&) override;

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
