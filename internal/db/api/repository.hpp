#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/message_record.hpp"
#include "internal/db/model/process_record.hpp"
#include "internal/db/model/scheduler_record.hpp"

namespace schedstore::db {

/*
  Query for one page of a process's messages.

  Bounds are exclusive below, inclusive above:
    timestamp > from AND timestamp <= to
  Rows are ordered by timestamp ascending. The caller sizes limit
  (the store over-fetches by one to detect a next page).
*/
struct MessageQuery {
  std::string            process_id;
  std::optional<int64_t> from;
  std::optional<int64_t> to;
  int64_t                limit = 0;

  // select only the lightweight columns (no message_data, no bundle)
  bool headers_only = false;
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - Every call runs inside a Transaction, which owns one pooled connection
  - Writes report through Result; lookups return std::nullopt on absence
  - Lookups throw on backend failure (translated by the store)
  - processes / schedulers / process_schedulers inserts are insert-if-absent

  The DB is the source of truth for:
    processes
    messages (including payload bytes)
    schedulers and process ownership
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin(ConnectionRole role) = 0;

  // ---------------------------------------------------------------------
  // Processes
  // ---------------------------------------------------------------------

  virtual Result InsertProcess(Transaction&, const model::ProcessRecord&) = 0;

  virtual std::optional<model::ProcessRecord> GetProcess(Transaction&, const std::string& process_id) = 0;

  // ---------------------------------------------------------------------
  // Messages
  // ---------------------------------------------------------------------

  // Sets r.row_id on success. A statement that inserts nothing reports NotInserted.
  virtual Result InsertMessage(Transaction&, model::MessageRecord& r) = 0;

  // Earliest-by-timestamp row where message_id = id OR assignment_id = id.
  virtual std::optional<model::MessageRecord> FindMessage(Transaction&, const std::string& id) = 0;

  // Earliest-by-timestamp row matching message_id and, when given, assignment_id.
  virtual std::optional<model::MessageRecord> FindMessageExact(Transaction&, const std::string& message_id,
                                                               const std::optional<std::string>& assignment_id) = 0;

  // Highest row_id for the process.
  virtual std::optional<model::MessageRecord> GetLatestMessage(Transaction&, const std::string& process_id) = 0;

  virtual std::vector<model::MessageRecord> ListMessages(Transaction&, const MessageQuery& query) = 0;

  virtual int64_t CountMessages(Transaction&) = 0;

  // Table-wide scan by logical offset, timestamp ascending. No limit when count is empty.
  virtual std::vector<model::MessageRecord> ListMessagesByOffset(Transaction&, int64_t offset, std::optional<int64_t> count) = 0;

  // offset 0 is the newest row by timestamp.
  virtual std::optional<model::MessageRecord> GetMessageFromEnd(Transaction&, int64_t offset) = 0;

  // ---------------------------------------------------------------------
  // Schedulers
  // ---------------------------------------------------------------------

  virtual Result InsertScheduler(Transaction&, const model::SchedulerRecord&) = 0;

  // NotFound when no row carries r.row_id.
  virtual Result UpdateScheduler(Transaction&, const model::SchedulerRecord& r) = 0;

  virtual std::optional<model::SchedulerRecord> GetScheduler(Transaction&, int32_t row_id) = 0;

  virtual std::optional<model::SchedulerRecord> GetSchedulerByUrl(Transaction&, const std::string& url) = 0;

  virtual std::vector<model::SchedulerRecord> ListSchedulers(Transaction&) = 0;

  virtual Result InsertProcessScheduler(Transaction&, const model::ProcessSchedulerRecord&) = 0;

  virtual std::optional<model::ProcessSchedulerRecord> GetProcessScheduler(Transaction&, const std::string& process_id) = 0;
};

} // namespace schedstore::db
