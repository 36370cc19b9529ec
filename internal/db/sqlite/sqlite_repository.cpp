#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace schedstore::db::sqlite {

using schedstore::db::ErrorCode;
using schedstore::db::Result;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

// sqlite3_bind_blob binds NULL for a null pointer; keep empty payloads NOT NULL.
void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  if (bytes.empty()) {
    sqlite3_bind_zeroblob(st, idx, 0);
    return;
  }
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int32_t v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  if (!t) return {};
  return std::string(reinterpret_cast<const char*>(t), static_cast<size_t>(sqlite3_column_bytes(st, col)));
}

std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  if (!data || size <= 0) return {};
  return std::string(static_cast<const char*>(data), static_cast<size_t>(size));
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

int32_t ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::MessageRecord ReadMessage(sqlite3_stmt* st) {
  model::MessageRecord r;
  r.row_id        = ColI32(st, 0);
  r.process_id    = ColText(st, 1);
  r.message_id    = ColText(st, 2);
  r.assignment_id = ColOptionalText(st, 3);
  r.message_data  = ColText(st, 4);
  r.epoch         = ColI32(st, 5);
  r.nonce         = ColI32(st, 6);
  r.timestamp     = ColI64(st, 7);
  r.bundle        = ColBlob(st, 8);
  r.hash_chain    = ColText(st, 9);
  return r;
}

model::SchedulerRecord ReadScheduler(sqlite3_stmt* st) {
  model::SchedulerRecord r;
  r.row_id        = ColI32(st, 0);
  r.url           = ColText(st, 1);
  r.process_count = ColI32(st, 2);
  return r;
}

// Steps a read statement; true when a row is available.
bool StepRow(sqlite3* db, sqlite3_stmt* st) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db));
}

std::optional<model::MessageRecord> FirstMessage(sqlite3* db, sqlite3_stmt* st) {
  if (!StepRow(db, st)) return std::nullopt;
  return ReadMessage(st);
}

std::vector<model::MessageRecord> AllMessages(sqlite3* db, sqlite3_stmt* st) {
  std::vector<model::MessageRecord> out;
  while (StepRow(db, st)) {
    out.push_back(ReadMessage(st));
  }
  return out;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin(ConnectionRole role) {
  return std::make_unique<SqliteTransaction>(db_, role);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Processes
// ------------------------------------------------------------------

Result SqliteRepository::InsertProcess(Transaction& t, const model::ProcessRecord& r) {
  auto* db = TX(t).Handle();
  try {
    auto st = Prepare(db, sql::INSERT_PROCESS);
    BindText(st.get(), 1, r.process_id);
    BindText(st.get(), 2, r.process_data);
    BindBlob(st.get(), 3, r.bundle);
    return Translate(db, sqlite3_step(st.get()));
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

std::optional<model::ProcessRecord> SqliteRepository::GetProcess(Transaction& t, const std::string& process_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_PROCESS);
  BindText(st.get(), 1, process_id);

  if (!StepRow(db, st.get())) return std::nullopt;

  model::ProcessRecord r;
  r.row_id       = ColI32(st.get(), 0);
  r.process_id   = ColText(st.get(), 1);
  r.process_data = ColText(st.get(), 2);
  r.bundle       = ColBlob(st.get(), 3);
  return r;
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result SqliteRepository::InsertMessage(Transaction& t, model::MessageRecord& r) {
  auto* db = TX(t).Handle();
  try {
    auto st = Prepare(db, sql::INSERT_MESSAGE);
    BindText(st.get(), 1, r.process_id);
    BindText(st.get(), 2, r.message_id);
    BindOptionalText(st.get(), 3, r.assignment_id);
    BindText(st.get(), 4, r.message_data);
    BindI32(st.get(), 5, r.epoch);
    BindI32(st.get(), 6, r.nonce);
    BindI64(st.get(), 7, r.timestamp);
    BindBlob(st.get(), 8, r.bundle);
    BindText(st.get(), 9, r.hash_chain);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;

    if (sqlite3_changes(db) == 0) {
      return Result::Err(ErrorCode::NotInserted, "no message row inserted");
    }
    r.row_id = static_cast<int32_t>(sqlite3_last_insert_rowid(db));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

std::optional<model::MessageRecord> SqliteRepository::FindMessage(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_MESSAGE_BY_ANY_ID);
  BindText(st.get(), 1, id);
  return FirstMessage(db, st.get());
}

std::optional<model::MessageRecord> SqliteRepository::FindMessageExact(Transaction& t, const std::string& message_id,
                                                                       const std::optional<std::string>& assignment_id) {
  auto* db = TX(t).Handle();
  if (assignment_id) {
    auto st = Prepare(db, sql::SELECT_MESSAGE_EXACT);
    BindText(st.get(), 1, message_id);
    BindText(st.get(), 2, *assignment_id);
    return FirstMessage(db, st.get());
  }

  auto st = Prepare(db, sql::SELECT_MESSAGE_BY_MESSAGE_ID);
  BindText(st.get(), 1, message_id);
  return FirstMessage(db, st.get());
}

std::optional<model::MessageRecord> SqliteRepository::GetLatestMessage(Transaction& t, const std::string& process_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_LATEST_MESSAGE);
  BindText(st.get(), 1, process_id);
  return FirstMessage(db, st.get());
}

std::vector<model::MessageRecord> SqliteRepository::ListMessages(Transaction& t, const MessageQuery& q) {
  auto* db = TX(t).Handle();

  std::string text = sql::SelectMessages(q.headers_only ? sql::MESSAGE_HEADER_COLUMNS : sql::MESSAGE_COLUMNS, "WHERE process_id=?");
  if (q.from) text += " AND timestamp>?";
  if (q.to) text += " AND timestamp<=?";
  text += " ORDER BY timestamp ASC, id ASC LIMIT ?;";

  auto st  = Prepare(db, text);
  int  idx = 1;
  BindText(st.get(), idx++, q.process_id);
  if (q.from) BindI64(st.get(), idx++, *q.from);
  if (q.to) BindI64(st.get(), idx++, *q.to);
  BindI64(st.get(), idx++, q.limit);

  return AllMessages(db, st.get());
}

int64_t SqliteRepository::CountMessages(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::COUNT_MESSAGES);
  if (!StepRow(db, st.get())) return 0;
  return ColI64(st.get(), 0);
}

std::vector<model::MessageRecord> SqliteRepository::ListMessagesByOffset(Transaction& t, int64_t offset, std::optional<int64_t> count) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_MESSAGES_BY_OFFSET);
  // LIMIT -1 is unbounded in sqlite
  BindI64(st.get(), 1, count.value_or(-1));
  BindI64(st.get(), 2, offset);
  return AllMessages(db, st.get());
}

std::optional<model::MessageRecord> SqliteRepository::GetMessageFromEnd(Transaction& t, int64_t offset) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_MESSAGE_FROM_END);
  BindI64(st.get(), 1, offset);
  return FirstMessage(db, st.get());
}

// ------------------------------------------------------------------
// Schedulers
// ------------------------------------------------------------------

Result SqliteRepository::InsertScheduler(Transaction& t, const model::SchedulerRecord& r) {
  auto* db = TX(t).Handle();
  try {
    auto st = Prepare(db, sql::INSERT_SCHEDULER);
    BindText(st.get(), 1, r.url);
    BindI32(st.get(), 2, r.process_count);
    return Translate(db, sqlite3_step(st.get()));
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

Result SqliteRepository::UpdateScheduler(Transaction& t, const model::SchedulerRecord& r) {
  auto* db = TX(t).Handle();
  try {
    auto st = Prepare(db, sql::UPDATE_SCHEDULER);
    BindI32(st.get(), 1, r.process_count);
    BindText(st.get(), 2, r.url);
    BindI32(st.get(), 3, r.row_id);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (result && sqlite3_changes(db) == 0) {
      return Result::Err(ErrorCode::NotFound, "Scheduler not found");
    }
    return result;
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

std::optional<model::SchedulerRecord> SqliteRepository::GetScheduler(Transaction& t, int32_t row_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_SCHEDULER);
  BindI32(st.get(), 1, row_id);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadScheduler(st.get());
}

std::optional<model::SchedulerRecord> SqliteRepository::GetSchedulerByUrl(Transaction& t, const std::string& url) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_SCHEDULER_BY_URL);
  BindText(st.get(), 1, url);
  if (!StepRow(db, st.get())) return std::nullopt;
  return ReadScheduler(st.get());
}

std::vector<model::SchedulerRecord> SqliteRepository::ListSchedulers(Transaction& t) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_SCHEDULERS);

  std::vector<model::SchedulerRecord> out;
  while (StepRow(db, st.get())) {
    out.push_back(ReadScheduler(st.get()));
  }
  return out;
}

Result SqliteRepository::InsertProcessScheduler(Transaction& t, const model::ProcessSchedulerRecord& r) {
  auto* db = TX(t).Handle();
  try {
    auto st = Prepare(db, sql::INSERT_PROCESS_SCHEDULER);
    BindText(st.get(), 1, r.process_id);
    BindI32(st.get(), 2, r.scheduler_row_id);
    return Translate(db, sqlite3_step(st.get()));
  } catch (const std::exception& e) {
    return Result::Err(ErrorCode::InternalError, e.what());
  }
}

std::optional<model::ProcessSchedulerRecord> SqliteRepository::GetProcessScheduler(Transaction& t, const std::string& process_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_PROCESS_SCHEDULER);
  BindText(st.get(), 1, process_id);
  if (!StepRow(db, st.get())) return std::nullopt;

  model::ProcessSchedulerRecord r;
  r.row_id           = ColI32(st.get(), 0);
  r.process_id       = ColText(st.get(), 1);
  r.scheduler_row_id = ColI32(st.get(), 2);
  return r;
}

} // namespace schedstore::db::sqlite
