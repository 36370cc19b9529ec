#include "pg_repository.hpp"

#include <cstddef>
#include <string_view>

namespace schedstore::db::postgres {

namespace {

using Bytes = std::basic_string<std::byte>;

std::basic_string_view<std::byte> AsBytea(const std::string& s) {
  return {reinterpret_cast<const std::byte*>(s.data()), s.size()};
}

std::string FromBytea(const pqxx::field& f) {
  if (f.is_null()) return {};
  auto bytes = f.as<Bytes>();
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::string TextOrEmpty(const pqxx::field& f) {
  return f.is_null() ? std::string() : std::string(f.c_str());
}

// Column order matches sql_queries.hpp.
model::MessageRecord ReadMessage(const pqxx::row& row) {
  model::MessageRecord r;
  r.row_id        = row[0].as<int32_t>();
  r.process_id    = row[1].c_str();
  r.message_id    = row[2].c_str();
  r.assignment_id = row[3].is_null() ? std::nullopt : std::optional<std::string>(row[3].c_str());
  r.message_data  = TextOrEmpty(row[4]);
  r.epoch         = row[5].as<int32_t>();
  r.nonce         = row[6].as<int32_t>();
  r.timestamp     = row[7].as<int64_t>();
  r.bundle        = FromBytea(row[8]);
  r.hash_chain    = row[9].c_str();
  return r;
}

std::optional<model::MessageRecord> FirstMessage(const pqxx::result& res) {
  if (res.empty()) return std::nullopt;
  return ReadMessage(res[0]);
}

std::vector<model::MessageRecord> AllMessages(const pqxx::result& res) {
  std::vector<model::MessageRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadMessage(row));
  }
  return out;
}

model::SchedulerRecord ReadScheduler(const pqxx::row& row) {
  model::SchedulerRecord r;
  r.row_id        = row[0].as<int32_t>();
  r.url           = row[1].c_str();
  r.process_count = row[2].as<int32_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> primary, std::shared_ptr<PgPool> replica)
    : primary_(std::move(primary)), replica_(std::move(replica)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin(ConnectionRole role) {
  return std::make_unique<PgTransaction>(role == ConnectionRole::Primary ? primary_ : replica_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e) != nullptr) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Processes
// ------------------------------------------------------------------

Result PgRepository::InsertProcess(Transaction& t, const model::ProcessRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_process", r.process_id, r.process_data, AsBytea(r.bundle));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProcessRecord> PgRepository::GetProcess(Transaction& t, const std::string& process_id) {
  auto res = TX(t).Work().exec_prepared("get_process", process_id);
  if (res.empty()) return std::nullopt;

  model::ProcessRecord r;
  r.row_id       = res[0][0].as<int32_t>();
  r.process_id   = res[0][1].c_str();
  r.process_data = res[0][2].c_str();
  r.bundle       = FromBytea(res[0][3]);
  return r;
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

Result PgRepository::InsertMessage(Transaction& t, model::MessageRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_message", r.process_id, r.message_id, r.assignment_id, r.message_data, r.epoch,
                                          r.nonce, r.timestamp, AsBytea(r.bundle), r.hash_chain);
    if (res.empty()) {
      return Result::Err(ErrorCode::NotInserted, "no message row inserted");
    }
    r.row_id = res[0][0].as<int32_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MessageRecord> PgRepository::FindMessage(Transaction& t, const std::string& id) {
  return FirstMessage(TX(t).Work().exec_prepared("find_message", id));
}

std::optional<model::MessageRecord> PgRepository::FindMessageExact(Transaction& t, const std::string& message_id,
                                                                   const std::optional<std::string>& assignment_id) {
  if (assignment_id) {
    return FirstMessage(TX(t).Work().exec_prepared("find_message_exact", message_id, *assignment_id));
  }
  return FirstMessage(TX(t).Work().exec_prepared("find_message_by_message_id", message_id));
}

std::optional<model::MessageRecord> PgRepository::GetLatestMessage(Transaction& t, const std::string& process_id) {
  return FirstMessage(TX(t).Work().exec_prepared("latest_message", process_id));
}

std::vector<model::MessageRecord> PgRepository::ListMessages(Transaction& t, const MessageQuery& q) {
  std::string sql = q.headers_only
                        ? "SELECT id,process_id,message_id,assignment_id,NULL,epoch,nonce,timestamp,NULL,hash_chain FROM messages"
                        : "SELECT id,process_id,message_id,assignment_id,message_data::text,epoch,nonce,timestamp,bundle,hash_chain FROM messages";

  pqxx::params params;
  params.append(q.process_id);
  sql += " WHERE process_id=$1";

  if (q.from) {
    params.append(*q.from);
    sql += " AND timestamp>$" + std::to_string(params.size());
  }
  if (q.to) {
    params.append(*q.to);
    sql += " AND timestamp<=$" + std::to_string(params.size());
  }
  params.append(q.limit);
  sql += " ORDER BY timestamp ASC, id ASC LIMIT $" + std::to_string(params.size()) + ";";

  return AllMessages(TX(t).Work().exec_params(sql, params));
}

int64_t PgRepository::CountMessages(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("count_messages");
  if (res.empty() || res[0][0].is_null()) return 0;
  return res[0][0].as<int64_t>();
}

std::vector<model::MessageRecord> PgRepository::ListMessagesByOffset(Transaction& t, int64_t offset, std::optional<int64_t> count) {
  return AllMessages(TX(t).Work().exec_prepared("messages_by_offset", offset, count));
}

std::optional<model::MessageRecord> PgRepository::GetMessageFromEnd(Transaction& t, int64_t offset) {
  return FirstMessage(TX(t).Work().exec_prepared("message_from_end", offset));
}

// ------------------------------------------------------------------
// Schedulers
// ------------------------------------------------------------------

Result PgRepository::InsertScheduler(Transaction& t, const model::SchedulerRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_scheduler", r.url, r.process_count);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateScheduler(Transaction& t, const model::SchedulerRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_scheduler", r.row_id, r.process_count, r.url);
    if (res.affected_rows() == 0) {
      return Result::Err(ErrorCode::NotFound, "Scheduler not found");
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::SchedulerRecord> PgRepository::GetScheduler(Transaction& t, int32_t row_id) {
  auto res = TX(t).Work().exec_prepared("get_scheduler", row_id);
  if (res.empty()) return std::nullopt;
  return ReadScheduler(res[0]);
}

std::optional<model::SchedulerRecord> PgRepository::GetSchedulerByUrl(Transaction& t, const std::string& url) {
  auto res = TX(t).Work().exec_prepared("get_scheduler_by_url", url);
  if (res.empty()) return std::nullopt;
  return ReadScheduler(res[0]);
}

std::vector<model::SchedulerRecord> PgRepository::ListSchedulers(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_schedulers");

  std::vector<model::SchedulerRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadScheduler(row));
  }
  return out;
}

Result PgRepository::InsertProcessScheduler(Transaction& t, const model::ProcessSchedulerRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_process_scheduler", r.process_id, r.scheduler_row_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProcessSchedulerRecord> PgRepository::GetProcessScheduler(Transaction& t, const std::string& process_id) {
  auto res = TX(t).Work().exec_prepared("get_process_scheduler", process_id);
  if (res.empty()) return std::nullopt;

  model::ProcessSchedulerRecord r;
  r.row_id           = res[0][0].as<int32_t>();
  r.process_id       = res[0][1].c_str();
  r.scheduler_row_id = res[0][2].as<int32_t>();
  return r;
}

} // namespace schedstore::db::postgres
