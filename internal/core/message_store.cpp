#include "message_store.hpp"

#include <exception>
#include <limits>
#include <string_view>
#include <utility>

#include "internal/core/row_mapping.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/parse.hpp"

namespace schedstore::core {

using db::ConnectionRole;

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    default:
      throw util::DatabaseError(message);
  }
}

// Store errors pass through; anything native (pqxx, sqlite) becomes DatabaseError.
template <typename Fn>
auto Translated(std::string_view context, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::DatabaseError(std::string(context) + ": " + e.what());
  }
}

std::optional<int64_t> ParseCursor(const std::optional<std::string>& cursor, std::string_view what) {
  if (!cursor) return std::nullopt;
  return util::ParseInt64(*cursor, what);
}

} // namespace

MessageStore::MessageStore(std::shared_ptr<db::Repository> repository, storage::BlobStorePtr blob_store, MessageDecoderPtr decoder)
    : repository_(std::move(repository)), blob_store_(std::move(blob_store)), decoder_(std::move(decoder)) {
  if (!repository_) {
    throw util::DatabaseError("message store requires a repository");
  }
  if (!decoder_) {
    decoder_ = std::make_shared<HeaderDocumentDecoder>();
  }
}

// ------------------------------------------------------------------
// Processes
// ------------------------------------------------------------------

void MessageStore::SaveProcess(const model::Process& process, const std::string& bundle) {
  auto record = ToRecord(process, bundle);

  Translated("save process", [&] {
    auto tx = repository_->Begin(ConnectionRole::Primary);
    ThrowIfDbError(repository_->InsertProcess(*tx, record), "save process");
    tx->Commit();
  });
}

model::Process MessageStore::GetProcess(const std::string& process_id) {
  auto record = Translated("get process", [&] {
    auto tx = repository_->Begin(ConnectionRole::Replica);
    auto r  = repository_->GetProcess(*tx, process_id);
    tx->Commit();
    return r;
  });

  if (!record) throw util::NotFound("Process not found");
  return FromRecord(*record);
}

// ------------------------------------------------------------------
// Messages
// ------------------------------------------------------------------

void MessageStore::CheckExistingMessage(const model::Message& message) {
  if (!message.HasPayload()) {
    return;
  }

  std::optional<model::Message> existing;
  try {
    existing = GetMessage(message.message_id);
  } catch (const util::NotFound&) {
    return;
  } catch (const util::StoreError&) {
    throw util::DatabaseError("Error checking message");
  }

  if (existing->HasPayload()) {
    throw util::MessageExists("Message already exists");
  }
}

void MessageStore::SaveMessage(const model::Message& message, const std::string& bundle) {
  CheckExistingMessage(message);

  auto record = ToRecord(message, bundle);

  Translated("save message", [&] {
    auto tx     = repository_->Begin(ConnectionRole::Primary);
    auto result = repository_->InsertMessage(*tx, record);
    if (!result) {
      throw util::DatabaseError("Error saving message");
    }
    tx->Commit();
  });

  if (!blob_store_) {
    return;
  }

  // The relational row is committed; a failure here leaves it without a blob copy.
  try {
    blob_store_->SaveBinary(BlobKeyFor(record), bundle);
  } catch (const util::StoreError& e) {
    SCHEDSTORE_LOG_ERROR("blob write failed after relational commit",
                         {observability::StringField("message_id", record.message_id),
                          observability::StringField("process_id", record.process_id),
                          observability::IntField("row_id", record.row_id), observability::StringField("error", e.what())});
    throw util::DatabaseError(e.what());
  }
}

model::Message MessageStore::GetMessage(const std::string& id) {
  auto record = Translated("get message", [&] {
    auto tx = repository_->Begin(ConnectionRole::Replica);
    auto r  = repository_->FindMessage(*tx, id);
    tx->Commit();
    return r;
  });

  if (!record) throw util::NotFound("Message not found");
  return FromRecord(*record);
}

std::optional<model::Message> MessageStore::GetLatestMessage(const std::string& process_id) {
  auto record = Translated("get latest message", [&] {
    auto tx = repository_->Begin(ConnectionRole::Primary);
    auto r  = repository_->GetLatestMessage(*tx, process_id);
    tx->Commit();
    return r;
  });

  if (!record) return std::nullopt;
  return FromRecord(*record);
}

model::PaginatedMessages MessageStore::GetMessages(const std::string& process_id, const std::optional<std::string>& from,
                                                   const std::optional<std::string>& to, std::optional<int64_t> limit) {
  const int64_t page_size = limit.value_or(kDefaultPageSize);
  if (page_size <= 0) {
    throw util::IntError("page limit must be positive, got " + std::to_string(page_size));
  }
  // the query over-fetches by one row
  if (page_size == std::numeric_limits<int64_t>::max()) {
    throw util::IntError("page limit out of range, got " + std::to_string(page_size));
  }

  db::MessageQuery query;
  query.process_id   = process_id;
  query.from         = ParseCursor(from, "from");
  query.to           = ParseCursor(to, "to");
  query.limit        = page_size + 1;
  query.headers_only = BlobTierEnabled();

  auto records = Translated("get messages", [&] {
    auto tx   = repository_->Begin(ConnectionRole::Replica);
    auto rows = repository_->ListMessages(*tx, query);
    tx->Commit();
    return rows;
  });

  const bool has_next_page = static_cast<int64_t>(records.size()) > page_size;
  if (has_next_page) {
    records.resize(static_cast<size_t>(page_size));
  }

  std::vector<model::Message> messages;
  if (BlobTierEnabled()) {
    messages = ResolvePayloads(std::move(records));
  } else {
    messages.reserve(records.size());
    for (const auto& r : records) {
      messages.push_back(FromRecord(r));
    }
  }

  return model::PaginatedMessages::FromMessages(std::move(messages), has_next_page);
}

/*
  Fills header-only rows from the blob tier.

  One bulk read covers the page. Keys the tier does not have fall back to
  a full-row relational fetch, earliest timestamp for the exact
  (message_id, assignment_id) pair.
*/
std::vector<model::Message> MessageStore::ResolvePayloads(std::vector<db::model::MessageRecord> headers) {
  std::vector<storage::BlobKey> keys;
  keys.reserve(headers.size());
  for (const auto& h : headers) {
    keys.push_back(BlobKeyFor(h));
  }

  auto binaries = blob_store_->ReadBinaries(keys);

  std::vector<model::Message>          out;
  std::unique_ptr<db::Transaction>     fallback_tx;
  out.reserve(headers.size());

  for (size_t i = 0; i < headers.size(); ++i) {
    auto& header = headers[i];

    auto hit = binaries.find(keys[i]);
    if (hit != binaries.end()) {
      header.bundle = std::move(hit->second);
      model::Message m = FromRecord(header);
      m.document       = decoder_->Decode(header, m.bundle);
      out.push_back(std::move(m));
      continue;
    }

    auto full = Translated("get messages fallback", [&] {
      if (!fallback_tx) {
        fallback_tx = repository_->Begin(ConnectionRole::Replica);
      }
      return repository_->FindMessageExact(*fallback_tx, header.message_id, header.assignment_id);
    });
    if (!full) throw util::NotFound("Message not found");
    out.push_back(FromRecord(*full));
  }

  if (fallback_tx) {
    Translated("get messages fallback", [&] { fallback_tx->Commit(); });
  }
  return out;
}

int64_t MessageStore::MessageCount() {
  return Translated("count messages", [&] {
    auto tx    = repository_->Begin(ConnectionRole::Replica);
    auto count = repository_->CountMessages(*tx);
    tx->Commit();
    return count;
  });
}

std::vector<model::Message> MessageStore::GetMessagesByOffset(int64_t offset, std::optional<int64_t> count) {
  auto records = Translated("get messages by offset", [&] {
    auto tx   = repository_->Begin(ConnectionRole::Replica);
    auto rows = repository_->ListMessagesByOffset(*tx, offset, count);
    tx->Commit();
    return rows;
  });

  std::vector<model::Message> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(FromRecord(r));
  }
  return out;
}

std::optional<model::Message> MessageStore::GetMessageFromEnd(int64_t offset) {
  auto record = Translated("get message from end", [&] {
    auto tx = repository_->Begin(ConnectionRole::Replica);
    auto r  = repository_->GetMessageFromEnd(*tx, offset);
    tx->Commit();
    return r;
  });

  if (!record) return std::nullopt;
  return FromRecord(*record);
}

// ------------------------------------------------------------------
// Schedulers
// ------------------------------------------------------------------

void MessageStore::SaveScheduler(const model::Scheduler& scheduler) {
  Translated("save scheduler", [&] {
    auto tx = repository_->Begin(ConnectionRole::Primary);
    ThrowIfDbError(repository_->InsertScheduler(*tx, ToRecord(scheduler)), "save scheduler");
    tx->Commit();
  });
}

void MessageStore::UpdateScheduler(const model::Scheduler& scheduler) {
  if (!scheduler.row_id) {
    throw util::DatabaseError("Scheduler row_id is required for update");
  }

  Translated("update scheduler", [&] {
    auto tx     = repository_->Begin(ConnectionRole::Primary);
    auto result = repository_->UpdateScheduler(*tx, ToRecord(scheduler));
    if (!result && result.code == db::ErrorCode::NotFound) {
      throw util::NotFound("Scheduler not found");
    }
    ThrowIfDbError(result, "update scheduler");
    tx->Commit();
  });
}

model::Scheduler MessageStore::GetScheduler(int32_t row_id) {
  auto record = Translated("get scheduler", [&] {
    auto tx = repository_->Begin(ConnectionRole::Replica);
    auto r  = repository_->GetScheduler(*tx, row_id);
    tx->Commit();
    return r;
  });

  if (!record) throw util::NotFound("Scheduler not found");
  return FromRecord(*record);
}

model::Scheduler MessageStore::GetSchedulerByUrl(const std::string& url) {
  auto record = Translated("get scheduler by url", [&] {
    auto tx = repository_->Begin(ConnectionRole::Replica);
    auto r  = repository_->GetSchedulerByUrl(*tx, url);
    tx->Commit();
    return r;
  });

  if (!record) throw util::NotFound("Scheduler not found");
  return FromRecord(*record);
}

std::vector<model::Scheduler> MessageStore::GetAllSchedulers() {
  auto records = Translated("get schedulers", [&] {
    auto tx   = repository_->Begin(ConnectionRole::Replica);
    auto rows = repository_->ListSchedulers(*tx);
    tx->Commit();
    return rows;
  });

  std::vector<model::Scheduler> out;
  out.reserve(records.size());
  for (const auto& r : records) {
    out.push_back(FromRecord(r));
  }
  return out;
}

void MessageStore::SaveProcessScheduler(const model::ProcessScheduler& process_scheduler) {
  Translated("save process scheduler", [&] {
    auto tx = repository_->Begin(ConnectionRole::Primary);
    ThrowIfDbError(repository_->InsertProcessScheduler(*tx, ToRecord(process_scheduler)), "save process scheduler");
    tx->Commit();
  });
}

model::ProcessScheduler MessageStore::GetProcessScheduler(const std::string& process_id) {
  auto record = Translated("get process scheduler", [&] {
    auto tx = repository_->Begin(ConnectionRole::Replica);
    auto r  = repository_->GetProcessScheduler(*tx, process_id);
    tx->Commit();
    return r;
  });

  if (!record) throw util::NotFound("Process scheduler not found");
  return FromRecord(*record);
}

} // namespace schedstore::core
