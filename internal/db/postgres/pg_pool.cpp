#include "pg_pool.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schedstore::db::postgres {

namespace {

constexpr const char* kMessageColumns =
    "id,process_id,message_id,assignment_id,message_data::text,epoch,nonce,timestamp,bundle,hash_chain";

std::string SelectMessages(const std::string& tail) {
  return std::string("SELECT ") + kMessageColumns + " FROM messages " + tail;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections, std::chrono::milliseconds acquire_timeout)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      acquire_timeout_(acquire_timeout) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  const auto deadline = std::chrono::steady_clock::now() + acquire_timeout_;

  std::unique_lock lock(mutex_);
  for (;;) {
    if (!idle_.empty()) {
      auto conn = std::move(idle_.back());
      idle_.pop_back();
      lock.unlock();

      if (IsAlive(*conn)) {
        return Wrap(conn.release());
      }

      SCHEDSTORE_LOG_WARN("dropping dead pooled connection");
      Discard(std::move(conn));
      lock.lock();
      continue;
    }

    if (live_connections_ < max_connections_) {
      ++live_connections_;
      lock.unlock();
      return Open();
    }

    const bool ready = cv_.wait_until(lock, deadline, [this] {
      return !idle_.empty() || live_connections_ < max_connections_;
    });
    if (!ready) {
      throw util::DatabaseError("Failed to get connection from pool.");
    }
  }
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_connections_;
}

std::shared_ptr<pqxx::connection> PgPool::Open() {
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Wrap(conn.release());
  } catch (const std::exception& e) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    SCHEDSTORE_LOG_ERROR("postgres connect failed", {observability::StringField("error", e.what())});
    throw util::DatabaseError("Failed to get connection from pool.");
  }
}

bool PgPool::IsAlive(pqxx::connection& conn) {
  if (!conn.is_open()) {
    return false;
  }
  try {
    pqxx::nontransaction probe(conn);
    probe.exec("SELECT 1");
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("insert_process",
               "INSERT INTO processes(process_id,process_data,bundle) VALUES($1,$2::jsonb,$3) "
               "ON CONFLICT(process_id) DO NOTHING");

  conn.prepare("get_process", "SELECT id,process_id,process_data::text,bundle FROM processes WHERE process_id=$1 LIMIT 1");

  conn.prepare("insert_message",
               "INSERT INTO messages(process_id,message_id,assignment_id,message_data,epoch,nonce,timestamp,bundle,hash_chain) "
               "VALUES($1,$2,$3,$4::jsonb,$5,$6,$7,$8,$9) RETURNING id");

  conn.prepare("find_message", SelectMessages("WHERE message_id=$1 OR assignment_id=$1 ORDER BY timestamp ASC, id ASC LIMIT 1"));

  conn.prepare("find_message_exact", SelectMessages("WHERE message_id=$1 AND assignment_id=$2 ORDER BY timestamp ASC, id ASC LIMIT 1"));

  conn.prepare("find_message_by_message_id", SelectMessages("WHERE message_id=$1 ORDER BY timestamp ASC, id ASC LIMIT 1"));

  conn.prepare("latest_message", SelectMessages("WHERE process_id=$1 ORDER BY id DESC LIMIT 1"));

  conn.prepare("count_messages", "SELECT COUNT(*) FROM messages");

  // LIMIT NULL means no limit
  conn.prepare("messages_by_offset", SelectMessages("ORDER BY timestamp ASC, id ASC OFFSET $1 LIMIT $2"));

  conn.prepare("message_from_end", SelectMessages("ORDER BY timestamp DESC, id DESC OFFSET $1 LIMIT 1"));

  conn.prepare("insert_scheduler", "INSERT INTO schedulers(url,process_count) VALUES($1,$2) ON CONFLICT(url) DO NOTHING");

  conn.prepare("update_scheduler", "UPDATE schedulers SET process_count=$2,url=$3 WHERE id=$1");

  conn.prepare("get_scheduler", "SELECT id,url,process_count FROM schedulers WHERE id=$1 LIMIT 1");

  conn.prepare("get_scheduler_by_url", "SELECT id,url,process_count FROM schedulers WHERE url=$1 LIMIT 1");

  conn.prepare("list_schedulers", "SELECT id,url,process_count FROM schedulers ORDER BY id ASC");

  conn.prepare("insert_process_scheduler",
               "INSERT INTO process_schedulers(process_id,scheduler_id) VALUES($1,$2) ON CONFLICT(process_id) DO NOTHING");

  conn.prepare("get_process_scheduler", "SELECT id,process_id,scheduler_id FROM process_schedulers WHERE process_id=$1 LIMIT 1");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  if (!conn->is_open()) {
    Discard(std::unique_ptr<pqxx::connection>(conn));
    return;
  }
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

void PgPool::Discard(std::unique_ptr<pqxx::connection> conn) {
  conn.reset();
  {
    std::lock_guard lock(mutex_);
    --live_connections_;
  }
  cv_.notify_one();
}

} // namespace schedstore::db::postgres
