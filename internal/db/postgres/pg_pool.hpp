#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace schedstore::db::postgres {

/*
  PgPool

  Bounded connection pool used by PgRepository. One pool per endpoint:
  the repository holds a primary (write) pool and a replica (read) pool.

  Design notes:
  -------------
  - Each transaction gets its own connection.
  - libpqxx connections are NOT thread-safe -> do not share.
  - Prepared statements are installed per connection.
  - Idle connections are validated on checkout (SELECT 1); a dead one
    is dropped and replaced.
  - Acquire() waits at most acquire_timeout for a free slot.
  - Failures surface as util::DatabaseError, never as pqxx errors.

  Lifetime:
    Repository owns shared_ptr<PgPool>
    Transaction acquires shared_ptr<pqxx::connection>; the deleter
    returns it to the pool
*/

class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  PgPool(std::string conninfo, std::size_t max_connections = 10,
         std::chrono::milliseconds acquire_timeout = std::chrono::seconds(30));

  // Acquire a validated, ready-to-use connection
  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections() const;

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  static bool                       IsAlive(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Open();
  std::shared_ptr<pqxx::connection> Wrap(pqxx::connection* conn);
  void                              Release(pqxx::connection* conn);
  void                              Discard(std::unique_ptr<pqxx::connection> conn);

  std::string               conninfo_;
  std::size_t               max_connections_;
  std::chrono::milliseconds acquire_timeout_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        cv_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_connections_ = 0;
};

} // namespace schedstore::db::postgres
