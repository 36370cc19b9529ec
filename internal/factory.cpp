#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/migration/backfill_migrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/rocks/rocks_blob_store.hpp"
#include "internal/util/errors.hpp"
#if SCHEDSTORE_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if SCHEDSTORE_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace schedstore::factory {

using schedstore::runtime::config::RuntimeConfig;

namespace {

#if SCHEDSTORE_DB_SQLITE
class SqliteMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit SqliteMigrationExecutor(std::shared_ptr<db::sqlite::SqliteDB> sqlite_db) : sqlite_db_(std::move(sqlite_db)) {
  }

  void ExecuteSQL(const std::string& sql) override {
    sqlite_db_->Exec(sql);
  }

 private:
  std::shared_ptr<db::sqlite::SqliteDB> sqlite_db_;
};

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  SqliteMigrationExecutor executor(sqlite_db);
  db::sql::RunMigrations(executor, db::sql::SqliteSchema());
}
#endif

#if SCHEDSTORE_DB_POSTGRES
// Runs on a dedicated connection: pooled connections prepare statements
// against tables that may not exist yet.
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::connection& conn) : conn_(conn) {
  }

  void ExecuteSQL(const std::string& sql) override {
    pqxx::work tx(conn_);
    tx.exec(sql);
    tx.commit();
  }

 private:
  pqxx::connection& conn_;
};

void BootstrapPostgresSchema(const std::string& url) {
  pqxx::connection    conn(url);
  PgMigrationExecutor executor(conn);
  db::sql::RunMigrations(executor, db::sql::PostgresSchema());
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SCHEDSTORE_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    SCHEDSTORE_LOG_INFO("sqlite backend ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::DatabaseError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if SCHEDSTORE_DB_POSTGRES
    const auto& pg       = database.postgres();
    const auto  read_url = pg.read_url().empty() ? pg.url() : pg.read_url();
    const auto  timeout  = std::chrono::milliseconds(pg.acquire_timeout_ms());

    BootstrapPostgresSchema(pg.url());

    auto primary = std::make_shared<db::postgres::PgPool>(pg.url(), pg.max_connections(), timeout);
    auto replica = std::make_shared<db::postgres::PgPool>(read_url, pg.max_connections(), timeout);
    SCHEDSTORE_LOG_INFO("postgres backend ready", {observability::IntField("max_connections", pg.max_connections()),
                                                  observability::BoolField("separate_replica", read_url != pg.url())});
    return std::make_shared<db::postgres::PgRepository>(std::move(primary), std::move(replica));
#else
    throw util::DatabaseError("postgres backend requested but not enabled at build time");
#endif
  }

  throw util::EnvVarError("DATABASE_URL not present");
}

storage::BlobStorePtr BuildBlobStore(const RuntimeConfig& config) {
  const auto& blob = config.blob_store();
  if (!blob.enabled()) {
    return nullptr;
  }
  if (blob.data_dir().empty()) {
    throw util::EnvVarError("SU_DATA_DIR not present");
  }

  storage::RocksBlobOptions options;
  options.data_dir = blob.data_dir();
  if (blob.min_blob_size() != 0) options.min_blob_size = blob.min_blob_size();
  if (blob.blob_file_size() != 0) options.blob_file_size = blob.blob_file_size();
  return std::make_shared<storage::RocksBlobStore>(options);
}

} // namespace

/*
    Build full store dependency graph
*/
StoreRuntime Build(const RuntimeConfig& config) {
  StoreRuntime rt;

  // ------------------------------------------------------------------
  // Tiers
  // ------------------------------------------------------------------
  try {
    rt.repository = BuildRepository(config);
  } catch (const util::StoreError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::DatabaseError(std::string("database bootstrap failed: ") + e.what());
  }
  rt.blob_store = BuildBlobStore(config);

  // ------------------------------------------------------------------
  // Orchestrator
  // ------------------------------------------------------------------
  rt.store = std::make_shared<core::MessageStore>(rt.repository, rt.blob_store);

  // ------------------------------------------------------------------
  // Startup catch-up
  // ------------------------------------------------------------------
  if (rt.blob_store && !config.blob_store().skip_startup_sync()) {
    migration::BackfillMigrator migrator(rt.store, rt.blob_store);
    migrator.SyncTail();
  }

  return rt;
}

} // namespace schedstore::factory
