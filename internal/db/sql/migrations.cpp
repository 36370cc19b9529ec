#include "internal/db/sql/migrations.hpp"

#include "internal/observability/logging.hpp"

namespace schedstore::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& statement : ordered_sql) {
    executor.ExecuteSQL(statement);
  }
  SCHEDSTORE_LOG_INFO("schema migrations applied", {observability::IntField("statements", static_cast<int64_t>(ordered_sql.size()))});
}

} // namespace schedstore::db::sql
