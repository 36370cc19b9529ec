#include "migrate_command.hpp"

#include <chrono>
#include <iostream>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/migration/backfill_migrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace schedstore::migration {

namespace {

constexpr const char* kUsage = "Usage: schedstore-migrate <from>[-<to>]";

} // namespace

int RunMigrateCommand(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    std::cerr << kUsage << std::endl;
    return kExitUsage;
  }

  OffsetRange range;
  try {
    range = ParseOffsetRange(args[0]);
  } catch (const util::IntError& e) {
    std::cerr << e.what() << std::endl;
    std::cerr << kUsage << std::endl;
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config::ConfigLoader::Load();
    observability::InitializeLogging(config.logging());

    if (!config.blob_store().enabled()) {
      throw util::EnvVarError("USE_DISK must be enabled to migrate");
    }

    // the range run replaces the startup tail-sync
    config.mutable_blob_store()->set_skip_startup_sync(true);

    // ------------------------------------------------------------
    // Build store and run
    // ------------------------------------------------------------
    auto rt = factory::Build(config);

    MigratorOptions options;
    options.batch_size        = config.migration().batch_size();
    options.progress_interval = std::chrono::seconds(config.migration().progress_interval_sec());

    BackfillMigrator migrator(rt.store, rt.blob_store, options);
    auto             report = migrator.MigrateRange(range);

    SCHEDSTORE_LOG_INFO("Migration finished", {observability::IntField("processed", report.processed),
                                               observability::IntField("elapsed_ms", report.elapsed.count())});
  } catch (const std::exception& e) {
    SCHEDSTORE_LOG_ERROR("Fatal error", {observability::StringField("error", e.what())});
    return kExitFailure;
  }

  return kExitOk;
}

} // namespace schedstore::migration
