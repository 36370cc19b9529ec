#include "internal/migration/migrate_command.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#ifdef SCHEDSTORE_DB_SQLITE
#include "internal/core/message_store.hpp"
#include "internal/factory.hpp"
#include "tests/support/store_fixture.hpp"
#endif

namespace {

using schedstore::migration::kExitFailure;
using schedstore::migration::kExitOk;
using schedstore::migration::kExitUsage;
using schedstore::migration::RunMigrateCommand;

constexpr const char* kManagedVars[] = {"DATABASE_URL", "DATABASE_READ_URL", "USE_DISK", "SU_DATA_DIR", "MIGRATION_BATCH_SIZE",
                                        "SCHEDSTORE_CONFIG"};

void ClearEnvironment() {
  for (const char* name : kManagedVars) {
    unsetenv(name);
  }
}

void TestBadArgumentsExitWithUsage() {
  ClearEnvironment();

  assert(RunMigrateCommand({}) == kExitUsage);
  assert(RunMigrateCommand({"0", "10"}) == kExitUsage);
  assert(RunMigrateCommand({"abc"}) == kExitUsage);
  assert(RunMigrateCommand({"5-"}) == kExitUsage);
  assert(RunMigrateCommand({"-3"}) == kExitUsage);
  assert(RunMigrateCommand({"10-4"}) == kExitUsage);
}

void TestConfigurationErrorsExitWithFailure() {
  // no database configured at all
  ClearEnvironment();
  assert(RunMigrateCommand({"0"}) == kExitFailure);

  // database present but the blob tier is off; fails before connecting
  ClearEnvironment();
  setenv("DATABASE_URL", "postgres://unused/su", 1);
  assert(RunMigrateCommand({"0-10"}) == kExitFailure);

  ClearEnvironment();
  setenv("DATABASE_URL", "postgres://unused/su", 1);
  setenv("USE_DISK", "maybe", 1);
  assert(RunMigrateCommand({"0"}) == kExitFailure);

  ClearEnvironment();
}

#ifdef SCHEDSTORE_DB_SQLITE
void TestRangeRunExitsOkAndFillsTier() {
  ClearEnvironment();

  const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  const auto root  = std::filesystem::temp_directory_path() / ("schedstore_migrate_cmd_" + std::to_string(stamp));
  std::filesystem::create_directories(root);

  schedstore::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path((root / "su.db").string());
  config.mutable_blob_store()->set_enabled(true);
  config.mutable_blob_store()->set_data_dir((root / "blobs").string());
  config.mutable_blob_store()->set_skip_startup_sync(true);

  {
    auto                          rt = schedstore::factory::Build(config);
    schedstore::core::MessageStore relational_only(rt.repository, nullptr);
    for (int64_t ts = 1; ts <= 7; ++ts) {
      const auto id = "m" + std::to_string(ts);
      relational_only.SaveMessage(schedstore::testing::MakeDataItem("p", id, ts), schedstore::testing::BundleFor(id));
    }
    assert(rt.blob_store->CountEntries() == 0);
  }

  const auto yaml_path = root / "schedstore.yaml";
  {
    std::ofstream out(yaml_path);
    out << "database:\n"
        << "  sqlite:\n"
        << "    path: " << (root / "su.db").string() << "\n"
        << "blob_store:\n"
        << "  enabled: true\n"
        << "  data_dir: " << (root / "blobs").string() << "\n"
        << "migration:\n"
        << "  batch_size: 3\n"
        << "  progress_interval_sec: 1\n";
  }
  setenv("SCHEDSTORE_CONFIG", yaml_path.string().c_str(), 1);

  assert(RunMigrateCommand({"2-5"}) == kExitOk);
  {
    auto rt = schedstore::factory::Build(config);
    assert(rt.blob_store->CountEntries() == 3);
  }

  assert(RunMigrateCommand({"0"}) == kExitOk);
  {
    auto rt = schedstore::factory::Build(config);
    assert(rt.blob_store->CountEntries() == 7);
  }

  ClearEnvironment();
  std::error_code ec;
  std::filesystem::remove_all(root, ec);
}
#endif

} // namespace

int main() {
  TestBadArgumentsExitWithUsage();
  TestConfigurationErrorsExitWithFailure();
#ifdef SCHEDSTORE_DB_SQLITE
  TestRangeRunExitsOkAndFillsTier();
#endif

  std::cout << "schedstore_unit_migrate_command: pass\n";
  return 0;
}
