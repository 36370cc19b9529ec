#pragma once

#include <string>

#include "config/config.pb.h"

namespace schedstore::config {

/*
  Loads RuntimeConfig.

  YAML is converted to JSON then parsed into protobuf. Deployment
  environment variables are applied on top:

    DATABASE_URL          primary postgres endpoint
    DATABASE_READ_URL     read replica (defaults to the primary)
    USE_DISK              true|false, enables the blob tier
    SU_DATA_DIR           blob tier data directory
    MIGRATION_BATCH_SIZE  rows per backfill batch
*/
class ConfigLoader {
 public:
  static schedstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // YAML file from SCHEDSTORE_CONFIG when set, then environment, then defaults.
  static schedstore::runtime::config::RuntimeConfig Load();

  static void ApplyEnvironment(schedstore::runtime::config::RuntimeConfig& config);
  static void ApplyDefaults(schedstore::runtime::config::RuntimeConfig& config);
};

} // namespace schedstore::config
