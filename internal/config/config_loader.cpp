#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <optional>
#include <stdexcept>

#include "internal/util/errors.hpp"
#include "internal/util/parse.hpp"

namespace schedstore::config {

using schedstore::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultMaxConnections   = 10;
constexpr uint32_t kDefaultAcquireTimeoutMs = 30'000;
constexpr uint64_t kDefaultMinBlobSize      = 1024;                      // low value so nearly everything is a blob
constexpr uint64_t kDefaultBlobFileSize     = 5ULL * 1024 * 1024 * 1024; // 5GB
constexpr uint32_t kDefaultBatchSize        = 1000;
constexpr uint32_t kDefaultProgressInterval = 10;

std::optional<std::string> Env(const char* name) {
  if (const char* value = std::getenv(name)) {
    return std::string(value);
  }
  return std::nullopt;
}

bool ParseBool(const std::string& name, const std::string& value) {
  if (value == "true" || value == "1") return true;
  if (value == "false" || value == "0") return false;
  throw util::EnvVarError(name + " must be true or false, got '" + value + "'");
}

} // namespace

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw util::JsonError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::JsonError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw util::JsonError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw util::JsonError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig ConfigLoader::Load() {
  RuntimeConfig config;
  if (auto path = Env("SCHEDSTORE_CONFIG")) {
    config = LoadFromYaml(*path);
  }

  ApplyEnvironment(config);

  if (config.database().backend_case() == schedstore::runtime::config::DatabaseConfig::BACKEND_NOT_SET) {
    throw util::EnvVarError("DATABASE_URL not present");
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyEnvironment(RuntimeConfig& config) {
  if (auto url = Env("DATABASE_URL")) {
    config.mutable_database()->mutable_postgres()->set_url(*url);
  }

  if (auto read_url = Env("DATABASE_READ_URL")) {
    if (!config.database().has_postgres()) {
      throw util::EnvVarError("DATABASE_READ_URL requires a postgres database");
    }
    config.mutable_database()->mutable_postgres()->set_read_url(*read_url);
  }

  if (auto use_disk = Env("USE_DISK")) {
    config.mutable_blob_store()->set_enabled(ParseBool("USE_DISK", *use_disk));
  }

  if (auto data_dir = Env("SU_DATA_DIR")) {
    config.mutable_blob_store()->set_data_dir(*data_dir);
  }

  if (auto batch_size = Env("MIGRATION_BATCH_SIZE")) {
    const auto parsed = util::ParseUint64(*batch_size, "MIGRATION_BATCH_SIZE");
    if (parsed == 0 || parsed > UINT32_MAX) {
      throw util::IntError("MIGRATION_BATCH_SIZE out of range: '" + *batch_size + "'");
    }
    config.mutable_migration()->set_batch_size(static_cast<uint32_t>(parsed));
  }
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.database().has_postgres()) {
    auto* pg = config.mutable_database()->mutable_postgres();
    if (pg->read_url().empty()) pg->set_read_url(pg->url());
    if (pg->max_connections() == 0) pg->set_max_connections(kDefaultMaxConnections);
    if (pg->acquire_timeout_ms() == 0) pg->set_acquire_timeout_ms(kDefaultAcquireTimeoutMs);
  }

  auto* blob = config.mutable_blob_store();
  if (blob->min_blob_size() == 0) blob->set_min_blob_size(kDefaultMinBlobSize);
  if (blob->blob_file_size() == 0) blob->set_blob_file_size(kDefaultBlobFileSize);
  if (blob->enabled() && blob->data_dir().empty()) {
    throw util::EnvVarError("SU_DATA_DIR not present");
  }

  auto* migration = config.mutable_migration();
  if (migration->batch_size() == 0) migration->set_batch_size(kDefaultBatchSize);
  if (migration->progress_interval_sec() == 0) migration->set_progress_interval_sec(kDefaultProgressInterval);
}

} // namespace schedstore::config
