#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace offline::config {

using offline::runtime::config::RuntimeConfig;

namespace {

constexpr double   kDefaultMaxCacheSizeMb       = 50.0;
constexpr double   kDefaultEvictionTargetRatio  = 0.8;
constexpr double   kDefaultHighTtlHours         = 24.0;
constexpr double   kDefaultMediumTtlHours       = 12.0;
constexpr double   kDefaultLowTtlHours          = 6.0;
constexpr uint32_t kDefaultMaxRetries           = 3;
constexpr uint64_t kDefaultRetryDelayMs         = 100;
constexpr uint64_t kDefaultDrainIntervalMs      = 5000;
constexpr uint64_t kDefaultSyncIntervalMs       = 5000;
constexpr uint32_t kDefaultBatchSize            = 10;
constexpr uint64_t kDefaultHousekeepingInterval = 60ull * 60ull * 1000ull;
constexpr uint64_t kDefaultRemoteTimeoutMs      = 10000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar = node.Scalar();

  // quoted scalars stay strings
  if (node.Tag() == "!" || scalar.empty()) {
    value->set_string_value(scalar);
    return;
  }

  if (scalar == "true" || scalar == "false") {
    value->set_bool_value(scalar == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(scalar.c_str(), &end);
  if (end && *end == '\0') {
    value->set_number_value(number);
    return;
  }

  value->set_string_value(scalar);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& it : node) {
        YamlToProtoValue(it.second, &(*fields)[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value root;
  if (yaml.IsNull() || !yaml.IsDefined()) {
    root.mutable_struct_value();
  } else if (yaml.IsMap()) {
    YamlToProtoValue(yaml, &root);
  } else {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.storage().backend_case() == offline::runtime::config::StorageConfig::BACKEND_NOT_SET) {
    config.mutable_storage()->mutable_memory();
  }

  auto* cache = config.mutable_cache();
  if (cache->max_cache_size_mb() == 0) cache->set_max_cache_size_mb(kDefaultMaxCacheSizeMb);
  if (cache->eviction_target_ratio() == 0) cache->set_eviction_target_ratio(kDefaultEvictionTargetRatio);

  auto* ttl = cache->mutable_priority_ttl_hours();
  if (ttl->high() == 0) ttl->set_high(kDefaultHighTtlHours);
  if (ttl->medium() == 0) ttl->set_medium(kDefaultMediumTtlHours);
  if (ttl->low() == 0) ttl->set_low(kDefaultLowTtlHours);

  auto* queue = config.mutable_queue();
  if (queue->max_retries() == 0) queue->set_max_retries(kDefaultMaxRetries);
  if (queue->retry_delay_ms() == 0) queue->set_retry_delay_ms(kDefaultRetryDelayMs);
  if (queue->drain_interval_ms() == 0) queue->set_drain_interval_ms(kDefaultDrainIntervalMs);

  auto* sync = config.mutable_sync();
  if (sync->interval_ms() == 0) sync->set_interval_ms(kDefaultSyncIntervalMs);
  if (sync->batch_size() == 0) sync->set_batch_size(kDefaultBatchSize);
  if (sync->housekeeping_interval_ms() == 0) sync->set_housekeeping_interval_ms(kDefaultHousekeepingInterval);
  if (sync->remote().timeout_ms() == 0) sync->mutable_remote()->set_timeout_ms(kDefaultRemoteTimeoutMs);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.storage().has_sqlite() && config.storage().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: storage.sqlite.path is required");
  }

  const auto& cache = config.cache();
  if (cache.max_cache_size_mb() < 0) {
    throw std::runtime_error("Invalid configuration: cache.max_cache_size_mb must be positive");
  }
  if (cache.eviction_target_ratio() < 0 || cache.eviction_target_ratio() > 1) {
    throw std::runtime_error("Invalid configuration: cache.eviction_target_ratio must be within (0, 1]");
  }

  const auto& ttl = cache.priority_ttl_hours();
  if (ttl.high() < 0 || ttl.medium() < 0 || ttl.low() < 0) {
    throw std::runtime_error("Invalid configuration: cache.priority_ttl_hours must not be negative");
  }
}

} // namespace offline::config
