#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace tasktree::config {

namespace {

using tasktree::runtime::config::RuntimeConfig;

constexpr const char* kDefaultBindAddress    = "0.0.0.0:50061";
constexpr const char* kDefaultCollectionName = "roo_tasks_semantic_index";
constexpr uint64_t    kDefaultStalenessMs    = 5 * 60 * 1000;
constexpr uint32_t    kDefaultMaxEntryChars  = 8000;
constexpr uint32_t    kDefaultPrefixLength   = 192;
constexpr uint32_t    kDefaultDimensions     = 1536;
constexpr uint32_t    kDefaultMaxChunkChars  = 800;
constexpr uint64_t    kDefaultUpsertInterval = 100;
constexpr uint32_t    kDefaultMaxRetries     = 3;
constexpr uint64_t    kDefaultBackoffMs      = 2000;
constexpr uint32_t    kDefaultFailureLimit   = 3;
constexpr uint64_t    kDefaultOpenTimeoutMs  = 30000;
constexpr uint64_t    kDefaultEmbeddingTtlMs = 7ULL * 24 * 60 * 60 * 1000;
constexpr uint64_t    kDefaultCacheEntries   = 50000;
constexpr uint64_t    kDefaultHealthPollMs   = 60000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  // Quoted scalars stay strings ("0.0.0.0:50061", "123").
  if (node.Tag() == "!") {
    value->set_string_value(node.Scalar());
    return;
  }

  const std::string& scalar_value = node.Scalar();
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
      throw std::runtime_error("Unsupported YAML node");
  }
}

template <typename T, typename Getter, typename Setter>
void DefaultIfZero(Getter get, Setter set, T fallback) {
  if (get() == 0) {
    set(fallback);
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (!yaml.IsNull()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);
    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  }

  ApplyDefaults(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  if (!config.records().has_sqlite() && !config.records().has_memory()) {
    config.mutable_records()->mutable_memory();
  }

  auto* cache = config.mutable_skeleton_cache();
  DefaultIfZero([&] { return cache->staleness_window_ms(); }, [&](uint64_t v) { cache->set_staleness_window_ms(v); }, kDefaultStalenessMs);
  DefaultIfZero([&] { return cache->max_entry_chars(); }, [&](uint32_t v) { cache->set_max_entry_chars(v); }, kDefaultMaxEntryChars);

  auto* resolver = config.mutable_resolver();
  DefaultIfZero([&] { return resolver->prefix_length(); }, [&](uint32_t v) { resolver->set_prefix_length(v); }, kDefaultPrefixLength);

  auto* indexing = config.mutable_indexing();
  if (indexing->collection_name().empty()) {
    indexing->set_collection_name(kDefaultCollectionName);
  }
  DefaultIfZero([&] { return indexing->vector_dimensions(); }, [&](uint32_t v) { indexing->set_vector_dimensions(v); }, kDefaultDimensions);
  DefaultIfZero([&] { return indexing->max_chunk_chars(); }, [&](uint32_t v) { indexing->set_max_chunk_chars(v); }, kDefaultMaxChunkChars);
  DefaultIfZero([&] { return indexing->upsert_interval_ms(); }, [&](uint64_t v) { indexing->set_upsert_interval_ms(v); }, kDefaultUpsertInterval);

  auto* retry = indexing->mutable_retry();
  DefaultIfZero([&] { return retry->max_retries(); }, [&](uint32_t v) { retry->set_max_retries(v); }, kDefaultMaxRetries);
  DefaultIfZero([&] { return retry->initial_backoff_ms(); }, [&](uint64_t v) { retry->set_initial_backoff_ms(v); }, kDefaultBackoffMs);

  auto* breaker = indexing->mutable_circuit_breaker();
  DefaultIfZero([&] { return breaker->failure_threshold(); }, [&](uint32_t v) { breaker->set_failure_threshold(v); }, kDefaultFailureLimit);
  DefaultIfZero([&] { return breaker->open_timeout_ms(); }, [&](uint64_t v) { breaker->set_open_timeout_ms(v); }, kDefaultOpenTimeoutMs);

  auto* embedding_cache = indexing->mutable_embedding_cache();
  DefaultIfZero([&] { return embedding_cache->ttl_ms(); }, [&](uint64_t v) { embedding_cache->set_ttl_ms(v); }, kDefaultEmbeddingTtlMs);
  DefaultIfZero([&] { return embedding_cache->max_entries(); }, [&](uint64_t v) { embedding_cache->set_max_entries(v); }, kDefaultCacheEntries);

  auto* hashing = config.mutable_embedding()->mutable_hashing();
  DefaultIfZero([&] { return hashing->dimensions(); }, [&](uint32_t v) { hashing->set_dimensions(v); }, indexing->vector_dimensions());

  auto* health = config.mutable_health();
  DefaultIfZero([&] { return health->poll_interval_ms(); }, [&](uint64_t v) { health->set_poll_interval_ms(v); }, kDefaultHealthPollMs);
}

} // namespace tasktree::config
