#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using tasktree::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "tasktree_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestDefaultsFillEmptyConfig() {
  const auto yaml_path = WriteYaml("defaults",
                                   R"(server:
  bind_address: "127.0.0.1:6000"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.records().has_memory());
  assert(config.skeleton_cache().staleness_window_ms() == 300000);
  assert(config.skeleton_cache().max_entry_chars() == 8000);
  assert(config.resolver().prefix_length() == 192);
  assert(!config.resolver().strict_mode());
  assert(config.indexing().collection_name() == "roo_tasks_semantic_index");
  assert(config.indexing().vector_dimensions() == 1536);
  assert(config.indexing().max_chunk_chars() == 800);
  assert(config.indexing().upsert_interval_ms() == 100);
  assert(config.indexing().retry().max_retries() == 3);
  assert(config.indexing().retry().initial_backoff_ms() == 2000);
  assert(config.indexing().circuit_breaker().failure_threshold() == 3);
  assert(config.indexing().circuit_breaker().open_timeout_ms() == 30000);
  assert(config.indexing().embedding_cache().ttl_ms() == 7ULL * 24 * 60 * 60 * 1000);
  assert(config.indexing().embedding_cache().max_entries() == 50000);
  assert(config.embedding().hashing().dimensions() == 1536);
  assert(!config.health().enabled());
  assert(config.health().poll_interval_ms() == 60000);
}

void TestEmptyBindAddressGetsDefault() {
  tasktree::runtime::config::RuntimeConfig config;
  ConfigLoader::ApplyDefaults(config);
  assert(config.server().bind_address() == "0.0.0.0:50061");
}

void TestExplicitValuesAreKept() {
  const auto yaml_path = WriteYaml("explicit",
                                   R"(records:
  sqlite:
    path: "/var/lib/tasktree/tasks.db"
resolver:
  prefix_length: 128
  strict_mode: true
indexing:
  collection_name: "tasks_dev"
  vector_dimensions: 64
  retry:
    max_retries: 5
health:
  enabled: true
  poll_interval_ms: 1000
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.records().has_sqlite());
  assert(config.records().sqlite().path() == "/var/lib/tasktree/tasks.db");
  assert(config.resolver().prefix_length() == 128);
  assert(config.resolver().strict_mode());
  assert(config.indexing().collection_name() == "tasks_dev");
  assert(config.indexing().vector_dimensions() == 64);
  assert(config.indexing().retry().max_retries() == 5);
  assert(config.indexing().retry().initial_backoff_ms() == 2000);
  // Embedder follows the collection when not given.
  assert(config.embedding().hashing().dimensions() == 64);
  assert(config.health().enabled());
  assert(config.health().poll_interval_ms() == 1000);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(records:
  sqlite:
    path: "C:\\tasks\\\"quoted\"\\db.sqlite"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.records().sqlite().path() == "C:\\tasks\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  const auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50061"
resolver:
  prefix_length: 192
  fuzzy_matching: true
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

} // namespace

int main() {
  TestDefaultsFillEmptyConfig();
  TestEmptyBindAddressGetsDefault();
  TestExplicitValuesAreKept();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestUnknownFieldsAreRejected();

  std::cout << "tasktree_unit_config_loader: pass\n";
  return 0;
}
