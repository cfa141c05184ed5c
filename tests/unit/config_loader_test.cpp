#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using pipeline::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "pipeline_store_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool ThrowsContaining(const std::string& yaml, const std::string& fragment) {
  try {
    ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error& e) {
    return std::string(e.what()).find(fragment) != std::string::npos;
  }
  return false;
}

void TestEmptyDocumentGetsDefaults() {
  auto config = ConfigLoader::LoadFromYamlString("");
  assert(config.workspace_id() == "ws_default");
  assert(config.store().has_memory());
  assert(!config.store().memory().durable());
  assert(config.persistence().conflict_retries() == 5);
  assert(config.persistence().conflict_backoff_ms() == 30);
}

void TestSqliteBackendFromFile() {
  const auto yaml_path = WriteYaml("sqlite",
                                   R"(workspace_id: "ws_studio"
store:
  sqlite:
    path: "C:\\pipeline\\\"quoted\"\\state.db"
persistence:
  conflict_retries: 8
logging:
  level: debug
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.workspace_id() == "ws_studio");
  assert(config.store().has_sqlite());
  assert(config.store().sqlite().path() == "C:\\pipeline\\\"quoted\"\\state.db");
  assert(config.persistence().conflict_retries() == 8);
  assert(config.persistence().conflict_backoff_ms() == 30);
  assert(config.logging().level() == "debug");
}

void TestBareMemoryKeySelectsMemory() {
  auto config = ConfigLoader::LoadFromYamlString(R"(store:
  memory:
)");
  assert(config.store().has_memory());

  auto durable = ConfigLoader::LoadFromYamlString(R"(store:
  memory:
    durable: true
)");
  assert(durable.store().memory().durable());
}

void TestPostgresSettings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(store:
  postgres:
    connection_uri: "postgresql://pipeline@localhost/pipeline"
    max_connections: 4
)");
  assert(config.store().has_postgres());
  assert(config.store().postgres().max_connections() == 4);
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(workspace_id: "12345"
)");
  assert(config.workspace_id() == "12345");
}

void TestInvalidDocumentsAreRejected() {
  assert(ThrowsContaining("store:\n  sqlite:\n    path: \"\"\n", "store.sqlite.path is required"));
  assert(ThrowsContaining("store:\n  postgres: {}\n", "store.postgres.connection_uri is required"));
  assert(ThrowsContaining("unknown_section: 1\n", "Invalid configuration"));
  assert(ThrowsContaining("- a\n- b\n", "top level must be a mapping"));

  bool threw = false;
  try {
    ConfigLoader::LoadFromYaml("/nonexistent/pipeline.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

} // namespace

int main() {
  TestEmptyDocumentGetsDefaults();
  TestSqliteBackendFromFile();
  TestBareMemoryKeySelectsMemory();
  TestPostgresSettings();
  TestQuotedNumbersStayStrings();
  TestInvalidDocumentsAreRejected();

  std::cout << "config_loader_test: pass\n";
  return 0;
}
