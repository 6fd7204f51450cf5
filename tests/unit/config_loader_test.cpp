#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "workflow_manager_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool Rejects(const std::string& yaml) {
  try {
    (void)workflow::config::ConfigLoader::LoadFromString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigFromFile() {
  const auto yaml_path = WriteYaml("full",
                                   R"(database:
  sqlite:
    path: "C:\\workflow\\\"quoted\"\\db.sqlite"
    busy_timeout_ms: 2500
logging:
  level: debug
  format: LOG_FORMAT_JSON
observability:
  metrics_enabled: false
  transport: OTLP_TRANSPORT_HTTP
retry:
  max_retries: 5
  base_delay_seconds: 60
leases:
  timeout_seconds: 120
quota:
  recency_window_seconds: 3600
  seed_defaults: true
  default_limits:
    - service_name: openai
      quota_type: requests_per_minute
      limit_value: 500
      window_seconds: 60
)");

  auto config = workflow::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().has_sqlite());
  assert(config.database().sqlite().path() == "C:\\workflow\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().busy_timeout_ms() == 2500);
  assert(config.logging().level() == "debug");
  assert(config.logging().format() == workflow::runtime::config::LOG_FORMAT_JSON);
  assert(config.observability().transport() == workflow::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.retry().max_retries() == 5);
  assert(config.retry().base_delay_seconds() == 60);
  assert(config.leases().timeout_seconds() == 120);
  assert(config.quota().recency_window_seconds() == 3600);
  assert(config.quota().seed_defaults());
  assert(config.quota().default_limits_size() == 1);
  assert(config.quota().default_limits(0).limit_value() == 500);
}

void TestQuotedNumbersStayStrings() {
  auto config = workflow::config::ConfigLoader::LoadFromString(R"(database:
  postgres:
    connection_uri: "12345"
    max_connections: 4
)");
  assert(config.database().has_postgres());
  assert(config.database().postgres().connection_uri() == "12345");
  assert(config.database().postgres().max_connections() == 4);
}

void TestEmptyDocumentSelectsDefaults() {
  auto config = workflow::config::ConfigLoader::LoadFromString("");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.retry().max_retries() == 0);
}

void TestUnknownFieldsAreRejected() {
  assert(Rejects("unknown_field: 123\n") && "ConfigLoader must reject unknown fields.");
  assert(Rejects("retry:\n  max_retries: 3\n  jitter: true\n"));
}

void TestInvalidSettingsAreRejected() {
  assert(Rejects("database:\n  sqlite:\n    busy_timeout_ms: 10\n"));
  assert(Rejects("database:\n  postgres:\n    max_connections: 2\n"));
  assert(Rejects(R"(quota:
  default_limits:
    - service_name: gemini
      quota_type: tokens_per_minute
      limit_value: 0
      window_seconds: 60
)"));
  assert(Rejects(R"(quota:
  default_limits:
    - service_name: gemini
      quota_type: tokens_per_minute
      limit_value: 10
      window_seconds: 60
    - service_name: gemini
      quota_type: tokens_per_minute
      limit_value: 20
      window_seconds: 60
)"));
  assert(Rejects("- just\n- a list\n"));
}

void TestDatabaseUrlSelectsBackend() {
  using workflow::config::ConfigLoader;

  auto config = ConfigLoader::LoadFromString("database:\n  postgres:\n    connection_uri: \"postgres://old\"\n    max_connections: 8\n");
  ConfigLoader::ApplyDatabaseUrl(config, "postgresql://worker@db:5432/workflows");
  assert(config.database().postgres().connection_uri() == "postgresql://worker@db:5432/workflows");
  assert(config.database().postgres().max_connections() == 8);

  ConfigLoader::ApplyDatabaseUrl(config, "sqlite:///tmp/workflow.db");
  assert(config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.database().sqlite().path() == "/tmp/workflow.db");

  ConfigLoader::ApplyDatabaseUrl(config, "memory://");
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());

  bool threw = false;
  try {
    ConfigLoader::ApplyDatabaseUrl(config, "mysql://db/workflows");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)workflow::config::ConfigLoader::LoadFromYaml("/nonexistent/workflow-manager.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigFromFile();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentSelectsDefaults();
  TestUnknownFieldsAreRejected();
  TestInvalidSettingsAreRejected();
  TestDatabaseUrlSelectsBackend();
  TestMissingFileIsReported();

  std::cout << "workflow_manager_unit_config_loader: pass\n";
  return 0;
}
