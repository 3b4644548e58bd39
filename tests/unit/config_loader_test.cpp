#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "netorch_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
database:
  sqlite:
    path: "C:\\netorch\\\"quoted\"\\db.sqlite"
)");

  auto config = netorch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\netorch\\\"quoted\"\\db.sqlite");
}

void TestScalarEscapingForNewlineAndUnicode() {
  const auto yaml_path = WriteYaml("newline_unicode",
                                   R"(server:
  bind_address: "line1\nline2☃"
)");

  auto config = netorch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.server().bind_address() == std::string("line1\nline2☃"));
}

void TestQuotedNumbersStayStrings() {
  auto config = netorch::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: "12345"
logging:
  level: "true"
)");
  assert(config.database().sqlite().path() == "12345");
  assert(config.logging().level() == "true");
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:50051"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)netorch::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestOversizedAnalysisWindowIsRejected() {
  bool threw = false;
  try {
    (void)netorch::config::ConfigLoader::LoadFromYamlString(R"(analytics:
  default_window_minutes: 61
)");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("default_window_minutes") != std::string::npos;
  }
  assert(threw && "ConfigLoader must reject an analysis window the service cannot serve.");

  auto config = netorch::config::ConfigLoader::LoadFromYamlString(R"(analytics:
  default_window_minutes: 60
)");
  assert(config.analytics().default_window_minutes() == 60);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)netorch::config::ConfigLoader::LoadFromYaml("/nonexistent/netorch.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestNonMappingDocumentIsRejected() {
  bool threw = false;
  try {
    (void)netorch::config::ConfigLoader::LoadFromYamlString("- a\n- b\n");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyDocumentGetsDefaults() {
  auto config = netorch::config::ConfigLoader::LoadFromYamlString("");
  assert(config.server().bind_address() == netorch::config::kDefaultBindAddress);
  assert(!config.database().has_sqlite());
  assert(!config.database().has_postgres());
  assert(config.workers().lifecycle().poll_interval_ms() == netorch::config::kDefaultLifecyclePollMs);
  assert(config.workers().telemetry().collection_interval_ms() == netorch::config::kDefaultTelemetryIntervalMs);
  assert(config.workers().lifecycle().error_backoff_ms() == netorch::config::kDefaultWorkerErrorBackoffMs);
  assert(config.analytics().default_window_minutes() == 10);
  assert(config.analytics().default_deviation_threshold() == 2.0);
}

void TestExplicitValuesOverrideDefaults() {
  auto config = netorch::config::ConfigLoader::LoadFromYamlString(R"(server:
  bind_address: "127.0.0.1:6000"
database:
  postgres:
    connection_uri: "postgresql://localhost/netorch"
workers:
  lifecycle:
    poll_interval_ms: 250
  telemetry:
    disabled: true
analytics:
  default_window_minutes: 30
  default_deviation_threshold: 1.5
observability:
  transport: OTLP_TRANSPORT_HTTP
  tracing:
    processor: PROCESSOR_SIMPLE
)");

  assert(config.server().bind_address() == "127.0.0.1:6000");
  assert(config.database().has_postgres());
  assert(config.database().postgres().max_connections() == netorch::config::kDefaultPostgresConnections);
  assert(config.workers().lifecycle().poll_interval_ms() == 250);
  assert(config.workers().telemetry().disabled());
  assert(config.analytics().default_window_minutes() == 30);
  assert(config.analytics().default_deviation_threshold() == 1.5);
  assert(config.observability().transport() == netorch::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().tracing().processor() ==
         netorch::runtime::config::ObservabilityConfig::TracingConfig::PROCESSOR_SIMPLE);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestScalarEscapingForNewlineAndUnicode();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestOversizedAnalysisWindowIsRejected();
  TestMissingFileIsReported();
  TestNonMappingDocumentIsRejected();
  TestEmptyDocumentGetsDefaults();
  TestExplicitValuesOverrideDefaults();

  std::cout << "netorch_unit_config_loader: pass\n";
  return 0;
}
