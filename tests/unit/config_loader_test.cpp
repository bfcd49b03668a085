#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/render/renderer.hpp"

namespace {

using faultline::config::ConfigLoader;
namespace config = faultline::runtime::config;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "faultline_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullDocumentLoads() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: "debug"
  pattern: "[%l] %v"
observability:
  metrics_enabled: true
  tracing_enabled: false
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_HTTP
rendering:
  staging_chain_depth: 3
  local_chain_depth: 20
  color: COLOR_MODE_NEVER
)");

  const auto cfg = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(cfg.logging().level() == "debug");
  assert(cfg.logging().pattern() == "[%l] %v");
  assert(cfg.observability().metrics_enabled());
  assert(!cfg.observability().tracing_enabled());
  assert(cfg.observability().otlp_endpoint() == "localhost:4317");
  assert(cfg.observability().transport() == config::OTLP_TRANSPORT_HTTP);
  assert(cfg.rendering().staging_chain_depth() == 3);
  assert(cfg.rendering().local_chain_depth() == 20);
  assert(cfg.rendering().color() == config::COLOR_MODE_NEVER);
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto cfg = ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "C:\\logs\\\"quoted\"\\%v"
)");
  assert(cfg.logging().pattern() == "C:\\logs\\\"quoted\"\\%v");
}

void TestQuotedNumbersStayStrings() {
  const auto cfg = ConfigLoader::LoadFromYamlString(R"(logging:
  pattern: "123"
)");
  assert(cfg.logging().pattern() == "123");
}

void TestEmptyDocumentUsesDefaults() {
  const auto cfg = ConfigLoader::LoadFromYamlString("");
  assert(cfg.logging().level().empty());
  assert(cfg.rendering().staging_chain_depth() == 0);
  assert(cfg.rendering().color() == config::COLOR_MODE_AUTO);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(logging:
  level: "info"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestUnknownLogLevelIsRejected() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYamlString(R"(logging:
  level: verbose
)");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("verbose") != std::string::npos;
  }
  assert(threw);

  const auto cfg = ConfigLoader::LoadFromYamlString(R"(logging:
  level: warning
)");
  assert(cfg.logging().level() == "warning");
}

void TestExporterIdentity() {
  const auto cfg = ConfigLoader::LoadFromYamlString(R"(observability:
  service_name: billing
  use_tls: true
)");
  assert(cfg.observability().service_name() == "billing");
  assert(cfg.observability().use_tls());
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/faultline.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestRenderingLimitsAreApplied() {
  const auto cfg = ConfigLoader::LoadFromYamlString(R"(rendering:
  staging_chain_depth: 7
  local_chain_depth: 12
)");
  faultline::render::ConfigureRendering(cfg);
  assert(faultline::render::CurrentRenderLimits().staging_chain_depth == 7);
  assert(faultline::render::CurrentRenderLimits().local_chain_depth == 12);
  faultline::render::testing::ResetRenderLimits();
}

} // namespace

int main() {
  TestFullDocumentLoads();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestEmptyDocumentUsesDefaults();
  TestUnknownFieldsAreRejected();
  TestUnknownLogLevelIsRejected();
  TestExporterIdentity();
  TestMissingFileIsReported();
  TestRenderingLimitsAreApplied();

  std::cout << "faultline_unit_config_loader: pass\n";
  return 0;
}
