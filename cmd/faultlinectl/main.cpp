#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "faultline/v1.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using faultline::protocol::CodeMapping;

static void ShutdownObservability() {
  faultline::observability::ShutdownLogging();
  faultline::observability::ShutdownMetrics();
  faultline::observability::ShutdownTracing();
}

static void Usage() {
  std::cout << "Usage:\n"
            << "  faultlinectl [--config <config.yaml>] list\n"
            << "  faultlinectl [--config <config.yaml>] explain <CODE>\n"
            << "  faultlinectl [--config <config.yaml>] render <prod|staging|local> <CODE> [message]\n";
}

static void PrintMapping(const CodeMapping& mapping) {
  std::cout << fmt::format("{:<24} {:<22} http={} grpc={}({}) {}\n", mapping.code, faultline::KindName(mapping.kind), mapping.http_status,
                           mapping.grpc.name, mapping.grpc.value, mapping.problem_type);
}

static int List() {
  for (const auto& mapping : faultline::protocol::kCodeMappings) {
    PrintMapping(mapping);
  }
  return 0;
}

static int Explain(const std::string& text) {
  const auto code = faultline::ErrorCode::Parse(text);
  const auto* mapping = faultline::protocol::MappingForCode(code.View());
  if (mapping == nullptr) {
    std::cerr << "no built-in mapping for " << code << "; the kind's canonical code applies\n";
    return 1;
  }

  std::cout << "Code:         " << mapping->code << '\n'
            << "Kind:         " << faultline::KindName(mapping->kind) << '\n'
            << "Title:        " << faultline::KindLabel(mapping->kind) << '\n'
            << "HTTP status:  " << mapping->http_status << '\n'
            << "gRPC status:  " << mapping->grpc.name << " (" << mapping->grpc.value << ")\n"
            << "Problem type: " << mapping->problem_type << '\n';
  return 0;
}

static int Render(const std::string& mode_text, const std::string& code_text, const std::optional<std::string>& message) {
  const auto mode = faultline::display::ParseDisplayMode(mode_text);
  if (!mode) {
    std::cerr << "unknown display mode: " << mode_text << '\n';
    return 1;
  }

  const auto  code    = faultline::ErrorCode::Parse(code_text);
  const auto* mapping = faultline::protocol::MappingForCode(code.View());
  const auto  kind    = mapping != nullptr ? mapping->kind : faultline::ErrorKind::kInternal;

  faultline::Error error(code, kind, message);
  std::cout << faultline::render::Render(error, *mode) << '\n';
  return 0;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);

  std::optional<std::string> config_path;
  if (args.size() >= 2 && args[0] == "--config") {
    config_path = args[1];
    args.erase(args.begin(), args.begin() + 2);
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  try {
    faultline::runtime::config::RuntimeConfig config;
    if (config_path) {
      config = faultline::config::ConfigLoader::LoadFromYaml(*config_path);
    }
    faultline::observability::InitializeTracing(config);
    faultline::observability::InitializeMetrics(config);
    faultline::observability::InitializeLogging(config);
    faultline::render::ConfigureRendering(config);

    const auto& cmd = args[0];
    int         rc  = 1;
    if (cmd == "list" && args.size() == 1) {
      rc = List();
    } else if (cmd == "explain" && args.size() == 2) {
      rc = Explain(args[1]);
    } else if (cmd == "render" && (args.size() == 3 || args.size() == 4)) {
      rc = Render(args[1], args[2], args.size() == 4 ? std::optional<std::string>(args[3]) : std::nullopt);
    } else {
      Usage();
    }

    ShutdownObservability();
    return rc;
  } catch (const faultline::Error& e) {
    // Invalid codes and statuses from the command line.
    std::cerr << faultline::render::RenderLocal(e) << '\n';
    ShutdownObservability();
    return 1;
  } catch (const std::exception& e) {
    FAULTLINE_LOG_ERROR("Fatal error", {faultline::observability::StringField("error", e.what())});
  }

  ShutdownObservability();
  return 2;
}
