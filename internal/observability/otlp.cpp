#include "internal/observability/otlp.hpp"

#include <cstdlib>

#include <fmt/format.h>

#include "config/config.pb.h"

namespace faultline::observability {

bool UsesHttpTransport(const faultline::runtime::config::ObservabilityConfig& config) {
  return config.transport() == faultline::runtime::config::OTLP_TRANSPORT_HTTP;
}

std::string ResolveOtlpEndpoint(const faultline::runtime::config::ObservabilityConfig& config, OtlpSignal signal) {
  if (!config.otlp_endpoint().empty()) {
    return config.otlp_endpoint();
  }

  const char* signal_variable =
      signal == OtlpSignal::kMetrics ? "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT" : "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT";
  if (const char* endpoint = std::getenv(signal_variable); endpoint != nullptr && *endpoint != '\0') {
    return endpoint;
  }

  const bool http = UsesHttpTransport(config);
  if (const char* base = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT"); base != nullptr && *base != '\0') {
    if (!http) {
      return base;
    }
    std::string_view trimmed(base);
    while (!trimmed.empty() && trimmed.back() == '/') {
      trimmed.remove_suffix(1);
    }
    return fmt::format("{}/v1/{}", trimmed, ToString(signal));
  }

  return http ? fmt::format("http://localhost:4318/v1/{}", ToString(signal)) : std::string("localhost:4317");
}

std::string ServiceName(const faultline::runtime::config::ObservabilityConfig& config) {
  return config.service_name().empty() ? std::string(kDefaultServiceName) : config.service_name();
}

} // namespace faultline::observability
