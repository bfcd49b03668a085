#pragma once

#include <string>
#include <string_view>

namespace faultline::runtime::config {
class ObservabilityConfig;
}

namespace faultline::observability {

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

constexpr std::string_view ToString(OtlpSignal signal) {
  return signal == OtlpSignal::kMetrics ? "metrics" : "traces";
}

inline constexpr std::string_view kDefaultServiceName = "faultline";

bool UsesHttpTransport(const faultline::runtime::config::ObservabilityConfig& config);

// Configured endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
// OTEL_EXPORTER_OTLP_ENDPOINT (with /v1/<signal> appended for HTTP), then the
// local collector default for the transport.
std::string ResolveOtlpEndpoint(const faultline::runtime::config::ObservabilityConfig& config, OtlpSignal signal);

std::string ServiceName(const faultline::runtime::config::ObservabilityConfig& config);

} // namespace faultline::observability
