#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define FAULTLINE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define FAULTLINE_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace faultline::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

using faultline::runtime::config::ObservabilityConfig;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

constexpr std::uint32_t kDefaultCollectionIntervalMs = 1000;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

std::unique_ptr<sdkmetrics::PushMetricExporter> MakeMetricExporter(const ObservabilityConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kMetrics);
  if (UsesHttpTransport(config)) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }

  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = config.use_tls();
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

std::unique_ptr<sdkmetrics::MetricReader> MakeReader(const ObservabilityConfig& config) {
  const auto& metrics = config.metrics();

  sdkmetrics::PeriodicExportingMetricReaderOptions options;
  options.export_interval_millis =
      std::chrono::milliseconds(metrics.collection_interval_ms() > 0 ? metrics.collection_interval_ms() : kDefaultCollectionIntervalMs);
  if (metrics.export_timeout_ms() > 0) {
    options.export_timeout_millis = std::chrono::milliseconds(metrics.export_timeout_ms());
  }

#ifdef FAULTLINE_OTEL_METRIC_READER_FACTORY
  return sdkmetrics::PeriodicExportingMetricReaderFactory::Create(MakeMetricExporter(config), options);
#else
  return std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(MakeMetricExporter(config), options);
#endif
}

// SDK releases disagree on whether readers are handed over as unique or shared pointers.
template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

bool InitializeMetrics(const faultline::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  resource::ResourceAttributes attributes = {{"service.name", ServiceName(observability)}};
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           resource::Resource::Create(attributes));
  AddMetricReaderCompat(g_provider, MakeReader(observability));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
  // Errors may have been counted before initialization; move the counter to the new provider.
  Metrics::Instance().Rebind();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

// ------------------------------------------------------------
// Metrics
// ------------------------------------------------------------

// Meter and counter are swapped together on Rebind; RecordError only loads.
struct CounterBinding {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter>                  meter;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> error_count;
};

struct Metrics::Impl {
  std::atomic<std::shared_ptr<const CounterBinding>> binding;
};

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  Rebind();
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::Rebind() {
  auto binding   = std::make_shared<CounterBinding>();
  binding->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("faultline", "0.1.0");
  binding->error_count =
      binding->meter->CreateUInt64Counter(std::string(kErrorCountMetric), "1", "Error records constructed or mutated, by code and category");
  impl_->binding.store(std::move(binding), std::memory_order_release);
}

void Metrics::RecordError(std::string_view code, std::string_view category) {
  const auto binding = impl_->binding.load(std::memory_order_acquire);
  if (!binding || !binding->error_count) {
    return;
  }

  const std::string                          code_label(code);
  const std::string                          category_label(category);
  const std::initializer_list<AttributePair> attributes = {{"code", code_label}, {"category", category_label}};
  AddWithAttributes(binding->error_count, static_cast<std::uint64_t>(1), attributes);
}

} // namespace faultline::observability

#endif
