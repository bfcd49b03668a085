#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_exporter_options.h>
#include <opentelemetry/sdk/resource/resource.h>
#include <opentelemetry/sdk/trace/batch_span_processor_factory.h>
#include <opentelemetry/sdk/trace/batch_span_processor_options.h>
#include <opentelemetry/sdk/trace/simple_processor_factory.h>
#include <opentelemetry/sdk/trace/tracer_provider_factory.h>
#include <opentelemetry/trace/provider.h>

#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp.hpp"

namespace faultline::observability {
namespace otlp      = opentelemetry::exporter::otlp;
namespace trace_api = opentelemetry::trace;
namespace sdktrace  = opentelemetry::sdk::trace;
namespace resource  = opentelemetry::sdk::resource;

using faultline::runtime::config::ObservabilityConfig;
using TraceProcessorType = faultline::runtime::config::ObservabilityConfig_TracingConfig_TraceProcessorType;

namespace {

std::shared_ptr<sdktrace::TracerProvider>           g_sdk_provider;
opentelemetry::nostd::shared_ptr<trace_api::Tracer> g_tracer;

std::unique_ptr<sdktrace::SpanExporter> MakeSpanExporter(const ObservabilityConfig& config) {
  const auto endpoint = ResolveOtlpEndpoint(config, OtlpSignal::kTraces);
  if (UsesHttpTransport(config)) {
    otlp::OtlpHttpExporterOptions options;
    options.url = endpoint;
    return otlp::OtlpHttpExporterFactory::Create(options);
  }

  otlp::OtlpGrpcExporterOptions options;
  options.endpoint            = endpoint;
  options.use_ssl_credentials = config.use_tls();
  return otlp::OtlpGrpcExporterFactory::Create(options);
}

std::unique_ptr<sdktrace::SpanProcessor> MakeProcessor(const ObservabilityConfig& config) {
  auto exporter = MakeSpanExporter(config);
  if (config.tracing().processor() == faultline::runtime::config::ObservabilityConfig_TracingConfig::TRACE_PROCESSOR_SIMPLE) {
    return sdktrace::SimpleSpanProcessorFactory::Create(std::move(exporter));
  }
  return sdktrace::BatchSpanProcessorFactory::Create(std::move(exporter), sdktrace::BatchSpanProcessorOptions{});
}

// Falls back to whatever provider is installed globally when tracing was
// not initialized here (an embedding application may own the SDK).
trace_api::Tracer* ActiveTracer() {
  if (!g_tracer) {
    if (auto provider = trace_api::Provider::GetTracerProvider()) {
      g_tracer = provider->GetTracer("faultline", "0.1.0");
    }
  }
  return g_tracer.get();
}

} // namespace

bool InitializeTracing(const faultline::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.tracing_enabled()) {
    ShutdownTracing();
    return false;
  }

  resource::ResourceAttributes attributes = {{"service.name", ServiceName(observability)}};
  g_sdk_provider = std::shared_ptr<sdktrace::TracerProvider>(
      sdktrace::TracerProviderFactory::Create(MakeProcessor(observability), resource::Resource::Create(attributes)));
  trace_api::Provider::SetTracerProvider(opentelemetry::nostd::shared_ptr<trace_api::TracerProvider>(g_sdk_provider));
  g_tracer = g_sdk_provider->GetTracer("faultline", "0.1.0");
  return static_cast<bool>(g_tracer);
}

void ShutdownTracing() {
  if (g_sdk_provider) {
    g_sdk_provider->ForceFlush();
    g_sdk_provider->Shutdown();
  }
  g_sdk_provider.reset();
  g_tracer = nullptr;
}

void RecordErrorEvent(std::string_view code, std::string_view category, std::string_view message) {
  auto span = trace_api::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span || !span->GetContext().IsValid()) {
    return;
  }

  const std::string code_attr(code);
  const std::string category_attr(category);
  if (message.empty()) {
    span->AddEvent(std::string(kErrorEventName), {{"error.code", code_attr}, {"error.category", category_attr}});
    return;
  }
  const std::string message_attr(message);
  span->AddEvent(std::string(kErrorEventName), {{"error.code", code_attr}, {"error.category", category_attr}, {"error.message", message_attr}});
}

// ------------------------------------------------------------
// SpanScope
// ------------------------------------------------------------

struct SpanScope::Impl {
  opentelemetry::nostd::shared_ptr<trace_api::Span> span;
  std::unique_ptr<trace_api::Scope>                 scope;
};

SpanScope::SpanScope(std::string_view name) : impl_(std::make_unique<Impl>()) {
  auto* tracer = ActiveTracer();
  if (tracer == nullptr) {
    return;
  }

  impl_->span  = tracer->StartSpan(std::string(name));
  impl_->scope = std::make_unique<trace_api::Scope>(tracer->WithActiveSpan(impl_->span));
}

SpanScope::~SpanScope() {
  if (impl_ && impl_->span) {
    impl_->scope.reset();
    impl_->span->End();
  }
}

SpanScope::SpanScope(SpanScope&&) noexcept            = default;
SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

void SpanScope::SetAttribute(std::string_view key, std::string_view value) {
  if (impl_ && impl_->span) {
    impl_->span->SetAttribute(std::string(key), std::string(value));
  }
}

void SpanScope::RecordError(const std::exception& error) {
  if (!impl_ || !impl_->span) {
    return;
  }
  const std::string description(error.what());
  impl_->span->AddEvent("exception", {{"exception.message", description}});
  impl_->span->SetStatus(trace_api::StatusCode::kError, description);
}

} // namespace faultline::observability

#endif
