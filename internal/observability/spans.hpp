#pragma once

#include <exception>
#include <memory>
#include <string>
#include <string_view>

namespace faultline::runtime::config {
class RuntimeConfig;
}

namespace faultline::observability {

inline constexpr std::string_view kErrorCountMetric = "faultline.error.count";
inline constexpr std::string_view kErrorEventName   = "error constructed";

// OTLP exporters are installed only when the matching *_enabled flag is set;
// otherwise the call shuts down any previous provider and returns false.
bool InitializeTracing(const faultline::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const faultline::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span. The span is active for the lifetime of the scope, so error
  events recorded meanwhile attach to it.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);

  // Marks the span failed. Uses what(), which a redacted faultline::Error
  // keeps to its kind label.
  void RecordError(const std::exception& error);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

// Adds an "error constructed" event to the active span, if any. An empty
// message is left off the event.
void RecordErrorEvent(std::string_view code, std::string_view category, std::string_view message);

/*
  Process-wide error counter (faultline.error.count{code, category}).
*/
class Metrics {
 public:
  static Metrics& Instance();

  void RecordError(std::string_view code, std::string_view category);

  // Re-resolves the counter against the current global meter provider.
  void Rebind();

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const faultline::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const faultline::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::RecordError(const std::exception&) {
}

inline void RecordErrorEvent(std::string_view, std::string_view, std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordError(std::string_view, std::string_view) {
}

inline void Metrics::Rebind() {
}
#endif

} // namespace faultline::observability
