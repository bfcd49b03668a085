#include "internal/telemetry/sinks.hpp"

#include <atomic>
#include <mutex>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace faultline::telemetry {

namespace {

spdlog::level::level_enum ToSpdlogLevel(Severity severity) {
  switch (severity) {
    case Severity::kTrace:
      return spdlog::level::trace;
    case Severity::kDebug:
      return spdlog::level::debug;
    case Severity::kInfo:
      return spdlog::level::info;
    case Severity::kWarn:
      return spdlog::level::warn;
    case Severity::kError:
    default:
      return spdlog::level::err;
  }
}

/*
  Counts through the OpenTelemetry meter (a no-op without ENABLE_OTEL).
*/
class MetricsCounterSink final : public CounterSink {
 public:
  void Increment(std::string_view name, std::initializer_list<CounterLabel> labels) override {
    if (name != kErrorCounterName) {
      return;
    }

    std::string_view code;
    std::string_view category;
    for (const auto& label : labels) {
      if (label.key == "code") {
        code = label.value;
      } else if (label.key == "category") {
        category = label.value;
      }
    }
    observability::Metrics::Instance().RecordError(code, category);
  }
};

/*
  Writes events through the spdlog logger and mirrors them onto the active
  span. The logger pointer is cached; RebuildInterest re-resolves it.
*/
class LoggingEventSink final : public EventSink {
 public:
  LoggingEventSink() {
    RebuildInterest();
  }

  bool Enabled(Severity severity) const override {
    const auto* logger = logger_.load(std::memory_order_acquire);
    return logger != nullptr && logger->should_log(ToSpdlogLevel(severity));
  }

  void RebuildInterest() override {
    auto                        logger = observability::ActiveLogger();
    std::lock_guard<std::mutex> lock(mutex_);
    logger_.store(logger.get(), std::memory_order_release);
    // Loggers seen here stay alive for the process so the cached pointer never dangles.
    if (logger && (retained_.empty() || retained_.back() != logger)) {
      retained_.push_back(std::move(logger));
    }
  }

  void Emit(Severity severity, const ErrorEvent& event) override {
    std::vector<observability::LogField> fields;
    fields.reserve(7);
    fields.push_back(observability::StringField("code", event.code));
    fields.push_back(observability::StringField("category", event.category));
    if (event.message) {
      fields.push_back(observability::StringField("message", *event.message));
    }
    if (event.retry_seconds) {
      fields.push_back(observability::UintField("retry_seconds", *event.retry_seconds));
    }
    fields.push_back(observability::BoolField("redactable", event.redactable));
    fields.push_back(observability::UintField("metadata_len", event.metadata_len));
    if (event.www_authenticate) {
      fields.push_back(observability::StringField("www_authenticate", *event.www_authenticate));
    }

    observability::Log(ToSpdlogLevel(severity), kErrorEventName, fields);
    observability::RecordErrorEvent(event.code, event.category, event.message.value_or(std::string_view{}));
  }

 private:
  std::atomic<spdlog::logger*>                 logger_{nullptr};
  std::mutex                                   mutex_;
  std::vector<std::shared_ptr<spdlog::logger>> retained_;
};

CounterSink& DefaultCounterSink() {
  static MetricsCounterSink sink;
  return sink;
}

EventSink& DefaultEventSink() {
  static LoggingEventSink sink;
  return sink;
}

std::atomic<CounterSink*> g_counter_sink{nullptr};
std::atomic<EventSink*>   g_event_sink{nullptr};

// Installed sinks are retained so a pointer loaded by a concurrent emitter stays valid.
std::mutex                                g_registry_mutex;
std::vector<std::shared_ptr<CounterSink>> g_counter_registry;
std::vector<std::shared_ptr<EventSink>>   g_event_registry;

} // namespace

void SetCounterSink(std::shared_ptr<CounterSink> sink) {
  std::lock_guard<std::mutex> lock(g_registry_mutex);
  auto*                       raw = sink.get();
  if (sink) {
    g_counter_registry.push_back(std::move(sink));
  }
  g_counter_sink.store(raw, std::memory_order_release);
}

void SetEventSink(std::shared_ptr<EventSink> sink) {
  std::lock_guard<std::mutex> lock(g_registry_mutex);
  auto*                       raw = sink.get();
  if (sink) {
    g_event_registry.push_back(std::move(sink));
  }
  g_event_sink.store(raw, std::memory_order_release);
}

CounterSink& CurrentCounterSink() {
  if (auto* sink = g_counter_sink.load(std::memory_order_acquire)) {
    return *sink;
  }
  return DefaultCounterSink();
}

EventSink& CurrentEventSink() {
  if (auto* sink = g_event_sink.load(std::memory_order_acquire)) {
    return *sink;
  }
  return DefaultEventSink();
}

} // namespace faultline::telemetry
