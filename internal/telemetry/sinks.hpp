#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string_view>

#include "internal/observability/spans.hpp"

namespace faultline::telemetry {

inline constexpr std::string_view kErrorCounterName = observability::kErrorCountMetric;
inline constexpr std::string_view kErrorEventName   = observability::kErrorEventName;

struct CounterLabel {
  std::string_view key;
  std::string_view value;
};

enum class Severity : std::uint8_t {
  kTrace = 0,
  kDebug,
  kInfo,
  kWarn,
  kError,
};

struct ErrorEvent {
  std::string_view                code;
  std::string_view                category;
  std::optional<std::string_view> message;
  std::optional<std::uint64_t>    retry_seconds;
  bool                            redactable{false};
  std::size_t                     metadata_len{0};
  std::optional<std::string_view> www_authenticate;
};

/*
  Counter metric keyed by string labels.
*/
class CounterSink {
 public:
  virtual ~CounterSink() = default;

  virtual void Increment(std::string_view name, std::initializer_list<CounterLabel> labels) = 0;
};

/*
  Structured event consumer with an interest query.

  RebuildInterest() refreshes whatever cached view of subscribers the sink
  keeps, so listeners registered after start are seen.
*/
class EventSink {
 public:
  virtual ~EventSink() = default;

  virtual bool Enabled(Severity severity) const = 0;
  virtual void RebuildInterest()                = 0;
  virtual void Emit(Severity severity, const ErrorEvent& event) = 0;
};

// Passing nullptr restores the default sink.
void SetCounterSink(std::shared_ptr<CounterSink> sink);
void SetEventSink(std::shared_ptr<EventSink> sink);

CounterSink& CurrentCounterSink();
EventSink&   CurrentEventSink();

} // namespace faultline::telemetry
