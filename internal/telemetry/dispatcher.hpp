#pragma once

#include <atomic>

namespace faultline {
class Error;
}

namespace faultline::telemetry {

/*
  Mark-dirty / take-and-clear flags owned by each error record.

  The counter flag and the event flag are independent: the event flag is
  re-armed when no subscriber listens, the counter flag never is.
*/
class DirtyFlags {
 public:
  DirtyFlags() = default;

  DirtyFlags(const DirtyFlags& other) noexcept
      : telemetry_(other.telemetry_.load(std::memory_order_relaxed)), tracing_(other.tracing_.load(std::memory_order_relaxed)) {
  }

  DirtyFlags& operator=(const DirtyFlags& other) noexcept {
    telemetry_.store(other.telemetry_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    tracing_.store(other.tracing_.load(std::memory_order_relaxed), std::memory_order_relaxed);
    return *this;
  }

  void MarkDirty() noexcept {
    telemetry_.store(true, std::memory_order_release);
    tracing_.store(true, std::memory_order_release);
  }

  bool TakeTelemetry() noexcept {
    return telemetry_.exchange(false, std::memory_order_acq_rel);
  }

  bool TakeTracing() noexcept {
    return tracing_.exchange(false, std::memory_order_acq_rel);
  }

  void RearmTracing() noexcept {
    tracing_.store(true, std::memory_order_release);
  }

  bool TelemetryPending() const noexcept {
    return telemetry_.load(std::memory_order_acquire);
  }

  bool TracingPending() const noexcept {
    return tracing_.load(std::memory_order_acquire);
  }

 private:
  std::atomic<bool> telemetry_{false};
  std::atomic<bool> tracing_{false};
};

// Emits the counter increment and the structured event for `error` if the
// corresponding flag is set.
void Dispatch(const Error& error, DirtyFlags& flags);

} // namespace faultline::telemetry
