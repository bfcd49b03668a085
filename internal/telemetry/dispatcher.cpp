#include "internal/telemetry/dispatcher.hpp"

#include "internal/error/error.hpp"
#include "internal/telemetry/sinks.hpp"

namespace faultline::telemetry {

namespace {

void FlushTracing(const Error& error, DirtyFlags& flags) {
  if (!flags.TakeTracing()) {
    return;
  }

  auto& sink = CurrentEventSink();
  if (!sink.Enabled(Severity::kError)) {
    sink.RebuildInterest();
    if (!sink.Enabled(Severity::kError)) {
      flags.RearmTracing();
      return;
    }
  }

  ErrorEvent event;
  event.code     = error.Code().View();
  event.category = KindName(error.Kind());
  if (!error.IsRedacted() && error.Message()) {
    event.message = *error.Message();
  }
  if (error.Retry()) {
    event.retry_seconds = error.Retry()->after_seconds;
  }
  event.redactable   = error.IsRedacted();
  event.metadata_len = error.GetMetadata().Size();
  if (error.WwwAuthenticate()) {
    event.www_authenticate = *error.WwwAuthenticate();
  }

  sink.Emit(Severity::kError, event);
}

} // namespace

void Dispatch(const Error& error, DirtyFlags& flags) {
  if (flags.TakeTelemetry()) {
    error.CaptureBacktraceIfEnabled();
    CurrentCounterSink().Increment(kErrorCounterName, {{"code", error.Code().View()}, {"category", KindName(error.Kind())}});
  }
  FlushTracing(error, flags);
}

} // namespace faultline::telemetry
