#include "internal/error/error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/telemetry/sinks.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <spdlog/sinks/ostream_sink.h>
#include <spdlog/spdlog.h>

namespace {

using faultline::Error;
using faultline::observability::BoolField;
using faultline::observability::IntField;
using faultline::observability::StringField;

/*
  Registers an ostream-backed "faultline" logger so every line the library
  writes can be inspected.
*/
class CapturedLog {
 public:
  CapturedLog() {
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out_);
    logger_   = std::make_shared<spdlog::logger>("faultline", sink);
    logger_->set_pattern("%l %v");
    logger_->set_level(spdlog::level::trace);
    spdlog::drop("faultline");
    spdlog::register_logger(logger_);
    // The default event sink caches its logger; point it at this one.
    faultline::telemetry::CurrentEventSink().RebuildInterest();
  }

  ~CapturedLog() {
    spdlog::drop("faultline");
  }

  std::string Take() {
    auto text = out_.str();
    out_.str("");
    return text;
  }

  spdlog::logger& Logger() {
    return *logger_;
  }

 private:
  std::ostringstream              out_;
  std::shared_ptr<spdlog::logger> logger_;
};

void TestFieldsAreAppendedAsKeyValuePairs() {
  CapturedLog log;
  faultline::observability::Log(spdlog::level::info, "ready",
                                {StringField("reason", "connection reset by peer"), IntField("attempt", -2), BoolField("ok", true),
                                 StringField("empty", "")});

  assert(log.Take() == "info ready reason=\"connection reset by peer\" attempt=-2 ok=true empty=\"\"\n");
}

void TestQuotesAndNewlinesAreEscaped() {
  CapturedLog log;
  FAULTLINE_LOG_WARN("odd", {StringField("value", "say \"hi\"\nbye")});
  assert(log.Take() == "warning odd value=\"say \\\"hi\\\"\\nbye\"\n");
}

void TestLevelFilteringSkipsFormatting() {
  CapturedLog log;
  log.Logger().set_level(spdlog::level::warn);
  FAULTLINE_LOG_INFO("hidden", {StringField("k", "v")});
  assert(log.Take().empty());
}

void TestErrorLogSanitizesMetadata() {
  CapturedLog log;
  const auto error = Error::RateLimited("slow down")
                         .WithField(faultline::field::Str("user_id", "u-1"))
                         .WithField(faultline::field::Str("password", "hunter2"))
                         .WithField(faultline::field::Str("card_number", "4111111111111111"))
                         .WithRetryAfterSecs(30);
  log.Take();

  error.Log();
  const auto line = log.Take();
  assert(line == "error slow down kind=RateLimited code=RATE_LIMITED retry_after=30 card_number=************1111 user_id=u-1\n");
  assert(line.find("hunter2") == std::string::npos);
}

void TestRedactedErrorLogsTheLabel() {
  CapturedLog log;
  const auto error = Error::Unauthorized("token abc expired").Redactable();
  log.Take();

  error.Log();
  const auto line = log.Take();
  assert(line == "error Unauthorized kind=Unauthorized code=UNAUTHORIZED\n");
}

} // namespace

int main() {
  TestFieldsAreAppendedAsKeyValuePairs();
  TestQuotesAndNewlinesAreEscaped();
  TestLevelFilteringSkipsFormatting();
  TestErrorLogSanitizesMetadata();
  TestRedactedErrorLogsTheLabel();

  std::cout << "faultline_unit_logging: pass\n";
  return 0;
}
