#include "internal/error/error.hpp"

#include <cassert>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

using faultline::EditPolicy;
using faultline::Error;
using faultline::ErrorCode;
using faultline::ErrorKind;
namespace field = faultline::field;

class LeafCause final : public faultline::Cause {
 public:
  explicit LeafCause(std::string text) : text_(std::move(text)) {
  }

  std::string Render() const override {
    return text_;
  }

 private:
  std::string text_;
};

void TestConstructorsSetCodeKindAndMessage() {
  const auto error = Error::NotFound("user 42 missing");
  assert(error.Kind() == ErrorKind::kNotFound);
  assert(error.Code() == "NOT_FOUND");
  assert(*error.Message() == "user 42 missing");
  assert(std::strcmp(error.what(), "user 42 missing") == 0);

  const Error bare(ErrorKind::kTimeout);
  assert(!bare.Message());
  assert(bare.RenderMessage() == "Operation timed out");
  assert(std::strcmp(bare.what(), "Operation timed out") == 0);

  const Error custom(ErrorCode::Parse("PAYMENT_DECLINED"), ErrorKind::kBadRequest, std::nullopt);
  assert(custom.Code() == "PAYMENT_DECLINED");
  assert(custom.Kind() == ErrorKind::kBadRequest);
}

void TestBuildersOnLvaluesAndRvalues() {
  Error error = Error::Internal("boom");
  error.WithField(field::U64("attempt", 3)).WithRetryAfterSecs(30).WithWwwAuthenticate("Bearer");
  assert(error.GetMetadata().Size() == 1);
  assert(error.Retry()->after_seconds == 30);
  assert(*error.WwwAuthenticate() == "Bearer");

  const auto moved = Error::Validation("bad input")
                         .WithFields({field::Str("field", "email"), field::Str("reason", "format")})
                         .WithCode(ErrorCode::Parse("EMAIL_FORMAT"))
                         .WithKind(ErrorKind::kBadRequest)
                         .WithMessage("email is malformed");
  assert(moved.GetMetadata().Size() == 2);
  assert(moved.Code() == "EMAIL_FORMAT");
  assert(moved.Kind() == ErrorKind::kBadRequest);
  assert(*moved.Message() == "email is malformed");
}

void TestRedactedMessageFallsBackToLabel() {
  const auto error = Error::Unauthorized("token for alice@example.com expired").Redactable();
  assert(error.IsRedacted());
  assert(error.GetEditPolicy() == EditPolicy::kRedact);
  assert(error.SafeMessage() == "Unauthorized");
  assert(std::string(error.what()) == "Unauthorized");
  assert(error.Render() == "Unauthorized");
  // The stored message is kept for local diagnostics.
  assert(error.RenderMessage() == "token for alice@example.com expired");
}

void TestRedactFieldOnRecord() {
  auto error = Error::Internal("boom").WithField(field::Str("email", "a@b.c")).RedactField("email", faultline::FieldRedaction::kRedact);
  assert(error.GetMetadata().GetField("email")->Redaction() == faultline::FieldRedaction::kRedact);

  // Redacting an absent field is a silent no-op for current content.
  error.RedactField("absent", faultline::FieldRedaction::kHash);
  assert(error.GetMetadata().Size() == 1);
}

void TestCauseChain() {
  auto root   = Error::Database("connection refused");
  auto middle = Error::Service("repository failed").AttachException(root);
  auto top    = Error::Internal("request failed").AttachShared(std::make_shared<const Error>(middle));

  const faultline::Cause* cause = top.Source();
  assert(cause != nullptr && cause->Render() == "repository failed");
  cause = cause->Next();
  assert(cause != nullptr && cause->Render() == "connection refused");
  assert(cause->Next() == nullptr);

  auto owned = Error::Internal("x").AttachOwned(std::make_unique<LeafCause>("leaf"));
  assert(owned.Source()->Render() == "leaf");

  // Copies share the chain.
  const auto copy = top;
  assert(copy.SharedSource() == top.SharedSource());
}

void TestAttachForeignExceptionWithNesting() {
  Error error = Error::Internal("wrapper");
  try {
    try {
      throw std::runtime_error("disk full");
    } catch (...) {
      std::throw_with_nested(std::logic_error("write failed"));
    }
  } catch (const std::exception& e) {
    error.AttachException(e);
  }

  const auto* cause = error.Source();
  assert(cause->Render() == "write failed");
  assert(cause->Next() != nullptr && cause->Next()->Render() == "disk full");
}

void TestThrownRecordIsCatchableAsStdException() {
  bool caught = false;
  try {
    throw Error::Conflict("duplicate key");
  } catch (const std::exception& e) {
    caught = std::string(e.what()) == "duplicate key";
    assert(dynamic_cast<const Error*>(&e) != nullptr);
  }
  assert(caught);
}

void TestDetailsAndBacktrace() {
  google::protobuf::Value details;
  (*details.mutable_struct_value()->mutable_fields())["limit"].set_number_value(10);

  const auto json = Error::RateLimited("slow down").WithDetails(details);
  assert(json.GetDetails()->AsJson() != nullptr);
  assert(json.GetDetails()->AsText() == nullptr);

  const auto text = Error::RateLimited("slow down").WithDetailsText("quota exceeded");
  assert(*text.GetDetails()->AsText() == "quota exceeded");

  const auto traced = Error::Internal("x").WithBacktrace(faultline::Backtrace::Capture());
  assert(traced.GetBacktrace() != nullptr);
  assert(!traced.GetBacktrace()->Empty());
}

void TestBacktraceToggleParsing() {
  assert(!faultline::ParseBacktraceToggle(""));
  assert(!faultline::ParseBacktraceToggle("0"));
  assert(!faultline::ParseBacktraceToggle(" OFF "));
  assert(!faultline::ParseBacktraceToggle("false"));
  assert(faultline::ParseBacktraceToggle("1"));
  assert(faultline::ParseBacktraceToggle("full"));
}

void TestBacktraceCapturedLazilyWhenEnabled() {
  setenv("FAULTLINE_BACKTRACE", "1", 1);
  faultline::testing::ResetBacktracePreference();

  auto error = Error::Internal("worker crashed");
  const auto* captured = error.GetBacktrace();
  assert(captured != nullptr);
  assert(!captured->Empty());

  // Later mutations reuse the first capture.
  error.WithField(field::U64("attempt", 3)).WithMessage("worker crashed twice");
  assert(error.GetBacktrace() == captured);

  error.WithBacktrace(faultline::Backtrace({reinterpret_cast<void*>(0x1234)}));
  assert(error.GetBacktrace() != captured);
  assert(error.GetBacktrace()->Frames().size() == 1);

  setenv("FAULTLINE_BACKTRACE", "off", 1);
  faultline::testing::ResetBacktracePreference();
  assert(Error::Internal("quiet").GetBacktrace() == nullptr);

  unsetenv("FAULTLINE_BACKTRACE");
  faultline::testing::ResetBacktracePreference();
}

} // namespace

int main() {
  TestConstructorsSetCodeKindAndMessage();
  TestBuildersOnLvaluesAndRvalues();
  TestRedactedMessageFallsBackToLabel();
  TestRedactFieldOnRecord();
  TestCauseChain();
  TestAttachForeignExceptionWithNesting();
  TestThrownRecordIsCatchableAsStdException();
  TestDetailsAndBacktrace();
  TestBacktraceToggleParsing();
  TestBacktraceCapturedLazilyWhenEnabled();

  std::cout << "faultline_unit_error: pass\n";
  return 0;
}
