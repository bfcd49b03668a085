#pragma once

#include <cstdint>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/error/backtrace.hpp"
#include "internal/error/cause.hpp"
#include "internal/error/code.hpp"
#include "internal/error/details.hpp"
#include "internal/error/diagnostics.hpp"
#include "internal/error/field.hpp"
#include "internal/error/kind.hpp"
#include "internal/error/metadata.hpp"
#include "internal/telemetry/dispatcher.hpp"

namespace faultline {

// Governs the top-level message only; per-field redaction is separate.
enum class EditPolicy : std::uint8_t {
  kPreserve = 0,
  kRedact,
};

struct RetryAdvice {
  std::uint64_t after_seconds{0};
};

/*
  Structured error record.

  Carries a stable code, a kind, an optional message, typed metadata,
  diagnostics and an optional causal chain. Every constructor and every
  state-changing builder ends by dispatching telemetry; dirty flags keep
  the dispatch idempotent so a builder chain reports its final state
  exactly once per change.

  Builders are ref-qualified: on an lvalue they mutate in place, on an
  rvalue they return the updated record by value.

  Throwable (std::exception) and usable as the cause of another record.
*/
class Error : public std::exception, public Cause {
 public:
  explicit Error(ErrorKind kind);
  Error(ErrorKind kind, std::string message);
  Error(ErrorCode code, ErrorKind kind, std::optional<std::string> message);

  Error(const Error& other);
  Error(Error&& other) noexcept;
  Error& operator=(const Error& other);
  Error& operator=(Error&& other) noexcept;
  ~Error() override;

  // ------------------------------------------------------------
  // Per-kind constructors
  // ------------------------------------------------------------

  static Error NotFound(std::string message) { return Error(ErrorKind::kNotFound, std::move(message)); }
  static Error Validation(std::string message) { return Error(ErrorKind::kValidation, std::move(message)); }
  static Error Conflict(std::string message) { return Error(ErrorKind::kConflict, std::move(message)); }
  static Error Unauthorized(std::string message) { return Error(ErrorKind::kUnauthorized, std::move(message)); }
  static Error Forbidden(std::string message) { return Error(ErrorKind::kForbidden, std::move(message)); }
  static Error NotImplemented(std::string message) { return Error(ErrorKind::kNotImplemented, std::move(message)); }
  static Error Internal(std::string message) { return Error(ErrorKind::kInternal, std::move(message)); }
  static Error BadRequest(std::string message) { return Error(ErrorKind::kBadRequest, std::move(message)); }
  static Error InvalidJwt(std::string message) { return Error(ErrorKind::kInvalidJwt, std::move(message)); }
  static Error Database(std::string message) { return Error(ErrorKind::kDatabase, std::move(message)); }
  static Error Service(std::string message) { return Error(ErrorKind::kService, std::move(message)); }
  static Error Config(std::string message) { return Error(ErrorKind::kConfig, std::move(message)); }
  static Error Timeout(std::string message) { return Error(ErrorKind::kTimeout, std::move(message)); }
  static Error Network(std::string message) { return Error(ErrorKind::kNetwork, std::move(message)); }
  static Error RateLimited(std::string message) { return Error(ErrorKind::kRateLimited, std::move(message)); }
  static Error DependencyUnavailable(std::string message) { return Error(ErrorKind::kDependencyUnavailable, std::move(message)); }
  static Error Serialization(std::string message) { return Error(ErrorKind::kSerialization, std::move(message)); }
  static Error Deserialization(std::string message) { return Error(ErrorKind::kDeserialization, std::move(message)); }
  static Error ExternalApi(std::string message) { return Error(ErrorKind::kExternalApi, std::move(message)); }
  static Error Queue(std::string message) { return Error(ErrorKind::kQueue, std::move(message)); }
  static Error Cache(std::string message) { return Error(ErrorKind::kCache, std::move(message)); }

  // ------------------------------------------------------------
  // Builders
  // ------------------------------------------------------------

  Error& WithField(Field field) &;
  Error  WithField(Field field) && { return std::move(WithField(std::move(field))); }

  Error& WithFields(std::vector<Field> fields) &;
  Error  WithFields(std::vector<Field> fields) && { return std::move(WithFields(std::move(fields))); }

  // Silently a no-op for current content when no field has this name.
  Error& RedactField(std::string_view name, FieldRedaction policy) &;
  Error  RedactField(std::string_view name, FieldRedaction policy) && { return std::move(RedactField(name, policy)); }

  Error& WithMetadata(Metadata metadata) &;
  Error  WithMetadata(Metadata metadata) && { return std::move(WithMetadata(std::move(metadata))); }

  Error& WithEditPolicy(EditPolicy policy) &;
  Error  WithEditPolicy(EditPolicy policy) && { return std::move(WithEditPolicy(policy)); }

  Error& Redactable() & { return WithEditPolicy(EditPolicy::kRedact); }
  Error  Redactable() && { return std::move(WithEditPolicy(EditPolicy::kRedact)); }

  Error& WithMessage(std::string message) &;
  Error  WithMessage(std::string message) && { return std::move(WithMessage(std::move(message))); }

  Error& WithCode(ErrorCode code) &;
  Error  WithCode(ErrorCode code) && { return std::move(WithCode(std::move(code))); }

  Error& WithKind(ErrorKind kind) &;
  Error  WithKind(ErrorKind kind) && { return std::move(WithKind(kind)); }

  Error& WithRetryAfterSecs(std::uint64_t seconds) &;
  Error  WithRetryAfterSecs(std::uint64_t seconds) && { return std::move(WithRetryAfterSecs(seconds)); }

  Error& WithWwwAuthenticate(std::string challenge) &;
  Error  WithWwwAuthenticate(std::string challenge) && { return std::move(WithWwwAuthenticate(std::move(challenge))); }

  Error& AttachOwned(std::unique_ptr<Cause> source) &;
  Error  AttachOwned(std::unique_ptr<Cause> source) && { return std::move(AttachOwned(std::move(source))); }

  Error& AttachShared(std::shared_ptr<const Cause> source) &;
  Error  AttachShared(std::shared_ptr<const Cause> source) && { return std::move(AttachShared(std::move(source))); }

  // Error records keep their own chain; other exceptions are snapshotted
  // together with their std::nested_exception chain.
  Error& AttachException(const std::exception& source) &;
  Error  AttachException(const std::exception& source) && { return std::move(AttachException(source)); }

  Error& WithBacktrace(Backtrace backtrace) &;
  Error  WithBacktrace(Backtrace backtrace) && { return std::move(WithBacktrace(std::move(backtrace))); }

  Error& WithDetails(google::protobuf::Value details) &;
  Error  WithDetails(google::protobuf::Value details) && { return std::move(WithDetails(std::move(details))); }

  Error& WithDetailsText(std::string details) &;
  Error  WithDetailsText(std::string details) && { return std::move(WithDetailsText(std::move(details))); }

  Error& WithHint(std::string message, Visibility visibility = Visibility::kDevOnly) &;
  Error  WithHint(std::string message, Visibility visibility = Visibility::kDevOnly) && {
    return std::move(WithHint(std::move(message), visibility));
  }

  Error& WithSuggestion(std::string message, Visibility visibility = Visibility::kDevOnly) &;
  Error  WithSuggestion(std::string message, Visibility visibility = Visibility::kDevOnly) && {
    return std::move(WithSuggestion(std::move(message), visibility));
  }

  Error& WithSuggestionCommand(std::string message, std::string command, Visibility visibility = Visibility::kDevOnly) &;
  Error  WithSuggestionCommand(std::string message, std::string command, Visibility visibility = Visibility::kDevOnly) && {
    return std::move(WithSuggestionCommand(std::move(message), std::move(command), visibility));
  }

  Error& WithDocs(std::string url, Visibility visibility = Visibility::kPublic) &;
  Error  WithDocs(std::string url, Visibility visibility = Visibility::kPublic) && { return std::move(WithDocs(std::move(url), visibility)); }

  Error& WithDocsTitled(std::string url, std::string title, Visibility visibility = Visibility::kPublic) &;
  Error  WithDocsTitled(std::string url, std::string title, Visibility visibility = Visibility::kPublic) && {
    return std::move(WithDocsTitled(std::move(url), std::move(title), visibility));
  }

  Error& WithRelatedCode(std::string code) &;
  Error  WithRelatedCode(std::string code) && { return std::move(WithRelatedCode(std::move(code))); }

  // ------------------------------------------------------------
  // Accessors
  // ------------------------------------------------------------

  const ErrorCode&                  Code() const noexcept { return code_; }
  ErrorKind                         Kind() const noexcept { return kind_; }
  const std::optional<std::string>& Message() const noexcept { return message_; }
  const Metadata&                   GetMetadata() const noexcept { return metadata_; }
  EditPolicy                        GetEditPolicy() const noexcept { return edit_policy_; }
  bool                              IsRedacted() const noexcept { return edit_policy_ == EditPolicy::kRedact; }
  const std::optional<RetryAdvice>& Retry() const noexcept { return retry_; }
  const std::optional<std::string>& WwwAuthenticate() const noexcept { return www_authenticate_; }
  const std::optional<Details>&     GetDetails() const noexcept { return details_; }
  const Cause*                      Source() const noexcept { return source_.get(); }
  std::shared_ptr<const Cause>      SharedSource() const noexcept { return source_; }
  const Diagnostics*                GetDiagnostics() const noexcept { return diagnostics_.get(); }

  // Attached backtrace if any, otherwise the lazily captured one.
  const Backtrace* GetBacktrace() const noexcept;

  // Message if present, otherwise the kind label.
  std::string_view RenderMessage() const noexcept;

  // RenderMessage(), but the kind label whenever the message is redacted.
  std::string_view SafeMessage() const noexcept;

  const char*  what() const noexcept override;
  std::string  Render() const override;
  const Cause* Next() const noexcept override;

  // ------------------------------------------------------------
  // Telemetry
  // ------------------------------------------------------------

  void MarkDirty() const noexcept { dirty_.MarkDirty(); }
  void EmitTelemetry() const;

  // At most once per record, and only when FAULTLINE_BACKTRACE asks for it.
  void CaptureBacktraceIfEnabled() const;

  // One log record at error level with sanitized metadata.
  void Log() const;

 private:
  friend class Context;

  // Used by Context, which dispatches telemetry once after assembling the record.
  struct DeferTelemetry {};
  Error(DeferTelemetry, ErrorCode code, ErrorKind kind);

  Error& Touch();
  Diagnostics& MutableDiagnostics();

  ErrorCode                    code_;
  ErrorKind                    kind_;
  std::optional<std::string>   message_;
  Metadata                     metadata_;
  EditPolicy                   edit_policy_{EditPolicy::kPreserve};
  std::optional<RetryAdvice>   retry_;
  std::optional<std::string>   www_authenticate_;
  std::optional<Details>       details_;
  std::shared_ptr<const Cause> source_;
  std::shared_ptr<const Backtrace> backtrace_;
  std::unique_ptr<Diagnostics>     diagnostics_;

  mutable std::shared_ptr<const Backtrace> captured_backtrace_;
  mutable std::once_flag                   capture_once_;
  mutable telemetry::DirtyFlags            dirty_;
};

} // namespace faultline
