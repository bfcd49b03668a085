#include "internal/error/error.hpp"

#include "internal/error/redaction.hpp"
#include "internal/observability/logging.hpp"

namespace faultline {

// ------------------------------------------------------------
// Construction
// ------------------------------------------------------------

Error::Error(ErrorKind kind) : Error(ErrorCode::FromKind(kind), kind, std::nullopt) {
}

Error::Error(ErrorKind kind, std::string message) : Error(ErrorCode::FromKind(kind), kind, std::move(message)) {
}

Error::Error(ErrorCode code, ErrorKind kind, std::optional<std::string> message)
    : code_(std::move(code)), kind_(kind), message_(std::move(message)) {
  dirty_.MarkDirty();
  EmitTelemetry();
}

Error::Error(DeferTelemetry, ErrorCode code, ErrorKind kind) : code_(std::move(code)), kind_(kind) {
}

Error::Error(const Error& other)
    : std::exception(other),
      Cause(other),
      code_(other.code_),
      kind_(other.kind_),
      message_(other.message_),
      metadata_(other.metadata_),
      edit_policy_(other.edit_policy_),
      retry_(other.retry_),
      www_authenticate_(other.www_authenticate_),
      details_(other.details_),
      source_(other.source_),
      backtrace_(other.backtrace_),
      diagnostics_(other.diagnostics_ ? std::make_unique<Diagnostics>(*other.diagnostics_) : nullptr),
      captured_backtrace_(other.captured_backtrace_),
      dirty_(other.dirty_) {
}

Error::Error(Error&& other) noexcept
    : std::exception(other),
      Cause(other),
      code_(std::move(other.code_)),
      kind_(other.kind_),
      message_(std::move(other.message_)),
      metadata_(std::move(other.metadata_)),
      edit_policy_(other.edit_policy_),
      retry_(other.retry_),
      www_authenticate_(std::move(other.www_authenticate_)),
      details_(std::move(other.details_)),
      source_(std::move(other.source_)),
      backtrace_(std::move(other.backtrace_)),
      diagnostics_(std::move(other.diagnostics_)),
      captured_backtrace_(std::move(other.captured_backtrace_)),
      dirty_(other.dirty_) {
}

Error& Error::operator=(const Error& other) {
  if (this != &other) {
    Error copy(other);
    *this = std::move(copy);
  }
  return *this;
}

Error& Error::operator=(Error&& other) noexcept {
  if (this != &other) {
    code_               = std::move(other.code_);
    kind_               = other.kind_;
    message_            = std::move(other.message_);
    metadata_           = std::move(other.metadata_);
    edit_policy_        = other.edit_policy_;
    retry_              = other.retry_;
    www_authenticate_   = std::move(other.www_authenticate_);
    details_            = std::move(other.details_);
    source_             = std::move(other.source_);
    backtrace_          = std::move(other.backtrace_);
    diagnostics_        = std::move(other.diagnostics_);
    captured_backtrace_ = std::move(other.captured_backtrace_);
    dirty_              = other.dirty_;
  }
  return *this;
}

Error::~Error() = default;

// ------------------------------------------------------------
// Builders
// ------------------------------------------------------------

Error& Error::Touch() {
  dirty_.MarkDirty();
  EmitTelemetry();
  return *this;
}

Diagnostics& Error::MutableDiagnostics() {
  if (!diagnostics_) {
    diagnostics_ = std::make_unique<Diagnostics>();
  }
  return *diagnostics_;
}

Error& Error::WithField(Field field) & {
  metadata_.Insert(std::move(field));
  return Touch();
}

Error& Error::WithFields(std::vector<Field> fields) & {
  for (auto& field : fields) {
    metadata_.Insert(std::move(field));
  }
  return Touch();
}

Error& Error::RedactField(std::string_view name, FieldRedaction policy) & {
  metadata_.SetRedaction(name, policy);
  return Touch();
}

Error& Error::WithMetadata(Metadata metadata) & {
  metadata_ = std::move(metadata);
  return Touch();
}

Error& Error::WithEditPolicy(EditPolicy policy) & {
  edit_policy_ = policy;
  return Touch();
}

Error& Error::WithMessage(std::string message) & {
  message_ = std::move(message);
  return Touch();
}

Error& Error::WithCode(ErrorCode code) & {
  code_ = std::move(code);
  return Touch();
}

Error& Error::WithKind(ErrorKind kind) & {
  kind_ = kind;
  return Touch();
}

Error& Error::WithRetryAfterSecs(std::uint64_t seconds) & {
  retry_ = RetryAdvice{seconds};
  return Touch();
}

Error& Error::WithWwwAuthenticate(std::string challenge) & {
  www_authenticate_ = std::move(challenge);
  return Touch();
}

Error& Error::AttachOwned(std::unique_ptr<Cause> source) & {
  source_ = std::shared_ptr<const Cause>(std::move(source));
  return Touch();
}

Error& Error::AttachShared(std::shared_ptr<const Cause> source) & {
  source_ = std::move(source);
  return Touch();
}

Error& Error::AttachException(const std::exception& source) & {
  if (const auto* error = dynamic_cast<const Error*>(&source)) {
    source_ = std::make_shared<const Error>(*error);
  } else {
    source_ = std::shared_ptr<const Cause>(ExceptionCause::FromException(source));
  }
  return Touch();
}

Error& Error::WithBacktrace(Backtrace backtrace) & {
  backtrace_ = std::make_shared<const Backtrace>(std::move(backtrace));
  return Touch();
}

Error& Error::WithDetails(google::protobuf::Value details) & {
  details_ = Details::Json(std::move(details));
  return Touch();
}

Error& Error::WithDetailsText(std::string details) & {
  details_ = Details::Text(std::move(details));
  return Touch();
}

Error& Error::WithHint(std::string message, Visibility visibility) & {
  MutableDiagnostics().PushHint(std::move(message), visibility);
  return Touch();
}

Error& Error::WithSuggestion(std::string message, Visibility visibility) & {
  MutableDiagnostics().PushSuggestion(std::move(message), visibility);
  return Touch();
}

Error& Error::WithSuggestionCommand(std::string message, std::string command, Visibility visibility) & {
  MutableDiagnostics().PushSuggestion(std::move(message), std::move(command), visibility);
  return Touch();
}

Error& Error::WithDocs(std::string url, Visibility visibility) & {
  MutableDiagnostics().SetDocLink(std::move(url), visibility);
  return Touch();
}

Error& Error::WithDocsTitled(std::string url, std::string title, Visibility visibility) & {
  MutableDiagnostics().SetDocLink(std::move(url), std::move(title), visibility);
  return Touch();
}

Error& Error::WithRelatedCode(std::string code) & {
  MutableDiagnostics().PushRelatedCode(std::move(code));
  return Touch();
}

// ------------------------------------------------------------
// Accessors
// ------------------------------------------------------------

const Backtrace* Error::GetBacktrace() const noexcept {
  if (backtrace_) {
    return backtrace_.get();
  }
  return captured_backtrace_.get();
}

std::string_view Error::RenderMessage() const noexcept {
  if (message_) {
    return *message_;
  }
  return KindLabel(kind_);
}

std::string_view Error::SafeMessage() const noexcept {
  if (IsRedacted()) {
    return KindLabel(kind_);
  }
  return RenderMessage();
}

const char* Error::what() const noexcept {
  // Kind labels are string literals, so data() is null-terminated.
  if (!IsRedacted() && message_) {
    return message_->c_str();
  }
  return KindLabel(kind_).data();
}

std::string Error::Render() const {
  return std::string(SafeMessage());
}

const Cause* Error::Next() const noexcept {
  return source_.get();
}

// ------------------------------------------------------------
// Telemetry
// ------------------------------------------------------------

void Error::EmitTelemetry() const {
  telemetry::Dispatch(*this, dirty_);
}

void Error::CaptureBacktraceIfEnabled() const {
  if (backtrace_ || captured_backtrace_ || !BacktraceCaptureEnabled()) {
    return;
  }
  std::call_once(capture_once_, [this] { captured_backtrace_ = std::make_shared<const Backtrace>(Backtrace::Capture(3)); });
}

void Error::Log() const {
  EmitTelemetry();

  std::vector<observability::LogField> fields;
  fields.reserve(metadata_.Size() + 3);
  fields.push_back(observability::StringField("kind", KindName(kind_)));
  fields.push_back(observability::StringField("code", code_.View()));
  if (retry_) {
    fields.push_back(observability::UintField("retry_after", retry_->after_seconds));
  }
  for (const auto& field : metadata_) {
    if (auto value = redaction::SanitizedValue(field)) {
      fields.push_back(observability::StringField(field.Name(), *value));
    }
  }

  observability::Log(spdlog::level::err, SafeMessage(), fields);
}

} // namespace faultline
