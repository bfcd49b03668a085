#include "internal/error/context.hpp"

#include <algorithm>

namespace faultline {

Context& Context::Code(ErrorCode code) & {
  code_            = std::move(code);
  code_overridden_ = true;
  return *this;
}

Context& Context::Category(ErrorKind kind) & {
  kind_ = kind;
  if (!code_overridden_) {
    code_ = ErrorCode::FromKind(kind);
  }
  return *this;
}

Context& Context::With(Field field) & {
  auto policy = std::find_if(policies_.begin(), policies_.end(), [&](const auto& entry) { return entry.first == field.Name(); });
  if (policy != policies_.end()) {
    field.SetRedaction(policy->second);
  }
  fields_.push_back(std::move(field));
  return *this;
}

Context& Context::RedactField(std::string_view name, FieldRedaction policy) & {
  auto existing = std::find_if(policies_.begin(), policies_.end(), [&](const auto& entry) { return entry.first == name; });
  if (existing != policies_.end()) {
    existing->second = policy;
  } else {
    policies_.emplace_back(std::string(name), policy);
  }

  for (auto& field : fields_) {
    if (field.Name() == name) {
      field.SetRedaction(policy);
    }
  }
  return *this;
}

Context& Context::Redact(bool redact) & {
  edit_policy_ = redact ? EditPolicy::kRedact : EditPolicy::kPreserve;
  return *this;
}

Context& Context::TrackCaller(std::source_location location) & {
  caller_ = location;
  return *this;
}

// ------------------------------------------------------------
// Materialization
// ------------------------------------------------------------

Error Context::Build(std::shared_ptr<const Cause> cause) const {
  Error error(Error::DeferTelemetry{}, code_, kind_);

  if (caller_) {
    error.metadata_.Insert(field::Str("caller.file", caller_->file_name()));
    error.metadata_.Insert(field::U64("caller.line", caller_->line()));
    error.metadata_.Insert(field::U64("caller.column", caller_->column()));
  }

  for (const auto& field : fields_) {
    error.metadata_.Insert(field);
  }
  for (const auto& [name, policy] : policies_) {
    error.metadata_.SetRedaction(name, policy);
  }

  error.edit_policy_ = edit_policy_;
  error.source_      = std::move(cause);

  error.dirty_.MarkDirty();
  error.EmitTelemetry();
  return error;
}

Error Context::IntoError() const {
  return Build(nullptr);
}

Error Context::IntoError(std::unique_ptr<Cause> cause) const {
  return Build(std::shared_ptr<const Cause>(std::move(cause)));
}

Error Context::IntoError(std::shared_ptr<const Cause> cause) const {
  return Build(std::move(cause));
}

Error Context::IntoError(const std::exception& cause) const {
  if (const auto* error = dynamic_cast<const Error*>(&cause)) {
    return Build(std::make_shared<const Error>(*error));
  }
  return Build(std::shared_ptr<const Cause>(ExceptionCause::FromException(cause)));
}

} // namespace faultline
