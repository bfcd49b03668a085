#pragma once

#include <exception>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/error/error.hpp"

namespace faultline {

/*
  Fluent accumulator that promotes a foreign cause into an Error.

  The code follows the category until overridden explicitly. Redaction
  policies apply to fields already collected and to fields added later.

    auto err = Context(ErrorKind::kDatabase)
                   .With(field::Str("table", "users"))
                   .TrackCaller()
                   .IntoError(caught);
*/
class Context {
 public:
  explicit Context(ErrorKind kind) : kind_(kind), code_(ErrorCode::FromKind(kind)) {
  }

  Context& Code(ErrorCode code) &;
  Context  Code(ErrorCode code) && { return std::move(Code(std::move(code))); }

  // Re-derives the code from the new category unless Code() overrode it.
  Context& Category(ErrorKind kind) &;
  Context  Category(ErrorKind kind) && { return std::move(Category(kind)); }

  Context& With(Field field) &;
  Context  With(Field field) && { return std::move(With(std::move(field))); }

  Context& RedactField(std::string_view name, FieldRedaction policy) &;
  Context  RedactField(std::string_view name, FieldRedaction policy) && { return std::move(RedactField(name, policy)); }

  Context& Redact(bool redact) &;
  Context  Redact(bool redact) && { return std::move(Redact(redact)); }

  Context& TrackCaller(std::source_location location = std::source_location::current()) &;
  Context  TrackCaller(std::source_location location = std::source_location::current()) && {
    return std::move(TrackCaller(location));
  }

  // Each call builds an independent record; the context is left untouched.
  Error IntoError() const;
  Error IntoError(std::unique_ptr<Cause> cause) const;
  Error IntoError(std::shared_ptr<const Cause> cause) const;
  Error IntoError(const std::exception& cause) const;

  ErrorKind        GetCategory() const noexcept { return kind_; }
  const ErrorCode& GetCode() const noexcept { return code_; }
  bool             CodeOverridden() const noexcept { return code_overridden_; }
  const std::vector<Field>& Fields() const noexcept { return fields_; }

 private:
  Error Build(std::shared_ptr<const Cause> cause) const;

  ErrorKind                                      kind_;
  ErrorCode                                      code_;
  bool                                           code_overridden_{false};
  std::vector<Field>                             fields_;
  std::vector<std::pair<std::string, FieldRedaction>> policies_;
  EditPolicy                                     edit_policy_{EditPolicy::kPreserve};
  std::optional<std::source_location>            caller_;
};

} // namespace faultline
