#pragma once

#include <compare>
#include <memory>
#include <ostream>
#include <string>
#include <string_view>

#include "internal/error/kind.hpp"

namespace faultline {

namespace codes {
inline constexpr std::string_view kNotFound              = "NOT_FOUND";
inline constexpr std::string_view kValidation            = "VALIDATION";
inline constexpr std::string_view kConflict              = "CONFLICT";
inline constexpr std::string_view kUserAlreadyExists     = "USER_ALREADY_EXISTS";
inline constexpr std::string_view kUnauthorized          = "UNAUTHORIZED";
inline constexpr std::string_view kForbidden             = "FORBIDDEN";
inline constexpr std::string_view kNotImplemented        = "NOT_IMPLEMENTED";
inline constexpr std::string_view kBadRequest            = "BAD_REQUEST";
inline constexpr std::string_view kRateLimited           = "RATE_LIMITED";
inline constexpr std::string_view kInvalidJwt            = "INVALID_JWT";
inline constexpr std::string_view kInternal              = "INTERNAL";
inline constexpr std::string_view kDatabase              = "DATABASE";
inline constexpr std::string_view kService               = "SERVICE";
inline constexpr std::string_view kConfig                = "CONFIG";
inline constexpr std::string_view kTimeout               = "TIMEOUT";
inline constexpr std::string_view kNetwork               = "NETWORK";
inline constexpr std::string_view kDependencyUnavailable = "DEPENDENCY_UNAVAILABLE";
inline constexpr std::string_view kSerialization         = "SERIALIZATION";
inline constexpr std::string_view kDeserialization       = "DESERIALIZATION";
inline constexpr std::string_view kExternalApi           = "EXTERNAL_API";
inline constexpr std::string_view kQueue                 = "QUEUE";
inline constexpr std::string_view kCache                 = "CACHE";
} // namespace codes

/*
  Stable machine-readable error code (SCREAMING_SNAKE_CASE).

  Built-in codes reference static storage; parsed codes share one heap
  string across copies.
*/
class ErrorCode {
 public:
  ErrorCode() noexcept : view_(codes::kInternal) {
  }

  // `literal` must outlive every copy of the code; meant for constants.
  static ErrorCode Static(std::string_view literal) noexcept {
    return ErrorCode(literal);
  }

  static ErrorCode FromKind(ErrorKind kind) noexcept;

  // Throws a Validation error when `text` is not a well-formed code.
  static ErrorCode Parse(std::string_view text);

  static bool IsValid(std::string_view text) noexcept;

  std::string_view View() const noexcept {
    return view_;
  }

  std::string ToString() const {
    return std::string(view_);
  }

  friend bool operator==(const ErrorCode& a, const ErrorCode& b) noexcept {
    return a.view_ == b.view_;
  }

  friend std::strong_ordering operator<=>(const ErrorCode& a, const ErrorCode& b) noexcept {
    return a.view_ <=> b.view_;
  }

  friend bool operator==(const ErrorCode& a, std::string_view b) noexcept {
    return a.view_ == b;
  }

 private:
  explicit ErrorCode(std::string_view view) noexcept : view_(view) {
  }

  std::string_view                   view_;
  std::shared_ptr<const std::string> owned_;
};

std::ostream& operator<<(std::ostream& out, const ErrorCode& code);

} // namespace faultline
