#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace faultline {

/*
  Semantic category of an error.

  Variants may be added but never removed; names and labels are part of
  the rendered wire shape.
*/
enum class ErrorKind : std::uint8_t {
  kNotFound = 0,
  kValidation,
  kConflict,
  kUnauthorized,
  kForbidden,
  kNotImplemented,
  kInternal,
  kBadRequest,
  kInvalidJwt,
  kDatabase,
  kService,
  kConfig,
  kTimeout,
  kNetwork,
  kRateLimited,
  kDependencyUnavailable,
  kSerialization,
  kDeserialization,
  kExternalApi,
  kQueue,
  kCache,
};

inline constexpr std::array<ErrorKind, 21> kAllErrorKinds = {
    ErrorKind::kNotFound,      ErrorKind::kValidation,     ErrorKind::kConflict,
    ErrorKind::kUnauthorized,  ErrorKind::kForbidden,      ErrorKind::kNotImplemented,
    ErrorKind::kInternal,      ErrorKind::kBadRequest,     ErrorKind::kInvalidJwt,
    ErrorKind::kDatabase,      ErrorKind::kService,        ErrorKind::kConfig,
    ErrorKind::kTimeout,       ErrorKind::kNetwork,        ErrorKind::kRateLimited,
    ErrorKind::kDependencyUnavailable, ErrorKind::kSerialization, ErrorKind::kDeserialization,
    ErrorKind::kExternalApi,   ErrorKind::kQueue,          ErrorKind::kCache,
};

// Stable identifier used as the "kind" key and as the telemetry category label.
std::string_view KindName(ErrorKind kind) noexcept;

// Human label, also the fallback whenever a message is required but absent or redacted.
std::string_view KindLabel(ErrorKind kind) noexcept;

std::uint16_t KindHttpStatus(ErrorKind kind) noexcept;

inline bool IsCritical(ErrorKind kind) noexcept {
  return KindHttpStatus(kind) >= 500;
}

} // namespace faultline
