#pragma once

#include <algorithm>
#include <array>
#include <cstdint>
#include <string_view>

#include "internal/error/code.hpp"
#include "internal/error/kind.hpp"

namespace faultline::protocol {

struct GrpcCode {
  std::string_view name;
  std::int32_t     value;
};

struct CodeMapping {
  std::string_view code;
  ErrorKind        kind;
  std::uint16_t    http_status;
  GrpcCode         grpc;
  std::string_view problem_type;
};

inline constexpr std::string_view kProblemTypeBase = "https://errors.faultline.dev/";

// Sorted by code; lookups binary-search it.
inline constexpr std::array<CodeMapping, 22> kCodeMappings = {{
    {"BAD_REQUEST", ErrorKind::kBadRequest, 400, {"INVALID_ARGUMENT", 3}, "https://errors.faultline.dev/bad-request"},
    {"CACHE", ErrorKind::kCache, 500, {"UNAVAILABLE", 14}, "https://errors.faultline.dev/cache"},
    {"CONFIG", ErrorKind::kConfig, 500, {"INTERNAL", 13}, "https://errors.faultline.dev/config"},
    {"CONFLICT", ErrorKind::kConflict, 409, {"ALREADY_EXISTS", 6}, "https://errors.faultline.dev/conflict"},
    {"DATABASE", ErrorKind::kDatabase, 500, {"INTERNAL", 13}, "https://errors.faultline.dev/database"},
    {"DEPENDENCY_UNAVAILABLE", ErrorKind::kDependencyUnavailable, 503, {"UNAVAILABLE", 14}, "https://errors.faultline.dev/dependency-unavailable"},
    {"DESERIALIZATION", ErrorKind::kDeserialization, 500, {"INTERNAL", 13}, "https://errors.faultline.dev/deserialization"},
    {"EXTERNAL_API", ErrorKind::kExternalApi, 500, {"UNAVAILABLE", 14}, "https://errors.faultline.dev/external-api"},
    {"FORBIDDEN", ErrorKind::kForbidden, 403, {"PERMISSION_DENIED", 7}, "https://errors.faultline.dev/forbidden"},
    {"INTERNAL", ErrorKind::kInternal, 500, {"INTERNAL", 13}, "https://errors.faultline.dev/internal"},
    {"INVALID_JWT", ErrorKind::kInvalidJwt, 401, {"UNAUTHENTICATED", 16}, "https://errors.faultline.dev/invalid-jwt"},
    {"NETWORK", ErrorKind::kNetwork, 503, {"UNAVAILABLE", 14}, "https://errors.faultline.dev/network"},
    {"NOT_FOUND", ErrorKind::kNotFound, 404, {"NOT_FOUND", 5}, "https://errors.faultline.dev/not-found"},
    {"NOT_IMPLEMENTED", ErrorKind::kNotImplemented, 501, {"UNIMPLEMENTED", 12}, "https://errors.faultline.dev/not-implemented"},
    {"QUEUE", ErrorKind::kQueue, 500, {"UNAVAILABLE", 14}, "https://errors.faultline.dev/queue"},
    {"RATE_LIMITED", ErrorKind::kRateLimited, 429, {"RESOURCE_EXHAUSTED", 8}, "https://errors.faultline.dev/rate-limited"},
    {"SERIALIZATION", ErrorKind::kSerialization, 500, {"INTERNAL", 13}, "https://errors.faultline.dev/serialization"},
    {"SERVICE", ErrorKind::kService, 500, {"INTERNAL", 13}, "https://errors.faultline.dev/service"},
    {"TIMEOUT", ErrorKind::kTimeout, 504, {"DEADLINE_EXCEEDED", 4}, "https://errors.faultline.dev/timeout"},
    {"UNAUTHORIZED", ErrorKind::kUnauthorized, 401, {"UNAUTHENTICATED", 16}, "https://errors.faultline.dev/unauthorized"},
    {"USER_ALREADY_EXISTS", ErrorKind::kConflict, 409, {"ALREADY_EXISTS", 6}, "https://errors.faultline.dev/user-already-exists"},
    {"VALIDATION", ErrorKind::kValidation, 422, {"INVALID_ARGUMENT", 3}, "https://errors.faultline.dev/validation"},
}};

static_assert(std::is_sorted(kCodeMappings.begin(), kCodeMappings.end(),
                             [](const CodeMapping& a, const CodeMapping& b) { return a.code < b.code; }),
              "kCodeMappings must stay sorted by code");

// Exact entry for `code`, or nullptr for codes outside the built-in set.
const CodeMapping* MappingForCode(std::string_view code) noexcept;

// Exact entry for `code`, else the entry of the kind's canonical code.
const CodeMapping& MappingFor(const ErrorCode& code, ErrorKind kind) noexcept;

} // namespace faultline::protocol
