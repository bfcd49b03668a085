#include "internal/error/kind.hpp"

namespace faultline {

std::string_view KindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "NotFound";
    case ErrorKind::kValidation:
      return "Validation";
    case ErrorKind::kConflict:
      return "Conflict";
    case ErrorKind::kUnauthorized:
      return "Unauthorized";
    case ErrorKind::kForbidden:
      return "Forbidden";
    case ErrorKind::kNotImplemented:
      return "NotImplemented";
    case ErrorKind::kBadRequest:
      return "BadRequest";
    case ErrorKind::kInvalidJwt:
      return "InvalidJwt";
    case ErrorKind::kDatabase:
      return "Database";
    case ErrorKind::kService:
      return "Service";
    case ErrorKind::kConfig:
      return "Config";
    case ErrorKind::kTimeout:
      return "Timeout";
    case ErrorKind::kNetwork:
      return "Network";
    case ErrorKind::kRateLimited:
      return "RateLimited";
    case ErrorKind::kDependencyUnavailable:
      return "DependencyUnavailable";
    case ErrorKind::kSerialization:
      return "Serialization";
    case ErrorKind::kDeserialization:
      return "Deserialization";
    case ErrorKind::kExternalApi:
      return "ExternalApi";
    case ErrorKind::kQueue:
      return "Queue";
    case ErrorKind::kCache:
      return "Cache";
    case ErrorKind::kInternal:
    default:
      return "Internal";
  }
}

std::string_view KindLabel(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNotFound:
      return "Not found";
    case ErrorKind::kValidation:
      return "Validation error";
    case ErrorKind::kConflict:
      return "Conflict";
    case ErrorKind::kUnauthorized:
      return "Unauthorized";
    case ErrorKind::kForbidden:
      return "Forbidden";
    case ErrorKind::kNotImplemented:
      return "Not implemented";
    case ErrorKind::kBadRequest:
      return "Bad request";
    case ErrorKind::kInvalidJwt:
      return "Invalid JWT";
    case ErrorKind::kDatabase:
      return "Database error";
    case ErrorKind::kService:
      return "Service error";
    case ErrorKind::kConfig:
      return "Configuration error";
    case ErrorKind::kTimeout:
      return "Operation timed out";
    case ErrorKind::kNetwork:
      return "Network error";
    case ErrorKind::kRateLimited:
      return "Rate limit exceeded";
    case ErrorKind::kDependencyUnavailable:
      return "External dependency unavailable";
    case ErrorKind::kSerialization:
      return "Serialization error";
    case ErrorKind::kDeserialization:
      return "Deserialization error";
    case ErrorKind::kExternalApi:
      return "External API error";
    case ErrorKind::kQueue:
      return "Queue processing error";
    case ErrorKind::kCache:
      return "Cache error";
    case ErrorKind::kInternal:
    default:
      return "Internal server error";
  }
}

std::uint16_t KindHttpStatus(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNotFound:
      return 404;
    case ErrorKind::kValidation:
      return 422;
    case ErrorKind::kConflict:
      return 409;
    case ErrorKind::kUnauthorized:
    case ErrorKind::kInvalidJwt:
      return 401;
    case ErrorKind::kForbidden:
      return 403;
    case ErrorKind::kNotImplemented:
      return 501;
    case ErrorKind::kBadRequest:
      return 400;
    case ErrorKind::kRateLimited:
      return 429;
    case ErrorKind::kTimeout:
      return 504;
    case ErrorKind::kNetwork:
    case ErrorKind::kDependencyUnavailable:
      return 503;
    default:
      return 500;
  }
}

} // namespace faultline
