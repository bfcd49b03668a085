#include "internal/error/code.hpp"

#include "internal/error/error.hpp"

namespace faultline {

ErrorCode ErrorCode::FromKind(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNotFound:
      return ErrorCode(codes::kNotFound);
    case ErrorKind::kValidation:
      return ErrorCode(codes::kValidation);
    case ErrorKind::kConflict:
      return ErrorCode(codes::kConflict);
    case ErrorKind::kUnauthorized:
      return ErrorCode(codes::kUnauthorized);
    case ErrorKind::kForbidden:
      return ErrorCode(codes::kForbidden);
    case ErrorKind::kNotImplemented:
      return ErrorCode(codes::kNotImplemented);
    case ErrorKind::kBadRequest:
      return ErrorCode(codes::kBadRequest);
    case ErrorKind::kInvalidJwt:
      return ErrorCode(codes::kInvalidJwt);
    case ErrorKind::kDatabase:
      return ErrorCode(codes::kDatabase);
    case ErrorKind::kService:
      return ErrorCode(codes::kService);
    case ErrorKind::kConfig:
      return ErrorCode(codes::kConfig);
    case ErrorKind::kTimeout:
      return ErrorCode(codes::kTimeout);
    case ErrorKind::kNetwork:
      return ErrorCode(codes::kNetwork);
    case ErrorKind::kRateLimited:
      return ErrorCode(codes::kRateLimited);
    case ErrorKind::kDependencyUnavailable:
      return ErrorCode(codes::kDependencyUnavailable);
    case ErrorKind::kSerialization:
      return ErrorCode(codes::kSerialization);
    case ErrorKind::kDeserialization:
      return ErrorCode(codes::kDeserialization);
    case ErrorKind::kExternalApi:
      return ErrorCode(codes::kExternalApi);
    case ErrorKind::kQueue:
      return ErrorCode(codes::kQueue);
    case ErrorKind::kCache:
      return ErrorCode(codes::kCache);
    case ErrorKind::kInternal:
    default:
      return ErrorCode(codes::kInternal);
  }
}

bool ErrorCode::IsValid(std::string_view text) noexcept {
  if (text.empty() || text.front() == '_' || text.back() == '_') {
    return false;
  }

  char previous = '\0';
  for (char c : text) {
    const bool upper = c >= 'A' && c <= 'Z';
    const bool digit = c >= '0' && c <= '9';
    if (!upper && !digit && c != '_') {
      return false;
    }
    if (c == '_' && previous == '_') {
      return false;
    }
    previous = c;
  }
  return true;
}

ErrorCode ErrorCode::Parse(std::string_view text) {
  if (!IsValid(text)) {
    throw Error::Validation("invalid error code").WithField(field::Str("code", std::string(text)));
  }

  ErrorCode code;
  code.owned_ = std::make_shared<const std::string>(text);
  code.view_  = *code.owned_;
  return code;
}

std::ostream& operator<<(std::ostream& out, const ErrorCode& code) {
  return out << code.View();
}

} // namespace faultline
