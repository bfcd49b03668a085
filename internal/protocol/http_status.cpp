#include "internal/protocol/http_status.hpp"

namespace faultline::protocol {

HttpStatus HttpStatus::FromInt(int value) {
  if (value < 100 || value > 599) {
    throw Error::Validation("invalid HTTP status").WithField(field::I64("status", value));
  }
  return HttpStatus(static_cast<std::uint16_t>(value));
}

HttpStatus HttpStatusFor(const Error& error) {
  return HttpStatus::FromInt(KindHttpStatus(error.Kind()));
}

std::optional<std::string> RetryAfterHeader(const Error& error) {
  if (!error.Retry()) {
    return std::nullopt;
  }
  return std::to_string(error.Retry()->after_seconds);
}

std::optional<std::string> WwwAuthenticateHeader(const Error& error) {
  return error.WwwAuthenticate();
}

} // namespace faultline::protocol
