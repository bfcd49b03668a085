#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/error/error.hpp"

namespace faultline::protocol {

/*
  Validated HTTP status code (100..599).
*/
class HttpStatus {
 public:
  // Throws a Validation error outside 100..599.
  static HttpStatus FromInt(int value);

  std::uint16_t Value() const noexcept {
    return value_;
  }

  bool IsClientError() const noexcept {
    return value_ >= 400 && value_ < 500;
  }

  bool IsServerError() const noexcept {
    return value_ >= 500;
  }

  friend bool operator==(HttpStatus a, HttpStatus b) noexcept {
    return a.value_ == b.value_;
  }

 private:
  explicit HttpStatus(std::uint16_t value) noexcept : value_(value) {
  }

  std::uint16_t value_;
};

// Status of the record's kind.
HttpStatus HttpStatusFor(const Error& error);

// Value for a Retry-After header, in seconds.
std::optional<std::string> RetryAfterHeader(const Error& error);

std::optional<std::string> WwwAuthenticateHeader(const Error& error);

} // namespace faultline::protocol
