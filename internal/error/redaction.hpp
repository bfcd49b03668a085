#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/error/field.hpp"

namespace faultline::redaction {

inline constexpr std::string_view kRedactedPlaceholder = "[REDACTED]";

// Lowercase hex SHA-256 of `input`.
std::string Sha256Hex(std::string_view input);

// Keeps the last 4 code points (or 1 when the value has 4 or fewer) behind
// one '*' per masked code point.
std::string MaskLast4(std::string_view value);

// SHA-256 used by the Hash policy.
std::string HashFieldValue(const FieldValue& value);

// Value as it may leave the process under the field's redaction:
// raw for None, digest for Hash, masked for Last4, nothing for Redact.
// Booleans cannot be masked and yield nothing under Last4.
std::optional<std::string> SanitizedValue(const Field& field);

} // namespace faultline::redaction
