#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "internal/error/details.hpp"
#include "internal/error/field.hpp"

namespace faultline::render {

// Largest integer magnitude a JSON number holds without losing precision.
inline constexpr std::uint64_t kMaxSafeJsonInteger = (std::uint64_t{1} << 53);

// Integers beyond 2^53 become decimal strings, non-finite floats become
// null and durations become {"secs","nanos"}.
google::protobuf::Value FieldValueToJson(const FieldValue& value);

// False when any number nested in the value is NaN or infinite.
bool IsSerializable(const google::protobuf::Value& value);

// Details as a JSON value, or nullopt when they cannot be serialized.
std::optional<google::protobuf::Value> DetailsToJson(const Details& details);

void SetString(google::protobuf::Struct* object, std::string_view key, std::string_view value);
void SetNumber(google::protobuf::Struct* object, std::string_view key, double value);

// Compact JSON with keys in lexicographic order. Throws std::runtime_error
// when protobuf rejects the document.
std::string ToJsonString(const google::protobuf::Struct& object);

} // namespace faultline::render
