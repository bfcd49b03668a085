#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "internal/util/uuid.hpp"

namespace faultline {

enum class FieldRedaction : std::uint8_t {
  kNone = 0,
  kRedact,
  kHash,
  kLast4,
};

constexpr std::string_view ToString(FieldRedaction redaction) {
  switch (redaction) {
    case FieldRedaction::kRedact:
      return "redact";
    case FieldRedaction::kHash:
      return "hash";
    case FieldRedaction::kLast4:
      return "last4";
    case FieldRedaction::kNone:
    default:
      return "none";
  }
}

/*
  Metadata field name.

  Only constructible from a string literal, so every name lives in static
  storage and can be held as a view.
*/
class FieldName {
 public:
  consteval FieldName(const char* literal) : view_(literal) {
  }

  constexpr std::string_view View() const noexcept {
    return view_;
  }

 private:
  std::string_view view_;
};

/*
  Immutable typed metadata value.
*/
class FieldValue {
 public:
  enum class Type : std::uint8_t {
    kStr = 0,
    kI64,
    kU64,
    kF64,
    kBool,
    kUuid,
    kDuration,
  };

  using Storage = std::variant<std::string, std::int64_t, std::uint64_t, double, bool, util::UUID, std::chrono::nanoseconds>;

  static FieldValue Str(std::string value) {
    return FieldValue(Storage(std::in_place_index<0>, std::move(value)));
  }
  static FieldValue I64(std::int64_t value) {
    return FieldValue(Storage(std::in_place_index<1>, value));
  }
  static FieldValue U64(std::uint64_t value) {
    return FieldValue(Storage(std::in_place_index<2>, value));
  }
  static FieldValue F64(double value) {
    return FieldValue(Storage(std::in_place_index<3>, value));
  }
  static FieldValue Bool(bool value) {
    return FieldValue(Storage(std::in_place_index<4>, value));
  }
  static FieldValue Uuid(const util::UUID& value) {
    return FieldValue(Storage(std::in_place_index<5>, value));
  }
  static FieldValue Duration(std::chrono::nanoseconds value) {
    return FieldValue(Storage(std::in_place_index<6>, value));
  }

  Type GetType() const noexcept {
    return static_cast<Type>(storage_.index());
  }

  const Storage& Raw() const noexcept {
    return storage_;
  }

  const std::string*  AsStr() const noexcept { return std::get_if<0>(&storage_); }
  const std::int64_t* AsI64() const noexcept { return std::get_if<1>(&storage_); }
  const std::uint64_t* AsU64() const noexcept { return std::get_if<2>(&storage_); }
  const double*       AsF64() const noexcept { return std::get_if<3>(&storage_); }
  const bool*         AsBool() const noexcept { return std::get_if<4>(&storage_); }

  // Canonical textual form used by every renderer.
  std::string ToString() const;

  friend bool operator==(const FieldValue& a, const FieldValue& b) {
    return a.storage_ == b.storage_;
  }

 private:
  explicit FieldValue(Storage storage) : storage_(std::move(storage)) {
  }

  Storage storage_;
};

std::string DurationToString(std::chrono::nanoseconds duration);

// Default redaction derived from a field name (password-like, token-like, card-like).
FieldRedaction InferRedaction(std::string_view name) noexcept;

class Field {
 public:
  Field(FieldName name, FieldValue value) : name_(name.View()), value_(std::move(value)), redaction_(InferRedaction(name_)) {
  }

  Field(FieldName name, FieldValue value, FieldRedaction redaction)
      : name_(name.View()), value_(std::move(value)), redaction_(redaction) {
  }

  std::string_view Name() const noexcept {
    return name_;
  }

  const FieldValue& Value() const noexcept {
    return value_;
  }

  FieldRedaction Redaction() const noexcept {
    return redaction_;
  }

  void SetRedaction(FieldRedaction redaction) noexcept {
    redaction_ = redaction;
  }

  Field WithRedaction(FieldRedaction redaction) && {
    redaction_ = redaction;
    return std::move(*this);
  }

 private:
  std::string_view name_;
  FieldValue       value_;
  FieldRedaction   redaction_;
};

namespace field {

inline Field Str(FieldName name, std::string value) {
  return Field(name, FieldValue::Str(std::move(value)));
}
inline Field I64(FieldName name, std::int64_t value) {
  return Field(name, FieldValue::I64(value));
}
inline Field U64(FieldName name, std::uint64_t value) {
  return Field(name, FieldValue::U64(value));
}
inline Field F64(FieldName name, double value) {
  return Field(name, FieldValue::F64(value));
}
inline Field Bool(FieldName name, bool value) {
  return Field(name, FieldValue::Bool(value));
}
inline Field Uuid(FieldName name, const util::UUID& value) {
  return Field(name, FieldValue::Uuid(value));
}
inline Field Duration(FieldName name, std::chrono::nanoseconds value) {
  return Field(name, FieldValue::Duration(value));
}

} // namespace field

} // namespace faultline
