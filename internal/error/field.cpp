#include "internal/error/field.hpp"

#include <array>

#include <fmt/format.h>

#include "internal/util/strings.hpp"

namespace faultline {

namespace {

using util::ContainsIgnoreCase;
using util::EndsWithIgnoreCase;
using util::EqualsIgnoreCase;

constexpr std::array<std::string_view, 10> kSecretMarkers = {
    "password", "passphrase", "secret", "authorization", "cookie", "session", "jwt", "bearer", "otp", "pin",
};

constexpr std::string_view kSegmentSeparators = "._-:/";

} // namespace

std::string DurationToString(std::chrono::nanoseconds duration) {
  std::string sign;
  auto        count = duration.count();
  if (count < 0) {
    sign  = "-";
    count = -count;
  }

  const auto secs  = count / 1'000'000'000;
  auto       nanos = count % 1'000'000'000;
  if (nanos == 0) {
    return fmt::format("{}{}s", sign, secs);
  }

  auto fraction = fmt::format("{:09d}", nanos);
  while (!fraction.empty() && fraction.back() == '0') {
    fraction.pop_back();
  }
  return fmt::format("{}{}.{}s", sign, secs, fraction);
}

std::string FieldValue::ToString() const {
  switch (GetType()) {
    case Type::kStr:
      return std::get<0>(storage_);
    case Type::kI64:
      return std::to_string(std::get<1>(storage_));
    case Type::kU64:
      return std::to_string(std::get<2>(storage_));
    case Type::kF64:
      return fmt::format("{}", std::get<3>(storage_));
    case Type::kBool:
      return std::get<4>(storage_) ? "true" : "false";
    case Type::kUuid:
      return util::ToString(std::get<5>(storage_));
    case Type::kDuration:
    default:
      return DurationToString(std::get<6>(storage_));
  }
}

FieldRedaction InferRedaction(std::string_view name) noexcept {
  for (auto marker : kSecretMarkers) {
    if (ContainsIgnoreCase(name, marker)) {
      return FieldRedaction::kRedact;
    }
  }

  const bool has_token   = ContainsIgnoreCase(name, "token");
  const bool has_key     = ContainsIgnoreCase(name, "key");
  bool       card_like   = false;
  bool       number_like = false;

  std::size_t start = 0;
  while (start <= name.size()) {
    auto end = name.find_first_of(kSegmentSeparators, start);
    if (end == std::string_view::npos) {
      end = name.size();
    }
    const auto segment = name.substr(start, end - start);
    start              = end + 1;

    if (segment.empty()) {
      continue;
    }

    if (EqualsIgnoreCase(segment, "token") || EqualsIgnoreCase(segment, "apikey") || (EqualsIgnoreCase(segment, "api") && has_key) ||
        EndsWithIgnoreCase(segment, "token") || EqualsIgnoreCase(segment, "key") || (EqualsIgnoreCase(segment, "access") && has_token) ||
        (EqualsIgnoreCase(segment, "refresh") && has_token)) {
      return FieldRedaction::kHash;
    }

    if (EqualsIgnoreCase(segment, "card") || EqualsIgnoreCase(segment, "iban") || EqualsIgnoreCase(segment, "pan") ||
        EqualsIgnoreCase(segment, "account") || EqualsIgnoreCase(segment, "acct")) {
      card_like = true;
    }
    if (EqualsIgnoreCase(segment, "number") || EqualsIgnoreCase(segment, "no") || EqualsIgnoreCase(segment, "id")) {
      number_like = true;
    }
  }

  return card_like && number_like ? FieldRedaction::kLast4 : FieldRedaction::kNone;
}

} // namespace faultline
