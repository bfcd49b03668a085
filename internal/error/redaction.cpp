#include "internal/error/redaction.hpp"

#include <bit>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <variant>

#include <openssl/evp.h>

namespace faultline::redaction {

std::string Sha256Hex(std::string_view input) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  unsigned char                                           digest[EVP_MAX_MD_SIZE];
  unsigned int                                            digest_len = 0;

  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 || EVP_DigestUpdate(ctx.get(), input.data(), input.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
    throw std::runtime_error("SHA-256 digest failed");
  }

  std::string out;
  out.reserve(digest_len * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[(digest[i] >> 4) & 0x0F]);
    out.push_back(kHex[digest[i] & 0x0F]);
  }
  return out;
}

namespace {

bool IsContinuationByte(char c) noexcept {
  return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::size_t CountCodePoints(std::string_view value) noexcept {
  std::size_t count = 0;
  for (char c : value) {
    if (!IsContinuationByte(c)) {
      ++count;
    }
  }
  return count;
}

// Byte offset where the last `n` code points begin.
std::size_t TailOffset(std::string_view value, std::size_t n) noexcept {
  std::size_t offset = value.size();
  while (n > 0 && offset > 0) {
    --offset;
    while (offset > 0 && IsContinuationByte(value[offset])) {
      --offset;
    }
    --n;
  }
  return offset;
}

void AppendLittleEndian(std::string& out, std::uint64_t value, std::size_t width) {
  for (std::size_t i = 0; i < width; ++i) {
    out.push_back(static_cast<char>((value >> (8 * i)) & 0xFF));
  }
}

// Floats and durations digest their binary little-endian form; everything
// else digests its canonical text.
std::string HashInput(const FieldValue& value) {
  std::string bytes;
  switch (value.GetType()) {
    case FieldValue::Type::kF64:
      AppendLittleEndian(bytes, std::bit_cast<std::uint64_t>(*value.AsF64()), 8);
      return bytes;
    case FieldValue::Type::kDuration: {
      const auto duration = std::get<std::chrono::nanoseconds>(value.Raw());
      const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
      const auto nanos    = (duration - seconds).count();
      AppendLittleEndian(bytes, static_cast<std::uint64_t>(seconds.count()), 8);
      AppendLittleEndian(bytes, static_cast<std::uint64_t>(nanos), 4);
      return bytes;
    }
    default:
      return value.ToString();
  }
}

} // namespace

std::string MaskLast4(std::string_view value) {
  const std::size_t total = CountCodePoints(value);
  if (total == 0) {
    return {};
  }

  const std::size_t keep   = total <= 4 ? 1 : 4;
  const std::size_t offset = TailOffset(value, keep);
  std::string       out(total - keep, '*');
  out.append(value.substr(offset));
  return out;
}

std::string HashFieldValue(const FieldValue& value) {
  return Sha256Hex(HashInput(value));
}

std::optional<std::string> SanitizedValue(const Field& field) {
  switch (field.Redaction()) {
    case FieldRedaction::kNone:
      return field.Value().ToString();
    case FieldRedaction::kHash:
      return HashFieldValue(field.Value());
    case FieldRedaction::kLast4:
      if (field.Value().GetType() == FieldValue::Type::kBool) {
        return std::nullopt;
      }
      return MaskLast4(field.Value().ToString());
    case FieldRedaction::kRedact:
    default:
      return std::nullopt;
  }
}

} // namespace faultline::redaction
