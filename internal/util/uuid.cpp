#include "uuid.hpp"

#include <random>
#include <stdexcept>

namespace faultline::util {

namespace {

int HexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

} // namespace

UUID GenerateUUID() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  UUID id{};
  for (auto& b : id)
    b = static_cast<std::uint8_t>(rng());

  // RFC4122 variant + version 4
  id[6] = (id[6] & 0x0F) | 0x40;
  id[8] = (id[8] & 0x3F) | 0x80;

  return id;
}

std::string ToString(const UUID& id) {
  static constexpr char kHex[] = "0123456789abcdef";

  std::string out;
  out.reserve(36);
  for (std::size_t i = 0; i < id.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) out.push_back('-');
    out.push_back(kHex[(id[i] >> 4) & 0x0F]);
    out.push_back(kHex[id[i] & 0x0F]);
  }
  return out;
}

UUID FromString(const std::string& str) {
  std::string hex;
  for (char c : str)
    if (c != '-') hex += c;

  if (hex.size() != 32)
    throw std::runtime_error("Invalid UUID string");

  UUID id{};
  for (std::size_t i = 0; i < 16; ++i) {
    const int hi = HexDigit(hex[i * 2]);
    const int lo = HexDigit(hex[i * 2 + 1]);
    if (hi < 0 || lo < 0)
      throw std::runtime_error("Invalid UUID string");
    id[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }

  return id;
}

} // namespace faultline::util
