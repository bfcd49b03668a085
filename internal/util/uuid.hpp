#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace faultline::util {

/*
  UUID helpers

  Raw 16 byte RFC4122 UUID carried by uuid metadata fields.
*/

using UUID = std::array<std::uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);
UUID        FromString(const std::string& str);

} // namespace faultline::util
