#pragma once

#include <string_view>

namespace faultline::util {

// ASCII-only helpers for environment values and field names.

std::string_view Trim(std::string_view value) noexcept;

char ToLowerAscii(char c) noexcept;

bool EqualsIgnoreCase(std::string_view a, std::string_view b) noexcept;
bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) noexcept;
bool EndsWithIgnoreCase(std::string_view value, std::string_view suffix) noexcept;

} // namespace faultline::util
