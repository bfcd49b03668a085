#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

#include "internal/error/diagnostics.hpp"

namespace faultline::display {

enum class DisplayMode : std::uint8_t {
  kProd = 0,
  kLocal,
  kStaging,
};

constexpr std::string_view ToString(DisplayMode mode) {
  switch (mode) {
    case DisplayMode::kLocal:
      return "local";
    case DisplayMode::kStaging:
      return "staging";
    case DisplayMode::kProd:
    default:
      return "prod";
  }
}

// Lowest diagnostic tier a mode shows.
constexpr Visibility MinimumVisibility(DisplayMode mode) {
  switch (mode) {
    case DisplayMode::kLocal:
      return Visibility::kDevOnly;
    case DisplayMode::kStaging:
      return Visibility::kInternal;
    case DisplayMode::kProd:
    default:
      return Visibility::kPublic;
  }
}

// "prod"/"production", "local"/"dev"/"development", "staging"/"stage";
// trimmed, any case. Anything else is unrecognized.
std::optional<DisplayMode> ParseDisplayMode(std::string_view value) noexcept;

// FAULTLINE_ENV, then KUBERNETES_SERVICE_HOST, then the build type
// (NDEBUG selects Prod). Not cached.
DisplayMode DetectDisplayMode();

// DetectDisplayMode() computed once per process.
DisplayMode CurrentDisplayMode();

enum class ColorPreference : std::uint8_t {
  kAuto = 0,
  kAlways,
  kNever,
};

void SetColorPreference(ColorPreference preference) noexcept;

// NO_COLOR disables; otherwise stdout must be a color-capable terminal.
// Cached once per process unless a preference forces the answer.
bool ColorEnabled();

namespace testing {
void ResetDisplayModeCache() noexcept;
void ResetColorCache() noexcept;
} // namespace testing

} // namespace faultline::display
