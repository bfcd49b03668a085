#include "internal/display/display_mode.hpp"

#include <atomic>
#include <cstdlib>
#include <cstdio>

#include <spdlog/details/os.h>

#include "internal/util/strings.hpp"

namespace faultline::display {

namespace {

constexpr std::uint8_t kUnset = 255;

std::atomic<std::uint8_t> g_display_mode{kUnset};
std::atomic<std::uint8_t> g_color_enabled{kUnset};
std::atomic<std::uint8_t> g_color_preference{static_cast<std::uint8_t>(ColorPreference::kAuto)};

using util::EqualsIgnoreCase;

} // namespace

std::optional<DisplayMode> ParseDisplayMode(std::string_view value) noexcept {
  const auto trimmed = util::Trim(value);
  if (EqualsIgnoreCase(trimmed, "prod") || EqualsIgnoreCase(trimmed, "production")) {
    return DisplayMode::kProd;
  }
  if (EqualsIgnoreCase(trimmed, "local") || EqualsIgnoreCase(trimmed, "dev") || EqualsIgnoreCase(trimmed, "development")) {
    return DisplayMode::kLocal;
  }
  if (EqualsIgnoreCase(trimmed, "staging") || EqualsIgnoreCase(trimmed, "stage")) {
    return DisplayMode::kStaging;
  }
  return std::nullopt;
}

DisplayMode DetectDisplayMode() {
  if (const char* env = std::getenv("FAULTLINE_ENV")) {
    if (auto mode = ParseDisplayMode(env)) {
      return *mode;
    }
  }

  if (std::getenv("KUBERNETES_SERVICE_HOST") != nullptr) {
    return DisplayMode::kProd;
  }

#ifdef NDEBUG
  return DisplayMode::kProd;
#else
  return DisplayMode::kLocal;
#endif
}

DisplayMode CurrentDisplayMode() {
  const auto cached = g_display_mode.load(std::memory_order_acquire);
  if (cached != kUnset) {
    return static_cast<DisplayMode>(cached);
  }

  const auto mode = DetectDisplayMode();
  g_display_mode.store(static_cast<std::uint8_t>(mode), std::memory_order_release);
  return mode;
}

void SetColorPreference(ColorPreference preference) noexcept {
  g_color_preference.store(static_cast<std::uint8_t>(preference), std::memory_order_release);
}

bool ColorEnabled() {
  switch (static_cast<ColorPreference>(g_color_preference.load(std::memory_order_acquire))) {
    case ColorPreference::kAlways:
      return true;
    case ColorPreference::kNever:
      return false;
    case ColorPreference::kAuto:
    default:
      break;
  }

  const auto cached = g_color_enabled.load(std::memory_order_acquire);
  if (cached != kUnset) {
    return cached == 1;
  }

  const bool enabled =
      std::getenv("NO_COLOR") == nullptr && spdlog::details::os::in_terminal(stdout) && spdlog::details::os::is_color_terminal();
  g_color_enabled.store(enabled ? 1 : 0, std::memory_order_release);
  return enabled;
}

namespace testing {

void ResetDisplayModeCache() noexcept {
  g_display_mode.store(kUnset, std::memory_order_release);
}

void ResetColorCache() noexcept {
  g_color_enabled.store(kUnset, std::memory_order_release);
  g_color_preference.store(static_cast<std::uint8_t>(ColorPreference::kAuto), std::memory_order_release);
}

} // namespace testing

} // namespace faultline::display
