#include "internal/display/display_mode.hpp"

#include <cassert>
#include <cstdlib>
#include <iostream>

namespace {

using faultline::Visibility;
using faultline::display::ColorPreference;
using faultline::display::DisplayMode;

void ClearEnvironment() {
  ::unsetenv("FAULTLINE_ENV");
  ::unsetenv("KUBERNETES_SERVICE_HOST");
  faultline::display::testing::ResetDisplayModeCache();
}

void TestParseAcceptsAliases() {
  using faultline::display::ParseDisplayMode;
  assert(ParseDisplayMode("prod") == DisplayMode::kProd);
  assert(ParseDisplayMode(" Production ") == DisplayMode::kProd);
  assert(ParseDisplayMode("DEV") == DisplayMode::kLocal);
  assert(ParseDisplayMode("development") == DisplayMode::kLocal);
  assert(ParseDisplayMode("stage") == DisplayMode::kStaging);
  assert(!ParseDisplayMode("qa"));
  assert(!ParseDisplayMode(""));
}

void TestEnvironmentOverrideWins() {
  ClearEnvironment();
  ::setenv("FAULTLINE_ENV", "staging", 1);
  ::setenv("KUBERNETES_SERVICE_HOST", "10.0.0.1", 1);
  assert(faultline::display::DetectDisplayMode() == DisplayMode::kStaging);
  ClearEnvironment();
}

void TestOrchestrationMarkerForcesProd() {
  ClearEnvironment();
  ::setenv("FAULTLINE_ENV", "nonsense", 1);
  ::setenv("KUBERNETES_SERVICE_HOST", "10.0.0.1", 1);
  assert(faultline::display::DetectDisplayMode() == DisplayMode::kProd);
  ClearEnvironment();
}

void TestBuildTypeFallback() {
  ClearEnvironment();
  // Release builds of the library fall back to Prod, debug builds to Local.
  const auto mode = faultline::display::DetectDisplayMode();
  assert(mode == DisplayMode::kProd || mode == DisplayMode::kLocal);
}

void TestCurrentModeIsCachedUntilReset() {
  ClearEnvironment();
  ::setenv("FAULTLINE_ENV", "local", 1);
  assert(faultline::display::CurrentDisplayMode() == DisplayMode::kLocal);

  ::setenv("FAULTLINE_ENV", "prod", 1);
  assert(faultline::display::CurrentDisplayMode() == DisplayMode::kLocal);

  faultline::display::testing::ResetDisplayModeCache();
  assert(faultline::display::CurrentDisplayMode() == DisplayMode::kProd);
  ClearEnvironment();
}

void TestMinimumVisibilityPerMode() {
  assert(faultline::display::MinimumVisibility(DisplayMode::kLocal) == Visibility::kDevOnly);
  assert(faultline::display::MinimumVisibility(DisplayMode::kStaging) == Visibility::kInternal);
  assert(faultline::display::MinimumVisibility(DisplayMode::kProd) == Visibility::kPublic);
}

void TestColorPreference() {
  faultline::display::testing::ResetColorCache();
  ::setenv("NO_COLOR", "1", 1);
  assert(!faultline::display::ColorEnabled());

  faultline::display::SetColorPreference(ColorPreference::kAlways);
  assert(faultline::display::ColorEnabled());
  faultline::display::SetColorPreference(ColorPreference::kNever);
  assert(!faultline::display::ColorEnabled());

  ::unsetenv("NO_COLOR");
  faultline::display::testing::ResetColorCache();
}

} // namespace

int main() {
  TestParseAcceptsAliases();
  TestEnvironmentOverrideWins();
  TestOrchestrationMarkerForcesProd();
  TestBuildTypeFallback();
  TestCurrentModeIsCachedUntilReset();
  TestMinimumVisibilityPerMode();
  TestColorPreference();

  std::cout << "faultline_unit_display_mode: pass\n";
  return 0;
}
