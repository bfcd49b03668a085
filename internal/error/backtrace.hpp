#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace faultline {

/*
  Captured stack snapshot. Frames are raw return addresses; symbol names
  are resolved only when the backtrace is rendered.
*/
class Backtrace {
 public:
  static constexpr std::size_t kMaxFrames = 64;

  Backtrace() = default;
  explicit Backtrace(std::vector<void*> frames) : frames_(std::move(frames)) {
  }

  // Skips this function and `skip` additional callers.
  static Backtrace Capture(std::size_t skip = 0);

  const std::vector<void*>& Frames() const noexcept {
    return frames_;
  }

  bool Empty() const noexcept {
    return frames_.empty();
  }

  std::vector<std::string> Symbolize() const;
  std::string              ToString() const;

 private:
  std::vector<void*> frames_;
};

// Absent, empty, "0", "off" and "false" (trimmed, any case) disable capture.
bool ParseBacktraceToggle(std::string_view value) noexcept;

// Reads FAULTLINE_BACKTRACE once and caches the answer for the process.
bool BacktraceCaptureEnabled() noexcept;

namespace testing {
void ResetBacktracePreference() noexcept;
}

} // namespace faultline
