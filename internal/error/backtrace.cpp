#include "internal/error/backtrace.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <memory>

#if defined(__linux__) || defined(__APPLE__)
#include <execinfo.h>
#define FAULTLINE_HAS_EXECINFO 1
#endif

#include <fmt/format.h>

#include "internal/util/strings.hpp"

namespace faultline {

namespace {

constexpr std::uint8_t kToggleUnset    = 0;
constexpr std::uint8_t kToggleEnabled  = 1;
constexpr std::uint8_t kToggleDisabled = 2;

std::atomic<std::uint8_t> g_backtrace_toggle{kToggleUnset};

} // namespace

Backtrace Backtrace::Capture(std::size_t skip) {
#ifdef FAULTLINE_HAS_EXECINFO
  void*     buffer[kMaxFrames + 8];
  const int frame_count = ::backtrace(buffer, static_cast<int>(kMaxFrames + 8));

  // Skip this function.
  const std::size_t first = std::min<std::size_t>(skip + 1, static_cast<std::size_t>(frame_count));

  std::vector<void*> frames;
  for (std::size_t i = first; i < static_cast<std::size_t>(frame_count) && frames.size() < kMaxFrames; ++i) {
    frames.push_back(buffer[i]);
  }
  return Backtrace(std::move(frames));
#else
  (void)skip;
  return Backtrace();
#endif
}

std::vector<std::string> Backtrace::Symbolize() const {
  std::vector<std::string> symbols;
  if (frames_.empty()) {
    return symbols;
  }

#ifdef FAULTLINE_HAS_EXECINFO
  std::unique_ptr<char*, decltype(&std::free)> names(
      ::backtrace_symbols(const_cast<void* const*>(frames_.data()), static_cast<int>(frames_.size())), &std::free);
  if (names) {
    symbols.reserve(frames_.size());
    for (std::size_t i = 0; i < frames_.size(); ++i) {
      symbols.emplace_back(names.get()[i]);
    }
    return symbols;
  }
#endif

  for (const auto* frame : frames_) {
    symbols.push_back(fmt::format("{}", fmt::ptr(frame)));
  }
  return symbols;
}

std::string Backtrace::ToString() const {
  std::string out;
  const auto  symbols = Symbolize();
  for (std::size_t i = 0; i < symbols.size(); ++i) {
    out += fmt::format("{:>4}: {}\n", i, symbols[i]);
  }
  return out;
}

bool ParseBacktraceToggle(std::string_view value) noexcept {
  const auto trimmed = util::Trim(value);
  if (trimmed.empty()) {
    return false;
  }

  return !util::EqualsIgnoreCase(trimmed, "0") && !util::EqualsIgnoreCase(trimmed, "off") && !util::EqualsIgnoreCase(trimmed, "false");
}

bool BacktraceCaptureEnabled() noexcept {
  const auto cached = g_backtrace_toggle.load(std::memory_order_acquire);
  if (cached != kToggleUnset) {
    return cached == kToggleEnabled;
  }

  const char* raw     = std::getenv("FAULTLINE_BACKTRACE");
  const bool  enabled = raw != nullptr && ParseBacktraceToggle(raw);
  g_backtrace_toggle.store(enabled ? kToggleEnabled : kToggleDisabled, std::memory_order_release);
  return enabled;
}

namespace testing {

void ResetBacktracePreference() noexcept {
  g_backtrace_toggle.store(kToggleUnset, std::memory_order_release);
}

} // namespace testing

} // namespace faultline
