#pragma once

#include <cstddef>
#include <ostream>
#include <string>

#include "internal/display/display_mode.hpp"
#include "internal/error/error.hpp"

namespace faultline::runtime::config {
class RuntimeConfig;
} // namespace faultline::runtime::config

namespace faultline::render {

inline constexpr std::size_t kDefaultStagingChainDepth = 5;
inline constexpr std::size_t kDefaultLocalChainDepth   = 10;

struct RenderLimits {
  std::size_t staging_chain_depth{kDefaultStagingChainDepth};
  std::size_t local_chain_depth{kDefaultLocalChainDepth};
};

RenderLimits CurrentRenderLimits() noexcept;

// Zero depths are ignored.
void SetRenderLimits(RenderLimits limits) noexcept;

// Applies rendering depth limits and the color preference.
void ConfigureRendering(const runtime::config::RuntimeConfig& config);

/*
  Mode-specific renderers.

  Prod and Staging produce compact JSON objects with lexicographically
  ordered keys; Local produces a labeled text block. None of them fail on
  unserializable details: the details are dropped instead.
*/
std::string RenderProd(const Error& error);
std::string RenderStaging(const Error& error);
std::string RenderLocal(const Error& error, bool color);
std::string RenderLocal(const Error& error);

std::string Render(const Error& error, display::DisplayMode mode);

// Uses the process display mode.
std::string Render(const Error& error);

namespace testing {
void ResetRenderLimits() noexcept;
} // namespace testing

} // namespace faultline::render

namespace faultline {

std::ostream& operator<<(std::ostream& os, const Error& error);

} // namespace faultline
