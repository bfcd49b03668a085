#include "internal/render/style.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

namespace faultline::render {

namespace {

std::string Paint(bool enabled, const fmt::text_style& style, std::string_view text) {
  if (!enabled) {
    return std::string(text);
  }
  return fmt::format(style, "{}", text);
}

} // namespace

std::string Palette::KindCritical(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::red) | fmt::emphasis::bold, text);
}

std::string Palette::KindWarning(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::yellow), text);
}

std::string Palette::Code(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::cyan), text);
}

std::string Palette::Message(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::bright_white), text);
}

std::string Palette::SourceContext(std::string_view text) const {
  return Paint(enabled_, fmt::text_style(fmt::emphasis::faint), text);
}

std::string Palette::MetadataKey(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::green), text);
}

std::string Palette::HintLabel(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::blue), text);
}

std::string Palette::HintText(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::bright_blue), text);
}

std::string Palette::SuggestionLabel(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::magenta), text);
}

std::string Palette::SuggestionText(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::bright_magenta), text);
}

std::string Palette::Command(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::green) | fmt::emphasis::bold, text);
}

std::string Palette::DocsLabel(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::cyan), text);
}

std::string Palette::Url(std::string_view text) const {
  return Paint(enabled_, fmt::fg(fmt::terminal_color::blue) | fmt::emphasis::underline, text);
}

std::string Palette::RelatedLabel(std::string_view text) const {
  return Paint(enabled_, fmt::text_style(fmt::emphasis::faint), text);
}

} // namespace faultline::render
