#pragma once

#include <string>
#include <string_view>

namespace faultline::render {

/*
  Terminal styling for the local renderer.

  Each method wraps a whole token in ANSI escapes when enabled and returns
  it unchanged otherwise. The token text itself is never altered.
*/
class Palette {
 public:
  explicit Palette(bool enabled) : enabled_(enabled) {
  }

  bool Enabled() const noexcept {
    return enabled_;
  }

  std::string KindCritical(std::string_view text) const;
  std::string KindWarning(std::string_view text) const;
  std::string Code(std::string_view text) const;
  std::string Message(std::string_view text) const;
  std::string SourceContext(std::string_view text) const;
  std::string MetadataKey(std::string_view text) const;
  std::string HintLabel(std::string_view text) const;
  std::string HintText(std::string_view text) const;
  std::string SuggestionLabel(std::string_view text) const;
  std::string SuggestionText(std::string_view text) const;
  std::string Command(std::string_view text) const;
  std::string DocsLabel(std::string_view text) const;
  std::string Url(std::string_view text) const;
  std::string RelatedLabel(std::string_view text) const;

 private:
  bool enabled_;
};

} // namespace faultline::render
