#pragma once

#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <vector>

namespace faultline {

// Ordered: an item is shown when item.visibility >= the renderer's minimum.
enum class Visibility : std::uint8_t {
  kDevOnly  = 0,
  kInternal = 1,
  kPublic   = 2,
};

constexpr std::string_view ToString(Visibility visibility) {
  switch (visibility) {
    case Visibility::kInternal:
      return "internal";
    case Visibility::kPublic:
      return "public";
    case Visibility::kDevOnly:
    default:
      return "dev_only";
  }
}

struct Hint {
  std::string message;
  Visibility  visibility{Visibility::kDevOnly};
};

struct Suggestion {
  std::string                message;
  std::optional<std::string> command;
  Visibility                 visibility{Visibility::kDevOnly};
};

struct DocLink {
  std::string                url;
  std::optional<std::string> title;
  Visibility                 visibility{Visibility::kPublic};
};

/*
  Hints, suggestions, a documentation link and related codes attached to
  an error. Visible* queries are lazy views over the stored items.
*/
class Diagnostics {
 public:
  void PushHint(std::string message, Visibility visibility = Visibility::kDevOnly);
  void PushSuggestion(std::string message, Visibility visibility = Visibility::kDevOnly);
  void PushSuggestion(std::string message, std::string command, Visibility visibility = Visibility::kDevOnly);
  void SetDocLink(std::string url, Visibility visibility = Visibility::kPublic);
  void SetDocLink(std::string url, std::string title, Visibility visibility = Visibility::kPublic);
  void PushRelatedCode(std::string code);

  bool IsEmpty() const noexcept;
  bool HasVisibleContent(Visibility minimum) const noexcept;

  auto VisibleHints(Visibility minimum) const {
    return hints_ | std::views::filter([minimum](const Hint& hint) { return hint.visibility >= minimum; });
  }

  auto VisibleSuggestions(Visibility minimum) const {
    return suggestions_ | std::views::filter([minimum](const Suggestion& suggestion) { return suggestion.visibility >= minimum; });
  }

  const DocLink* VisibleDocLink(Visibility minimum) const noexcept;

  const std::vector<Hint>&        Hints() const noexcept { return hints_; }
  const std::vector<Suggestion>&  Suggestions() const noexcept { return suggestions_; }
  const std::optional<DocLink>&   Doc() const noexcept { return doc_link_; }
  const std::vector<std::string>& RelatedCodes() const noexcept { return related_codes_; }

 private:
  std::vector<Hint>        hints_;
  std::vector<Suggestion>  suggestions_;
  std::optional<DocLink>   doc_link_;
  std::vector<std::string> related_codes_;
};

} // namespace faultline
