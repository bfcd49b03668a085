#include "internal/error/diagnostics.hpp"

#include <algorithm>
#include <utility>

namespace faultline {

void Diagnostics::PushHint(std::string message, Visibility visibility) {
  hints_.push_back(Hint{std::move(message), visibility});
}

void Diagnostics::PushSuggestion(std::string message, Visibility visibility) {
  suggestions_.push_back(Suggestion{std::move(message), std::nullopt, visibility});
}

void Diagnostics::PushSuggestion(std::string message, std::string command, Visibility visibility) {
  suggestions_.push_back(Suggestion{std::move(message), std::move(command), visibility});
}

void Diagnostics::SetDocLink(std::string url, Visibility visibility) {
  doc_link_ = DocLink{std::move(url), std::nullopt, visibility};
}

void Diagnostics::SetDocLink(std::string url, std::string title, Visibility visibility) {
  doc_link_ = DocLink{std::move(url), std::move(title), visibility};
}

void Diagnostics::PushRelatedCode(std::string code) {
  related_codes_.push_back(std::move(code));
}

bool Diagnostics::IsEmpty() const noexcept {
  return hints_.empty() && suggestions_.empty() && !doc_link_ && related_codes_.empty();
}

bool Diagnostics::HasVisibleContent(Visibility minimum) const noexcept {
  const auto hint_visible       = std::ranges::any_of(hints_, [minimum](const Hint& h) { return h.visibility >= minimum; });
  const auto suggestion_visible = std::ranges::any_of(suggestions_, [minimum](const Suggestion& s) { return s.visibility >= minimum; });
  return hint_visible || suggestion_visible || VisibleDocLink(minimum) != nullptr;
}

const DocLink* Diagnostics::VisibleDocLink(Visibility minimum) const noexcept {
  if (doc_link_ && doc_link_->visibility >= minimum) {
    return &*doc_link_;
  }
  return nullptr;
}

} // namespace faultline
