#include "internal/error/diagnostics.hpp"
#include "internal/error/error.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using faultline::Diagnostics;
using faultline::Visibility;

template <typename View>
std::vector<std::string> Messages(View&& view) {
  std::vector<std::string> out;
  for (const auto& item : view) {
    out.push_back(item.message);
  }
  return out;
}

void TestVisibilityFiltering() {
  Diagnostics diagnostics;
  assert(diagnostics.IsEmpty());

  diagnostics.PushHint("dev hint");
  diagnostics.PushHint("internal hint", Visibility::kInternal);
  diagnostics.PushHint("public hint", Visibility::kPublic);
  assert(!diagnostics.IsEmpty());

  assert(Messages(diagnostics.VisibleHints(Visibility::kDevOnly)).size() == 3);
  assert(Messages(diagnostics.VisibleHints(Visibility::kInternal)) == (std::vector<std::string>{"internal hint", "public hint"}));
  assert(Messages(diagnostics.VisibleHints(Visibility::kPublic)) == std::vector<std::string>{"public hint"});
}

void TestSuggestionsKeepOptionalCommand() {
  Diagnostics diagnostics;
  diagnostics.PushSuggestion("retry later");
  diagnostics.PushSuggestion("run migrations", "make migrate", Visibility::kInternal);

  assert(diagnostics.Suggestions().size() == 2);
  assert(!diagnostics.Suggestions()[0].command);
  assert(*diagnostics.Suggestions()[1].command == "make migrate");
  assert(Messages(diagnostics.VisibleSuggestions(Visibility::kInternal)) == std::vector<std::string>{"run migrations"});
  assert(!diagnostics.HasVisibleContent(Visibility::kPublic));
  assert(diagnostics.HasVisibleContent(Visibility::kInternal));
}

void TestDocLinkDefaultsToPublic() {
  Diagnostics diagnostics;
  diagnostics.SetDocLink("https://docs.example/errors");
  assert(diagnostics.VisibleDocLink(Visibility::kPublic) != nullptr);
  assert(!diagnostics.Doc()->title);

  diagnostics.SetDocLink("https://docs.example/internal", "Runbook", Visibility::kInternal);
  assert(diagnostics.VisibleDocLink(Visibility::kPublic) == nullptr);
  assert(diagnostics.VisibleDocLink(Visibility::kInternal)->url == "https://docs.example/internal");
  assert(*diagnostics.Doc()->title == "Runbook");

  diagnostics.PushRelatedCode("NOT_FOUND");
  assert(diagnostics.RelatedCodes() == std::vector<std::string>{"NOT_FOUND"});
}

void TestErrorBuildersCollectDiagnostics() {
  auto error = faultline::Error::Internal("boom")
                   .WithHint("check the logs")
                   .WithSuggestionCommand("restart", "systemctl restart app")
                   .WithDocs("https://docs.example/internal")
                   .WithRelatedCode("SERVICE");

  const auto* diagnostics = error.GetDiagnostics();
  assert(diagnostics != nullptr);
  assert(diagnostics->Hints().size() == 1);
  assert(diagnostics->Suggestions().size() == 1);
  assert(diagnostics->VisibleDocLink(Visibility::kPublic) != nullptr);

  // Copies do not share the diagnostics bundle.
  auto copy = error;
  copy.WithHint("only on the copy");
  assert(error.GetDiagnostics()->Hints().size() == 1);
  assert(copy.GetDiagnostics()->Hints().size() == 2);

  assert(faultline::Error::Internal("plain").GetDiagnostics() == nullptr);
}

} // namespace

int main() {
  TestVisibilityFiltering();
  TestSuggestionsKeepOptionalCommand();
  TestDocLinkDefaultsToPublic();
  TestErrorBuildersCollectDiagnostics();

  std::cout << "faultline_unit_diagnostics: pass\n";
  return 0;
}
