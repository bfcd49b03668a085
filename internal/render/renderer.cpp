#include "internal/render/renderer.hpp"

#include <atomic>
#include <iterator>
#include <vector>

#include <fmt/format.h>

#include "config/config.pb.h"
#include "internal/error/redaction.hpp"
#include "internal/render/json.hpp"
#include "internal/render/style.hpp"

namespace faultline::render {

namespace {

std::atomic<std::size_t> g_staging_chain_depth{kDefaultStagingChainDepth};
std::atomic<std::size_t> g_local_chain_depth{kDefaultLocalChainDepth};

// Renderings of the causal chain, at most `limit` entries.
std::vector<std::string> CollectChain(const Error& error, std::size_t limit) {
  std::vector<std::string> chain;
  for (const Cause* current = error.Source(); current != nullptr && chain.size() < limit; current = current->Next()) {
    chain.push_back(current->Render());
  }
  return chain;
}

void AppendHeader(const Error& error, google::protobuf::Struct* document) {
  SetString(document, "kind", KindName(error.Kind()));
  SetString(document, "code", error.Code().View());
  if (!error.IsRedacted() && error.Message()) {
    SetString(document, "message", *error.Message());
  }
}

void AppendDetails(const Error& error, google::protobuf::Struct* document) {
  if (error.IsRedacted() || !error.GetDetails()) {
    return;
  }
  if (auto details = DetailsToJson(*error.GetDetails())) {
    (*document->mutable_fields())["details"] = std::move(*details);
  }
}

void AppendMetadata(google::protobuf::Struct&& metadata, google::protobuf::Struct* document) {
  if (metadata.fields().empty()) {
    return;
  }
  *(*document->mutable_fields())["metadata"].mutable_struct_value() = std::move(metadata);
}

} // namespace

// ------------------------------------------------------------
// Limits
// ------------------------------------------------------------

RenderLimits CurrentRenderLimits() noexcept {
  return RenderLimits{g_staging_chain_depth.load(std::memory_order_relaxed), g_local_chain_depth.load(std::memory_order_relaxed)};
}

void SetRenderLimits(RenderLimits limits) noexcept {
  if (limits.staging_chain_depth > 0) {
    g_staging_chain_depth.store(limits.staging_chain_depth, std::memory_order_relaxed);
  }
  if (limits.local_chain_depth > 0) {
    g_local_chain_depth.store(limits.local_chain_depth, std::memory_order_relaxed);
  }
}

void ConfigureRendering(const runtime::config::RuntimeConfig& config) {
  const auto& rendering = config.rendering();
  SetRenderLimits(RenderLimits{rendering.staging_chain_depth(), rendering.local_chain_depth()});

  switch (rendering.color()) {
    case runtime::config::COLOR_MODE_ALWAYS:
      display::SetColorPreference(display::ColorPreference::kAlways);
      break;
    case runtime::config::COLOR_MODE_NEVER:
      display::SetColorPreference(display::ColorPreference::kNever);
      break;
    default:
      display::SetColorPreference(display::ColorPreference::kAuto);
      break;
  }
}

// ------------------------------------------------------------
// Prod
// ------------------------------------------------------------

std::string RenderProd(const Error& error) {
  google::protobuf::Struct document;
  AppendHeader(error, &document);

  google::protobuf::Struct metadata;
  for (const auto& field : error.GetMetadata()) {
    if (field.Redaction() == FieldRedaction::kNone) {
      (*metadata.mutable_fields())[std::string(field.Name())] = FieldValueToJson(field.Value());
    }
  }
  AppendMetadata(std::move(metadata), &document);
  AppendDetails(error, &document);

  return ToJsonString(document);
}

// ------------------------------------------------------------
// Staging
// ------------------------------------------------------------

std::string RenderStaging(const Error& error) {
  google::protobuf::Struct document;
  AppendHeader(error, &document);

  if (error.Source() != nullptr) {
    auto* chain = (*document.mutable_fields())["source_chain"].mutable_list_value();
    for (auto& entry : CollectChain(error, g_staging_chain_depth.load(std::memory_order_relaxed))) {
      chain->add_values()->set_string_value(std::move(entry));
    }
  }

  google::protobuf::Struct metadata;
  for (const auto& field : error.GetMetadata()) {
    const std::string name(field.Name());
    switch (field.Redaction()) {
      case FieldRedaction::kNone:
        (*metadata.mutable_fields())[name] = FieldValueToJson(field.Value());
        break;
      case FieldRedaction::kHash:
      case FieldRedaction::kLast4:
        if (auto value = redaction::SanitizedValue(field)) {
          (*metadata.mutable_fields())[name].set_string_value(std::move(*value));
        }
        break;
      case FieldRedaction::kRedact:
        break;
    }
  }
  AppendMetadata(std::move(metadata), &document);
  AppendDetails(error, &document);

  if (error.Retry()) {
    SetNumber(&document, "retry_after", static_cast<double>(error.Retry()->after_seconds));
  }

  return ToJsonString(document);
}

// ------------------------------------------------------------
// Local
// ------------------------------------------------------------

std::string RenderLocal(const Error& error, bool color) {
  const Palette palette(color);
  std::string   out;
  auto          it = std::back_inserter(out);

  const auto label = KindLabel(error.Kind());
  fmt::format_to(it, "Error: {}\n", IsCritical(error.Kind()) ? palette.KindCritical(label) : palette.KindWarning(label));
  fmt::format_to(it, "Code: {}\n", palette.Code(error.Code().View()));
  fmt::format_to(it, "Message: {}\n", palette.Message(error.RenderMessage()));

  const auto chain = CollectChain(error, g_local_chain_depth.load(std::memory_order_relaxed));
  if (!chain.empty()) {
    out.push_back('\n');
    for (const auto& entry : chain) {
      fmt::format_to(it, "  {}: {}\n", palette.SourceContext("Caused by"), palette.SourceContext(entry));
    }
  }

  if (!error.GetMetadata().Empty()) {
    out += "\nContext:\n";
    for (const auto& field : error.GetMetadata()) {
      fmt::format_to(it, "  {}: {}\n", palette.MetadataKey(field.Name()), field.Value().ToString());
    }
  }

  if (const auto* diagnostics = error.GetDiagnostics()) {
    constexpr auto kLevel = Visibility::kDevOnly;

    bool first_hint = true;
    for (const auto& hint : diagnostics->VisibleHints(kLevel)) {
      if (first_hint) {
        out.push_back('\n');
        first_hint = false;
      }
      fmt::format_to(it, "  {}: {}\n", palette.HintLabel("hint"), palette.HintText(hint.message));
    }

    for (const auto& suggestion : diagnostics->VisibleSuggestions(kLevel)) {
      fmt::format_to(it, "\n  {}: {}\n", palette.SuggestionLabel("suggestion"), palette.SuggestionText(suggestion.message));
      if (suggestion.command) {
        fmt::format_to(it, "              {}\n", palette.Command(*suggestion.command));
      }
    }

    if (const auto* doc = diagnostics->VisibleDocLink(kLevel)) {
      if (doc->title) {
        fmt::format_to(it, "\n  {}: {} ({})\n", palette.DocsLabel("docs"), *doc->title, palette.Url(doc->url));
      } else {
        fmt::format_to(it, "\n  {}: {}\n", palette.DocsLabel("docs"), palette.Url(doc->url));
      }
    }

    if (!diagnostics->RelatedCodes().empty()) {
      fmt::format_to(it, "\n  {}: {}\n", palette.RelatedLabel("see also"), fmt::join(diagnostics->RelatedCodes(), ", "));
    }
  }

  if (const auto* backtrace = error.GetBacktrace(); backtrace != nullptr && !backtrace->Empty()) {
    out += "\nBacktrace:\n";
    out += backtrace->ToString();
  }

  return out;
}

std::string RenderLocal(const Error& error) {
  return RenderLocal(error, display::ColorEnabled());
}

std::string Render(const Error& error, display::DisplayMode mode) {
  switch (mode) {
    case display::DisplayMode::kLocal:
      return RenderLocal(error);
    case display::DisplayMode::kStaging:
      return RenderStaging(error);
    case display::DisplayMode::kProd:
    default:
      return RenderProd(error);
  }
}

std::string Render(const Error& error) {
  return Render(error, display::CurrentDisplayMode());
}

namespace testing {

void ResetRenderLimits() noexcept {
  g_staging_chain_depth.store(kDefaultStagingChainDepth, std::memory_order_relaxed);
  g_local_chain_depth.store(kDefaultLocalChainDepth, std::memory_order_relaxed);
}

} // namespace testing

} // namespace faultline::render

namespace faultline {

std::ostream& operator<<(std::ostream& os, const Error& error) {
  return os << render::Render(error);
}

} // namespace faultline
