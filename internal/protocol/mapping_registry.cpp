#include "internal/protocol/mapping_registry.hpp"

namespace faultline::protocol {

const CodeMapping* MappingForCode(std::string_view code) noexcept {
  const auto it = std::lower_bound(kCodeMappings.begin(), kCodeMappings.end(), code,
                                   [](const CodeMapping& entry, std::string_view key) { return entry.code < key; });
  if (it == kCodeMappings.end() || it->code != code) {
    return nullptr;
  }
  return &*it;
}

const CodeMapping& MappingFor(const ErrorCode& code, ErrorKind kind) noexcept {
  if (const auto* exact = MappingForCode(code.View())) {
    return *exact;
  }
  if (const auto* canonical = MappingForCode(ErrorCode::FromKind(kind).View())) {
    return *canonical;
  }
  // Unreachable while every kind has a canonical entry; the registry test pins that.
  return *MappingForCode(codes::kInternal);
}

} // namespace faultline::protocol
