#include "internal/error/metadata.hpp"

#include <algorithm>

namespace faultline {

namespace {

bool NameLess(const Field& field, std::string_view name) {
  return field.Name() < name;
}

} // namespace

Metadata Metadata::FromFields(std::vector<Field> fields) {
  Metadata metadata;
  metadata.fields_.reserve(fields.size());
  for (auto& field : fields) {
    metadata.Insert(std::move(field));
  }
  return metadata;
}

std::vector<Field>::iterator Metadata::LowerBound(std::string_view name) {
  return std::lower_bound(fields_.begin(), fields_.end(), name, NameLess);
}

std::vector<Field>::const_iterator Metadata::LowerBound(std::string_view name) const {
  return std::lower_bound(fields_.begin(), fields_.end(), name, NameLess);
}

// ------------------------------------------------------------
// Mutation
// ------------------------------------------------------------

std::optional<FieldValue> Metadata::Insert(Field field) {
  if (auto policy = policies_.find(field.Name()); policy != policies_.end()) {
    field.SetRedaction(policy->second);
  }

  auto it = LowerBound(field.Name());
  if (it != fields_.end() && it->Name() == field.Name()) {
    std::optional<FieldValue> previous(it->Value());
    *it = std::move(field);
    return previous;
  }

  fields_.insert(it, std::move(field));
  return std::nullopt;
}

void Metadata::SetRedaction(std::string_view name, FieldRedaction policy) {
  if (auto it = policies_.find(name); it != policies_.end()) {
    it->second = policy;
  } else {
    policies_.emplace(std::string(name), policy);
  }

  auto it = LowerBound(name);
  if (it != fields_.end() && it->Name() == name) {
    it->SetRedaction(policy);
  }
}

// ------------------------------------------------------------
// Lookup
// ------------------------------------------------------------

const Field* Metadata::GetField(std::string_view name) const {
  auto it = LowerBound(name);
  if (it == fields_.end() || it->Name() != name) {
    return nullptr;
  }
  return &*it;
}

const FieldValue* Metadata::Get(std::string_view name) const {
  const auto* field = GetField(name);
  return field ? &field->Value() : nullptr;
}

std::optional<FieldRedaction> Metadata::Redaction(std::string_view name) const {
  if (auto policy = policies_.find(name); policy != policies_.end()) {
    return policy->second;
  }
  if (const auto* field = GetField(name)) {
    return field->Redaction();
  }
  return std::nullopt;
}

} // namespace faultline
