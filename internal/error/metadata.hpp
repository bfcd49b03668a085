#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "internal/error/field.hpp"

namespace faultline {

/*
  Name-ordered metadata store.

  Fields are kept sorted by name so two stores built from the same fields
  iterate (and serialize) identically. Redaction policies are tracked per
  name independently of field presence: registering one rewrites a
  present field and tags every later insert under that name.
*/
class Metadata {
 public:
  using const_iterator = std::vector<Field>::const_iterator;

  Metadata() = default;

  static Metadata FromFields(std::vector<Field> fields);

  // Replaces a field with the same name and returns its previous value.
  std::optional<FieldValue> Insert(Field field);

  template <typename Range>
  void Extend(Range&& fields) {
    for (auto&& field : fields) {
      Insert(Field(std::forward<decltype(field)>(field)));
    }
  }

  const FieldValue* Get(std::string_view name) const;
  const Field*      GetField(std::string_view name) const;

  std::optional<FieldRedaction> Redaction(std::string_view name) const;
  void                          SetRedaction(std::string_view name, FieldRedaction policy);

  const std::map<std::string, FieldRedaction, std::less<>>& Policies() const noexcept {
    return policies_;
  }

  const std::vector<Field>& Fields() const noexcept {
    return fields_;
  }

  const_iterator begin() const noexcept {
    return fields_.begin();
  }

  const_iterator end() const noexcept {
    return fields_.end();
  }

  std::size_t Size() const noexcept {
    return fields_.size();
  }

  bool Empty() const noexcept {
    return fields_.empty();
  }

 private:
  std::vector<Field>::iterator       LowerBound(std::string_view name);
  std::vector<Field>::const_iterator LowerBound(std::string_view name) const;

  std::vector<Field>                                 fields_;
  std::map<std::string, FieldRedaction, std::less<>> policies_;
};

} // namespace faultline
