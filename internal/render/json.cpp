#include "internal/render/json.hpp"

#include <chrono>
#include <cmath>
#include <memory>
#include <stdexcept>
#include <variant>
#include <vector>

#include <google/protobuf/descriptor.h>
#include <google/protobuf/io/coded_stream.h>
#include <google/protobuf/io/zero_copy_stream_impl_lite.h>
#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/type_resolver.h>
#include <google/protobuf/util/type_resolver_util.h>

namespace faultline::render {

namespace {

constexpr char kTypeUrlPrefix[] = "type.googleapis.com";

google::protobuf::util::TypeResolver* GeneratedTypeResolver() {
  static const std::unique_ptr<google::protobuf::util::TypeResolver> resolver(
      google::protobuf::util::NewTypeResolverForDescriptorPool(kTypeUrlPrefix, google::protobuf::DescriptorPool::generated_pool()));
  return resolver.get();
}

google::protobuf::Value NumberOrString(std::uint64_t magnitude, double number, const std::string& text) {
  google::protobuf::Value value;
  if (magnitude > kMaxSafeJsonInteger) {
    value.set_string_value(text);
  } else {
    value.set_number_value(number);
  }
  return value;
}

} // namespace

google::protobuf::Value FieldValueToJson(const FieldValue& value) {
  google::protobuf::Value out;
  switch (value.GetType()) {
    case FieldValue::Type::kStr:
      out.set_string_value(*value.AsStr());
      break;

    case FieldValue::Type::kI64: {
      const std::int64_t v = *value.AsI64();
      const std::uint64_t magnitude =
          v < 0 ? static_cast<std::uint64_t>(-(v + 1)) + 1 : static_cast<std::uint64_t>(v);
      out = NumberOrString(magnitude, static_cast<double>(v), value.ToString());
      break;
    }

    case FieldValue::Type::kU64: {
      const std::uint64_t v = *value.AsU64();
      out = NumberOrString(v, static_cast<double>(v), value.ToString());
      break;
    }

    case FieldValue::Type::kF64: {
      const double v = *value.AsF64();
      if (std::isfinite(v)) {
        out.set_number_value(v);
      } else {
        out.set_null_value(google::protobuf::NULL_VALUE);
      }
      break;
    }

    case FieldValue::Type::kBool:
      out.set_bool_value(*value.AsBool());
      break;

    case FieldValue::Type::kUuid:
      out.set_string_value(value.ToString());
      break;

    case FieldValue::Type::kDuration: {
      const auto nanos = std::get<std::chrono::nanoseconds>(value.Raw()).count();
      auto*      fields = out.mutable_struct_value()->mutable_fields();
      (*fields)["secs"].set_number_value(static_cast<double>(nanos / 1'000'000'000));
      (*fields)["nanos"].set_number_value(static_cast<double>(nanos % 1'000'000'000));
      break;
    }
  }
  return out;
}

bool IsSerializable(const google::protobuf::Value& value) {
  // Explicit stack keeps arbitrarily deep documents off the call stack.
  std::vector<const google::protobuf::Value*> pending{&value};
  while (!pending.empty()) {
    const auto* current = pending.back();
    pending.pop_back();

    switch (current->kind_case()) {
      case google::protobuf::Value::kNumberValue:
        if (!std::isfinite(current->number_value())) {
          return false;
        }
        break;
      case google::protobuf::Value::kListValue:
        for (const auto& item : current->list_value().values()) {
          pending.push_back(&item);
        }
        break;
      case google::protobuf::Value::kStructValue:
        for (const auto& [key, item] : current->struct_value().fields()) {
          pending.push_back(&item);
        }
        break;
      default:
        break;
    }
  }
  return true;
}

std::optional<google::protobuf::Value> DetailsToJson(const Details& details) {
  if (const auto* text = details.AsText()) {
    google::protobuf::Value value;
    value.set_string_value(*text);
    return value;
  }
  if (const auto* json = details.AsJson(); json != nullptr && IsSerializable(*json)) {
    return *json;
  }
  return std::nullopt;
}

void SetString(google::protobuf::Struct* object, std::string_view key, std::string_view value) {
  (*object->mutable_fields())[std::string(key)].set_string_value(std::string(value));
}

void SetNumber(google::protobuf::Struct* object, std::string_view key, double value) {
  (*object->mutable_fields())[std::string(key)].set_number_value(value);
}

// ------------------------------------------------------------
// Serialization
// ------------------------------------------------------------

std::string ToJsonString(const google::protobuf::Struct& object) {
  std::string binary;
  {
    google::protobuf::io::StringOutputStream raw(&binary);
    google::protobuf::io::CodedOutputStream  coded(&raw);
    // Map entries are written sorted by key, which fixes the JSON key order.
    coded.SetSerializationDeterministic(true);
    if (!object.SerializeToCodedStream(&coded)) {
      throw std::runtime_error("Failed to serialize JSON document");
    }
  }

  const std::string type_url = std::string(kTypeUrlPrefix) + "/" + google::protobuf::Struct::descriptor()->full_name();

  std::string json;
  auto status = google::protobuf::util::BinaryToJsonString(GeneratedTypeResolver(), type_url, binary, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to render JSON document: " + std::string(status.message()));
  }
  return json;
}

} // namespace faultline::render
