#include "internal/config/config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <string_view>

#include <fmt/format.h>

namespace faultline::config {

namespace {

using faultline::runtime::config::RuntimeConfig;

// Plain scalars may be bool or numeric; quoted ones (tag "!") and empty
// ones always stay strings.
google::protobuf::Value ScalarToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  const std::string&      text = node.Scalar();

  if (node.Tag() == "!" || text.empty()) {
    value.set_string_value(text);
    return value;
  }

  if (text == "true" || text == "false") {
    value.set_bool_value(text == "true");
    return value;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (end != nullptr && *end == '\0') {
    value.set_number_value(number);
  } else {
    value.set_string_value(text);
  }
  return value;
}

void ToValue(const YAML::Node& node, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      *out = ScalarToValue(node);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (const auto& item : node) {
        ToValue(item, list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        ToValue(entry.second, &(*fields)[entry.first.Scalar()]);
      }
      return;
    }
  }
  throw std::runtime_error("Unsupported YAML node");
}

// spdlog::level::from_str maps unknown names to "off", which would silence
// every error record, so unknown names are rejected here instead.
void ValidateLogLevel(const std::string& level) {
  static constexpr std::array<std::string_view, 9> kLevels = {"trace", "debug", "info", "warning", "warn", "error", "err", "critical", "off"};
  if (level.empty()) {
    return;
  }
  for (auto known : kLevels) {
    if (level == known) {
      return;
    }
  }
  throw std::runtime_error(fmt::format("logging.level: unknown level '{}'", level));
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value document;
  if (yaml.IsNull()) {
    // An empty document selects every default.
    document.mutable_struct_value();
  } else {
    ToValue(yaml, &document);
  }

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(document, &json); !status.ok()) {
    throw std::runtime_error(fmt::format("Failed to serialize YAML to JSON: {}", std::string(status.message())));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  RuntimeConfig config;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error(fmt::format("Invalid configuration: {}", std::string(status.message())));
  }

  ValidateLogLevel(config.logging().level());
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(fmt::format("Failed to load YAML config {}: {}", path, e.what()));
  }

  try {
    return FromYamlNode(yaml);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error(fmt::format("{}: {}", path, e.what()));
  }
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(fmt::format("Failed to parse YAML config: {}", e.what()));
  }
  return FromYamlNode(yaml);
}

} // namespace faultline::config
