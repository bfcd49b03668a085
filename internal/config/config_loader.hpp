#pragma once

#include <string>

#include "config/config.pb.h"

namespace faultline::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, printed as JSON and parsed into
  the message. Unknown fields and unknown log level names are rejected;
  every failure surfaces as std::runtime_error.
*/
class ConfigLoader {
 public:
  static faultline::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static faultline::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace faultline::config
