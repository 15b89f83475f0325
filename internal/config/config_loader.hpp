#pragma once

#include <string>

#include "config/config.pb.h"

namespace chains::config {

/*
  Loads RuntimeConfig from YAML.

  The YAML tree goes through google.protobuf.Value and JSON into the
  RuntimeConfig message, so unknown keys and mistyped values are
  rejected by the protobuf JSON parser. Quoted scalars stay strings.
  An empty document yields the defaults. Every failure is a
  std::runtime_error prefixed "config: ".
*/
class ConfigLoader {
 public:
  static constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

  static chains::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static chains::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace chains::config
