#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <string>

namespace chains::config {

using chains::runtime::config::RuntimeConfig;

namespace {

// Quoted scalars are always strings; plain ones may be booleans, null or numbers.
void ConvertScalar(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();

  if (node.Tag() != "!") {
    if (text == "true" || text == "false") {
      out->set_bool_value(text == "true");
      return;
    }
    if (text == "~" || text == "null") {
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    }

    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (!text.empty() && end && *end == '\0') {
      out->set_number_value(number);
      return;
    }
  }

  out->set_string_value(text);
}

void Convert(const YAML::Node& node, google::protobuf::Value* out) {
  if (node.IsNull()) {
    out->set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    ConvertScalar(node, out);
  } else if (node.IsSequence()) {
    auto* list = out->mutable_list_value();
    for (const auto& item : node) {
      Convert(item, list->add_values());
    }
  } else if (node.IsMap()) {
    auto* fields = out->mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      Convert(entry.second, &(*fields)[entry.first.Scalar()]);
    }
  } else {
    throw std::runtime_error("config: unsupported YAML node");
  }
}

void ApplyDefaults(RuntimeConfig& config) {
  if (config.server().bind_address().empty()) {
    config.mutable_server()->set_bind_address(ConfigLoader::kDefaultBindAddress);
  }
}

void Validate(const RuntimeConfig& config) {
  const auto& address = config.server().bind_address();
  const auto  colon   = address.rfind(':');
  if (colon == std::string::npos || colon + 1 == address.size()) {
    throw std::runtime_error("config: server.bind_address needs host:port, got '" + address + "'");
  }

  for (const auto& prefix : config.classifier().favicon_prefixes()) {
    if (prefix.empty()) {
      throw std::runtime_error("config: classifier.favicon_prefixes holds an empty entry");
    }
  }
  for (const auto& mime : config.classifier().icon_mime_types()) {
    if (mime.empty()) {
      throw std::runtime_error("config: classifier.icon_mime_types holds an empty entry");
    }
  }
}

RuntimeConfig FromYaml(const YAML::Node& yaml) {
  google::protobuf::Value tree;
  if (yaml.IsNull()) {
    tree.mutable_struct_value();
  } else if (!yaml.IsMap()) {
    throw std::runtime_error("config: top level must be a mapping");
  } else {
    Convert(yaml, &tree);
  }

  std::string json;
  auto        printed = google::protobuf::util::MessageToJsonString(tree, &json);
  if (!printed.ok()) {
    throw std::runtime_error("config: " + std::string(printed.message()));
  }

  RuntimeConfig                            config;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("config: " + std::string(parsed.message()));
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("config: cannot read " + path + ": " + e.what());
  }

  return FromYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("config: ") + e.what());
  }

  return FromYaml(yaml);
}

} // namespace chains::config
