#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

namespace convtree::config {

using convtree::runtime::config::RuntimeConfig;

namespace {

constexpr std::array<std::string_view, 7> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

// Preview text is meant for a single line in a tree widget.
constexpr uint32_t kMaxPreviewLength = 4096;

[[noreturn]] void Invalid(const std::string& what) {
  throw std::runtime_error("Invalid configuration: " + what);
}

google::protobuf::Value ScalarValue(const YAML::Node& node) {
  google::protobuf::Value value;
  const auto&             text = node.Scalar();

  // "!" is the tag yaml-cpp gives quoted scalars
  if (node.Tag() == "!") {
    value.set_string_value(text);
    return value;
  }
  if (text == "true" || text == "True" || text == "false" || text == "False") {
    value.set_bool_value(text[0] == 't' || text[0] == 'T');
    return value;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && *end == '\0' && std::isfinite(number)) {
    value.set_number_value(number);
  } else {
    value.set_string_value(text);
  }
  return value;
}

google::protobuf::Value ToValue(const YAML::Node& node) {
  google::protobuf::Value value;
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value.set_null_value(google::protobuf::NULL_VALUE);
      return value;
    case YAML::NodeType::Scalar:
      return ScalarValue(node);
    case YAML::NodeType::Sequence:
      for (const auto& item : node) {
        *value.mutable_list_value()->add_values() = ToValue(item);
      }
      return value;
    case YAML::NodeType::Map: {
      auto& fields = *value.mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        fields[entry.first.as<std::string>()] = ToValue(entry.second);
      }
      return value;
    }
    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

RuntimeConfig Parse(const YAML::Node& document) {
  RuntimeConfig config;
  if (document.IsNull()) {
    return config;
  }
  if (!document.IsMap()) {
    Invalid("top-level YAML node must be a mapping");
  }

  std::string json;
  const auto  encoded = google::protobuf::util::MessageToJsonString(ToValue(document), &json);
  if (!encoded.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + encoded.ToString());
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  const auto parsed             = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    Invalid(parsed.ToString());
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node document;
  try {
    document = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return Parse(document);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& yaml) {
  YAML::Node document;
  try {
    document = YAML::Load(yaml);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse YAML config: ") + e.what());
  }
  return Parse(document);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite() && database.sqlite().path().empty()) {
    Invalid("database.sqlite.path is required");
  }
  if (database.has_postgres() && database.postgres().connection_uri().empty()) {
    Invalid("database.postgres.connection_uri is required");
  }

  const auto& level = config.logging().level();
  if (!level.empty() && std::find(kLogLevels.begin(), kLogLevels.end(), level) == kLogLevels.end()) {
    Invalid("logging.level must be one of trace, debug, info, warn, error, critical, off");
  }

  const auto& tree = config.tree();
  if (tree.has_default_depth() && tree.default_depth() < -1) {
    Invalid("tree.default_depth must be >= -1");
  }
  if (tree.preview_length() > kMaxPreviewLength) {
    Invalid("tree.preview_length must be <= " + std::to_string(kMaxPreviewLength));
  }
}

} // namespace convtree::config
