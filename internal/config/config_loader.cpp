#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace relay::config {

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static std::string ExpandVars(const std::string& input) {
  std::string out;
  out.reserve(input.size());

  for (std::size_t i = 0; i < input.size(); ++i) {
    if (input[i] != '$' || i + 1 >= input.size()) {
      out.push_back(input[i]);
      continue;
    }

    std::size_t start = i + 1;
    std::size_t end   = start;
    bool        braced = input[start] == '{';
    if (braced) {
      end = input.find('}', start);
      if (end == std::string::npos) {
        out.push_back(input[i]);
        continue;
      }
      ++start;
    } else {
      while (end < input.size() && (std::isalnum(static_cast<unsigned char>(input[end])) || input[end] == '_')) {
        ++end;
      }
      if (end == start) {
        out.push_back(input[i]);
        continue;
      }
    }

    const std::string name = input.substr(start, end - start);
    if (const char* env = std::getenv(name.c_str())) {
      out += env;
    } else {
      // unknown variables stay untouched, like os.path.expandvars
      out += input.substr(i, (braced ? end + 1 : end) - i);
    }
    i = braced ? end : end - 1;
  }
  return out;
}

static std::string JoinPaths(const YAML::Node& node) {
  std::string joined;
  for (std::size_t i = 0; i < node.size(); ++i) {
    std::string part = node[i].Scalar();
    if (part.empty()) {
      continue;
    }
    if (joined.empty() || joined.back() == '/') {
      joined += part;
    } else if (part.front() == '/') {
      joined += part;
    } else {
      joined += "/" + part;
    }
  }
  return joined;
}

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  if (node.Tag() == "!expandVars") {
    value->set_string_value(ExpandVars(scalar_value));
    return;
  }

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "True" || scalar_value == "false" || scalar_value == "False") {
    value->set_bool_value(scalar_value == "true" || scalar_value == "True");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static bool IsTransferLocationsKey(const std::string& key) {
  return key == "dataTransferLocations" || key == "data_transfer_locations";
}

// "name: target" mapping -> [{name, target}, ...] preserving declaration order
static void TransferLocationsToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  auto* list_value = value->mutable_list_value();
  for (auto it : node) {
    auto* fields = list_value->add_values()->mutable_struct_value()->mutable_fields();
    (*fields)["name"].set_string_value(it.first.Scalar());
    if (it.second.IsNull()) {
      (*fields)["target"].set_string_value("");
    } else if (it.second.IsSequence() && it.second.Tag() == "!joinPaths") {
      (*fields)["target"].set_string_value(JoinPaths(it.second));
    } else if (it.second.Tag() == "!expandVars") {
      (*fields)["target"].set_string_value(ExpandVars(it.second.Scalar()));
    } else {
      (*fields)["target"].set_string_value(it.second.Scalar());
    }
  }
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      if (node.Tag() == "!joinPaths") {
        value->set_string_value(JoinPaths(node));
        break;
      }
      auto* list_value = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        const std::string key   = it.first.Scalar();
        auto*             field = &(*struct_value->mutable_fields())[key];
        if (IsTransferLocationsKey(key) && it.second.IsMap()) {
          TransferLocationsToProtoValue(it.second, field);
        } else {
          YamlToProtoValue(it.second, field);
        }
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static relay::runtime::config::RuntimeConfig ParseYaml(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  relay::runtime::config::RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

relay::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

relay::runtime::config::RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYaml(yaml);
}

} // namespace relay::config
