#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace docsync::config {

namespace {

constexpr const char* kSourcesKey = "content_sources";

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0' && std::isfinite(numeric_value)) {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

void ParseInto(const google::protobuf::Value& json_value, google::protobuf::Message* message, bool ignore_unknown_fields) {
  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = ignore_unknown_fields;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error(std::string(status.message()));
  }
}

std::string EntryLabel(const YAML::Node& entry, size_t index) {
  std::string label = "content_sources[" + std::to_string(index) + "]";
  if (entry.IsMap()) {
    const auto name = entry["name"];
    if (name && name.IsScalar()) {
      label += " (" + name.Scalar() + ")";
    }
  }
  return label;
}

LoadedConfig Load(const YAML::Node& yaml) {
  LoadedConfig loaded;

  if (!yaml || yaml.IsNull()) {
    return loaded;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  // ------------------------------------------------------------
  // Top-level sections (strict)
  // ------------------------------------------------------------
  google::protobuf::Value sections;
  auto*                   fields = sections.mutable_struct_value()->mutable_fields();
  for (auto it : yaml) {
    const auto key = it.first.Scalar();
    if (key == kSourcesKey) {
      continue;
    }
    YamlToProtoValue(it.second, &(*fields)[key]);
  }

  try {
    ParseInto(sections, &loaded.config, /*ignore_unknown_fields=*/false);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("Invalid configuration: " + std::string(e.what()));
  }

  // ------------------------------------------------------------
  // Content sources (per entry)
  // ------------------------------------------------------------
  const auto sources = yaml[kSourcesKey];
  if (!sources || sources.IsNull()) {
    return loaded;
  }
  if (!sources.IsSequence()) {
    throw std::runtime_error("Invalid configuration: content_sources must be a list");
  }

  for (size_t i = 0; i < sources.size(); ++i) {
    const auto entry = sources[i];
    if (!entry.IsMap()) {
      loaded.rejected_sources.push_back(EntryLabel(entry, i) + ": entry is not a mapping");
      continue;
    }

    try {
      google::protobuf::Value entry_value;
      YamlToProtoValue(entry, &entry_value);

      docsync::runtime::config::ContentSourceConfig source;
      ParseInto(entry_value, &source, /*ignore_unknown_fields=*/true);
      *loaded.config.add_content_sources() = std::move(source);
    } catch (const std::runtime_error& e) {
      loaded.rejected_sources.push_back(EntryLabel(entry, i) + ": " + e.what());
    }
  }

  return loaded;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

LoadedConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return Load(yaml);
}

LoadedConfig ConfigLoader::LoadFromString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return Load(yaml);
}

} // namespace docsync::config
