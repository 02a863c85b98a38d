#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"

namespace docsync::config {

struct LoadedConfig {
  docsync::runtime::config::RuntimeConfig config;

  // One diagnostic per content_sources entry that could not be parsed.
  std::vector<std::string> rejected_sources;
};

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Top-level sections
  are strict (unknown keys throw). content_sources entries are parsed one
  by one: unknown keys are ignored and an entry that does not parse is
  reported in rejected_sources instead of failing the whole file.
*/
class ConfigLoader {
 public:
  static LoadedConfig LoadFromYaml(const std::string& path);
  static LoadedConfig LoadFromString(const std::string& yaml);
};

} // namespace docsync::config
