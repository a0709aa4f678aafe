#pragma once

#include <string>

#include "config/config.pb.h"

namespace speechmaker::config {

/*
  Reads the daemon's YAML configuration into RuntimeConfig.

  Keys are matched against the proto field names (snake_case or lowerCamel)
  and scalars are converted to the field's declared type. Unknown keys,
  sequences and values that do not fit their field are errors; the message
  names the offending key path, e.g. "conversion.voice_speed".

  Range checks and defaults are applied later by ResolveSettings.
*/
class ConfigLoader {
 public:
  // Environment variable consulted when no path is given on the command line.
  static constexpr const char* kPathEnv     = "SPEECHMAKER_CONFIG";
  static constexpr const char* kDefaultPath = "config/speechmaker.yaml";

  static speechmaker::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static speechmaker::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Command line path, then $SPEECHMAKER_CONFIG, then kDefaultPath.
  static std::string ResolvePath(const std::string& cli_path);
};

} // namespace speechmaker::config
