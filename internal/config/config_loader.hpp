#pragma once

#include <string>

#include "asyncprof/config/v1/config.pb.h"

namespace asyncprof::config {

/*
  Loads ProfilerConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so durations use the
  protobuf JSON form ("0.1s") and unknown keys are rejected.
*/
class ConfigLoader {
 public:
  static asyncprof::config::v1::ProfilerConfig LoadFromYaml(const std::string& path);
  static asyncprof::config::v1::ProfilerConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace asyncprof::config
