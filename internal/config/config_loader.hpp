#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"

namespace scribe::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static scribe::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Fills every unset field with its default. Idempotent.
  static void ApplyDefaults(scribe::runtime::config::RuntimeConfig* config);

  // Human-readable problems; empty when the config is usable.
  static std::vector<std::string> Validate(const scribe::runtime::config::RuntimeConfig& config);

  static std::vector<std::string> DefaultSupportedFormats();

  // processing.ledger_path, or <output_dir>/.processing_history.json.
  static std::string LedgerPath(const scribe::runtime::config::RuntimeConfig& config);
};

} // namespace scribe::config
