#pragma once

#include <string>

#include "config/config.pb.h"

namespace chatrelay::config {

/*
  Loads EngineConfig / IngestConfig from YAML files.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Unset numeric settings are filled with their defaults and
  CHATRELAY_WEBHOOK_SECRET overrides the configured secret.

  Throws util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static chatrelay::runtime::config::EngineConfig LoadEngineFromYaml(const std::string& path);
  static chatrelay::runtime::config::IngestConfig LoadIngestFromYaml(const std::string& path);

  static void ApplyDefaults(chatrelay::runtime::config::EngineConfig& config);
  static void ApplyDefaults(chatrelay::runtime::config::IngestConfig& config);

  // Startup checks that would otherwise make the process misbehave.
  static void Validate(const chatrelay::runtime::config::EngineConfig& config);
  static void Validate(const chatrelay::runtime::config::IngestConfig& config);
};

} // namespace chatrelay::config
