#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "utils/logging.hpp"

namespace codebox::config {

// Reads $CODEBOX_CONFIG or ~/.codebox/config.json, then applies CODEBOX_*
// environment overrides. A missing or unparsable file leaves defaults.
Config LoadConfig();
Config LoadConfigFromFile(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironmentOverrides(Config& config);

// Unrecognized keys are ignored.
SessionConfig ParseSessionConfig(const nlohmann::json& data, const SessionConfig& defaults);

codebox::utils::LogConfig ToLogConfig(const Config& config);

}  // namespace codebox::config
