#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace kestrel::config {

// $KESTREL_CONFIG, else ~/.kestrel/config.json.
std::filesystem::path GetConfigPath();

// Defaults, then the config file (if present), then environment overrides.
// Paths come back with "~" expanded. Throws utils::Error(kValidation) for
// out-of-range values.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironment(Config& config);
void ValidateConfig(const Config& config);

}  // namespace kestrel::config
