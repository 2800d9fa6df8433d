#pragma once

#include <filesystem>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"

namespace runbox::config {

// Defaults, then $RUNBOX_CONFIG or ~/.runbox/config.json, then RUNBOX_* variables.
Config LoadConfig();

// Defaults overlaid with one JSON file. A missing or malformed file keeps defaults.
Config LoadConfigFromFile(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvOverrides(Config& config);

std::filesystem::path ResolveRootDir(const Config& config);

nlohmann::json ConfigToJson(const Config& config);

}  // namespace runbox::config
