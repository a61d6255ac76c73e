#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "config/config_schema.hpp"

namespace llmtrigger::config {

std::filesystem::path DefaultConfigPath();

// Reads the JSON file (if present), applies environment overrides and
// validates the result.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& path);

// Applies a JSON document on top of `config`. Unknown keys are ignored.
void ApplyConfigJson(Config& config, const std::string& json_text);

// Replaces out-of-range values by their defaults. Returns one warning per fix.
std::vector<std::string> ValidateConfig(Config& config);

}  // namespace llmtrigger::config
