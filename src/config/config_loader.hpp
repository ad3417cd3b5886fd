#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

#include "config/config_schema.hpp"

namespace aide::config {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// ~/.aide/config.json
std::filesystem::path DefaultConfigPath();

// Defaults, overlaid by the JSON file (if present), overlaid by AIDE_* environment variables.
// Paths starting with "~" are expanded against $HOME.
Config LoadConfig(const std::filesystem::path& config_path);
Config LoadConfig();

std::filesystem::path StateDbPath(const Config& config);

// Throws ConfigError when the gateway cannot run with this configuration.
void ValidateGatewayConfig(const Config& config);

}  // namespace aide::config
