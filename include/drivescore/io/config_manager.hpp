#pragma once

#include <filesystem>
#include <string>

#include "drivescore/config/behavior_config.hpp"
#include "yaml-cpp/yaml.h"

#ifndef DRIVESCORE_CONFIG_ROOT
#define DRIVESCORE_CONFIG_ROOT "config"
#endif

namespace drivescore::io {

class ConfigManager {
public:
    /// Construct a configuration manager rooted at `config_root`, which must be an
    /// existing directory; otherwise construction throws `errors::ConfigError`.
    explicit ConfigManager(std::filesystem::path config_root = std::filesystem::path(DRIVESCORE_CONFIG_ROOT));

    [[nodiscard]] const std::filesystem::path& config_root() const noexcept { return config_root_; }

    [[nodiscard]] config::BehaviorConfig load_behavior_config(
        const std::filesystem::path& path = "behavior.yaml") const;

    /// Parse an already loaded document. `path` is only used in error messages.
    [[nodiscard]] static config::BehaviorConfig parse_behavior_config(const YAML::Node&            node,
                                                                      const std::filesystem::path& path);

private:
    std::filesystem::path config_root_;

    [[nodiscard]] std::filesystem::path resolve_config_path(const std::filesystem::path& path) const;
    [[nodiscard]] YAML::Node load_yaml(const std::filesystem::path& path, const std::string& description) const;
};

} // namespace drivescore::io
