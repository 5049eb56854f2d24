#include "drivescore/io/config_manager.hpp"

#include <sstream>
#include <string>

#include "drivescore/common/errors.hpp"

namespace drivescore::io {

namespace {
namespace fs = std::filesystem;

// A mapping together with its dotted path, so errors can name the key at fault.
struct Section {
    YAML::Node  node;
    std::string name;

    std::string key(const std::string& field) const { return name.empty() ? field : name + "." + field; }
};

template <typename T>
T convert(const YAML::Node& value, const std::string& key, const fs::path& path)
{
    try {
        return value.as<T>();
    } catch (const YAML::BadConversion& ex) {
        std::ostringstream oss;
        oss << "Invalid type for key '" << key << "' in " << path.string() << ": " << ex.what();
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()), key);
    }
}

template <typename T>
T required_scalar(const Section& section, const std::string& field, const fs::path& path)
{
    const auto key   = section.key(field);
    auto       value = section.node[field];
    if (!value) {
        std::ostringstream oss;
        oss << "Missing required key '" << key << "' in " << path.string();
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()), key);
    }
    return convert<T>(value, key, path);
}

template <typename T>
T optional_scalar(const Section& section, const std::string& field, T fallback, const fs::path& path)
{
    auto value = section.node[field];
    if (!value) {
        return fallback;
    }
    return convert<T>(value, section.key(field), path);
}

Section required_section(const Section& root, const std::string& name, const fs::path& path)
{
    Section section{root.node[name], root.key(name)};
    if (!section.node || !section.node.IsMap()) {
        std::ostringstream oss;
        oss << "behavior config missing '" << section.name << "' section in " << path.string();
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()), section.name);
    }
    return section;
}

config::RateBands parse_rate_bands(const Section& section, const fs::path& path)
{
    config::RateBands bands{};
    bands.minor    = required_scalar<double>(section, "minor", path);
    bands.moderate = required_scalar<double>(section, "moderate", path);
    bands.severe   = required_scalar<double>(section, "severe", path);
    return bands;
}

} // namespace

ConfigManager::ConfigManager(std::filesystem::path config_root)
    : config_root_(std::move(config_root))
{
    if (!fs::exists(config_root_) || !fs::is_directory(config_root_)) {
        std::ostringstream oss;
        oss << "Config root is not a valid directory: " << config_root_.string();
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()));
    }
}

config::BehaviorConfig ConfigManager::load_behavior_config(const std::filesystem::path& path) const
{
    const auto resolved = resolve_config_path(path);
    const auto node     = load_yaml(resolved, "behavior");
    return parse_behavior_config(node, resolved);
}

config::BehaviorConfig ConfigManager::parse_behavior_config(const YAML::Node& node, const std::filesystem::path& path)
{
    if (!node || !node.IsMap()) {
        std::ostringstream oss;
        oss << "behavior config must be a mapping: " << path.string();
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()));
    }

    const Section          root{node, ""};
    config::BehaviorConfig cfg{};
    cfg.acceleration = parse_rate_bands(required_section(root, "acceleration", path), path);
    cfg.braking      = parse_rate_bands(required_section(root, "braking", path), path);

    const auto rpm              = required_section(root, "rpm", path);
    cfg.rpm.optimal_min         = required_scalar<int>(rpm, "optimal_min", path);
    cfg.rpm.optimal_max         = required_scalar<int>(rpm, "optimal_max", path);
    cfg.rpm.high_warning        = required_scalar<int>(rpm, "high_warning", path);
    cfg.rpm.excessive           = required_scalar<int>(rpm, "excessive", path);
    cfg.rpm.redline             = required_scalar<int>(rpm, "redline", path);
    cfg.rpm.sustained_seconds   = optional_scalar<double>(rpm, "sustained_seconds", cfg.rpm.sustained_seconds, path);
    cfg.rpm.critical_seconds    = optional_scalar<double>(rpm, "critical_seconds", cfg.rpm.critical_seconds, path);

    const auto gear                = required_section(root, "wrong_gear", path);
    cfg.wrong_gear.rpm_threshold   = required_scalar<int>(gear, "rpm_threshold", path);
    cfg.wrong_gear.min_duration_s  = required_scalar<double>(gear, "min_duration_s", path);
    cfg.wrong_gear.min_speed_mph   = optional_scalar<double>(gear, "min_speed_mph", cfg.wrong_gear.min_speed_mph, path);
    cfg.wrong_gear.default_max_gear =
        optional_scalar<int>(gear, "default_max_gear", cfg.wrong_gear.default_max_gear, path);
    if (const auto types = gear.node["vehicle_types"]) {
        const auto types_key = gear.key("vehicle_types");
        if (!types.IsMap()) {
            std::ostringstream oss;
            oss << types_key << " must be a mapping in " << path.string();
            throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()), types_key);
        }
        for (const auto& entry : types) {
            const auto name = convert<std::string>(entry.first, types_key, path);
            cfg.wrong_gear.vehicle_types[name] = convert<int>(entry.second, types_key + "." + name, path);
        }
    }

    const auto speed                  = required_section(root, "speed", path);
    cfg.speed.warning                 = required_scalar<double>(speed, "warning", path);
    cfg.speed.excessive               = required_scalar<double>(speed, "excessive", path);
    cfg.speed.severe                  = required_scalar<double>(speed, "severe", path);
    cfg.speed.sustained_seconds       = optional_scalar<double>(speed, "sustained_seconds", cfg.speed.sustained_seconds, path);
    cfg.speed.fuel_baseline_mph       = optional_scalar<double>(speed, "fuel_baseline_mph", cfg.speed.fuel_baseline_mph, path);

    const auto waste                              = required_section(root, "fuel_waste", path);
    cfg.fuel_waste.hard_accel_gal                 = required_scalar<double>(waste, "hard_accel_gal", path);
    cfg.fuel_waste.hard_brake_gal                 = required_scalar<double>(waste, "hard_brake_gal", path);
    cfg.fuel_waste.high_rpm_gal_per_min           = required_scalar<double>(waste, "high_rpm_gal_per_min", path);
    cfg.fuel_waste.wrong_gear_gal_per_min         = required_scalar<double>(waste, "wrong_gear_gal_per_min", path);
    cfg.fuel_waste.overspeed_gal_per_min_per_mph  = required_scalar<double>(waste, "overspeed_gal_per_min_per_mph", path);

    const auto cross                     = required_section(root, "cross_validation", path);
    cfg.cross_validation.tolerance_pct   = required_scalar<double>(cross, "tolerance_pct", path);
    cfg.cross_validation.window          = optional_scalar<std::size_t>(cross, "window", cfg.cross_validation.window, path);
    cfg.cross_validation.min_samples     =
        optional_scalar<std::size_t>(cross, "min_samples", cfg.cross_validation.min_samples, path);

    if (node["gap"]) {
        const auto gap   = required_section(root, "gap", path);
        cfg.gap.min_dt_s = optional_scalar<double>(gap, "min_dt_s", cfg.gap.min_dt_s, path);
        cfg.gap.max_dt_s = optional_scalar<double>(gap, "max_dt_s", cfg.gap.max_dt_s, path);
    }
    if (node["device"]) {
        const auto device         = required_section(root, "device", path);
        cfg.device.harsh_accel_mg = optional_scalar<double>(device, "harsh_accel_mg", cfg.device.harsh_accel_mg, path);
        cfg.device.harsh_brake_mg = optional_scalar<double>(device, "harsh_brake_mg", cfg.device.harsh_brake_mg, path);
    }
    cfg.event_log_capacity = optional_scalar<std::size_t>(root, "event_log_capacity", cfg.event_log_capacity, path);

    cfg.validate();
    return cfg;
}

std::filesystem::path ConfigManager::resolve_config_path(const std::filesystem::path& path) const
{
    if (path.is_absolute()) {
        return path;
    }
    return config_root_ / path;
}

YAML::Node ConfigManager::load_yaml(const std::filesystem::path& path, const std::string& description) const
{
    if (!std::filesystem::exists(path)) {
        std::ostringstream oss;
        oss << "Missing " << description << " config file: " << path.string();
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()));
    }

    try {
        return YAML::LoadFile(path.string());
    } catch (const YAML::ParserException& ex) {
        std::ostringstream oss;
        oss << "Failed to parse " << description << " config at " << path.string() << ": " << ex.what();
        throw ::drivescore::errors::ConfigError(DRIVESCORE_LOC(oss.str()));
    }
}

} // namespace drivescore::io
