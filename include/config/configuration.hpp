#pragma once

#include <nlohmann/json.hpp>
#include <string>
#include <memory>
#include <optional>

namespace RigTune {
namespace Config {

using json = nlohmann::json;

// Logging configuration
struct LoggingConfig {
    std::string directory = "logs";
    std::string level = "info";
    bool console = true;

    static LoggingConfig from_json(const json& j);
};

// On-disk stores
struct StorageConfig {
    std::string profiles_path = "data/game_profiles.json";
    std::string settings_path = "data/settings.json";

    static StorageConfig from_json(const json& j);
};

// Live telemetry polling
struct MonitorConfig {
    int poll_interval_ms = 2000;
    size_t channel_capacity = 64;

    static MonitorConfig from_json(const json& j);
};

// Hardware detection
struct HardwareConfig {
    std::optional<std::string> capability_table;  // JSON keyword table replacing the built-in one
    std::optional<std::string> sysroot;           // prefix for /proc and /sys, for fixtures

    static HardwareConfig from_json(const json& j);
};

// Main configuration class
class Configuration {
public:
    Configuration() = default;

    // Load configuration from JSON file
    static std::unique_ptr<Configuration> load_from_file(const std::string& filepath);

    // Parse configuration from JSON string
    static std::unique_ptr<Configuration> load_from_string(const std::string& json_str);

    // Validate configuration
    bool validate() const;

    // Print configuration summary
    void print_summary() const;

    // Getters
    const LoggingConfig& get_logging_config() const { return logging_config_; }
    const StorageConfig& get_storage_config() const { return storage_config_; }
    const MonitorConfig& get_monitor_config() const { return monitor_config_; }
    const HardwareConfig& get_hardware_config() const { return hardware_config_; }

private:
    LoggingConfig logging_config_;
    StorageConfig storage_config_;
    MonitorConfig monitor_config_;
    HardwareConfig hardware_config_;

    void parse_json(const json& j);
};

} // namespace Config
} // namespace RigTune
