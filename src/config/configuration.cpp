#include "config/configuration.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace RigTune {
namespace Config {

// Helper function to safely get optional values
template<typename T>
std::optional<T> get_optional(const json& j, const std::string& key) {
    if (j.contains(key)) {
        return j[key].get<T>();
    }
    return std::nullopt;
}

LoggingConfig LoggingConfig::from_json(const json& j) {
    LoggingConfig config;
    config.directory = get_optional<std::string>(j, "directory").value_or(config.directory);
    config.level = get_optional<std::string>(j, "level").value_or(config.level);
    config.console = get_optional<bool>(j, "console").value_or(config.console);
    return config;
}

StorageConfig StorageConfig::from_json(const json& j) {
    StorageConfig config;
    config.profiles_path = get_optional<std::string>(j, "profiles_path").value_or(config.profiles_path);
    config.settings_path = get_optional<std::string>(j, "settings_path").value_or(config.settings_path);
    return config;
}

MonitorConfig MonitorConfig::from_json(const json& j) {
    MonitorConfig config;
    config.poll_interval_ms = get_optional<int>(j, "poll_interval_ms").value_or(config.poll_interval_ms);
    config.channel_capacity = get_optional<size_t>(j, "channel_capacity").value_or(config.channel_capacity);
    return config;
}

HardwareConfig HardwareConfig::from_json(const json& j) {
    HardwareConfig config;
    config.capability_table = get_optional<std::string>(j, "capability_table");
    config.sysroot = get_optional<std::string>(j, "sysroot");
    return config;
}

// Configuration implementations
std::unique_ptr<Configuration> Configuration::load_from_file(const std::string& filepath) {
    Utils::ModuleLogger logger("CONFIG");

    logger.info("Loading configuration from: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        logger.error("Failed to open configuration file: " + filepath);
        throw std::runtime_error("Cannot open configuration file: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    file.close();

    return load_from_string(buffer.str());
}

std::unique_ptr<Configuration> Configuration::load_from_string(const std::string& json_str) {
    Utils::ModuleLogger logger("CONFIG");

    try {
        json j = json::parse(json_str);

        auto config = std::make_unique<Configuration>();
        config->parse_json(j);

        logger.info("Configuration loaded successfully");
        return config;
    } catch (const json::exception& e) {
        logger.error("JSON parsing error: " + std::string(e.what()));
        throw std::runtime_error("Invalid JSON configuration: " + std::string(e.what()));
    }
}

void Configuration::parse_json(const json& j) {
    if (!j.is_object()) {
        throw std::runtime_error("Configuration root must be an object");
    }

    // Every section is optional, missing ones keep their defaults
    if (j.contains("logging")) logging_config_ = LoggingConfig::from_json(j["logging"]);
    if (j.contains("storage")) storage_config_ = StorageConfig::from_json(j["storage"]);
    if (j.contains("monitor")) monitor_config_ = MonitorConfig::from_json(j["monitor"]);
    if (j.contains("hardware")) hardware_config_ = HardwareConfig::from_json(j["hardware"]);
}

bool Configuration::validate() const {
    Utils::ModuleLogger logger("CONFIG");

    std::string level = logging_config_.level;
    std::transform(level.begin(), level.end(), level.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (level != "debug" && level != "info" && level != "warning" &&
        level != "error" && level != "critical") {
        logger.error("Invalid log level: " + logging_config_.level);
        return false;
    }

    if (storage_config_.profiles_path.empty() || storage_config_.settings_path.empty()) {
        logger.error("Storage paths must not be empty");
        return false;
    }

    if (storage_config_.profiles_path == storage_config_.settings_path) {
        logger.error("Profile store and settings store must be different files");
        return false;
    }

    if (monitor_config_.poll_interval_ms <= 0) {
        logger.error("poll_interval_ms must be positive");
        return false;
    }

    if (monitor_config_.channel_capacity == 0) {
        logger.error("channel_capacity must be positive");
        return false;
    }

    if (monitor_config_.poll_interval_ms < 500) {
        logger.warning("Polling faster than 500 ms spawns the GPU diagnostic tool very often");
    }

    logger.info("Configuration validation successful");
    return true;
}

void Configuration::print_summary() const {
    Utils::ModuleLogger logger("CONFIG");

    logger.info("=== Configuration Summary ===");
    logger.info("Logging:");
    logger.info("  Directory: " + logging_config_.directory);
    logger.info("  Level: " + logging_config_.level);
    logger.info("Storage:");
    logger.info("  Profiles: " + storage_config_.profiles_path);
    logger.info("  Settings: " + storage_config_.settings_path);
    logger.info("Monitor:");
    logger.info("  Poll interval: " + std::to_string(monitor_config_.poll_interval_ms) + " ms");
    logger.info("  Channel capacity: " + std::to_string(monitor_config_.channel_capacity));
    logger.info("Hardware:");
    logger.info("  Capability table: " +
                hardware_config_.capability_table.value_or(std::string("(built-in)")));
    if (hardware_config_.sysroot.has_value()) {
        logger.info("  Sysroot: " + hardware_config_.sysroot.value());
    }
    logger.info("==============================");
}

} // namespace Config
} // namespace RigTune
