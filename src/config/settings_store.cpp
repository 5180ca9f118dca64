#include "config/settings_store.hpp"
#include "utils/logger.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace RigTune {
namespace Config {

SettingsStore::SettingsStore(const std::string& filepath)
    : filepath_(filepath), values_(json::object()) {
    load();
}

void SettingsStore::load() {
    Utils::ModuleLogger logger("SETTINGS");

    std::ifstream file(filepath_);
    if (!file.is_open()) {
        logger.debug("No settings file at " + filepath_ + ", starting empty");
        return;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        json parsed = json::parse(buffer.str());
        if (parsed.is_object()) {
            values_ = parsed;
        } else {
            logger.error("Settings file is not a JSON object: " + filepath_);
        }
    } catch (const json::exception& e) {
        logger.error("Failed to load settings: " + std::string(e.what()));
    }
}

bool SettingsStore::save() const {
    Utils::ModuleLogger logger("SETTINGS");

    std::error_code ec;
    fs::path parent = fs::path(filepath_).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::ofstream file(filepath_, std::ios::trunc);
    if (!file.is_open()) {
        logger.error("Failed to save settings: cannot open " + filepath_);
        return false;
    }

    file << values_.dump(4);
    if (!file.good()) {
        logger.error("Failed to save settings: write error on " + filepath_);
        return false;
    }
    return true;
}

json SettingsStore::get(const std::string& key, const json& default_value) const {
    auto it = values_.find(key);
    if (it == values_.end()) {
        return default_value;
    }
    return *it;
}

bool SettingsStore::contains(const std::string& key) const {
    return values_.contains(key);
}

bool SettingsStore::set(const std::string& key, const json& value) {
    values_[key] = value;
    return save();
}

bool SettingsStore::erase(const std::string& key) {
    if (values_.erase(key) == 0) {
        return true;
    }
    return save();
}

} // namespace Config
} // namespace RigTune
