#include "tuning/profile_store.hpp"
#include "hardware/capability_table.hpp"
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace RigTune {
namespace Tuning {

namespace {

GameProfile make_profile(const std::string& name, const std::string& exe,
                         const std::string& config_path, bool dlss, bool fsr, bool rt,
                         Resolution resolution, unsigned int fps) {
    GameProfile profile;
    profile.name = name;
    profile.executable_names = {exe};
    profile.config_file_path = config_path;
    profile.capability_requirements.supports_dlss = dlss;
    profile.capability_requirements.supports_fsr = fsr;
    profile.capability_requirements.supports_raytracing = rt;
    profile.target_resolution = resolution;
    profile.target_fps = fps;
    return profile;
}

bool same_name(const std::string& a, const std::string& b) {
    return Hardware::to_lower(a) == Hardware::to_lower(b);
}

// Lower-cased names of the regular files under dir, down to max_depth
void collect_file_names(const fs::path& dir, int max_depth, std::set<std::string>& names,
                        Utils::ModuleLogger& logger) {
    std::error_code ec;
    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        logger.debug("Skipping search directory " + dir.string() + ": " + ec.message());
        return;
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            logger.debug("Stopped scanning " + dir.string() + ": " + ec.message());
            return;
        }
        if (it.depth() >= max_depth) {
            it.disable_recursion_pending();
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            names.insert(Hardware::to_lower(it->path().filename().string()));
        }
    }
}

} // namespace

ProfileStore::ProfileStore(const std::string& filepath)
    : filepath_(filepath), logger_("PROFILES") {}

std::vector<GameProfile> ProfileStore::default_profiles() {
    return {
        make_profile("Cyberpunk 2077", "Cyberpunk2077.exe",
                     "Documents/CD Projekt RED/Cyberpunk 2077/UserSettings.json",
                     true, true, true, Resolution::R4K, 60),
        make_profile("Call of Duty: Modern Warfare II", "cod.exe",
                     "Documents/Call of Duty/players/config.cfg",
                     true, true, false, Resolution::R1440p, 120),
        make_profile("Fortnite", "FortniteClient-Win64-Shipping.exe",
                     "AppData/Local/FortniteGame/Saved/Config/WindowsClient/GameUserSettings.ini",
                     true, false, false, Resolution::R1080p, 144),
        make_profile("Valorant", "VALORANT-Win64-Shipping.exe",
                     "AppData/Local/VALORANT/Saved/Config/Windows/RiotUserSettings.ini",
                     false, false, false, Resolution::R1080p, 240),
        make_profile("Apex Legends", "r5apex.exe",
                     "Documents/Respawn/Apex Legends/local/videoconfig.txt",
                     false, true, false, Resolution::R1440p, 144),
    };
}

std::vector<GameProfile> ProfileStore::parse_profiles(const std::string& json_text) {
    json j = json::parse(json_text);
    if (!j.is_object() || !j.contains("games") || !j["games"].is_array()) {
        throw std::runtime_error("Profile store must be an object with a \"games\" array");
    }

    std::vector<GameProfile> profiles;
    for (const auto& entry : j["games"]) {
        profiles.push_back(GameProfile::from_json(entry));
    }
    return profiles;
}

std::string ProfileStore::serialize_profiles(const std::vector<GameProfile>& profiles) {
    json games = json::array();
    for (const auto& profile : profiles) {
        games.push_back(profile.to_json());
    }
    json j;
    j["games"] = games;
    return j.dump(4);
}

bool ProfileStore::write_file(const std::string& filepath, const std::string& contents,
                              Utils::ModuleLogger& logger) {
    std::error_code ec;
    fs::path parent = fs::path(filepath).parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
    }

    std::ofstream file(filepath, std::ios::trunc);
    if (!file.is_open()) {
        logger.error("Cannot open profile store for writing: " + filepath);
        return false;
    }
    file << contents;
    file.close();
    if (file.fail()) {
        logger.error("Error writing profile store: " + filepath);
        return false;
    }
    return true;
}

std::vector<GameProfile> ProfileStore::load_profiles() {
    std::error_code ec;
    if (!fs::exists(filepath_, ec)) {
        logger_.warning("Game profiles file not found at " + filepath_ + ", creating defaults");
        profiles_ = default_profiles();
        if (!save_profiles(profiles_)) {
            logger_.warning("Default profiles are kept in memory only");
        }
        return profiles_;
    }

    std::ifstream file(filepath_);
    if (!file.is_open()) {
        logger_.error("Cannot open profile store " + filepath_ + ", continuing without profiles");
        profiles_.clear();
        return profiles_;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    // The file is left as is until the next explicit save
    try {
        profiles_ = parse_profiles(buffer.str());
    } catch (const json::exception& e) {
        logger_.error("Invalid profile store " + filepath_ + ": " + e.what() +
                      ", continuing without profiles");
        profiles_.clear();
        return profiles_;
    } catch (const std::runtime_error& e) {
        logger_.error("Invalid profile store " + filepath_ + ": " + e.what() +
                      ", continuing without profiles");
        profiles_.clear();
        return profiles_;
    }

    logger_.info("Loaded " + std::to_string(profiles_.size()) + " game profiles");
    return profiles_;
}

std::vector<GameProfile> ProfileStore::detect_installed(
    const std::string& base_dir, const std::vector<std::string>& search_dirs) const {
    Utils::ModuleLogger logger("PROFILES");
    std::set<std::string> file_names;
    for (const auto& dir : search_dirs) {
        collect_file_names(dir, kExecutableSearchDepth, file_names, logger);
    }

    std::vector<GameProfile> installed;
    for (const auto& profile : profiles_) {
        bool found = false;

        fs::path config = profile.config_file_path;
        if (config.is_relative() && !config.empty()) {
            config = base_dir.empty() ? fs::path() : fs::path(base_dir) / config;
        }
        if (!config.empty()) {
            std::error_code ec;
            found = fs::exists(config, ec);
        }

        for (const auto& exe : profile.executable_names) {
            if (found) break;
            found = file_names.count(Hardware::to_lower(exe)) > 0;
        }

        if (found) {
            installed.push_back(profile);
        }
    }

    logger.info("Detected " + std::to_string(installed.size()) + " of " +
                std::to_string(profiles_.size()) + " games as installed");
    return installed;
}

bool ProfileStore::save_profiles(const std::vector<GameProfile>& profiles) {
    if (!write_file(filepath_, serialize_profiles(profiles), logger_)) {
        return false;
    }
    if (&profiles != &profiles_) {
        profiles_ = profiles;
    }
    logger_.debug("Saved " + std::to_string(profiles.size()) + " game profiles");
    return true;
}

std::optional<GameProfile> ProfileStore::find(const std::string& name) const {
    for (const auto& profile : profiles_) {
        if (same_name(profile.name, name)) {
            return profile;
        }
    }
    return std::nullopt;
}

bool ProfileStore::upsert(const GameProfile& profile) {
    std::vector<GameProfile> updated = profiles_;

    bool replaced = false;
    for (auto& existing : updated) {
        if (same_name(existing.name, profile.name)) {
            existing = profile;
            replaced = true;
            break;
        }
    }
    if (!replaced) {
        updated.push_back(profile);
    }

    return save_profiles(updated);
}

std::optional<size_t> ProfileStore::import_profiles(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        logger_.error("Failed to import game profiles: cannot open " + filepath);
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    std::vector<GameProfile> imported;
    try {
        imported = parse_profiles(buffer.str());
    } catch (const json::exception& e) {
        logger_.error("Failed to import game profiles from " + filepath + ": " + e.what());
        return std::nullopt;
    } catch (const std::runtime_error& e) {
        logger_.error("Failed to import game profiles from " + filepath + ": " + e.what());
        return std::nullopt;
    }

    std::vector<GameProfile> merged = profiles_;
    for (const auto& profile : imported) {
        bool replaced = false;
        for (auto& existing : merged) {
            if (same_name(existing.name, profile.name)) {
                existing = profile;
                replaced = true;
                break;
            }
        }
        if (!replaced) {
            merged.push_back(profile);
        }
    }

    if (!save_profiles(merged)) {
        return std::nullopt;
    }

    logger_.info("Imported " + std::to_string(imported.size()) + " game profiles from " + filepath);
    return imported.size();
}

bool ProfileStore::export_profiles(const std::string& filepath) const {
    Utils::ModuleLogger logger("PROFILES");
    if (!write_file(filepath, serialize_profiles(profiles_), logger)) {
        return false;
    }
    logger.info("Exported " + std::to_string(profiles_.size()) + " game profiles to " + filepath);
    return true;
}

} // namespace Tuning
} // namespace RigTune
