#pragma once

#include "io/setting_schema.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>

namespace RigTune {
namespace Tuning {

using json = nlohmann::json;

enum class Resolution {
    R1080p,
    R1440p,   // "2K"
    R4K,
    R5K,
    R6K
};

const char* resolution_name(Resolution resolution);
std::optional<Resolution> resolution_from_string(const std::string& name);

// Upscalers and features the game itself can use
struct CapabilityRequirements {
    bool supports_dlss = false;
    bool supports_fsr = false;
    bool supports_xess = false;
    bool supports_raytracing = false;
};

// Schema applied to generated settings when a profile does not carry its own
IO::SettingSchema default_settings_schema();

struct GameProfile {
    std::string name;
    std::set<std::string> executable_names;
    std::string config_file_path;
    CapabilityRequirements capability_requirements;
    Resolution target_resolution = Resolution::R1080p;
    unsigned int target_fps = 60;
    IO::SettingSchema settings_schema = default_settings_schema();
    std::string last_applied;   // timestamp of the last successful apply, empty if never

    // Flat record: name, executable_names, config_file_path, supports_dlss,
    // supports_fsr, supports_xess, supports_raytracing, target_resolution,
    // target_fps, settings_schema, last_applied. Throws json::exception on a
    // missing name or a wrongly typed field, std::runtime_error on an empty
    // name, an unknown resolution or a target_fps that is not positive.
    static GameProfile from_json(const json& j);
    json to_json() const;
};

} // namespace Tuning
} // namespace RigTune
