#include "tuning/game_profile.hpp"
#include <cstdint>
#include <stdexcept>

namespace RigTune {
namespace Tuning {

namespace {

template<typename T>
std::optional<T> get_optional(const json& j, const std::string& key) {
    if (j.contains(key)) {
        return j[key].get<T>();
    }
    return std::nullopt;
}

} // namespace

const char* resolution_name(Resolution resolution) {
    switch (resolution) {
        case Resolution::R1080p: return "1080p";
        case Resolution::R1440p: return "2K";
        case Resolution::R4K: return "4K";
        case Resolution::R5K: return "5K";
        case Resolution::R6K: return "6K";
    }
    return "1080p";
}

std::optional<Resolution> resolution_from_string(const std::string& name) {
    if (name == "1080p") return Resolution::R1080p;
    if (name == "2K" || name == "1440p") return Resolution::R1440p;
    if (name == "4K") return Resolution::R4K;
    if (name == "5K") return Resolution::R5K;
    if (name == "6K") return Resolution::R6K;
    return std::nullopt;
}

IO::SettingSchema default_settings_schema() {
    using IO::SettingRule;
    using IO::SettingType;

    IO::SettingSchema schema;
    schema["resolution"] = SettingRule{SettingType::String, {}, {}, {"1080p", "2K", "4K", "5K", "6K"}};
    schema["fps"] = SettingRule{SettingType::Int, 30.0, 240.0, {}};
    schema["upscaling"] = SettingRule{SettingType::String, {}, {}, {"Off", "DLSS", "FSR", "XeSS"}};
    schema["quality_preset"] = SettingRule{SettingType::String, {}, {},
        {"Quality", "Balanced", "Performance", "Ultra Performance"}};
    schema["ray_tracing"] = SettingRule{SettingType::Bool, {}, {}, {}};
    schema["resolution_scale"] = SettingRule{SettingType::Float, 0.1, 1.0, {}};

    // Manual tweaks accepted by most games
    schema["vrs"] = SettingRule{SettingType::Bool, {}, {}, {}};
    schema["low_latency"] = SettingRule{SettingType::Bool, {}, {}, {}};
    schema["dynamic_res"] = SettingRule{SettingType::Bool, {}, {}, {}};
    schema["dynres_min"] = SettingRule{SettingType::Int, 30.0, 120.0, {}};
    schema["framecap"] = SettingRule{SettingType::Bool, {}, {}, {}};
    schema["framecap_val"] = SettingRule{SettingType::Int, 30.0, 240.0, {}};
    return schema;
}

GameProfile GameProfile::from_json(const json& j) {
    GameProfile profile;
    profile.name = j.at("name").get<std::string>();
    if (profile.name.empty()) {
        throw std::runtime_error("Game profile without a name");
    }

    if (j.contains("executable_names")) {
        for (const auto& exe : j["executable_names"]) {
            profile.executable_names.insert(exe.get<std::string>());
        }
    }
    profile.config_file_path = get_optional<std::string>(j, "config_file_path").value_or("");

    CapabilityRequirements& req = profile.capability_requirements;
    req.supports_dlss = get_optional<bool>(j, "supports_dlss").value_or(false);
    req.supports_fsr = get_optional<bool>(j, "supports_fsr").value_or(false);
    req.supports_xess = get_optional<bool>(j, "supports_xess").value_or(false);
    req.supports_raytracing = get_optional<bool>(j, "supports_raytracing").value_or(false);

    if (auto res = get_optional<std::string>(j, "target_resolution")) {
        auto parsed = resolution_from_string(*res);
        if (!parsed) {
            throw std::runtime_error("Unknown target resolution '" + *res + "' in profile " + profile.name);
        }
        profile.target_resolution = *parsed;
    }
    if (auto fps = get_optional<int64_t>(j, "target_fps")) {
        if (*fps <= 0) {
            throw std::runtime_error("Target fps must be positive in profile " + profile.name);
        }
        profile.target_fps = static_cast<unsigned int>(*fps);
    }

    if (j.contains("settings_schema")) {
        profile.settings_schema = IO::schema_from_json(j["settings_schema"]);
    }
    profile.last_applied = get_optional<std::string>(j, "last_applied").value_or("");

    return profile;
}

json GameProfile::to_json() const {
    json j;
    j["name"] = name;
    j["executable_names"] = executable_names;
    j["config_file_path"] = config_file_path;
    j["supports_dlss"] = capability_requirements.supports_dlss;
    j["supports_fsr"] = capability_requirements.supports_fsr;
    j["supports_xess"] = capability_requirements.supports_xess;
    j["supports_raytracing"] = capability_requirements.supports_raytracing;
    j["target_resolution"] = resolution_name(target_resolution);
    j["target_fps"] = target_fps;
    j["settings_schema"] = IO::schema_to_json(settings_schema);
    if (!last_applied.empty()) {
        j["last_applied"] = last_applied;
    }
    return j;
}

} // namespace Tuning
} // namespace RigTune
