#include "io/setting_schema.hpp"
#include <stdexcept>

namespace RigTune {
namespace IO {

const char* setting_type_name(SettingType type) {
    switch (type) {
        case SettingType::Int: return "int";
        case SettingType::Float: return "float";
        case SettingType::String: return "string";
        case SettingType::Bool: return "bool";
    }
    return "string";
}

std::optional<SettingType> setting_type_from_string(const std::string& name) {
    if (name == "int") return SettingType::Int;
    if (name == "float") return SettingType::Float;
    if (name == "string") return SettingType::String;
    if (name == "bool") return SettingType::Bool;
    return std::nullopt;
}

SettingRule SettingRule::from_json(const json& j) {
    SettingRule rule;

    std::string type_name = j.at("type").get<std::string>();
    auto type = setting_type_from_string(type_name);
    if (!type) {
        throw std::runtime_error("Unknown setting type: " + type_name);
    }
    rule.type = *type;

    if (j.contains("min")) rule.min = j["min"].get<double>();
    if (j.contains("max")) rule.max = j["max"].get<double>();
    if (j.contains("options")) rule.options = j["options"].get<std::vector<std::string>>();
    return rule;
}

json SettingRule::to_json() const {
    json j;
    j["type"] = setting_type_name(type);

    // Integer bounds go back out as integers
    auto bound = [this](double value) -> json {
        if (type == SettingType::Int) {
            return static_cast<int64_t>(value);
        }
        return value;
    };
    if (min) j["min"] = bound(*min);
    if (max) j["max"] = bound(*max);
    if (!options.empty()) j["options"] = options;
    return j;
}

SettingSchema schema_from_json(const json& j) {
    SettingSchema schema;
    for (auto it = j.begin(); it != j.end(); ++it) {
        schema[it.key()] = SettingRule::from_json(it.value());
    }
    return schema;
}

json schema_to_json(const SettingSchema& schema) {
    json j = json::object();
    for (const auto& [key, rule] : schema) {
        j[key] = rule.to_json();
    }
    return j;
}

} // namespace IO
} // namespace RigTune
