#pragma once

#include <nlohmann/json.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace RigTune {
namespace IO {

using json = nlohmann::json;

enum class SettingType {
    Int,
    Float,
    String,
    Bool
};

const char* setting_type_name(SettingType type);
std::optional<SettingType> setting_type_from_string(const std::string& name);

// Declared shape of one game setting
struct SettingRule {
    SettingType type = SettingType::String;
    std::optional<double> min;
    std::optional<double> max;
    std::vector<std::string> options;   // empty means any string

    static SettingRule from_json(const json& j);
    json to_json() const;
};

using SettingSchema = std::map<std::string, SettingRule>;

SettingSchema schema_from_json(const json& j);
json schema_to_json(const SettingSchema& schema);

} // namespace IO
} // namespace RigTune
