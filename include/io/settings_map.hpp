#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace RigTune {
namespace IO {

using ordered_json = nlohmann::ordered_json;

using SettingValue = std::variant<bool, int64_t, double, std::string>;

// "bool", "int", "float" or "string"
const char* setting_type_name(const SettingValue& value);

// Scalar rendering used by the INI and XML writers: True/False, 60, 0.8, 1.0, text
std::string to_display_string(const SettingValue& value);

// Debug-dump rendering: strings are single-quoted, everything else as above
std::string to_repr_string(const SettingValue& value);

// Shortest decimal text that parses back to the same double, always with a
// fractional part or exponent ("1.0", "0.8", "1e+16")
std::string format_double(double value);

/**
 * Ordered key -> value map written to a game config file.
 *
 * Keeps insertion order, which is also the order keys are written out.
 * set() on an existing key replaces the value in place.
 */
class SettingsMap {
public:
    using Entry = std::pair<std::string, SettingValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    SettingsMap() = default;
    SettingsMap(std::initializer_list<Entry> entries);

    void set(const std::string& key, SettingValue value);
    bool erase(const std::string& key);

    const SettingValue* find(const std::string& key) const;
    bool contains(const std::string& key) const { return find(key) != nullptr; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    bool operator==(const SettingsMap& other) const { return entries_ == other.entries_; }
    bool operator!=(const SettingsMap& other) const { return !(*this == other); }

    // {'fps': 60, 'ray_tracing': True}
    std::string to_repr() const;

    ordered_json to_json() const;
    // Nested arrays and objects are stored as their JSON text
    static SettingsMap from_json(const ordered_json& j);

private:
    std::vector<Entry> entries_;
};

} // namespace IO
} // namespace RigTune
