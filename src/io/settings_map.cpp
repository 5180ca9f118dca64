#include "io/settings_map.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace RigTune {
namespace IO {

const char* setting_type_name(const SettingValue& value) {
    switch (value.index()) {
        case 0: return "bool";
        case 1: return "int";
        case 2: return "float";
        default: return "string";
    }
}

std::string format_double(double value) {
    if (std::isnan(value)) return "nan";
    if (std::isinf(value)) return value > 0 ? "inf" : "-inf";

    char buffer[64];
    int precision = 1;
    for (; precision < 17; ++precision) {
        std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, value);
        if (std::strtod(buffer, nullptr) == value) {
            break;
        }
    }
    std::snprintf(buffer, sizeof(buffer), "%.*e", precision - 1, value);

    std::string scientific(buffer);
    size_t e_pos = scientific.find('e');
    int exponent = std::atoi(scientific.c_str() + e_pos + 1);

    if (exponent < -4 || exponent >= 16) {
        char exponent_text[16];
        std::snprintf(exponent_text, sizeof(exponent_text), "e%c%02d",
                      exponent < 0 ? '-' : '+', std::abs(exponent));
        return scientific.substr(0, e_pos) + exponent_text;
    }

    int decimals = std::max(precision - 1 - exponent, 0);
    std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
    std::string fixed(buffer);
    if (fixed.find('.') == std::string::npos) {
        fixed += ".0";
    }
    return fixed;
}

std::string to_display_string(const SettingValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        return *b ? "True" : "False";
    }
    if (const int64_t* i = std::get_if<int64_t>(&value)) {
        return std::to_string(*i);
    }
    if (const double* d = std::get_if<double>(&value)) {
        return format_double(*d);
    }
    return std::get<std::string>(value);
}

std::string to_repr_string(const SettingValue& value) {
    const std::string* text = std::get_if<std::string>(&value);
    if (!text) {
        return to_display_string(value);
    }

    // Single quotes unless the text holds a single quote and no double quote
    bool has_single = text->find('\'') != std::string::npos;
    bool has_double = text->find('"') != std::string::npos;
    char quote = (has_single && !has_double) ? '"' : '\'';

    std::ostringstream out;
    out << quote;
    for (char c : *text) {
        switch (c) {
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (c == quote) out << '\\';
                out << c;
        }
    }
    out << quote;
    return out.str();
}

SettingsMap::SettingsMap(std::initializer_list<Entry> entries) {
    for (const auto& entry : entries) {
        set(entry.first, entry.second);
    }
}

void SettingsMap::set(const std::string& key, SettingValue value) {
    for (auto& entry : entries_) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(key, std::move(value));
}

bool SettingsMap::erase(const std::string& key) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&key](const Entry& entry) { return entry.first == key; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

const SettingValue* SettingsMap::find(const std::string& key) const {
    for (const auto& entry : entries_) {
        if (entry.first == key) {
            return &entry.second;
        }
    }
    return nullptr;
}

std::string SettingsMap::to_repr() const {
    std::ostringstream out;
    out << "{";
    bool first = true;
    for (const auto& entry : entries_) {
        if (!first) out << ", ";
        first = false;
        out << to_repr_string(entry.first) << ": " << to_repr_string(entry.second);
    }
    out << "}";
    return out.str();
}

ordered_json SettingsMap::to_json() const {
    ordered_json j = ordered_json::object();
    for (const auto& entry : entries_) {
        std::visit([&j, &entry](const auto& v) { j[entry.first] = v; }, entry.second);
    }
    return j;
}

SettingsMap SettingsMap::from_json(const ordered_json& j) {
    SettingsMap settings;
    if (!j.is_object()) {
        return settings;
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        const ordered_json& v = it.value();
        if (v.is_boolean()) {
            settings.set(it.key(), v.get<bool>());
        } else if (v.is_number_integer()) {
            settings.set(it.key(), v.get<int64_t>());
        } else if (v.is_number_float()) {
            settings.set(it.key(), v.get<double>());
        } else if (v.is_string()) {
            settings.set(it.key(), v.get<std::string>());
        } else {
            settings.set(it.key(), v.dump());
        }
    }
    return settings;
}

} // namespace IO
} // namespace RigTune
