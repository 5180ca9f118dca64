#include "io/config_writer.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace RigTune {
namespace IO {

namespace {

std::string lower_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::string xml_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c;
        }
    }
    return out;
}

std::string xml_unescape(const std::string& text) {
    static const std::pair<const char*, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}
    };

    std::string out;
    size_t i = 0;
    while (i < text.size()) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& entity : entities) {
                std::string name(entity.first);
                if (text.compare(i, name.size(), name) == 0) {
                    out += entity.second;
                    i += name.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) {
            out += text[i++];
        }
    }
    return out;
}

std::string render_ini(const SettingsMap& settings) {
    std::string out;
    bool first = true;
    for (const auto& [key, value] : settings) {
        if (!first) out += "\n";
        first = false;
        out += key + "=" + to_display_string(value);
    }
    return out;
}

std::string render_xml(const SettingsMap& settings) {
    std::string out = "<?xml version='1.0' encoding='utf-8'?>\n<Settings>";
    for (const auto& [key, value] : settings) {
        out += "<" + key + ">" + xml_escape(to_display_string(value)) + "</" + key + ">";
    }
    out += "</Settings>";
    return out;
}

SettingsMap parse_ini(const std::string& contents) {
    SettingsMap settings;
    std::istringstream stream(contents);
    std::string line;
    while (std::getline(stream, line)) {
        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        settings.set(trim(line.substr(0, eq)), trim(line.substr(eq + 1)));
    }
    return settings;
}

// Reads the flat <Settings><key>value</key>...</Settings> layout written above
SettingsMap parse_flat_xml(const std::string& contents) {
    SettingsMap settings;

    size_t pos = contents.find("<Settings");
    if (pos == std::string::npos) {
        return settings;
    }
    pos = contents.find('>', pos);
    if (pos == std::string::npos || contents[pos - 1] == '/') {
        return settings;
    }
    ++pos;

    while (true) {
        size_t open = contents.find('<', pos);
        if (open == std::string::npos || contents.compare(open, 2, "</") == 0) {
            break;
        }
        size_t close = contents.find('>', open);
        if (close == std::string::npos) {
            break;
        }

        std::string tag = contents.substr(open + 1, close - open - 1);
        if (!tag.empty() && tag.back() == '/') {
            settings.set(trim(tag.substr(0, tag.size() - 1)), std::string());
            pos = close + 1;
            continue;
        }

        std::string end_tag = "</" + tag + ">";
        size_t end = contents.find(end_tag, close + 1);
        if (end == std::string::npos) {
            break;
        }
        settings.set(tag, xml_unescape(contents.substr(close + 1, end - close - 1)));
        pos = end + end_tag.size();
    }
    return settings;
}

} // namespace

const char* config_format_name(ConfigFormat format) {
    switch (format) {
        case ConfigFormat::Ini: return "ini";
        case ConfigFormat::Json: return "json";
        case ConfigFormat::Xml: return "xml";
        case ConfigFormat::Raw: return "raw";
    }
    return "raw";
}

std::optional<ConfigFormat> config_format_from_string(const std::string& name) {
    if (name == "ini") return ConfigFormat::Ini;
    if (name == "json") return ConfigFormat::Json;
    if (name == "xml") return ConfigFormat::Xml;
    if (name == "raw") return ConfigFormat::Raw;
    return std::nullopt;
}

ConfigFormat config_format_for_path(const std::string& path) {
    std::string ext = lower_extension(path);
    if (ext == ".ini" || ext == ".cfg" || ext == ".ltx") return ConfigFormat::Ini;
    if (ext == ".json" || ext == ".jsn") return ConfigFormat::Json;
    if (ext == ".xml") return ConfigFormat::Xml;
    return ConfigFormat::Raw;
}

ConfigWriter::ConfigWriter() : logger_("CONFIG_WRITER") {}

std::string ConfigWriter::backup_path_for(const std::string& path) {
    return path + kBackupSuffix;
}

std::string ConfigWriter::render(const SettingsMap& settings, ConfigFormat format) {
    switch (format) {
        case ConfigFormat::Ini: return render_ini(settings);
        case ConfigFormat::Json: return settings.to_json().dump(2);
        case ConfigFormat::Xml: return render_xml(settings);
        case ConfigFormat::Raw: return settings.to_repr();
    }
    return settings.to_repr();
}

std::optional<std::string> ConfigWriter::backup(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }

    std::string backup_path = backup_path_for(path);
    fs::copy_file(path, backup_path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        logger_.error("Failed to backup config " + path + ": " + ec.message());
        return std::nullopt;
    }

    logger_.info("Config backup created: " + backup_path);
    return backup_path;
}

bool ConfigWriter::restore(const std::string& path) {
    std::string backup_path = backup_path_for(path);

    std::error_code ec;
    if (!fs::exists(backup_path, ec)) {
        logger_.warning("No backup to restore for " + path);
        return false;
    }

    fs::copy_file(backup_path, path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        logger_.error("Failed to restore config from backup: " + ec.message());
        return false;
    }

    logger_.info("Config restored from backup: " + backup_path);
    return true;
}

bool ConfigWriter::write(const std::string& path, const SettingsMap& settings,
                         std::optional<ConfigFormat> format_hint) {
    ConfigFormat format = format_hint.value_or(config_format_for_path(path));

    // Render before touching the file so a failure leaves it intact
    std::string contents;
    try {
        contents = render(settings, format);
    } catch (const nlohmann::json::exception& e) {
        logger_.error("Failed to render config " + path + ": " + e.what());
        return false;
    }

    std::error_code ec;
    if (fs::exists(path, ec) && !backup(path).has_value()) {
        logger_.error("Refusing to write " + path + " without a backup");
        return false;
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
        logger_.error("Failed to write config " + path + ": cannot open file");
        return false;
    }

    file << contents;
    file.close();
    if (file.fail()) {
        logger_.error("Failed to write config " + path + ": write error");
        return false;
    }

    logger_.info(std::string("Wrote ") + config_format_name(format) + " config: " + path);
    return true;
}

SettingsMap ConfigWriter::read(const std::string& path, std::optional<ConfigFormat> format_hint) {
    std::ifstream file(path);
    if (!file.is_open()) {
        logger_.debug("Config not readable: " + path);
        return SettingsMap();
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    std::string contents = buffer.str();

    switch (format_hint.value_or(config_format_for_path(path))) {
        case ConfigFormat::Ini:
            return parse_ini(contents);
        case ConfigFormat::Json:
            try {
                ordered_json j = ordered_json::parse(contents);
                if (!j.is_object()) {
                    logger_.warning("JSON config is not an object: " + path);
                    return SettingsMap();
                }
                return SettingsMap::from_json(j);
            } catch (const ordered_json::exception& e) {
                logger_.error("Failed to read config " + path + ": " + std::string(e.what()));
                return SettingsMap();
            }
        case ConfigFormat::Xml:
            return parse_flat_xml(contents);
        case ConfigFormat::Raw:
            break;
    }

    SettingsMap raw;
    raw.set("raw", contents);
    return raw;
}

ValidationResult ConfigWriter::validate(const SettingsMap& settings, const SettingSchema& schema) {
    for (const auto& [key, value] : settings) {
        auto rule_it = schema.find(key);
        if (rule_it == schema.end()) {
            return ValidationResult::failure(key, "Unknown setting: " + key);
        }
        const SettingRule& rule = rule_it->second;

        switch (rule.type) {
            case SettingType::Int:
            case SettingType::Float: {
                double number = 0.0;
                if (const int64_t* i = std::get_if<int64_t>(&value)) {
                    number = static_cast<double>(*i);
                } else if (rule.type == SettingType::Float && std::holds_alternative<double>(value)) {
                    number = std::get<double>(value);
                } else {
                    return ValidationResult::failure(
                        key, "Setting " + key + " must be " + setting_type_name(rule.type));
                }
                if (rule.min && number < *rule.min) {
                    return ValidationResult::failure(key, "Setting " + key + " too low");
                }
                if (rule.max && number > *rule.max) {
                    return ValidationResult::failure(key, "Setting " + key + " too high");
                }
                break;
            }
            case SettingType::String: {
                const std::string* text = std::get_if<std::string>(&value);
                if (!text) {
                    return ValidationResult::failure(key, "Setting " + key + " must be string");
                }
                if (!rule.options.empty() &&
                    std::find(rule.options.begin(), rule.options.end(), *text) == rule.options.end()) {
                    return ValidationResult::failure(key, "Setting " + key + " invalid value");
                }
                break;
            }
            case SettingType::Bool:
                if (!std::holds_alternative<bool>(value)) {
                    return ValidationResult::failure(key, "Setting " + key + " must be bool");
                }
                break;
        }
    }
    return ValidationResult::success();
}

} // namespace IO
} // namespace RigTune
