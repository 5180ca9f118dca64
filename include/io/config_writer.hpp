#pragma once

#include "io/setting_schema.hpp"
#include "io/settings_map.hpp"
#include "utils/logger.hpp"
#include <optional>
#include <string>

namespace RigTune {
namespace IO {

enum class ConfigFormat {
    Ini,    // .ini .cfg .ltx
    Json,   // .json .jsn
    Xml,    // .xml
    Raw     // anything else, debug dump of the map
};

const char* config_format_name(ConfigFormat format);
std::optional<ConfigFormat> config_format_from_string(const std::string& name);
ConfigFormat config_format_for_path(const std::string& path);

// Outcome of checking a settings map against a schema. On failure, field names
// the first offending key.
struct ValidationResult {
    bool ok = true;
    std::string field;
    std::string reason;

    static ValidationResult success() { return ValidationResult{}; }
    static ValidationResult failure(const std::string& field, const std::string& reason) {
        return ValidationResult{false, field, reason};
    }
};

/**
 * Serializes settings into a game's native config file.
 *
 * Every write backs the existing file up to "<path>.bak" first. If the file
 * exists and the backup cannot be made, the write is refused and the original
 * stays untouched. Failures are reported through the return value and the
 * log, never by exception.
 */
class ConfigWriter {
public:
    static constexpr const char* kBackupSuffix = ".bak";

    ConfigWriter();

    bool write(const std::string& path, const SettingsMap& settings,
               std::optional<ConfigFormat> format_hint = std::nullopt);

    // Copies path to path.bak, replacing an older backup. nullopt if path does
    // not exist or the copy failed.
    std::optional<std::string> backup(const std::string& path);

    // Copies path.bak back over path; false when there is no backup
    bool restore(const std::string& path);

    // INI and XML values come back as strings; JSON keeps its types.
    // Unknown formats yield {raw: <contents>}, missing files an empty map.
    // format_hint overrides the extension like it does for write().
    SettingsMap read(const std::string& path,
                     std::optional<ConfigFormat> format_hint = std::nullopt);

    static ValidationResult validate(const SettingsMap& settings, const SettingSchema& schema);

    static std::string backup_path_for(const std::string& path);
    static std::string render(const SettingsMap& settings, ConfigFormat format);

private:
    Utils::ModuleLogger logger_;
};

} // namespace IO
} // namespace RigTune
