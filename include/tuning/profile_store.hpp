#pragma once

#include "tuning/game_profile.hpp"
#include "utils/logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace RigTune {
namespace Tuning {

/**
 * JSON-on-disk collection of game profiles: {"games": [ {...}, ... ]}.
 *
 * The whole file is rewritten after every change. There is no locking and no
 * atomic rename, so a crash mid-write can leave a truncated store; the next
 * load_profiles() then logs an error and starts from an empty list, leaving
 * the damaged file on disk until something is saved.
 */
class ProfileStore {
public:
    explicit ProfileStore(const std::string& filepath);

    // Creates and saves the built-in profiles when the file does not exist.
    // Unreadable or malformed content yields an empty list and an ERROR log.
    std::vector<GameProfile> load_profiles();
    bool save_profiles(const std::vector<GameProfile>& profiles);

    const std::vector<GameProfile>& profiles() const { return profiles_; }

    // Case-insensitive lookup by name
    std::optional<GameProfile> find(const std::string& name) const;

    // Replaces the profile with the same name (case-insensitive) or appends, then persists
    bool upsert(const GameProfile& profile);

    // Merges profiles from another store file; returns the number imported, nullopt on error
    std::optional<size_t> import_profiles(const std::string& filepath);
    bool export_profiles(const std::string& filepath) const;

    // Profiles that look installed: the config file exists (relative paths are
    // resolved against base_dir, and skipped when it is empty) or one of the
    // executables is found within
    // kExecutableSearchDepth levels of a search directory. Names compare
    // case-insensitively; unreadable directories are skipped.
    std::vector<GameProfile> detect_installed(const std::string& base_dir,
                                              const std::vector<std::string>& search_dirs) const;

    const std::string& path() const { return filepath_; }

    static constexpr int kExecutableSearchDepth = 3;

    static std::vector<GameProfile> default_profiles();
    static std::vector<GameProfile> parse_profiles(const std::string& json_text);
    static std::string serialize_profiles(const std::vector<GameProfile>& profiles);

private:
    static bool write_file(const std::string& filepath, const std::string& contents,
                           Utils::ModuleLogger& logger);

    std::string filepath_;
    std::vector<GameProfile> profiles_;
    Utils::ModuleLogger logger_;
};

} // namespace Tuning
} // namespace RigTune
