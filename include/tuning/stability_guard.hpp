#pragma once

#include "config/settings_store.hpp"
#include "utils/logger.hpp"
#include <string>

namespace RigTune {
namespace Tuning {

/**
 * Crash flag and settings rollback across runs.
 *
 * mark_running() raises a flag in the settings store that only
 * mark_clean_shutdown() clears, so a flag still set at startup means the
 * previous run died. Sections of the settings store can be snapshotted under
 * "backups.<section>" before risky changes and rolled back afterwards.
 */
class StabilityGuard {
public:
    static constexpr const char* kCrashFlagKey = "app.had_crash_on_last_run";
    static constexpr const char* kBackupPrefix = "backups.";

    explicit StabilityGuard(Config::SettingsStore& settings);

    bool crashed_last_run() const;
    void mark_running();
    void mark_clean_shutdown();

    bool backup_section(const std::string& section);
    bool rollback_section(const std::string& section);

private:
    Config::SettingsStore& settings_;
    Utils::ModuleLogger logger_;
};

} // namespace Tuning
} // namespace RigTune
