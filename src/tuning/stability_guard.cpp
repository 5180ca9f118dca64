#include "tuning/stability_guard.hpp"

namespace RigTune {
namespace Tuning {

StabilityGuard::StabilityGuard(Config::SettingsStore& settings)
    : settings_(settings), logger_("STABILITY") {}

bool StabilityGuard::crashed_last_run() const {
    Config::json flag = settings_.get(kCrashFlagKey, false);
    return flag.is_boolean() && flag.get<bool>();
}

void StabilityGuard::mark_running() {
    logger_.debug("Setting instability flag (app is running)");
    if (!settings_.set(kCrashFlagKey, true)) {
        logger_.warning("Instability flag could not be persisted");
    }
}

void StabilityGuard::mark_clean_shutdown() {
    logger_.debug("Clearing instability flag (clean shutdown)");
    if (!settings_.set(kCrashFlagKey, false)) {
        logger_.warning("Instability flag could not be cleared");
    }
}

bool StabilityGuard::backup_section(const std::string& section) {
    logger_.info("Backing up '" + section + "' settings before applying changes");
    Config::json current = settings_.get(section, Config::json::object());
    return settings_.set(kBackupPrefix + section, current);
}

bool StabilityGuard::rollback_section(const std::string& section) {
    std::string backup_key = kBackupPrefix + section;
    if (!settings_.contains(backup_key)) {
        logger_.error("No backup found for section '" + section + "', cannot roll back");
        return false;
    }

    logger_.warning("Rolling back '" + section + "' settings");
    if (!settings_.set(section, settings_.get(backup_key))) {
        return false;
    }
    logger_.info("Successfully rolled back '" + section + "' settings");
    return true;
}

} // namespace Tuning
} // namespace RigTune
