#pragma once

#include "config/settings_store.hpp"
#include "hardware/hardware_snapshot.hpp"
#include "utils/logger.hpp"
#include <optional>
#include <string>

namespace RigTune {
namespace Tuning {

enum class PerformanceTier {
    Low,
    Normal,
    High
};

// Persisted labels: "Low-End", "Normal", "High-End"
const char* tier_name(PerformanceTier tier);
std::optional<PerformanceTier> tier_from_string(const std::string& name);

// High: >= 8 cores and >= 12 GB. Normal: >= 4 cores and >= 6 GB. Otherwise Low.
PerformanceTier classify(unsigned int physical_cores, size_t total_ram_mb);
PerformanceTier classify(const Hardware::HardwareSnapshot& snapshot);

// High unlocks everything, Normal unlocks Normal and Low, Low unlocks Low only
bool is_feature_unlocked(PerformanceTier required, PerformanceTier current);

/**
 * First-run tier commit.
 *
 * The tier is classified once and written to the settings store; later runs
 * read it back and never reclassify on their own, even after a hardware
 * change. Only override_tier() or reclassify() replace the stored value.
 */
class TierStore {
public:
    static constexpr const char* kSettingsKey = "app.performance_mode";

    explicit TierStore(Config::SettingsStore& settings);

    PerformanceTier resolve(const Hardware::HardwareSnapshot& snapshot);
    PerformanceTier reclassify(const Hardware::HardwareSnapshot& snapshot);
    void override_tier(PerformanceTier tier);

    bool has_committed_tier() const;
    PerformanceTier current() const;

private:
    void commit(PerformanceTier tier);

    Config::SettingsStore& settings_;
    Utils::ModuleLogger logger_;
};

} // namespace Tuning
} // namespace RigTune
