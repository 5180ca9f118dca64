#include "tuning/performance_tier.hpp"

namespace RigTune {
namespace Tuning {

namespace {

constexpr unsigned int kHighMinCores = 8;
constexpr size_t kHighMinRamMb = 12 * 1024;
constexpr unsigned int kNormalMinCores = 4;
constexpr size_t kNormalMinRamMb = 6 * 1024;

} // namespace

const char* tier_name(PerformanceTier tier) {
    switch (tier) {
        case PerformanceTier::Low: return "Low-End";
        case PerformanceTier::Normal: return "Normal";
        case PerformanceTier::High: return "High-End";
    }
    return "Low-End";
}

std::optional<PerformanceTier> tier_from_string(const std::string& name) {
    if (name == "Low-End") return PerformanceTier::Low;
    if (name == "Normal") return PerformanceTier::Normal;
    if (name == "High-End") return PerformanceTier::High;
    return std::nullopt;
}

PerformanceTier classify(unsigned int physical_cores, size_t total_ram_mb) {
    if (physical_cores >= kHighMinCores && total_ram_mb >= kHighMinRamMb) {
        return PerformanceTier::High;
    }
    if (physical_cores >= kNormalMinCores && total_ram_mb >= kNormalMinRamMb) {
        return PerformanceTier::Normal;
    }
    return PerformanceTier::Low;
}

PerformanceTier classify(const Hardware::HardwareSnapshot& snapshot) {
    return classify(snapshot.cpu.physical_cores, snapshot.memory.total_mb);
}

bool is_feature_unlocked(PerformanceTier required, PerformanceTier current) {
    return static_cast<int>(required) <= static_cast<int>(current);
}

TierStore::TierStore(Config::SettingsStore& settings)
    : settings_(settings), logger_("TIER") {}

bool TierStore::has_committed_tier() const {
    return settings_.contains(kSettingsKey);
}

PerformanceTier TierStore::current() const {
    Config::json stored = settings_.get(kSettingsKey, tier_name(PerformanceTier::Low));
    if (!stored.is_string()) {
        return PerformanceTier::Low;
    }
    return tier_from_string(stored.get<std::string>()).value_or(PerformanceTier::Low);
}

PerformanceTier TierStore::resolve(const Hardware::HardwareSnapshot& snapshot) {
    if (has_committed_tier()) {
        PerformanceTier tier = current();
        logger_.debug(std::string("Using committed performance mode: ") + tier_name(tier));
        return tier;
    }
    return reclassify(snapshot);
}

PerformanceTier TierStore::reclassify(const Hardware::HardwareSnapshot& snapshot) {
    PerformanceTier tier = classify(snapshot);
    logger_.info(std::string("Determined hardware performance mode: ") + tier_name(tier));
    commit(tier);
    return tier;
}

void TierStore::override_tier(PerformanceTier tier) {
    logger_.info(std::string("Performance mode overridden by user: ") + tier_name(tier));
    commit(tier);
}

void TierStore::commit(PerformanceTier tier) {
    if (!settings_.set(kSettingsKey, tier_name(tier))) {
        logger_.warning("Performance mode could not be persisted, it will be reclassified next run");
    }
}

} // namespace Tuning
} // namespace RigTune
