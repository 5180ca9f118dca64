#pragma once

#include "hardware/snapshot_collector.hpp"
#include "io/config_writer.hpp"
#include "tuning/game_optimizer.hpp"
#include "tuning/performance_tier.hpp"
#include "tuning/profile_store.hpp"
#include "utils/logger.hpp"
#include <optional>
#include <string>

namespace RigTune {
namespace Executor {

enum class ApplyStatus {
    Applied,
    UnknownGame,
    ValidationFailed,
    WriteFailed
};

const char* apply_status_name(ApplyStatus status);

struct ApplyResult {
    ApplyStatus status = ApplyStatus::UnknownGame;
    Tuning::OptimizationDecision decision;
    IO::SettingsMap settings;
    IO::ValidationResult validation;
    std::optional<std::string> backup_path;   // set when an existing file was backed up

    bool applied() const { return status == ApplyStatus::Applied; }
};

// Runs the apply-settings action end to end:
// snapshot -> tier -> decision -> settings -> validate -> write -> persist profile
class OptimizationExecutor {
public:
    OptimizationExecutor(Hardware::SnapshotCollector& collector,
                         Tuning::TierStore& tiers,
                         Tuning::ProfileStore& profiles,
                         IO::ConfigWriter& writer);

    ApplyResult apply(const std::string& game_name,
                      const Tuning::OptimizerOverrides& overrides = {});

    // Same decision as apply() without touching any file
    std::optional<Tuning::OptimizationDecision> preview(
        const std::string& game_name, const Tuning::OptimizerOverrides& overrides = {});

    bool restore(const std::string& game_name);

    std::string get_status() const { return status_; }

private:
    Hardware::SnapshotCollector& collector_;
    Tuning::TierStore& tiers_;
    Tuning::ProfileStore& profiles_;
    IO::ConfigWriter& writer_;
    Utils::ModuleLogger logger_;
    std::string status_;

    static std::string current_timestamp();
};

} // namespace Executor
} // namespace RigTune
