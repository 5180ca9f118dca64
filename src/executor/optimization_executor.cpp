#include "executor/optimization_executor.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

namespace RigTune {
namespace Executor {

const char* apply_status_name(ApplyStatus status) {
    switch (status) {
        case ApplyStatus::Applied: return "applied";
        case ApplyStatus::UnknownGame: return "unknown game";
        case ApplyStatus::ValidationFailed: return "validation failed";
        case ApplyStatus::WriteFailed: return "write failed";
    }
    return "unknown";
}

OptimizationExecutor::OptimizationExecutor(Hardware::SnapshotCollector& collector,
                                           Tuning::TierStore& tiers,
                                           Tuning::ProfileStore& profiles,
                                           IO::ConfigWriter& writer)
    : collector_(collector), tiers_(tiers), profiles_(profiles), writer_(writer),
      logger_("EXECUTOR"), status_("initialized") {}

std::string OptimizationExecutor::current_timestamp() {
    auto now = std::chrono::system_clock::now();
    std::time_t time = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S");
    return oss.str();
}

std::optional<Tuning::OptimizationDecision> OptimizationExecutor::preview(
    const std::string& game_name, const Tuning::OptimizerOverrides& overrides) {
    auto profile = profiles_.find(game_name);
    if (!profile) {
        return std::nullopt;
    }

    Hardware::HardwareSnapshot snapshot = collector_.capture();
    Tuning::PerformanceTier tier = tiers_.resolve(snapshot);
    return Tuning::GameOptimizer::optimize(*profile, snapshot, tier, overrides);
}

ApplyResult OptimizationExecutor::apply(const std::string& game_name,
                                        const Tuning::OptimizerOverrides& overrides) {
    ApplyResult result;
    status_ = "running";

    auto found = profiles_.find(game_name);
    if (!found) {
        logger_.error("Cannot apply optimization: no profile for '" + game_name + "'");
        result.status = ApplyStatus::UnknownGame;
        status_ = "failed";
        return result;
    }
    Tuning::GameProfile profile = *found;

    logger_.info("=== Applying optimizations for " + profile.name + " ===");

    Hardware::HardwareSnapshot snapshot = collector_.capture();
    Tuning::PerformanceTier tier = tiers_.resolve(snapshot);
    logger_.info(std::string("Performance mode: ") + Tuning::tier_name(tier));

    result.decision = Tuning::GameOptimizer::optimize(profile, snapshot, tier, overrides);
    result.settings = Tuning::GameOptimizer::to_settings_map(profile, result.decision);

    logger_.info(std::string("  - Upscaling: ") +
                 Tuning::upscaling_name(result.decision.chosen_upscaling) + " (" +
                 Tuning::quality_preset_name(result.decision.quality_preset) + ")");
    logger_.info(std::string("  - Ray tracing: ") +
                 (result.decision.ray_tracing_enabled ? "Enabled" : "Disabled"));
    logger_.info("  - Resolution scale: " + IO::format_double(result.decision.resolution_scale));

    result.validation = IO::ConfigWriter::validate(result.settings, profile.settings_schema);
    if (!result.validation.ok) {
        logger_.error("Settings rejected for " + profile.name + ": " + result.validation.reason);
        result.status = ApplyStatus::ValidationFailed;
        status_ = "failed";
        return result;
    }

    const std::string& path = profile.config_file_path;
    std::error_code ec;
    bool existed = fs::exists(path, ec);

    if (path.empty() || !writer_.write(path, result.settings)) {
        logger_.error("Failed to write config for " + profile.name);
        result.status = ApplyStatus::WriteFailed;
        status_ = "failed";
        return result;
    }
    if (existed) {
        result.backup_path = IO::ConfigWriter::backup_path_for(path);
    }

    profile.last_applied = current_timestamp();
    if (!profiles_.upsert(profile)) {
        logger_.warning("Config written but profile store could not be updated");
    }

    result.status = ApplyStatus::Applied;
    status_ = "completed";
    logger_.info("Configuration for '" + profile.name + "' applied to " + path);
    return result;
}

bool OptimizationExecutor::restore(const std::string& game_name) {
    auto profile = profiles_.find(game_name);
    if (!profile) {
        logger_.error("Cannot restore: no profile for '" + game_name + "'");
        return false;
    }
    return writer_.restore(profile->config_file_path);
}

} // namespace Executor
} // namespace RigTune
