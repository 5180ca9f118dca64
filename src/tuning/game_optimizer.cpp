#include "tuning/game_optimizer.hpp"
#include "hardware/capability_table.hpp"

namespace RigTune {
namespace Tuning {

namespace {

constexpr size_t kFullScale4KMinVramMb = 8192;
constexpr double kReducedScale4K = 0.8;
constexpr double kReducedScale6K = 0.6;
constexpr PerformanceTier kRayTracingMinTier = PerformanceTier::Normal;

} // namespace

const char* upscaling_name(Upscaling upscaling) {
    switch (upscaling) {
        case Upscaling::None: return "Off";
        case Upscaling::DLSS: return "DLSS";
        case Upscaling::FSR: return "FSR";
        case Upscaling::XeSS: return "XeSS";
    }
    return "Off";
}

const char* quality_preset_name(QualityPreset preset) {
    switch (preset) {
        case QualityPreset::Quality: return "Quality";
        case QualityPreset::Balanced: return "Balanced";
        case QualityPreset::Performance: return "Performance";
        case QualityPreset::UltraPerformance: return "Ultra Performance";
    }
    return "Quality";
}

std::optional<QualityPreset> quality_preset_from_string(const std::string& name) {
    std::string lower = Hardware::to_lower(name);
    if (lower == "quality") return QualityPreset::Quality;
    if (lower == "balanced") return QualityPreset::Balanced;
    if (lower == "performance" || lower == "perf") return QualityPreset::Performance;
    if (lower == "ultra performance" || lower == "ultra_performance" || lower == "ultra") {
        return QualityPreset::UltraPerformance;
    }
    return std::nullopt;
}

QualityPreset GameOptimizer::preset_for_fps(unsigned int target_fps) {
    if (target_fps >= 120) return QualityPreset::Performance;
    if (target_fps >= 90) return QualityPreset::Balanced;
    return QualityPreset::Quality;
}

OptimizationDecision GameOptimizer::optimize(const GameProfile& profile,
                                             const Hardware::HardwareSnapshot& snapshot,
                                             PerformanceTier tier,
                                             const OptimizerOverrides& overrides) {
    OptimizationDecision decision;
    if (snapshot.gpus.empty()) {
        return decision;
    }

    const Hardware::GpuRecord& gpu = snapshot.primary_gpu();
    const Hardware::GpuCapabilities& caps = gpu.capabilities;
    const CapabilityRequirements& req = profile.capability_requirements;

    bool fsr_fallback = false;
    if (caps.supports_dlss && req.supports_dlss) {
        decision.chosen_upscaling = Upscaling::DLSS;
    } else if (caps.supports_fsr && req.supports_fsr) {
        decision.chosen_upscaling = Upscaling::FSR;
    } else if (caps.supports_xess && req.supports_xess) {
        decision.chosen_upscaling = Upscaling::XeSS;
    } else if (caps.supports_fsr) {
        // FSR runs on any GPU even when the profile does not list it
        decision.chosen_upscaling = Upscaling::FSR;
        fsr_fallback = true;
    }

    if (decision.chosen_upscaling == Upscaling::None) {
        decision.quality_preset = QualityPreset::Quality;
    } else if (overrides.quality_preset.has_value()) {
        decision.quality_preset = *overrides.quality_preset;
    } else if (fsr_fallback) {
        decision.quality_preset = QualityPreset::Balanced;
    } else {
        decision.quality_preset = preset_for_fps(profile.target_fps);
    }

    decision.ray_tracing_enabled = caps.supports_raytracing &&
                                   req.supports_raytracing &&
                                   is_feature_unlocked(kRayTracingMinTier, tier);

    if (profile.target_resolution == Resolution::R4K && gpu.vram_mb < kFullScale4KMinVramMb) {
        decision.resolution_scale = kReducedScale4K;
    } else if (profile.target_resolution == Resolution::R6K && !caps.six_k_capable) {
        decision.resolution_scale = kReducedScale6K;
    }

    return decision;
}

IO::SettingsMap GameOptimizer::to_settings_map(const GameProfile& profile,
                                               const OptimizationDecision& decision) {
    IO::SettingsMap settings;
    settings.set("resolution", std::string(resolution_name(profile.target_resolution)));
    settings.set("fps", static_cast<int64_t>(profile.target_fps));
    settings.set("upscaling", std::string(upscaling_name(decision.chosen_upscaling)));
    settings.set("quality_preset", std::string(quality_preset_name(decision.quality_preset)));
    settings.set("ray_tracing", decision.ray_tracing_enabled);
    settings.set("resolution_scale", decision.resolution_scale);
    return settings;
}

} // namespace Tuning
} // namespace RigTune
