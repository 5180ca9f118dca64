#pragma once

#include "hardware/hardware_snapshot.hpp"
#include "io/settings_map.hpp"
#include "tuning/game_profile.hpp"
#include "tuning/performance_tier.hpp"
#include <optional>
#include <string>

namespace RigTune {
namespace Tuning {

enum class Upscaling {
    None,
    DLSS,
    FSR,
    XeSS
};

enum class QualityPreset {
    Quality,
    Balanced,
    Performance,
    UltraPerformance
};

// "Off", "DLSS", "FSR", "XeSS"
const char* upscaling_name(Upscaling upscaling);
// "Quality", "Balanced", "Performance", "Ultra Performance"
const char* quality_preset_name(QualityPreset preset);
// Accepts the names above plus lower-case short forms ("ultra", "perf")
std::optional<QualityPreset> quality_preset_from_string(const std::string& name);

struct OptimizationDecision {
    Upscaling chosen_upscaling = Upscaling::None;
    QualityPreset quality_preset = QualityPreset::Quality;
    bool ray_tracing_enabled = false;
    double resolution_scale = 1.0;   // in (0, 1]
};

// Explicit user choices that take precedence over the automatic ones
struct OptimizerOverrides {
    std::optional<QualityPreset> quality_preset;
};

/**
 * Picks upscaler, preset, ray tracing and resolution scale for a game on the
 * captured hardware. Pure: no I/O, no logging, and every input produces a
 * decision.
 */
class GameOptimizer {
public:
    static OptimizationDecision optimize(const GameProfile& profile,
                                         const Hardware::HardwareSnapshot& snapshot,
                                         PerformanceTier tier,
                                         const OptimizerOverrides& overrides = {});

    // resolution, fps, upscaling, quality_preset, ray_tracing, resolution_scale
    static IO::SettingsMap to_settings_map(const GameProfile& profile,
                                           const OptimizationDecision& decision);

    static QualityPreset preset_for_fps(unsigned int target_fps);
};

} // namespace Tuning
} // namespace RigTune
