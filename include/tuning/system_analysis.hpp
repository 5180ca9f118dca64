#pragma once

#include "hardware/hardware_snapshot.hpp"
#include <string>
#include <vector>

namespace RigTune {
namespace Tuning {

enum class PerformanceClass {
    Unknown,
    Low,
    Medium,
    High
};

enum class MemoryAdequacy {
    Unknown,
    Limited,
    Good,
    Excellent
};

const char* performance_class_name(PerformanceClass value);
const char* memory_adequacy_name(MemoryAdequacy value);

// Per-component rating of a snapshot with the advice that follows from it.
// A component whose detection produced a zero record stays Unknown.
struct SystemAnalysis {
    PerformanceClass cpu_class = PerformanceClass::Unknown;
    PerformanceClass gpu_class = PerformanceClass::Unknown;
    MemoryAdequacy memory = MemoryAdequacy::Unknown;
    std::vector<std::string> bottlenecks;
    std::vector<std::string> recommendations;
};

// CPU: High with >= 8 cores at >= 3500 MHz max, Medium with >= 6 cores at
// >= 3000 MHz. GPU by primary VRAM: High >= 12 GB, Medium >= 8 GB.
// Memory: Excellent >= 32 GB, Good >= 16 GB. Anything below is a bottleneck.
SystemAnalysis analyze(const Hardware::HardwareSnapshot& snapshot);

} // namespace Tuning
} // namespace RigTune
