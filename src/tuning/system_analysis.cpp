#include "tuning/system_analysis.hpp"

namespace RigTune {
namespace Tuning {

namespace {

constexpr unsigned int kHighCpuCores = 8;
constexpr double kHighCpuMaxMhz = 3500.0;
constexpr unsigned int kMediumCpuCores = 6;
constexpr double kMediumCpuMaxMhz = 3000.0;

constexpr size_t kHighGpuVramMb = 12288;
constexpr size_t kMediumGpuVramMb = 8192;

constexpr size_t kExcellentMemoryMb = 32768;
constexpr size_t kGoodMemoryMb = 16384;

PerformanceClass rate_cpu(const Hardware::CpuRecord& cpu) {
    if (cpu.physical_cores == 0) {
        return PerformanceClass::Unknown;
    }
    if (cpu.physical_cores >= kHighCpuCores && cpu.max_freq_mhz >= kHighCpuMaxMhz) {
        return PerformanceClass::High;
    }
    if (cpu.physical_cores >= kMediumCpuCores && cpu.max_freq_mhz >= kMediumCpuMaxMhz) {
        return PerformanceClass::Medium;
    }
    return PerformanceClass::Low;
}

PerformanceClass rate_gpu(const std::vector<Hardware::GpuRecord>& gpus) {
    if (gpus.empty()) {
        return PerformanceClass::Unknown;
    }
    size_t vram = gpus.front().vram_mb;
    if (vram >= kHighGpuVramMb) return PerformanceClass::High;
    if (vram >= kMediumGpuVramMb) return PerformanceClass::Medium;
    return PerformanceClass::Low;
}

MemoryAdequacy rate_memory(const Hardware::MemoryRecord& memory) {
    if (memory.total_mb == 0) return MemoryAdequacy::Unknown;
    if (memory.total_mb >= kExcellentMemoryMb) return MemoryAdequacy::Excellent;
    if (memory.total_mb >= kGoodMemoryMb) return MemoryAdequacy::Good;
    return MemoryAdequacy::Limited;
}

void add_recommendations(SystemAnalysis& analysis) {
    auto& out = analysis.recommendations;

    if (analysis.cpu_class == PerformanceClass::Low) {
        out.push_back("Enable CPU priority optimization for games");
        out.push_back("Close unnecessary background applications");
    }

    // An unrated GPU gets the conservative advice
    switch (analysis.gpu_class) {
        case PerformanceClass::High:
            out.push_back("Enable high-quality upscaling (DLSS Quality/FSR Ultra Quality)");
            out.push_back("Ray tracing can be enabled with good performance");
            out.push_back("Consider 4K gaming with upscaling");
            break;
        case PerformanceClass::Medium:
            out.push_back("Use balanced upscaling settings (DLSS Balanced/FSR Quality)");
            out.push_back("Ray tracing at medium settings");
            out.push_back("1440p recommended resolution");
            break;
        case PerformanceClass::Low:
        case PerformanceClass::Unknown:
            out.push_back("Use performance upscaling (DLSS Performance/FSR Performance)");
            out.push_back("Disable ray tracing for better performance");
            out.push_back("1080p recommended resolution");
            break;
    }

    if (analysis.memory == MemoryAdequacy::Limited) {
        out.push_back("Enable memory optimization");
        out.push_back("Reduce texture quality in games");
        out.push_back("Close memory-intensive background applications");
    }
}

} // namespace

const char* performance_class_name(PerformanceClass value) {
    switch (value) {
        case PerformanceClass::Unknown: return "unknown";
        case PerformanceClass::Low: return "low";
        case PerformanceClass::Medium: return "medium";
        case PerformanceClass::High: return "high";
    }
    return "unknown";
}

const char* memory_adequacy_name(MemoryAdequacy value) {
    switch (value) {
        case MemoryAdequacy::Unknown: return "unknown";
        case MemoryAdequacy::Limited: return "limited";
        case MemoryAdequacy::Good: return "good";
        case MemoryAdequacy::Excellent: return "excellent";
    }
    return "unknown";
}

SystemAnalysis analyze(const Hardware::HardwareSnapshot& snapshot) {
    SystemAnalysis analysis;

    analysis.cpu_class = rate_cpu(snapshot.cpu);
    if (analysis.cpu_class == PerformanceClass::Low) {
        analysis.bottlenecks.push_back("CPU performance may limit gaming performance");
    }

    analysis.gpu_class = rate_gpu(snapshot.gpus);
    if (analysis.gpu_class == PerformanceClass::Low) {
        analysis.bottlenecks.push_back("Limited GPU VRAM may restrict high resolutions");
    }

    analysis.memory = rate_memory(snapshot.memory);
    if (analysis.memory == MemoryAdequacy::Limited) {
        analysis.bottlenecks.push_back("Limited system memory may cause performance issues");
    }

    add_recommendations(analysis);
    return analysis;
}

} // namespace Tuning
} // namespace RigTune
