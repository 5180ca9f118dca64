#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace RigTune {
namespace Hardware {

enum class CpuVendor {
    Intel,
    AMD,
    ARM,
    Unknown
};

enum class GpuVendor {
    NVIDIA,
    AMD,
    Intel,
    Unknown
};

const char* cpu_vendor_name(CpuVendor vendor);
const char* gpu_vendor_name(GpuVendor vendor);
GpuVendor gpu_vendor_from_string(const std::string& name);

struct CpuRecord {
    std::string name = "Unknown CPU";
    CpuVendor vendor = CpuVendor::Unknown;
    unsigned int physical_cores = 0;
    unsigned int logical_threads = 0;
    double base_freq_mhz = 0.0;
    double max_freq_mhz = 0.0;
};

// Derived from the device name by CapabilityTable, never queried from a driver
struct GpuCapabilities {
    bool supports_dlss = false;
    bool supports_fsr = false;
    bool supports_xess = false;
    bool supports_raytracing = false;
    bool six_k_capable = false;   // resolution gating only, vram_mb >= 8192
};

struct GpuRecord {
    std::string name = "Unknown GPU";
    GpuVendor vendor = GpuVendor::Unknown;
    size_t vram_mb = 0;
    std::string driver_version = "Unknown";
    GpuCapabilities capabilities;
};

struct MemoryRecord {
    size_t total_mb = 0;
    size_t available_mb = 0;
};

// Captured once by SnapshotCollector and read-only afterwards.
// gpus is never empty; index 0 is the primary adapter.
struct HardwareSnapshot {
    CpuRecord cpu;
    std::vector<GpuRecord> gpus;
    MemoryRecord memory;

    const GpuRecord& primary_gpu() const { return gpus.front(); }
};

// Record substituted when GPU detection fails or finds nothing
GpuRecord make_fallback_gpu();

// Volatile telemetry, re-fetched on every poll. Carries no capability data.
struct LiveStats {
    double cpu_utilization_percent = 0.0;
    double cpu_current_freq_mhz = 0.0;
    bool gpu_telemetry_available = false;
    double gpu_utilization_percent = 0.0;
    double gpu_vram_usage_percent = 0.0;
    double gpu_temperature_c = 0.0;
    double gpu_core_clock_mhz = 0.0;
    double gpu_mem_clock_mhz = 0.0;
    double gpu_power_draw_w = 0.0;
};

} // namespace Hardware
} // namespace RigTune
