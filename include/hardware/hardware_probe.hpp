#pragma once

#include "hardware/capability_table.hpp"
#include "hardware/command_runner.hpp"
#include "hardware/cpu_detector.hpp"
#include "hardware/gpu_detector.hpp"
#include "hardware/hardware_snapshot.hpp"
#include "hardware/memory_detector.hpp"
#include "utils/logger.hpp"
#include <optional>
#include <string>
#include <vector>

namespace RigTune {
namespace Hardware {

// Aggregate jiffies from the first line of /proc/stat
struct CpuTimes {
    unsigned long long idle = 0;
    unsigned long long total = 0;
};

/**
 * OS/driver boundary consumed by SnapshotCollector.
 *
 * Every query may throw; the collector treats each one independently and
 * substitutes an empty record for the ones that fail.
 */
class HardwareProbe {
public:
    virtual ~HardwareProbe() = default;

    virtual CpuRecord query_cpu_info() = 0;
    virtual std::vector<GpuRecord> query_gpu_list() = 0;
    virtual MemoryRecord query_memory_info() = 0;

    // Live telemetry
    virtual CpuTimes query_cpu_times() = 0;
    virtual double query_cpu_frequency_mhz() = 0;
    virtual std::optional<GpuTelemetry> query_gpu_telemetry() = 0;
};

// Reads /proc and sysfs under sysroot. Queries whose kernel interface the
// platform lacks return zero records without touching the filesystem.
class LinuxHardwareProbe : public HardwareProbe {
public:
    LinuxHardwareProbe(const CapabilityTable& table, const PlatformCapabilities& platform,
                       CommandRunner& runner, const std::string& sysroot = "");

    CpuRecord query_cpu_info() override;
    std::vector<GpuRecord> query_gpu_list() override;
    MemoryRecord query_memory_info() override;

    CpuTimes query_cpu_times() override;
    double query_cpu_frequency_mhz() override;
    std::optional<GpuTelemetry> query_gpu_telemetry() override;

    CPUDetector& cpu_detector() { return cpu_detector_; }
    GPUDetector& gpu_detector() { return gpu_detector_; }
    MemoryDetector& memory_detector() { return memory_detector_; }

private:
    const PlatformCapabilities& platform_;
    Utils::ModuleLogger logger_;
    std::string sysroot_;
    CPUDetector cpu_detector_;
    GPUDetector gpu_detector_;
    MemoryDetector memory_detector_;
};

} // namespace Hardware
} // namespace RigTune
