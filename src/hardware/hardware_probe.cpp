#include "hardware/hardware_probe.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace RigTune {
namespace Hardware {

LinuxHardwareProbe::LinuxHardwareProbe(const CapabilityTable& table,
                                       const PlatformCapabilities& platform,
                                       CommandRunner& runner, const std::string& sysroot)
    : platform_(platform),
      logger_("PROBE"),
      sysroot_(sysroot),
      cpu_detector_(table, sysroot),
      gpu_detector_(table, platform, runner, sysroot),
      memory_detector_(sysroot) {}

CpuRecord LinuxHardwareProbe::query_cpu_info() {
    if (!platform_.has_proc_cpuinfo) {
        logger_.debug("No /proc/cpuinfo, CPU record left empty");
        return CpuRecord{};
    }
    if (!platform_.has_cpufreq_sysfs) {
        logger_.debug("No cpufreq sysfs, CPU frequency range unknown");
    }
    return cpu_detector_.detect(platform_.has_cpufreq_sysfs);
}

std::vector<GpuRecord> LinuxHardwareProbe::query_gpu_list() {
    return gpu_detector_.detect();
}

MemoryRecord LinuxHardwareProbe::query_memory_info() {
    if (!platform_.has_proc_meminfo) {
        logger_.debug("No /proc/meminfo, memory record left empty");
        return MemoryRecord{};
    }
    return memory_detector_.detect();
}

CpuTimes LinuxHardwareProbe::query_cpu_times() {
    if (!platform_.has_proc_stat) {
        return CpuTimes{};
    }

    std::ifstream stat(sysroot_ + "/proc/stat");
    if (!stat.is_open()) {
        throw std::runtime_error("Cannot read " + sysroot_ + "/proc/stat");
    }

    std::string line;
    std::getline(stat, line);
    if (line.rfind("cpu ", 0) != 0) {
        throw std::runtime_error("Unexpected /proc/stat format");
    }

    std::istringstream iss(line);
    std::string label;
    iss >> label;

    // user nice system idle iowait irq softirq steal
    CpuTimes times;
    unsigned long long value = 0;
    int column = 0;
    while (iss >> value && column < 8) {
        times.total += value;
        if (column == 3 || column == 4) {
            times.idle += value;
        }
        ++column;
    }
    return times;
}

double LinuxHardwareProbe::query_cpu_frequency_mhz() {
    if (!platform_.has_proc_cpuinfo) {
        return 0.0;
    }
    return cpu_detector_.get_current_frequency_mhz();
}

std::optional<GpuTelemetry> LinuxHardwareProbe::query_gpu_telemetry() {
    return gpu_detector_.query_nvidia_telemetry();
}

} // namespace Hardware
} // namespace RigTune
