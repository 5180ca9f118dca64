#pragma once

#include "hardware/capability_table.hpp"
#include "hardware/hardware_snapshot.hpp"
#include <string>

namespace RigTune {
namespace Hardware {

// Reads CPU facts from /proc/cpuinfo and cpufreq sysfs under sysroot
// ("" for the live system, a fixture directory in tests).
class CPUDetector {
public:
    CPUDetector(const CapabilityTable& table, const std::string& sysroot = "");

    // Throws std::runtime_error when /proc/cpuinfo cannot be read. Without
    // read_cpufreq the frequency range stays 0.
    CpuRecord detect(bool read_cpufreq = true);
    void print_info(const CpuRecord& info);

    double get_current_frequency_mhz();

private:
    std::string get_vendor_string();
    std::string get_model();
    unsigned int get_core_count();
    unsigned int get_thread_count();
    double get_max_frequency_mhz();
    double get_min_frequency_mhz();
    double read_khz_file(const std::string& relative_path);

    const CapabilityTable& table_;
    std::string sysroot_;
};

} // namespace Hardware
} // namespace RigTune
