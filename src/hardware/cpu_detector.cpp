#include "hardware/cpu_detector.hpp"
#include "utils/logger.hpp"
#include <thread>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <cstring>
#include <stdexcept>

#ifdef __x86_64__
#include <cpuid.h>
#endif

namespace RigTune {
namespace Hardware {

CPUDetector::CPUDetector(const CapabilityTable& table, const std::string& sysroot)
    : table_(table), sysroot_(sysroot) {}

CpuRecord CPUDetector::detect(bool read_cpufreq) {
    Utils::ModuleLogger logger("CPU_DETECTOR");
    logger.debug("Starting CPU detection...");

    std::ifstream probe(sysroot_ + "/proc/cpuinfo");
    if (!probe.is_open()) {
        throw std::runtime_error("Cannot read " + sysroot_ + "/proc/cpuinfo");
    }

    CpuRecord info;
    info.name = get_model();
    info.physical_cores = get_core_count();
    info.logical_threads = get_thread_count();
    if (read_cpufreq) {
        info.base_freq_mhz = get_min_frequency_mhz();
        info.max_freq_mhz = get_max_frequency_mhz();
    }

    // CPUID is only meaningful for the live system
    std::string vendor_str = sysroot_.empty() ? get_vendor_string() : "";
    if (vendor_str == "GenuineIntel") {
        info.vendor = CpuVendor::Intel;
    } else if (vendor_str == "AuthenticAMD") {
        info.vendor = CpuVendor::AMD;
    } else {
        info.vendor = table_.infer_cpu_vendor(info.name);
    }

    logger.debug("CPU detection complete");
    return info;
}

std::string CPUDetector::get_vendor_string() {
#ifdef __x86_64__
    unsigned int eax, ebx, ecx, edx;
    char vendor[13];

    __cpuid(0, eax, ebx, ecx, edx);
    memcpy(vendor, &ebx, 4);
    memcpy(vendor + 4, &edx, 4);
    memcpy(vendor + 8, &ecx, 4);
    vendor[12] = '\0';

    return std::string(vendor);
#else
    return "";
#endif
}

std::string CPUDetector::get_model() {
    std::ifstream cpuinfo(sysroot_ + "/proc/cpuinfo");
    std::string line;

    while (std::getline(cpuinfo, line)) {
        // x86 uses "model name", some ARM kernels only report "Hardware" or "Processor"
        if (line.find("model name") == 0 || line.find("Hardware") == 0 ||
            line.find("Processor") == 0) {
            size_t pos = line.find(":");
            if (pos != std::string::npos && pos + 2 <= line.size()) {
                std::string model = line.substr(pos + 1);
                model.erase(0, model.find_first_not_of(" \t"));
                if (!model.empty()) {
                    return model;
                }
            }
        }
    }

    return "Unknown CPU";
}

unsigned int CPUDetector::get_core_count() {
    std::ifstream cpuinfo(sysroot_ + "/proc/cpuinfo");
    std::string line;
    int cores = 0;

    while (std::getline(cpuinfo, line)) {
        if (line.find("cpu cores") != std::string::npos) {
            size_t pos = line.find(":");
            if (pos != std::string::npos) {
                cores = std::stoi(line.substr(pos + 1));
                break;
            }
        }
    }

    return cores > 0 ? static_cast<unsigned int>(cores) : get_thread_count();
}

unsigned int CPUDetector::get_thread_count() {
    std::ifstream cpuinfo(sysroot_ + "/proc/cpuinfo");
    std::string line;
    unsigned int processors = 0;

    while (std::getline(cpuinfo, line)) {
        if (line.find("processor") == 0) {
            ++processors;
        }
    }

    if (processors > 0) {
        return processors;
    }
    return sysroot_.empty() ? std::thread::hardware_concurrency() : 0;
}

double CPUDetector::get_current_frequency_mhz() {
    std::ifstream freq_file(sysroot_ + "/proc/cpuinfo");
    std::string line;

    while (std::getline(freq_file, line)) {
        if (line.find("cpu MHz") != std::string::npos) {
            size_t pos = line.find(":");
            if (pos != std::string::npos) {
                return std::stod(line.substr(pos + 1));
            }
        }
    }

    return 0.0;
}

double CPUDetector::read_khz_file(const std::string& relative_path) {
    std::ifstream freq(sysroot_ + relative_path);
    if (freq.is_open()) {
        std::string freq_str;
        std::getline(freq, freq_str);
        if (!freq_str.empty()) {
            return std::stod(freq_str) / 1000.0; // kHz to MHz
        }
    }
    return 0.0;
}

double CPUDetector::get_max_frequency_mhz() {
    return read_khz_file("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq");
}

double CPUDetector::get_min_frequency_mhz() {
    return read_khz_file("/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_min_freq");
}

void CPUDetector::print_info(const CpuRecord& info) {
    Utils::ModuleLogger logger("CPU_DETECTOR");

    std::ostringstream oss;
    oss << "\n=== CPU Information ===\n"
        << "Vendor: " << cpu_vendor_name(info.vendor) << "\n"
        << "Model: " << info.name << "\n"
        << "Cores: " << info.physical_cores << " (Physical)\n"
        << "Threads: " << info.logical_threads << " (Logical)\n"
        << "Frequency:\n"
        << std::fixed << std::setprecision(0)
        << "  Base: " << info.base_freq_mhz << " MHz\n"
        << "  Max: " << info.max_freq_mhz << " MHz";

    logger.info(oss.str());
}

} // namespace Hardware
} // namespace RigTune
