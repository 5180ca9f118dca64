#include "hardware/memory_detector.hpp"
#include "utils/logger.hpp"
#include <fstream>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace RigTune {
namespace Hardware {

MemoryDetector::MemoryDetector(const std::string& sysroot) : sysroot_(sysroot) {}

MemoryRecord MemoryDetector::detect() {
    Utils::ModuleLogger logger("MEMORY_DETECTOR");
    logger.debug("Detecting memory information...");

    std::ifstream probe(sysroot_ + "/proc/meminfo");
    if (!probe.is_open()) {
        throw std::runtime_error("Cannot read " + sysroot_ + "/proc/meminfo");
    }

    MemoryRecord info;
    info.total_mb = read_meminfo_mb("MemTotal:");
    info.available_mb = read_meminfo_mb("MemAvailable:");

    logger.debug("Memory detection complete");
    return info;
}

size_t MemoryDetector::read_meminfo_mb(const std::string& key) {
    std::ifstream meminfo(sysroot_ + "/proc/meminfo");
    std::string line;

    while (std::getline(meminfo, line)) {
        if (line.find(key) == 0) {
            std::istringstream iss(line);
            std::string label;
            size_t kb = 0;
            iss >> label >> kb;
            return kb / 1024; // Convert to MB
        }
    }

    return 0;
}

void MemoryDetector::print_info(const MemoryRecord& info) {
    Utils::ModuleLogger logger("MEMORY_DETECTOR");

    size_t used_mb = info.total_mb > info.available_mb ? info.total_mb - info.available_mb : 0;
    double usage_percent = (info.total_mb > 0) ?
        (static_cast<double>(used_mb) / info.total_mb * 100.0) : 0.0;

    std::ostringstream oss;
    oss << "\n=== Memory Information ===\n"
        << "Total: " << info.total_mb << " MB\n"
        << "Available: " << info.available_mb << " MB\n"
        << "Used: " << used_mb << " MB\n"
        << "Usage: " << std::fixed << std::setprecision(2)
        << usage_percent << "%";

    logger.info(oss.str());
}

} // namespace Hardware
} // namespace RigTune
