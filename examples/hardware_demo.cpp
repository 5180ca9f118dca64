#include "hardware/capability_table.hpp"
#include "hardware/command_runner.hpp"
#include "hardware/cpu_detector.hpp"
#include "hardware/gpu_detector.hpp"
#include "hardware/memory_detector.hpp"
#include "tuning/performance_tier.hpp"
#include "utils/logger.hpp"
#include <exception>
#include <iostream>

using namespace RigTune;

int main() {
    Utils::Logger::instance().set_log_directory("logs");
    Utils::ModuleLogger logger("HARDWARE_DEMO");

    logger.info("=== Hardware Detection Demo ===\n");

    Hardware::CapabilityTable table = Hardware::CapabilityTable::defaults();
    Hardware::PlatformCapabilities platform = Hardware::PlatformCapabilities::detect();
    Hardware::PopenCommandRunner runner;
    logger.info(platform.to_string());

    // The detectors throw; each one is reported on its own
    Hardware::CpuRecord cpu_info;
    logger.info("Detecting CPU...");
    Hardware::CPUDetector cpu_detector(table);
    try {
        cpu_info = cpu_detector.detect();
        cpu_detector.print_info(cpu_info);
    } catch (const std::exception& e) {
        logger.warning(std::string("CPU detection failed: ") + e.what());
    }

    Hardware::MemoryRecord mem_info;
    logger.info("\nDetecting Memory...");
    Hardware::MemoryDetector mem_detector;
    try {
        mem_info = mem_detector.detect();
        mem_detector.print_info(mem_info);
    } catch (const std::exception& e) {
        logger.warning(std::string("Memory detection failed: ") + e.what());
    }

    logger.info("\nDetecting GPU...");
    Hardware::GPUDetector gpu_detector(table, platform, runner);
    try {
        auto gpus = gpu_detector.detect();
        if (gpus.empty()) {
            logger.warning("No GPUs detected");
        }
        for (const auto& gpu : gpus) {
            gpu_detector.print_info(gpu);
        }
    } catch (const std::exception& e) {
        logger.warning(std::string("GPU detection failed: ") + e.what());
    }

    Tuning::PerformanceTier tier = Tuning::classify(cpu_info.physical_cores, mem_info.total_mb);
    logger.info(std::string("\nThis machine classifies as: ") + Tuning::tier_name(tier));

    logger.info("\n=== Hardware Detection Complete ===");

    return 0;
}
