#include "hardware/snapshot_collector.hpp"
#include <exception>
#include <string>

namespace RigTune {
namespace Hardware {

SnapshotCollector::SnapshotCollector(HardwareProbe& probe)
    : probe_(probe), logger_("COLLECTOR"), telemetry_warning_logged_(false) {}

HardwareSnapshot SnapshotCollector::capture() {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    if (!snapshot_.has_value()) {
        snapshot_ = probe_all();
    }
    return snapshot_.value();
}

void SnapshotCollector::refresh() {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    logger_.info("Hardware snapshot invalidated, next capture will re-probe");
    snapshot_.reset();
}

bool SnapshotCollector::has_snapshot() const {
    std::lock_guard<std::mutex> lock(snapshot_mutex_);
    return snapshot_.has_value();
}

HardwareSnapshot SnapshotCollector::probe_all() {
    logger_.info("Capturing hardware snapshot...");

    HardwareSnapshot snapshot;

    try {
        snapshot.cpu = probe_.query_cpu_info();
    } catch (const std::exception& e) {
        logger_.warning("CPU probe failed, using empty record: " + std::string(e.what()));
        snapshot.cpu = CpuRecord{};
    }

    try {
        snapshot.gpus = probe_.query_gpu_list();
    } catch (const std::exception& e) {
        logger_.warning("GPU probe failed: " + std::string(e.what()));
        snapshot.gpus.clear();
    }

    if (snapshot.gpus.empty()) {
        logger_.warning("No GPU detected, substituting fallback record");
        snapshot.gpus.push_back(make_fallback_gpu());
    }

    try {
        snapshot.memory = probe_.query_memory_info();
    } catch (const std::exception& e) {
        logger_.warning("Memory probe failed, using empty record: " + std::string(e.what()));
        snapshot.memory = MemoryRecord{};
    }

    logger_.info("CPU: " + snapshot.cpu.name + " (" +
                 std::to_string(snapshot.cpu.physical_cores) + " cores, " +
                 std::to_string(snapshot.cpu.logical_threads) + " threads)");
    for (const auto& gpu : snapshot.gpus) {
        logger_.info("GPU: " + gpu.name + " - VRAM: " + std::to_string(gpu.vram_mb) + "MB");
    }
    logger_.info("Memory: " + std::to_string(snapshot.memory.total_mb) + "MB total");

    return snapshot;
}

LiveStats SnapshotCollector::capture_live_stats() {
    std::lock_guard<std::mutex> lock(live_mutex_);
    LiveStats stats;

    try {
        CpuTimes now = probe_.query_cpu_times();
        if (previous_cpu_times_.has_value()) {
            const CpuTimes& before = previous_cpu_times_.value();
            if (now.total > before.total) {
                double total_delta = static_cast<double>(now.total - before.total);
                double idle_delta = now.idle >= before.idle ?
                    static_cast<double>(now.idle - before.idle) : 0.0;
                stats.cpu_utilization_percent = (1.0 - idle_delta / total_delta) * 100.0;
            }
        }
        previous_cpu_times_ = now;
    } catch (const std::exception& e) {
        logger_.debug("CPU times unavailable: " + std::string(e.what()));
    }

    try {
        stats.cpu_current_freq_mhz = probe_.query_cpu_frequency_mhz();
    } catch (const std::exception& e) {
        logger_.debug("CPU frequency unavailable: " + std::string(e.what()));
    }

    // Telemetry is NVIDIA-only; skip the subprocess for other primary adapters
    bool query_gpu = true;
    {
        std::lock_guard<std::mutex> snapshot_lock(snapshot_mutex_);
        if (snapshot_.has_value() && snapshot_->primary_gpu().vendor != GpuVendor::NVIDIA) {
            query_gpu = false;
        }
    }

    if (query_gpu) {
        std::optional<GpuTelemetry> telemetry;
        try {
            telemetry = probe_.query_gpu_telemetry();
        } catch (const std::exception& e) {
            logger_.debug("GPU telemetry query failed: " + std::string(e.what()));
        }

        if (telemetry.has_value()) {
            stats.gpu_telemetry_available = true;
            stats.gpu_utilization_percent = telemetry->utilization_percent;
            stats.gpu_vram_usage_percent = telemetry->vram_usage_percent;
            stats.gpu_temperature_c = telemetry->temperature_c;
            stats.gpu_core_clock_mhz = telemetry->core_clock_mhz;
            stats.gpu_mem_clock_mhz = telemetry->mem_clock_mhz;
            stats.gpu_power_draw_w = telemetry->power_draw_w;
            telemetry_warning_logged_ = false;
        } else if (!telemetry_warning_logged_) {
            logger_.warning("GPU diagnostic tool unavailable, reporting zero GPU telemetry");
            telemetry_warning_logged_ = true;
        }
    }

    return stats;
}

} // namespace Hardware
} // namespace RigTune
