#pragma once

#include "hardware/capability_table.hpp"
#include "hardware/command_runner.hpp"
#include "hardware/hardware_snapshot.hpp"
#include <optional>
#include <string>
#include <vector>

namespace RigTune {
namespace Hardware {

struct DisplayController {
    std::string bus_id;   // e.g. "01:00.0"
    std::string name;     // e.g. "NVIDIA Corporation AD102 [GeForce RTX 4090]"
};

struct GpuTelemetry {
    double utilization_percent = 0.0;
    double vram_usage_percent = 0.0;
    double temperature_c = 0.0;
    double core_clock_mhz = 0.0;
    double mem_clock_mhz = 0.0;
    double power_draw_w = 0.0;
};

// Output parsers, exposed for tests
std::vector<GpuRecord> parse_nvidia_smi_inventory(const std::string& csv);
std::vector<DisplayController> parse_lspci_display_controllers(const std::string& output);
std::optional<GpuTelemetry> parse_nvidia_smi_telemetry(const std::string& csv);

class GPUDetector {
public:
    GPUDetector(const CapabilityTable& table, const PlatformCapabilities& platform,
                CommandRunner& runner, const std::string& sysroot = "");

    // Enumerates adapters, nvidia-smi first, then lspci. Returned records are
    // already classified. Throws std::runtime_error if no enumeration tool exists.
    std::vector<GpuRecord> detect();

    // One nvidia-smi telemetry query; nullopt if the tool is missing or failed
    std::optional<GpuTelemetry> query_nvidia_telemetry();

    void print_info(const GpuRecord& info);

private:
    std::vector<GpuRecord> detect_nvidia_smi();
    std::vector<GpuRecord> detect_lspci(bool skip_nvidia);
    size_t read_amd_vram_mb(const std::string& bus_id);

    const CapabilityTable& table_;
    const PlatformCapabilities& platform_;
    CommandRunner& runner_;
    std::string sysroot_;
};

} // namespace Hardware
} // namespace RigTune
