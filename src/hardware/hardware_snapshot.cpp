#include "hardware/hardware_snapshot.hpp"

namespace RigTune {
namespace Hardware {

const char* cpu_vendor_name(CpuVendor vendor) {
    switch (vendor) {
        case CpuVendor::Intel: return "Intel";
        case CpuVendor::AMD: return "AMD";
        case CpuVendor::ARM: return "ARM";
        case CpuVendor::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* gpu_vendor_name(GpuVendor vendor) {
    switch (vendor) {
        case GpuVendor::NVIDIA: return "NVIDIA";
        case GpuVendor::AMD: return "AMD";
        case GpuVendor::Intel: return "Intel";
        case GpuVendor::Unknown: return "Unknown";
    }
    return "Unknown";
}

GpuVendor gpu_vendor_from_string(const std::string& name) {
    if (name == "NVIDIA") return GpuVendor::NVIDIA;
    if (name == "AMD") return GpuVendor::AMD;
    if (name == "Intel") return GpuVendor::Intel;
    return GpuVendor::Unknown;
}

GpuRecord make_fallback_gpu() {
    GpuRecord gpu;
    gpu.name = "Unknown GPU";
    gpu.vendor = GpuVendor::Unknown;
    gpu.vram_mb = 0;
    gpu.driver_version = "Unknown";
    gpu.capabilities = GpuCapabilities{};
    return gpu;
}

} // namespace Hardware
} // namespace RigTune
