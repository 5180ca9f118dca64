#include "hardware/gpu_detector.hpp"
#include "utils/logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace RigTune {
namespace Hardware {

namespace {

std::string trim(const std::string& text) {
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> parts;
    std::stringstream ss(line);
    std::string part;
    while (std::getline(ss, part, ',')) {
        parts.push_back(trim(part));
    }
    return parts;
}

// nvidia-smi reports "[N/A]" or "[Not Supported]" for missing sensors
double parse_number(const std::string& text) {
    if (text.empty()) {
        return 0.0;
    }
    char* end = nullptr;
    double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str()) {
        return 0.0;
    }
    return value;
}

} // namespace

std::vector<GpuRecord> parse_nvidia_smi_inventory(const std::string& csv) {
    std::vector<GpuRecord> gpus;
    std::istringstream iss(csv);
    std::string line;

    while (std::getline(iss, line)) {
        if (trim(line).empty()) {
            continue;
        }
        auto parts = split_csv_line(line);
        if (parts.size() < 3) {
            continue;
        }

        GpuRecord gpu;
        gpu.name = parts[0];
        gpu.vram_mb = static_cast<size_t>(parse_number(parts[1]));
        gpu.driver_version = parts[2].empty() ? "Unknown" : parts[2];
        gpus.push_back(gpu);
    }

    return gpus;
}

std::vector<DisplayController> parse_lspci_display_controllers(const std::string& output) {
    static const char* kClasses[] = {
        "VGA compatible controller: ",
        "3D controller: ",
        "Display controller: ",
    };

    std::vector<DisplayController> controllers;
    std::istringstream iss(output);
    std::string line;

    while (std::getline(iss, line)) {
        for (const char* cls : kClasses) {
            size_t pos = line.find(cls);
            if (pos == std::string::npos) {
                continue;
            }

            DisplayController controller;
            size_t space_pos = line.find(' ');
            if (space_pos != std::string::npos) {
                controller.bus_id = line.substr(0, space_pos);
            }

            std::string name = line.substr(pos + std::string(cls).size());
            size_t rev_pos = name.rfind(" (rev ");
            if (rev_pos != std::string::npos) {
                name = name.substr(0, rev_pos);
            }
            controller.name = trim(name);

            if (!controller.name.empty()) {
                controllers.push_back(controller);
            }
            break;
        }
    }

    return controllers;
}

std::optional<GpuTelemetry> parse_nvidia_smi_telemetry(const std::string& csv) {
    std::istringstream iss(csv);
    std::string line;

    while (std::getline(iss, line)) {
        if (trim(line).empty()) {
            continue;
        }
        // utilization.gpu, memory.used, memory.total, temperature.gpu, clocks.gr, clocks.mem, power.draw
        auto parts = split_csv_line(line);
        if (parts.size() < 7) {
            return std::nullopt;
        }

        GpuTelemetry telemetry;
        telemetry.utilization_percent = parse_number(parts[0]);
        double used_mb = parse_number(parts[1]);
        double total_mb = parse_number(parts[2]);
        telemetry.vram_usage_percent = total_mb > 0.0 ? (used_mb / total_mb) * 100.0 : 0.0;
        telemetry.temperature_c = parse_number(parts[3]);
        telemetry.core_clock_mhz = parse_number(parts[4]);
        telemetry.mem_clock_mhz = parse_number(parts[5]);
        telemetry.power_draw_w = parse_number(parts[6]);
        return telemetry;
    }

    return std::nullopt;
}

GPUDetector::GPUDetector(const CapabilityTable& table, const PlatformCapabilities& platform,
                         CommandRunner& runner, const std::string& sysroot)
    : table_(table), platform_(platform), runner_(runner), sysroot_(sysroot) {}

std::vector<GpuRecord> GPUDetector::detect() {
    Utils::ModuleLogger logger("GPU_DETECTOR");
    logger.debug("Starting GPU detection...");

    if (!platform_.has_nvidia_smi && !platform_.has_lspci) {
        throw std::runtime_error("Neither nvidia-smi nor lspci is available");
    }

    std::vector<GpuRecord> gpus;

    if (platform_.has_nvidia_smi) {
        gpus = detect_nvidia_smi();
        if (!gpus.empty()) {
            logger.info("NVIDIA GPU(s) detected via nvidia-smi: " + std::to_string(gpus.size()));
        }
    }

    if (platform_.has_lspci) {
        auto others = detect_lspci(!gpus.empty());
        gpus.insert(gpus.end(), others.begin(), others.end());
    }

    for (auto& gpu : gpus) {
        table_.classify(gpu);
    }

    if (gpus.empty()) {
        logger.warning("No GPU detected or drivers not available");
    }

    return gpus;
}

std::vector<GpuRecord> GPUDetector::detect_nvidia_smi() {
    auto output = runner_.run(
        "nvidia-smi --query-gpu=name,memory.total,driver_version --format=csv,noheader,nounits");
    if (!output.has_value()) {
        return {};
    }
    return parse_nvidia_smi_inventory(output.value());
}

std::vector<GpuRecord> GPUDetector::detect_lspci(bool skip_nvidia) {
    std::vector<GpuRecord> gpus;

    auto output = runner_.run("lspci");
    if (!output.has_value()) {
        return gpus;
    }

    for (const auto& controller : parse_lspci_display_controllers(output.value())) {
        GpuVendor vendor = table_.infer_gpu_vendor(controller.name);

        // nvidia-smi already reported these with VRAM and driver data
        if (skip_nvidia && vendor == GpuVendor::NVIDIA) {
            continue;
        }

        GpuRecord gpu;
        gpu.name = controller.name;
        if (vendor == GpuVendor::AMD) {
            gpu.vram_mb = read_amd_vram_mb(controller.bus_id);
        }
        gpus.push_back(gpu);
    }

    return gpus;
}

size_t GPUDetector::read_amd_vram_mb(const std::string& bus_id) {
    const fs::path drm_dir(sysroot_ + "/sys/class/drm");
    std::error_code ec;
    if (bus_id.empty() || !fs::is_directory(drm_dir, ec)) {
        return 0;
    }

    for (const auto& entry : fs::directory_iterator(drm_dir, ec)) {
        const std::string card = entry.path().filename().string();
        if (card.rfind("card", 0) != 0 || card.find('-') != std::string::npos) {
            continue;
        }

        std::ifstream uevent(entry.path() / "device" / "uevent");
        std::string line;
        bool same_device = false;
        while (std::getline(uevent, line)) {
            if (line.rfind("PCI_SLOT_NAME=", 0) == 0 &&
                line.size() >= bus_id.size() &&
                line.compare(line.size() - bus_id.size(), bus_id.size(), bus_id) == 0) {
                same_device = true;
                break;
            }
        }
        if (!same_device) {
            continue;
        }

        std::ifstream vram(entry.path() / "device" / "mem_info_vram_total");
        unsigned long long bytes = 0;
        if (vram >> bytes) {
            return static_cast<size_t>(bytes / (1024ull * 1024ull));
        }
    }

    return 0;
}

std::optional<GpuTelemetry> GPUDetector::query_nvidia_telemetry() {
    if (!platform_.has_nvidia_smi) {
        return std::nullopt;
    }

    auto output = runner_.run(
        "nvidia-smi --query-gpu=utilization.gpu,memory.used,memory.total,temperature.gpu,"
        "clocks.gr,clocks.mem,power.draw --format=csv,noheader,nounits");
    if (!output.has_value()) {
        return std::nullopt;
    }
    return parse_nvidia_smi_telemetry(output.value());
}

void GPUDetector::print_info(const GpuRecord& info) {
    Utils::ModuleLogger logger("GPU_DETECTOR");

    const auto& caps = info.capabilities;
    std::ostringstream oss;
    oss << "\n=== GPU Information ===\n"
        << "Vendor: " << gpu_vendor_name(info.vendor) << "\n"
        << "Model: " << info.name << "\n";

    if (!info.driver_version.empty() && info.driver_version != "Unknown") {
        oss << "Driver: " << info.driver_version << "\n";
    }

    if (info.vram_mb > 0) {
        oss << "Memory: " << info.vram_mb << " MB\n";
    }

    oss << "DLSS: " << (caps.supports_dlss ? "Yes" : "No") << "\n"
        << "FSR: " << (caps.supports_fsr ? "Yes" : "No") << "\n"
        << "XeSS: " << (caps.supports_xess ? "Yes" : "No") << "\n"
        << "Ray Tracing: " << (caps.supports_raytracing ? "Yes" : "No") << "\n"
        << "6K Capable: " << (caps.six_k_capable ? "Yes" : "No");

    logger.info(oss.str());
}

} // namespace Hardware
} // namespace RigTune
