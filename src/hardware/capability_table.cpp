#include "hardware/capability_table.hpp"
#include "utils/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace RigTune {
namespace Hardware {

std::string to_lower(const std::string& text) {
    std::string lower = text;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

namespace {

bool contains_any(const std::string& lower_name, const std::vector<std::string>& keywords) {
    for (const auto& keyword : keywords) {
        if (lower_name.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

CpuVendor cpu_vendor_from_string(const std::string& name) {
    if (name == "Intel") return CpuVendor::Intel;
    if (name == "AMD") return CpuVendor::AMD;
    if (name == "ARM") return CpuVendor::ARM;
    return CpuVendor::Unknown;
}

std::vector<std::string> lowered_keywords(const json& j) {
    std::vector<std::string> keywords;
    for (const auto& keyword : j) {
        keywords.push_back(to_lower(keyword.get<std::string>()));
    }
    return keywords;
}

CapabilityRule rule_from_json(const json& j) {
    CapabilityRule rule;
    if (j.contains("vendor")) {
        rule.vendor = gpu_vendor_from_string(j["vendor"].get<std::string>());
    }
    if (j.contains("keywords")) {
        rule.keywords = lowered_keywords(j["keywords"]);
    }
    return rule;
}

json rule_to_json(const CapabilityRule& rule) {
    json j;
    if (rule.vendor.has_value()) {
        j["vendor"] = gpu_vendor_name(rule.vendor.value());
    }
    j["keywords"] = rule.keywords;
    return j;
}

} // namespace

bool CapabilityRule::matches(const std::string& lower_name, GpuVendor actual_vendor) const {
    if (vendor.has_value() && vendor.value() != actual_vendor) {
        return false;
    }
    if (keywords.empty()) {
        return true;
    }
    return contains_any(lower_name, keywords);
}

CapabilityTable::CapabilityTable() : six_k_min_vram_mb_(8192) {
    gpu_vendor_rules_ = {
        {GpuVendor::NVIDIA, {"nvidia", "geforce", "rtx", "gtx"}},
        {GpuVendor::AMD, {"amd", "radeon", "rx "}},
        {GpuVendor::Intel, {"intel", "uhd", "iris", "arc"}},
    };

    cpu_vendor_rules_ = {
        {CpuVendor::Intel, {"intel"}},
        {CpuVendor::AMD, {"amd"}},
        {CpuVendor::ARM, {"arm", "aarch64"}},
    };

    dlss_rule_.vendor = GpuVendor::NVIDIA;
    dlss_rule_.keywords = {"rtx", "gtx 16"};

    // FSR is treated as available on every vendor
    fsr_rule_.keywords = {};

    xess_rule_.vendor = GpuVendor::Intel;
    xess_rule_.keywords = {"arc"};

    raytracing_rule_.keywords = {"rtx", "rx 6", "rx 7", "arc"};
}

CapabilityTable CapabilityTable::defaults() {
    return CapabilityTable();
}

CapabilityTable CapabilityTable::from_json(const json& j) {
    CapabilityTable table;

    if (j.contains("gpu_vendors")) {
        table.gpu_vendor_rules_.clear();
        for (const auto& entry : j["gpu_vendors"]) {
            table.gpu_vendor_rules_.emplace_back(
                gpu_vendor_from_string(entry["vendor"].get<std::string>()),
                lowered_keywords(entry["keywords"]));
        }
    }

    if (j.contains("cpu_vendors")) {
        table.cpu_vendor_rules_.clear();
        for (const auto& entry : j["cpu_vendors"]) {
            table.cpu_vendor_rules_.emplace_back(
                cpu_vendor_from_string(entry["vendor"].get<std::string>()),
                lowered_keywords(entry["keywords"]));
        }
    }

    if (j.contains("dlss")) table.dlss_rule_ = rule_from_json(j["dlss"]);
    if (j.contains("fsr")) table.fsr_rule_ = rule_from_json(j["fsr"]);
    if (j.contains("xess")) table.xess_rule_ = rule_from_json(j["xess"]);
    if (j.contains("raytracing")) table.raytracing_rule_ = rule_from_json(j["raytracing"]);
    if (j.contains("six_k_min_vram_mb")) {
        table.six_k_min_vram_mb_ = j["six_k_min_vram_mb"].get<size_t>();
    }

    return table;
}

CapabilityTable CapabilityTable::load_from_file(const std::string& filepath) {
    Utils::ModuleLogger logger("CAPABILITY_TABLE");
    logger.info("Loading capability table from: " + filepath);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        logger.error("Failed to open capability table: " + filepath);
        throw std::runtime_error("Cannot open capability table: " + filepath);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return from_json(json::parse(buffer.str()));
    } catch (const json::exception& e) {
        logger.error("JSON parsing error: " + std::string(e.what()));
        throw std::runtime_error("Invalid capability table: " + std::string(e.what()));
    }
}

GpuVendor CapabilityTable::infer_gpu_vendor(const std::string& device_name) const {
    const std::string lower = to_lower(device_name);
    for (const auto& rule : gpu_vendor_rules_) {
        if (contains_any(lower, rule.second)) {
            return rule.first;
        }
    }
    return GpuVendor::Unknown;
}

CpuVendor CapabilityTable::infer_cpu_vendor(const std::string& model_name) const {
    const std::string lower = to_lower(model_name);
    for (const auto& rule : cpu_vendor_rules_) {
        if (contains_any(lower, rule.second)) {
            return rule.first;
        }
    }
    return CpuVendor::Unknown;
}

GpuCapabilities CapabilityTable::infer_capabilities(const std::string& device_name,
                                                   GpuVendor vendor,
                                                   size_t vram_mb) const {
    const std::string lower = to_lower(device_name);

    GpuCapabilities caps;
    caps.supports_dlss = dlss_rule_.matches(lower, vendor);
    caps.supports_fsr = fsr_rule_.matches(lower, vendor);
    caps.supports_xess = xess_rule_.matches(lower, vendor);
    caps.supports_raytracing = raytracing_rule_.matches(lower, vendor);
    caps.six_k_capable = vram_mb >= six_k_min_vram_mb_;
    return caps;
}

void CapabilityTable::classify(GpuRecord& gpu) const {
    gpu.vendor = infer_gpu_vendor(gpu.name);
    gpu.capabilities = infer_capabilities(gpu.name, gpu.vendor, gpu.vram_mb);
}

json CapabilityTable::to_json() const {
    json j;

    j["gpu_vendors"] = json::array();
    for (const auto& rule : gpu_vendor_rules_) {
        j["gpu_vendors"].push_back({{"vendor", gpu_vendor_name(rule.first)},
                                    {"keywords", rule.second}});
    }

    j["cpu_vendors"] = json::array();
    for (const auto& rule : cpu_vendor_rules_) {
        j["cpu_vendors"].push_back({{"vendor", cpu_vendor_name(rule.first)},
                                    {"keywords", rule.second}});
    }

    j["dlss"] = rule_to_json(dlss_rule_);
    j["fsr"] = rule_to_json(fsr_rule_);
    j["xess"] = rule_to_json(xess_rule_);
    j["raytracing"] = rule_to_json(raytracing_rule_);
    j["six_k_min_vram_mb"] = six_k_min_vram_mb_;
    return j;
}

} // namespace Hardware
} // namespace RigTune
