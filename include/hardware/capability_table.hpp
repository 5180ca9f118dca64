#pragma once

#include "hardware/hardware_snapshot.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace RigTune {
namespace Hardware {

using json = nlohmann::json;

// A feature is granted when the vendor matches (if one is required) and the
// lower-cased device name contains any keyword. No keywords means no name check.
struct CapabilityRule {
    std::optional<GpuVendor> vendor;
    std::vector<std::string> keywords;

    bool matches(const std::string& lower_name, GpuVendor actual_vendor) const;
};

/**
 * Ordered keyword table mapping device names to vendors and capability flags.
 *
 * Vendor rules are evaluated in order and the first rule with a matching
 * keyword wins. The built-in table reproduces the rules saved profiles were
 * created with; a JSON file can replace any section without code changes.
 */
class CapabilityTable {
public:
    CapabilityTable();

    static CapabilityTable defaults();
    static CapabilityTable from_json(const json& j);
    static CapabilityTable load_from_file(const std::string& filepath);

    GpuVendor infer_gpu_vendor(const std::string& device_name) const;
    CpuVendor infer_cpu_vendor(const std::string& model_name) const;
    GpuCapabilities infer_capabilities(const std::string& device_name, GpuVendor vendor,
                                       size_t vram_mb) const;

    // Fills vendor and capabilities of a record from its name and VRAM
    void classify(GpuRecord& gpu) const;

    json to_json() const;

private:
    std::vector<std::pair<GpuVendor, std::vector<std::string>>> gpu_vendor_rules_;
    std::vector<std::pair<CpuVendor, std::vector<std::string>>> cpu_vendor_rules_;
    CapabilityRule dlss_rule_;
    CapabilityRule fsr_rule_;
    CapabilityRule xess_rule_;
    CapabilityRule raytracing_rule_;
    size_t six_k_min_vram_mb_;
};

std::string to_lower(const std::string& text);

} // namespace Hardware
} // namespace RigTune
