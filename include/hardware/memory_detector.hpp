#pragma once

#include "hardware/hardware_snapshot.hpp"
#include <cstddef>
#include <string>

namespace RigTune {
namespace Hardware {

class MemoryDetector {
public:
    explicit MemoryDetector(const std::string& sysroot = "");

    // Throws std::runtime_error when /proc/meminfo cannot be read
    MemoryRecord detect();
    void print_info(const MemoryRecord& info);

private:
    size_t read_meminfo_mb(const std::string& key);

    std::string sysroot_;
};

} // namespace Hardware
} // namespace RigTune
