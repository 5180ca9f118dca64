#pragma once

#include "hardware/hardware_probe.hpp"
#include "hardware/hardware_snapshot.hpp"
#include "utils/logger.hpp"
#include <mutex>
#include <optional>

namespace RigTune {
namespace Hardware {

/**
 * Produces the process-wide HardwareSnapshot.
 *
 * capture() probes once and caches; later calls return the cached value until
 * refresh() is called. No probe failure escapes: a failing CPU or memory probe
 * yields a zero record, a failing or empty GPU probe yields make_fallback_gpu().
 *
 * capture_live_stats() is the lighter polling call. It is never cached and may
 * block on the vendor diagnostic tool.
 */
class SnapshotCollector {
public:
    explicit SnapshotCollector(HardwareProbe& probe);

    HardwareSnapshot capture();
    void refresh();
    bool has_snapshot() const;

    LiveStats capture_live_stats();

private:
    HardwareSnapshot probe_all();

    HardwareProbe& probe_;
    Utils::ModuleLogger logger_;

    mutable std::mutex snapshot_mutex_;
    std::optional<HardwareSnapshot> snapshot_;

    std::mutex live_mutex_;
    std::optional<CpuTimes> previous_cpu_times_;
    bool telemetry_warning_logged_;
};

} // namespace Hardware
} // namespace RigTune
