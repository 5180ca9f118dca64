#pragma once

#include <optional>
#include <string>

namespace RigTune {
namespace Hardware {

// Runs a shell command and returns its stdout, or nullopt if it could not be
// started or exited non-zero. Blocks for the duration of the command.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual std::optional<std::string> run(const std::string& command) = 0;
};

class PopenCommandRunner : public CommandRunner {
public:
    std::optional<std::string> run(const std::string& command) override;
};

// Tools and kernel interfaces available on this machine, checked once at startup.
// A missing kernel interface makes the matching LinuxHardwareProbe query return
// a zero record instead of failing.
struct PlatformCapabilities {
    bool has_proc_cpuinfo = false;
    bool has_proc_meminfo = false;
    bool has_proc_stat = false;
    bool has_cpufreq_sysfs = false;
    bool has_lspci = false;
    bool has_nvidia_smi = false;

    // Kernel files are looked up under sysroot, tools on the live PATH
    static PlatformCapabilities detect(const std::string& sysroot = "");
    std::string to_string() const;
};

} // namespace Hardware
} // namespace RigTune
