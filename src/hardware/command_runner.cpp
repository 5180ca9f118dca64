#include "hardware/command_runner.hpp"
#include "utils/logger.hpp"
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <sys/wait.h>

namespace RigTune {
namespace Hardware {

namespace {

bool tool_exists(const std::string& tool) {
    std::string cmd = "command -v " + tool + " > /dev/null 2>&1";
    int result = system(cmd.c_str());
    return result == 0;
}

bool file_readable(const std::string& path) {
    std::ifstream file(path);
    return file.good();
}

} // namespace

std::optional<std::string> PopenCommandRunner::run(const std::string& command) {
    std::string full_command = command + " 2>/dev/null";
    FILE* pipe = popen(full_command.c_str(), "r");
    if (!pipe) {
        return std::nullopt;
    }

    std::string output;
    char buffer[512];
    while (fgets(buffer, sizeof(buffer), pipe) != nullptr) {
        output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1 || !WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        return std::nullopt;
    }
    return output;
}

PlatformCapabilities PlatformCapabilities::detect(const std::string& sysroot) {
    Utils::ModuleLogger logger("PLATFORM");

    PlatformCapabilities caps;
    caps.has_proc_cpuinfo = file_readable(sysroot + "/proc/cpuinfo");
    caps.has_proc_meminfo = file_readable(sysroot + "/proc/meminfo");
    caps.has_proc_stat = file_readable(sysroot + "/proc/stat");
    caps.has_cpufreq_sysfs = file_readable(sysroot + "/sys/devices/system/cpu/cpu0/cpufreq/cpuinfo_max_freq");
    caps.has_lspci = tool_exists("lspci");
    caps.has_nvidia_smi = tool_exists("nvidia-smi");

    logger.debug("Platform capabilities: " + caps.to_string());
    return caps;
}

std::string PlatformCapabilities::to_string() const {
    std::ostringstream oss;
    oss << "cpuinfo=" << (has_proc_cpuinfo ? "yes" : "no")
        << " meminfo=" << (has_proc_meminfo ? "yes" : "no")
        << " stat=" << (has_proc_stat ? "yes" : "no")
        << " cpufreq=" << (has_cpufreq_sysfs ? "yes" : "no")
        << " lspci=" << (has_lspci ? "yes" : "no")
        << " nvidia-smi=" << (has_nvidia_smi ? "yes" : "no");
    return oss.str();
}

} // namespace Hardware
} // namespace RigTune
