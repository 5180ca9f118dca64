#include "config/configuration.hpp"
#include "config/settings_store.hpp"
#include "executor/optimization_executor.hpp"
#include "hardware/capability_table.hpp"
#include "hardware/command_runner.hpp"
#include "hardware/hardware_probe.hpp"
#include "hardware/snapshot_collector.hpp"
#include "io/config_writer.hpp"
#include "monitor/live_stats_poller.hpp"
#include "tuning/game_optimizer.hpp"
#include "tuning/performance_tier.hpp"
#include "tuning/profile_store.hpp"
#include "tuning/stability_guard.hpp"
#include "tuning/system_analysis.hpp"
#include "utils/logger.hpp"
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace RigTune;

namespace {

void print_usage(const std::string& program_name) {
    std::cout << "RigTune - Hardware-aware game settings optimizer\n";
    std::cout << "================================================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [--config <file.json>] <command> [options]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  detect                     Capture and print the hardware snapshot\n";
    std::cout << "  platform                   Show which probes and tools are available\n";
    std::cout << "  analyze                    Rate CPU, GPU and memory and suggest settings\n";
    std::cout << "  tier                       Show the committed performance mode\n";
    std::cout << "    --override <mode>        Set the mode (Low-End, Normal, High-End)\n";
    std::cout << "    --reclassify             Classify the current hardware again\n";
    std::cout << "    --rollback               Return to the mode saved before the last override\n";
    std::cout << "  list-profiles              List the known game profiles\n";
    std::cout << "  installed [dir...]         List profiles found under $HOME or in the given\n";
    std::cout << "                             directories (default: $PATH)\n";
    std::cout << "  optimize <game>            Show the settings that apply would write\n";
    std::cout << "  apply <game>               Write optimized settings to the game config\n";
    std::cout << "    --preset <name>          Force a quality preset (quality, balanced,\n";
    std::cout << "                             performance, ultra)\n";
    std::cout << "  restore <game>             Restore the game config from its backup\n";
    std::cout << "  read <config_file>         Print the settings stored in a config file\n";
    std::cout << "    --format <name>          Parse as ini, json, xml or raw instead of\n";
    std::cout << "                             guessing from the extension\n";
    std::cout << "  import-profiles <file>     Merge profiles from another store file\n";
    std::cout << "  export-profiles <file>     Write all profiles to a file\n";
    std::cout << "  live [samples]             Poll live CPU/GPU telemetry (default: 5 samples)\n";
    std::cout << "  validate-config <file>     Validate an application config file\n";
    std::cout << "  --help, -h                 Show this help message\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " detect\n";
    std::cout << "  " << program_name << " apply \"Cyberpunk 2077\" --preset ultra\n";
    std::cout << "  " << program_name << " --config configs/rigtune.json live 10\n\n";
}

bool validate_config(const std::string& config_file) {
    Utils::ModuleLogger logger("VALIDATE");

    logger.info("Validating configuration file: " + config_file);

    try {
        auto config = Config::Configuration::load_from_file(config_file);
        config->print_summary();

        if (config->validate()) {
            logger.info("✓ Configuration is valid!");
            return true;
        }
        logger.error("✗ Configuration validation failed!");
        return false;
    } catch (const std::exception& e) {
        logger.error("Error loading configuration: " + std::string(e.what()));
        return false;
    }
}

void print_snapshot(const Hardware::HardwareSnapshot& snapshot) {
    std::cout << "CPU:    " << snapshot.cpu.name
              << " [" << Hardware::cpu_vendor_name(snapshot.cpu.vendor) << "]\n";
    std::cout << "        " << snapshot.cpu.physical_cores << " cores / "
              << snapshot.cpu.logical_threads << " threads";
    if (snapshot.cpu.max_freq_mhz > 0) {
        std::cout << ", " << std::fixed << std::setprecision(0)
                  << snapshot.cpu.base_freq_mhz << "-" << snapshot.cpu.max_freq_mhz << " MHz";
    }
    std::cout << "\n";

    for (size_t i = 0; i < snapshot.gpus.size(); ++i) {
        const auto& gpu = snapshot.gpus[i];
        std::cout << (i == 0 ? "GPU:    " : "        ") << gpu.name
                  << " [" << Hardware::gpu_vendor_name(gpu.vendor) << "]"
                  << " VRAM " << gpu.vram_mb << " MB, driver " << gpu.driver_version << "\n";
        std::cout << "        DLSS " << (gpu.capabilities.supports_dlss ? "yes" : "no")
                  << " | FSR " << (gpu.capabilities.supports_fsr ? "yes" : "no")
                  << " | XeSS " << (gpu.capabilities.supports_xess ? "yes" : "no")
                  << " | RT " << (gpu.capabilities.supports_raytracing ? "yes" : "no")
                  << " | 6K " << (gpu.capabilities.six_k_capable ? "yes" : "no") << "\n";
    }

    std::cout << "Memory: " << snapshot.memory.total_mb << " MB total, "
              << snapshot.memory.available_mb << " MB available\n";
}

void print_settings(const IO::SettingsMap& settings) {
    for (const auto& [key, value] : settings) {
        std::cout << "  " << std::left << std::setw(18) << key << IO::to_display_string(value) << "\n";
    }
}

std::optional<Tuning::OptimizerOverrides> parse_overrides(const std::vector<std::string>& args,
                                                          size_t start) {
    Tuning::OptimizerOverrides overrides;
    for (size_t i = start; i < args.size(); ++i) {
        if (args[i] == "--preset" && i + 1 < args.size()) {
            auto preset = Tuning::quality_preset_from_string(args[i + 1]);
            if (!preset) {
                std::cerr << "Error: unknown preset '" << args[i + 1] << "'\n";
                return std::nullopt;
            }
            overrides.quality_preset = preset;
            ++i;
        } else {
            std::cerr << "Error: unexpected option '" << args[i] << "'\n";
            return std::nullopt;
        }
    }
    return overrides;
}

// Wires the pipeline from the loaded configuration and dispatches one command
class Application {
public:
    explicit Application(const Config::Configuration& config)
        : config_(config),
          logger_("CLI"),
          table_(load_capability_table(config)),
          platform_(Hardware::PlatformCapabilities::detect(
              config.get_hardware_config().sysroot.value_or(""))),
          probe_(table_, platform_, runner_, config.get_hardware_config().sysroot.value_or("")),
          collector_(probe_),
          settings_(config.get_storage_config().settings_path),
          tiers_(settings_),
          guard_(settings_),
          profiles_(config.get_storage_config().profiles_path),
          executor_(collector_, tiers_, profiles_, writer_) {}

    int run(const std::string& command, const std::vector<std::string>& args) {
        if (guard_.crashed_last_run()) {
            logger_.warning("Previous run did not shut down cleanly; "
                            "use 'tier --rollback' if the last override caused it");
        }
        guard_.mark_running();

        int rc = 1;
        try {
            rc = dispatch(command, args);
        } catch (const std::exception&) {
            // An error is not a crash
            guard_.mark_clean_shutdown();
            throw;
        }

        guard_.mark_clean_shutdown();
        return rc;
    }

private:
    static Hardware::CapabilityTable load_capability_table(const Config::Configuration& config) {
        const auto& path = config.get_hardware_config().capability_table;
        if (path.has_value()) {
            return Hardware::CapabilityTable::load_from_file(*path);
        }
        return Hardware::CapabilityTable::defaults();
    }

    int dispatch(const std::string& command, const std::vector<std::string>& args) {
        if (command == "detect") return cmd_detect();
        if (command == "platform") return cmd_platform();
        if (command == "tier") return cmd_tier(args);
        if (command == "analyze") return cmd_analyze();
        if (command == "list-profiles") return cmd_list_profiles();
        if (command == "installed") return cmd_installed(args);
        if (command == "optimize") return cmd_optimize(args);
        if (command == "apply") return cmd_apply(args);
        if (command == "restore") return cmd_restore(args);
        if (command == "read") return cmd_read(args);
        if (command == "import-profiles") return cmd_import(args);
        if (command == "export-profiles") return cmd_export(args);
        if (command == "live") return cmd_live(args);

        std::cerr << "Error: Unknown command '" << command << "'\n";
        std::cerr << "Run with --help for the list of commands\n";
        return 1;
    }

    int cmd_detect() {
        print_snapshot(collector_.capture());
        return 0;
    }

    int cmd_platform() {
        std::cout << platform_.to_string() << "\n";
        return 0;
    }

    int cmd_tier(const std::vector<std::string>& args) {
        Hardware::HardwareSnapshot snapshot = collector_.capture();

        if (args.empty()) {
            Tuning::PerformanceTier tier = tiers_.resolve(snapshot);
            std::cout << "Performance mode: " << Tuning::tier_name(tier) << "\n";
            std::cout << "Hardware classifies as: "
                      << Tuning::tier_name(Tuning::classify(snapshot)) << "\n";
            return 0;
        }

        if (args[0] == "--reclassify") {
            Tuning::PerformanceTier tier = tiers_.reclassify(snapshot);
            std::cout << "Performance mode: " << Tuning::tier_name(tier) << "\n";
            return 0;
        }

        if (args[0] == "--override" && args.size() > 1) {
            auto tier = Tuning::tier_from_string(args[1]);
            if (!tier) {
                std::cerr << "Error: unknown performance mode '" << args[1] << "'\n";
                return 1;
            }
            if (tiers_.has_committed_tier() &&
                !guard_.backup_section(Tuning::TierStore::kSettingsKey)) {
                logger_.warning("Previous performance mode could not be saved for rollback");
            }
            tiers_.override_tier(*tier);
            std::cout << "Performance mode: " << Tuning::tier_name(*tier) << "\n";
            return 0;
        }

        if (args[0] == "--rollback") {
            if (!guard_.rollback_section(Tuning::TierStore::kSettingsKey)) {
                return 1;
            }
            std::cout << "Performance mode: " << Tuning::tier_name(tiers_.current()) << "\n";
            return 0;
        }

        std::cerr << "Error: unknown tier option '" << args[0] << "'\n";
        return 1;
    }

    int cmd_list_profiles() {
        profiles_.load_profiles();
        for (const auto& profile : profiles_.profiles()) {
            const auto& req = profile.capability_requirements;
            std::cout << "  " << profile.name << "\n";
            std::cout << "      " << Tuning::resolution_name(profile.target_resolution)
                      << " @ " << profile.target_fps << " fps"
                      << (req.supports_dlss ? " | DLSS" : "")
                      << (req.supports_fsr ? " | FSR" : "")
                      << (req.supports_xess ? " | XeSS" : "")
                      << (req.supports_raytracing ? " | RT" : "") << "\n";
            std::cout << "      " << profile.config_file_path << "\n";
            if (!profile.last_applied.empty()) {
                std::cout << "      last applied " << profile.last_applied << "\n";
            }
        }
        return 0;
    }

    int cmd_analyze() {
        Tuning::SystemAnalysis analysis = Tuning::analyze(collector_.capture());
        std::cout << "CPU class:    " << Tuning::performance_class_name(analysis.cpu_class) << "\n";
        std::cout << "GPU class:    " << Tuning::performance_class_name(analysis.gpu_class) << "\n";
        std::cout << "Memory:       " << Tuning::memory_adequacy_name(analysis.memory) << "\n";

        if (!analysis.bottlenecks.empty()) {
            std::cout << "Bottlenecks:\n";
            for (const auto& item : analysis.bottlenecks) {
                std::cout << "  - " << item << "\n";
            }
        }
        std::cout << "Recommendations:\n";
        for (const auto& item : analysis.recommendations) {
            std::cout << "  - " << item << "\n";
        }
        return 0;
    }

    int cmd_installed(const std::vector<std::string>& args) {
        const char* home = std::getenv("HOME");
        std::vector<std::string> search_dirs = args;
        if (search_dirs.empty()) {
            const char* path = std::getenv("PATH");
            std::istringstream dirs(path ? path : "");
            std::string dir;
            while (std::getline(dirs, dir, ':')) {
                if (!dir.empty()) search_dirs.push_back(dir);
            }
        }

        profiles_.load_profiles();
        auto installed = profiles_.detect_installed(home ? home : "", search_dirs);
        if (installed.empty()) {
            std::cout << "No installed games detected\n";
            return 0;
        }
        for (const auto& profile : installed) {
            std::cout << "  " << profile.name << "\n";
        }
        return 0;
    }

    int cmd_optimize(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cerr << "Error: optimize requires a game name\n";
            return 1;
        }
        auto overrides = parse_overrides(args, 1);
        if (!overrides) return 1;

        profiles_.load_profiles();
        auto profile = profiles_.find(args[0]);
        if (!profile) {
            std::cerr << "Error: no profile named '" << args[0] << "'\n";
            return 1;
        }

        auto decision = executor_.preview(args[0], *overrides);
        if (!decision) return 1;

        std::cout << profile->name << " -> " << profile->config_file_path << "\n";
        print_settings(Tuning::GameOptimizer::to_settings_map(*profile, *decision));
        return 0;
    }

    int cmd_apply(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cerr << "Error: apply requires a game name\n";
            return 1;
        }
        auto overrides = parse_overrides(args, 1);
        if (!overrides) return 1;

        profiles_.load_profiles();
        Executor::ApplyResult result = executor_.apply(args[0], *overrides);

        std::cout << "Status: " << Executor::apply_status_name(result.status) << "\n";
        if (result.status == Executor::ApplyStatus::ValidationFailed) {
            std::cout << "  " << result.validation.field << ": " << result.validation.reason << "\n";
        }
        if (result.status != Executor::ApplyStatus::UnknownGame) {
            print_settings(result.settings);
        }
        if (result.backup_path) {
            std::cout << "Backup: " << *result.backup_path << "\n";
        }
        return result.applied() ? 0 : 1;
    }

    int cmd_restore(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cerr << "Error: restore requires a game name\n";
            return 1;
        }
        profiles_.load_profiles();
        if (!executor_.restore(args[0])) {
            std::cout << "Nothing restored\n";
            return 1;
        }
        std::cout << "Restored\n";
        return 0;
    }

    int cmd_read(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cerr << "Error: read requires a config file path\n";
            return 1;
        }
        std::optional<IO::ConfigFormat> format;
        for (size_t i = 1; i < args.size(); ++i) {
            if (args[i] == "--format" && i + 1 < args.size()) {
                format = IO::config_format_from_string(args[i + 1]);
                if (!format) {
                    std::cerr << "Error: unknown config format '" << args[i + 1] << "'\n";
                    return 1;
                }
                ++i;
            } else {
                std::cerr << "Error: unexpected option '" << args[i] << "'\n";
                return 1;
            }
        }

        IO::SettingsMap settings = writer_.read(args[0], format);
        if (settings.empty()) {
            std::cout << "(no settings)\n";
            return 0;
        }
        print_settings(settings);
        return 0;
    }

    int cmd_import(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cerr << "Error: import-profiles requires a file path\n";
            return 1;
        }
        profiles_.load_profiles();
        auto count = profiles_.import_profiles(args[0]);
        if (!count) return 1;
        std::cout << "Imported " << *count << " profiles\n";
        return 0;
    }

    int cmd_export(const std::vector<std::string>& args) {
        if (args.empty()) {
            std::cerr << "Error: export-profiles requires a file path\n";
            return 1;
        }
        profiles_.load_profiles();
        return profiles_.export_profiles(args[0]) ? 0 : 1;
    }

    int cmd_live(const std::vector<std::string>& args) {
        size_t samples = 5;
        if (!args.empty()) {
            samples = static_cast<size_t>(std::stoul(args[0]));
        }

        // The snapshot decides whether the GPU tool is worth spawning
        collector_.capture();

        const auto& monitor = config_.get_monitor_config();
        std::chrono::milliseconds interval(monitor.poll_interval_ms);
        Monitor::StatsChannel channel(monitor.channel_capacity);
        Monitor::LiveStatsPoller poller(collector_, channel, interval);
        poller.start();

        std::cout << std::fixed << std::setprecision(1);
        for (size_t received = 0; received < samples;) {
            auto stats = channel.pop(interval * 2);
            if (!stats) continue;
            ++received;

            std::cout << "CPU " << std::setw(5) << stats->cpu_utilization_percent << "% @ "
                      << std::setw(6) << stats->cpu_current_freq_mhz << " MHz";
            if (stats->gpu_telemetry_available) {
                std::cout << " | GPU " << std::setw(5) << stats->gpu_utilization_percent << "%"
                          << " VRAM " << stats->gpu_vram_usage_percent << "%"
                          << " " << stats->gpu_temperature_c << "C"
                          << " " << stats->gpu_core_clock_mhz << "/" << stats->gpu_mem_clock_mhz << " MHz"
                          << " " << stats->gpu_power_draw_w << " W";
            } else {
                std::cout << " | GPU telemetry unavailable";
            }
            std::cout << "\n";
        }

        poller.stop();
        channel.close();
        return 0;
    }

    const Config::Configuration& config_;
    Utils::ModuleLogger logger_;
    Hardware::CapabilityTable table_;
    Hardware::PlatformCapabilities platform_;
    Hardware::PopenCommandRunner runner_;
    Hardware::LinuxHardwareProbe probe_;
    Hardware::SnapshotCollector collector_;
    Config::SettingsStore settings_;
    Tuning::TierStore tiers_;
    Tuning::StabilityGuard guard_;
    Tuning::ProfileStore profiles_;
    IO::ConfigWriter writer_;
    Executor::OptimizationExecutor executor_;
};

} // namespace

int main(int argc, char* argv[]) {
    Utils::ModuleLogger main_logger("CLI");

    std::vector<std::string> args(argv, argv + argc);

    if (argc < 2) {
        print_usage(args[0]);
        return 1;
    }

    size_t next = 1;
    std::string config_file;
    if (args[next] == "--config" || args[next] == "-c") {
        if (args.size() < 3) {
            std::cerr << "Error: " << args[next] << " requires a configuration file path\n";
            print_usage(args[0]);
            return 1;
        }
        config_file = args[next + 1];
        next += 2;
    }

    if (next >= args.size()) {
        print_usage(args[0]);
        return 1;
    }

    std::string command = args[next];
    std::vector<std::string> command_args(args.begin() + next + 1, args.end());

    if (command == "--help" || command == "-h") {
        print_usage(args[0]);
        return 0;
    }

    if (command == "validate-config") {
        if (command_args.empty()) {
            std::cerr << "Error: validate-config requires a configuration file path\n";
            return 1;
        }
        return validate_config(command_args[0]) ? 0 : 1;
    }

    try {
        std::unique_ptr<Config::Configuration> config;
        if (config_file.empty()) {
            config = std::make_unique<Config::Configuration>();
        } else {
            config = Config::Configuration::load_from_file(config_file);
        }

        const auto& logging = config->get_logging_config();
        Utils::Logger::instance().set_log_directory(logging.directory);
        Utils::Logger::instance().set_min_level(Utils::log_level_from_string(logging.level));
        Utils::Logger::instance().set_console_output(logging.console);

        if (!config->validate()) {
            main_logger.error("Configuration validation failed. Aborting.");
            return 1;
        }

        Application app(*config);
        return app.run(command, command_args);
    } catch (const std::exception& e) {
        main_logger.error("Error: " + std::string(e.what()));
        return 1;
    }
}
