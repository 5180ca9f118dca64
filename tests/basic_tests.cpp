#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include "config/configuration.hpp"
#include "config/settings_store.hpp"
#include "hardware/capability_table.hpp"
#include "utils/logger.hpp"

using namespace RigTune;
namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("rigtune_basic_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

std::string read_all_logs(const fs::path& dir) {
    std::string contents;
    for (const auto& entry : fs::directory_iterator(dir)) {
        std::ifstream file(entry.path());
        std::stringstream buffer;
        buffer << file.rdbuf();
        contents += buffer.str();
    }
    return contents;
}

} // namespace

void test_logger() {
    std::cout << "Testing logger..." << std::endl;

    fs::path dir = make_temp_dir("logger");
    Utils::Logger::instance().set_log_directory(dir.string());
    Utils::Logger::instance().set_min_level(Utils::LogLevel::DEBUG);
    Utils::ModuleLogger logger("TEST");

    logger.debug("Debug message");
    logger.info("Info message");
    logger.warning("Warning message");
    logger.error("Error message");
    RIGTUNE_LOG_CRITICAL("TEST", "Critical message");

    std::string logs = read_all_logs(dir);
    assert(logs.find("[TEST] Debug message") != std::string::npos);
    assert(logs.find("[CRITICAL] [TEST] Critical message") != std::string::npos);

    Utils::Logger::instance().set_min_level(Utils::LogLevel::WARNING);
    logger.info("Filtered message");
    logger.warning("Kept message");
    logs = read_all_logs(dir);
    assert(logs.find("Filtered message") == std::string::npos);
    assert(logs.find("Kept message") != std::string::npos);

    Utils::Logger::instance().set_min_level(Utils::LogLevel::DEBUG);
    Utils::Logger::instance().set_log_directory("logs");

    std::cout << "  ✓ Logger tests passed" << std::endl;
}

void test_log_level_names() {
    std::cout << "Testing log level names..." << std::endl;

    assert(Utils::log_level_from_string("debug") == Utils::LogLevel::DEBUG);
    assert(Utils::log_level_from_string("WARNING") == Utils::LogLevel::WARNING);
    assert(Utils::log_level_from_string("warn") == Utils::LogLevel::WARNING);
    assert(Utils::log_level_from_string("Error") == Utils::LogLevel::ERROR);
    assert(Utils::log_level_from_string("critical") == Utils::LogLevel::CRITICAL);
    assert(Utils::log_level_from_string("verbose") == Utils::LogLevel::INFO);

    std::cout << "  ✓ Log level name tests passed" << std::endl;
}

void test_configuration_defaults() {
    std::cout << "Testing configuration defaults..." << std::endl;

    Config::Configuration defaults;
    assert(defaults.validate());
    assert(defaults.get_logging_config().level == "info");
    assert(defaults.get_storage_config().profiles_path == "data/game_profiles.json");
    assert(defaults.get_monitor_config().poll_interval_ms == 2000);
    assert(!defaults.get_hardware_config().capability_table.has_value());

    // Missing sections keep their defaults
    auto partial = Config::Configuration::load_from_string(R"({
        "logging": { "level": "debug", "console": false },
        "monitor": { "poll_interval_ms": 750 }
    })");
    assert(partial->get_logging_config().level == "debug");
    assert(!partial->get_logging_config().console);
    assert(partial->get_logging_config().directory == "logs");
    assert(partial->get_monitor_config().poll_interval_ms == 750);
    assert(partial->get_monitor_config().channel_capacity == 64);
    assert(partial->get_storage_config().settings_path == "data/settings.json");
    assert(partial->validate());

    // Level names are matched the way the logger reads them
    auto upper = Config::Configuration::load_from_string(R"({"logging": {"level": "INFO"}})");
    assert(upper->validate());
    assert(Config::Configuration::load_from_string(R"({"logging": {"level": "Warning"}})")->validate());

    std::cout << "  ✓ Configuration default tests passed" << std::endl;
}

void test_configuration_validation() {
    std::cout << "Testing configuration validation..." << std::endl;

    const char* invalid[] = {
        R"({"logging": {"level": "loud"}})",
        R"({"storage": {"profiles_path": "same.json", "settings_path": "same.json"}})",
        R"({"storage": {"profiles_path": ""}})",
        R"({"monitor": {"poll_interval_ms": 0}})",
        R"({"monitor": {"channel_capacity": 0}})",
    };
    for (const char* text : invalid) {
        assert(!Config::Configuration::load_from_string(text)->validate());
    }

    bool threw = false;
    try {
        Config::Configuration::load_from_string("{ not json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Config::Configuration::load_from_string("[]");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        Config::Configuration::load_from_file("does/not/exist.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << "  ✓ Configuration validation tests passed" << std::endl;
}

void test_sample_configuration() {
    std::cout << "Testing sample configuration..." << std::endl;

    auto config = Config::Configuration::load_from_file("configs/rigtune.json");
    assert(config->validate());
    assert(config->get_storage_config().profiles_path != config->get_storage_config().settings_path);

    // The shipped keyword table matches the built-in one
    const auto& table_path = config->get_hardware_config().capability_table;
    assert(table_path.has_value());
    auto table = Hardware::CapabilityTable::load_from_file(*table_path);
    for (const char* name : {"NVIDIA GeForce RTX 3070", "Intel Arc A750", "AMD Radeon RX 580",
                             "NVIDIA GeForce GTX 1650", "Intel UHD Graphics 770"}) {
        Hardware::GpuRecord from_file;
        from_file.name = name;
        from_file.vram_mb = 8192;
        Hardware::GpuRecord built_in = from_file;
        table.classify(from_file);
        Hardware::CapabilityTable::defaults().classify(built_in);
        assert(from_file.vendor == built_in.vendor);
        assert(from_file.capabilities.supports_dlss == built_in.capabilities.supports_dlss);
        assert(from_file.capabilities.supports_xess == built_in.capabilities.supports_xess);
        assert(from_file.capabilities.supports_raytracing == built_in.capabilities.supports_raytracing);
    }

    std::cout << "  ✓ Sample configuration tests passed" << std::endl;
}

void test_settings_store() {
    std::cout << "Testing settings store..." << std::endl;

    fs::path dir = make_temp_dir("settings");
    std::string path = (dir / "nested" / "settings.json").string();

    {
        Config::SettingsStore store(path);
        assert(!store.contains("app.theme"));
        assert(store.get("app.theme", "dark") == "dark");
        assert(store.set("app.theme", "light"));
        assert(store.set("app.window.width", 1280));
        assert(fs::exists(path));
    }

    {
        Config::SettingsStore store(path);
        assert(store.get("app.theme") == "light");
        assert(store.get("app.window.width") == 1280);
        assert(store.erase("app.theme"));
        // Erasing a missing key is not an error
        assert(store.erase("app.theme"));
    }

    Config::SettingsStore reread(path);
    assert(!reread.contains("app.theme"));
    assert(reread.contains("app.window.width"));

    // A corrupt file starts empty instead of failing
    fs::path corrupt = dir / "corrupt.json";
    {
        std::ofstream file(corrupt);
        file << "{\"app.theme\": ";
    }
    Config::SettingsStore broken(corrupt.string());
    assert(!broken.contains("app.theme"));
    assert(broken.get("app.theme").is_null());

    std::cout << "  ✓ Settings store tests passed" << std::endl;
}

int main() {
    std::cout << "\n=== Running RigTune Basic Tests ===\n" << std::endl;

    Utils::Logger::instance().set_log_directory("logs");
    Utils::Logger::instance().set_console_output(false);

    test_logger();
    test_log_level_names();
    test_configuration_defaults();
    test_configuration_validation();
    test_sample_configuration();
    test_settings_store();

    std::cout << "\n=== All Tests Passed ===\n" << std::endl;

    return 0;
}
