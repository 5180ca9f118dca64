#include "config/settings_store.hpp"
#include "tuning/performance_tier.hpp"
#include "tuning/stability_guard.hpp"
#include "tuning/system_analysis.hpp"
#include "utils/logger.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace RigTune;
using Tuning::PerformanceTier;
namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("rigtune_tier_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

Hardware::HardwareSnapshot snapshot_with(unsigned int cores, size_t ram_mb) {
    Hardware::HardwareSnapshot snapshot;
    snapshot.cpu.physical_cores = cores;
    snapshot.memory.total_mb = ram_mb;
    snapshot.gpus.push_back(Hardware::make_fallback_gpu());
    return snapshot;
}

} // namespace

void test_classify_thresholds() {
    std::cout << "Testing tier classification..." << std::endl;

    assert(Tuning::classify(8, 12288) == PerformanceTier::High);
    assert(Tuning::classify(16, 65536) == PerformanceTier::High);
    assert(Tuning::classify(4, 8192) == PerformanceTier::Normal);
    assert(Tuning::classify(4, 6144) == PerformanceTier::Normal);

    // Enough cores without the memory, or the reverse
    assert(Tuning::classify(8, 12287) == PerformanceTier::Normal);
    assert(Tuning::classify(7, 65536) == PerformanceTier::Normal);
    assert(Tuning::classify(3, 65536) == PerformanceTier::Low);
    assert(Tuning::classify(16, 6143) == PerformanceTier::Low);
    assert(Tuning::classify(0, 0) == PerformanceTier::Low);

    // A fully failed probe classifies instead of erroring
    Hardware::HardwareSnapshot empty;
    empty.gpus.push_back(Hardware::make_fallback_gpu());
    assert(Tuning::classify(empty) == PerformanceTier::Low);
    assert(Tuning::classify(snapshot_with(8, 16384)) == PerformanceTier::High);

    std::cout << "  ✓ Tier classification tests passed" << std::endl;
}

void test_tier_names() {
    std::cout << "Testing tier names..." << std::endl;

    assert(std::string(Tuning::tier_name(PerformanceTier::Low)) == "Low-End");
    assert(std::string(Tuning::tier_name(PerformanceTier::Normal)) == "Normal");
    assert(std::string(Tuning::tier_name(PerformanceTier::High)) == "High-End");

    for (auto tier : {PerformanceTier::Low, PerformanceTier::Normal, PerformanceTier::High}) {
        assert(Tuning::tier_from_string(Tuning::tier_name(tier)) == tier);
    }
    assert(!Tuning::tier_from_string("Ultra").has_value());

    std::cout << "  ✓ Tier name tests passed" << std::endl;
}

void test_feature_unlock() {
    std::cout << "Testing feature unlocks..." << std::endl;

    assert(Tuning::is_feature_unlocked(PerformanceTier::Low, PerformanceTier::Low));
    assert(!Tuning::is_feature_unlocked(PerformanceTier::Normal, PerformanceTier::Low));
    assert(!Tuning::is_feature_unlocked(PerformanceTier::High, PerformanceTier::Low));
    assert(Tuning::is_feature_unlocked(PerformanceTier::Low, PerformanceTier::Normal));
    assert(Tuning::is_feature_unlocked(PerformanceTier::Normal, PerformanceTier::Normal));
    assert(!Tuning::is_feature_unlocked(PerformanceTier::High, PerformanceTier::Normal));
    assert(Tuning::is_feature_unlocked(PerformanceTier::High, PerformanceTier::High));

    std::cout << "  ✓ Feature unlock tests passed" << std::endl;
}

void test_system_analysis() {
    std::cout << "Testing system analysis..." << std::endl;

    using Tuning::MemoryAdequacy;
    using Tuning::PerformanceClass;

    auto contains = [](const std::vector<std::string>& items, const std::string& text) {
        for (const auto& item : items) {
            if (item == text) return true;
        }
        return false;
    };

    Hardware::HardwareSnapshot rig = snapshot_with(8, 32768);
    rig.cpu.max_freq_mhz = 5000.0;
    rig.gpus[0].vram_mb = 16384;
    auto high = Tuning::analyze(rig);
    assert(high.cpu_class == PerformanceClass::High);
    assert(high.gpu_class == PerformanceClass::High);
    assert(high.memory == MemoryAdequacy::Excellent);
    assert(high.bottlenecks.empty());
    assert(high.recommendations.size() == 3);
    assert(contains(high.recommendations, "Ray tracing can be enabled with good performance"));

    // Boundaries are inclusive, one step below drops a class
    Hardware::HardwareSnapshot mid = snapshot_with(6, 16384);
    mid.cpu.max_freq_mhz = 3000.0;
    mid.gpus[0].vram_mb = 8192;
    auto medium = Tuning::analyze(mid);
    assert(medium.cpu_class == PerformanceClass::Medium);
    assert(medium.gpu_class == PerformanceClass::Medium);
    assert(medium.memory == MemoryAdequacy::Good);
    assert(medium.bottlenecks.empty());
    assert(contains(medium.recommendations, "1440p recommended resolution"));

    mid.cpu.max_freq_mhz = 2999.0;
    mid.gpus[0].vram_mb = 8191;
    mid.memory.total_mb = 16383;
    auto low = Tuning::analyze(mid);
    assert(low.cpu_class == PerformanceClass::Low);
    assert(low.gpu_class == PerformanceClass::Low);
    assert(low.memory == MemoryAdequacy::Limited);
    assert(low.bottlenecks.size() == 3);
    assert(low.bottlenecks[0] == "CPU performance may limit gaming performance");
    assert(low.recommendations.size() == 8);
    assert(low.recommendations.front() == "Enable CPU priority optimization for games");
    assert(contains(low.recommendations, "Disable ray tracing for better performance"));
    assert(contains(low.recommendations, "Reduce texture quality in games"));

    // Eight cores without the clock speed is not a high-end CPU
    Hardware::HardwareSnapshot slow = snapshot_with(8, 32768);
    slow.cpu.max_freq_mhz = 3400.0;
    assert(Tuning::analyze(slow).cpu_class == PerformanceClass::Medium);

    // Zero records from failed detection stay unrated
    Hardware::HardwareSnapshot empty;
    auto unknown = Tuning::analyze(empty);
    assert(unknown.cpu_class == PerformanceClass::Unknown);
    assert(unknown.gpu_class == PerformanceClass::Unknown);
    assert(unknown.memory == MemoryAdequacy::Unknown);
    assert(unknown.bottlenecks.empty());
    assert(unknown.recommendations.size() == 3);
    assert(unknown.recommendations[2] == "1080p recommended resolution");

    assert(std::string(Tuning::performance_class_name(PerformanceClass::Medium)) == "medium");
    assert(std::string(Tuning::memory_adequacy_name(MemoryAdequacy::Limited)) == "limited");

    std::cout << "  ✓ System analysis tests passed" << std::endl;
}

void test_tier_store_commits_once() {
    std::cout << "Testing one-time tier commit..." << std::endl;

    fs::path dir = make_temp_dir("commit");
    std::string path = (dir / "settings.json").string();

    {
        Config::SettingsStore settings(path);
        Tuning::TierStore store(settings);
        assert(!store.has_committed_tier());
        assert(store.resolve(snapshot_with(8, 16384)) == PerformanceTier::High);
        assert(store.has_committed_tier());
    }

    // Next run on weaker hardware still reads the committed value
    {
        Config::SettingsStore settings(path);
        assert(settings.get(Tuning::TierStore::kSettingsKey) == "High-End");
        Tuning::TierStore store(settings);
        assert(store.resolve(snapshot_with(2, 4096)) == PerformanceTier::High);

        assert(store.reclassify(snapshot_with(2, 4096)) == PerformanceTier::Low);
        assert(store.resolve(snapshot_with(8, 16384)) == PerformanceTier::Low);

        store.override_tier(PerformanceTier::Normal);
        assert(store.current() == PerformanceTier::Normal);
    }

    {
        Config::SettingsStore settings(path);
        Tuning::TierStore store(settings);
        assert(store.resolve(snapshot_with(8, 16384)) == PerformanceTier::Normal);
    }

    std::cout << "  ✓ One-time tier commit tests passed" << std::endl;
}

void test_tier_store_invalid_value() {
    std::cout << "Testing unreadable persisted tier..." << std::endl;

    fs::path dir = make_temp_dir("invalid");
    std::string path = (dir / "settings.json").string();
    {
        std::ofstream file(path);
        file << R"({"app.performance_mode": "Turbo"})";
    }

    Config::SettingsStore settings(path);
    Tuning::TierStore store(settings);
    assert(store.resolve(snapshot_with(16, 65536)) == PerformanceTier::Low);

    settings.set(Tuning::TierStore::kSettingsKey, 42);
    assert(store.current() == PerformanceTier::Low);

    std::cout << "  ✓ Unreadable persisted tier tests passed" << std::endl;
}

void test_stability_guard() {
    std::cout << "Testing stability guard..." << std::endl;

    fs::path dir = make_temp_dir("stability");
    std::string path = (dir / "settings.json").string();

    {
        Config::SettingsStore settings(path);
        Tuning::StabilityGuard guard(settings);
        assert(!guard.crashed_last_run());
        guard.mark_running();
        // Process "dies" here without mark_clean_shutdown()
    }

    {
        Config::SettingsStore settings(path);
        Tuning::StabilityGuard guard(settings);
        assert(guard.crashed_last_run());
        guard.mark_clean_shutdown();
        assert(!guard.crashed_last_run());
    }

    Config::SettingsStore settings(path);
    Tuning::StabilityGuard guard(settings);
    Tuning::TierStore tiers(settings);

    assert(!guard.rollback_section(Tuning::TierStore::kSettingsKey));

    tiers.override_tier(PerformanceTier::Normal);
    assert(guard.backup_section(Tuning::TierStore::kSettingsKey));
    tiers.override_tier(PerformanceTier::High);
    assert(settings.get("backups.app.performance_mode") == "Normal");

    assert(guard.rollback_section(Tuning::TierStore::kSettingsKey));
    assert(tiers.current() == PerformanceTier::Normal);

    std::cout << "  ✓ Stability guard tests passed" << std::endl;
}

int main() {
    std::cout << "\n=== Running Tier Tests ===\n" << std::endl;

    Utils::Logger::instance().set_log_directory("logs");
    Utils::Logger::instance().set_console_output(false);

    test_classify_thresholds();
    test_tier_names();
    test_feature_unlock();
    test_system_analysis();
    test_tier_store_commits_once();
    test_tier_store_invalid_value();
    test_stability_guard();

    std::cout << "\n=== All Tests Passed ===\n" << std::endl;

    return 0;
}
