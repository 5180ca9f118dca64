#include "tuning/profile_store.hpp"
#include "utils/logger.hpp"
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace RigTune;
namespace fs = std::filesystem;

namespace {

fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("rigtune_store_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& contents) {
    std::ofstream file(path);
    file << contents;
}

std::string read_file(const fs::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

} // namespace

void test_default_profiles_created() {
    std::cout << "Testing default profile creation..." << std::endl;

    fs::path dir = make_temp_dir("defaults");
    fs::path path = dir / "data" / "game_profiles.json";

    Tuning::ProfileStore store(path.string());
    auto profiles = store.load_profiles();
    assert(profiles.size() == 5);
    assert(fs::exists(path));

    auto cyberpunk = store.find("Cyberpunk 2077");
    assert(cyberpunk.has_value());
    assert(cyberpunk->capability_requirements.supports_dlss);
    assert(cyberpunk->capability_requirements.supports_fsr);
    assert(cyberpunk->capability_requirements.supports_raytracing);
    assert(!cyberpunk->capability_requirements.supports_xess);
    assert(cyberpunk->executable_names.count("Cyberpunk2077.exe") == 1);

    auto valorant = store.find("valorant");
    assert(valorant.has_value());
    assert(!valorant->capability_requirements.supports_dlss);
    assert(!valorant->capability_requirements.supports_fsr);

    auto apex = store.find("APEX LEGENDS");
    assert(apex.has_value());
    assert(apex->capability_requirements.supports_fsr);
    assert(!apex->capability_requirements.supports_dlss);

    assert(!store.find("Half-Life 3").has_value());

    // A second store on the same file reads what the first wrote
    Tuning::ProfileStore reread(path.string());
    auto again = reread.load_profiles();
    assert(again.size() == 5);
    assert(again[0].name == profiles[0].name);
    assert(again[0].target_resolution == profiles[0].target_resolution);
    assert(again[0].settings_schema.size() == profiles[0].settings_schema.size());

    std::cout << "  ✓ Default profile creation tests passed" << std::endl;
}

void test_profile_json_format() {
    std::cout << "Testing profile JSON format..." << std::endl;

    fs::path dir = make_temp_dir("format");
    fs::path path = dir / "profiles.json";
    write_file(path, R"({
        "games": [
            {
                "name": "Starfield",
                "executable_names": ["Starfield.exe"],
                "config_file_path": "StarfieldPrefs.ini",
                "supports_dlss": true,
                "supports_fsr": true,
                "supports_raytracing": false,
                "target_resolution": "4K",
                "target_fps": 60
            }
        ]
    })");

    Tuning::ProfileStore store(path.string());
    auto profiles = store.load_profiles();
    assert(profiles.size() == 1);

    const auto& starfield = profiles[0];
    assert(starfield.config_file_path == "StarfieldPrefs.ini");
    assert(starfield.target_resolution == Tuning::Resolution::R4K);
    assert(starfield.target_fps == 60);
    // Missing XeSS flag and schema take their defaults
    assert(!starfield.capability_requirements.supports_xess);
    assert(starfield.settings_schema.count("fps") == 1);
    assert(starfield.last_applied.empty());

    // Keys on disk are flat and dot-free
    Tuning::json j = starfield.to_json();
    for (auto it = j.begin(); it != j.end(); ++it) {
        assert(it.key().find('.') == std::string::npos);
    }
    assert(j["target_resolution"] == "4K");

    Tuning::GameProfile round_trip = Tuning::GameProfile::from_json(j);
    assert(round_trip.name == starfield.name);
    assert(round_trip.executable_names == starfield.executable_names);
    assert(round_trip.settings_schema.at("fps").max == starfield.settings_schema.at("fps").max);

    std::cout << "  ✓ Profile JSON format tests passed" << std::endl;
}

void test_malformed_store_kept_on_disk() {
    std::cout << "Testing malformed profile store..." << std::endl;

    fs::path dir = make_temp_dir("malformed");

    const char* bad_documents[] = {
        "{ \"games\": [ { \"name\": ",
        "[1, 2, 3]",
        "{ \"games\": [ { \"supports_dlss\": true } ] }",
        "{ \"games\": [ { \"name\": \"X\", \"target_resolution\": \"8K\" } ] }",
        "{ \"games\": [ { \"name\": \"X\", \"target_fps\": 0 } ] }",
        "{ \"games\": [ { \"name\": \"X\", \"target_fps\": -30 } ] }",
    };

    int index = 0;
    for (const char* document : bad_documents) {
        fs::path path = dir / ("bad_" + std::to_string(index++) + ".json");
        write_file(path, document);

        // Loads as empty and leaves the damaged file alone
        Tuning::ProfileStore store(path.string());
        assert(store.load_profiles().empty());
        assert(store.profiles().empty());
        assert(!store.find("X").has_value());
        assert(read_file(path) == document);
    }

    // An explicit save replaces the damaged content
    fs::path path = dir / "bad_0.json";
    Tuning::ProfileStore store(path.string());
    store.load_profiles();
    Tuning::GameProfile custom;
    custom.name = "Recovered";
    assert(store.upsert(custom));

    Tuning::ProfileStore reread(path.string());
    assert(reread.load_profiles().size() == 1);
    assert(reread.find("recovered").has_value());

    std::cout << "  ✓ Malformed profile store tests passed" << std::endl;
}

void test_target_fps_must_be_positive() {
    std::cout << "Testing target fps parsing..." << std::endl;

    Tuning::json j = {{"name", "Quake"}, {"target_fps", 165}};
    assert(Tuning::GameProfile::from_json(j).target_fps == 165);

    for (int fps : {0, -1, -144}) {
        j["target_fps"] = fps;
        bool threw = false;
        try {
            Tuning::GameProfile::from_json(j);
        } catch (const std::runtime_error&) {
            threw = true;
        }
        assert(threw);
    }

    // Missing target keeps the default
    Tuning::json bare = {{"name", "Quake"}};
    assert(Tuning::GameProfile::from_json(bare).target_fps == 60);

    std::cout << "  ✓ Target fps parsing tests passed" << std::endl;
}

void test_detect_installed() {
    std::cout << "Testing installed game detection..." << std::endl;

    fs::path dir = make_temp_dir("installed");
    fs::path home = dir / "home";
    fs::path games = dir / "games";
    fs::create_directories(home / "Documents" / "Call of Duty" / "players");
    fs::create_directories(games / "Epic" / "Fortnite" / "Binaries");
    fs::create_directories(games / "a" / "b" / "c" / "d");

    Tuning::ProfileStore store((dir / "profiles.json").string());
    store.load_profiles();
    assert(store.detect_installed(home.string(), {games.string()}).empty());

    // Relative config path under the base directory
    write_file(home / "Documents" / "Call of Duty" / "players" / "config.cfg", "");
    // Executable name matched regardless of case
    write_file(games / "Epic" / "Fortnite" / "Binaries" / "fortniteclient-win64-shipping.EXE", "");
    // Too deep to be found
    write_file(games / "a" / "b" / "c" / "d" / "r5apex.exe", "");

    Tuning::GameProfile absolute;
    absolute.name = "Absolute";
    absolute.config_file_path = (dir / "absolute.ini").string();
    write_file(absolute.config_file_path, "");
    assert(store.upsert(absolute));

    auto installed = store.detect_installed(home.string(), {games.string(), (dir / "missing").string()});
    assert(installed.size() == 3);
    assert(installed[0].name == "Call of Duty: Modern Warfare II");
    assert(installed[1].name == "Fortnite");
    assert(installed[2].name == "Absolute");

    // Without a base directory relative config paths are not resolved
    auto no_base = store.detect_installed("", {});
    assert(no_base.size() == 1);
    assert(no_base[0].name == "Absolute");

    std::cout << "  ✓ Installed game detection tests passed" << std::endl;
}

void test_upsert_persists() {
    std::cout << "Testing profile upsert..." << std::endl;

    fs::path dir = make_temp_dir("upsert");
    std::string path = (dir / "profiles.json").string();

    Tuning::ProfileStore store(path);
    store.load_profiles();

    auto fortnite = *store.find("Fortnite");
    fortnite.target_fps = 240;
    fortnite.last_applied = "2026-01-01T12:00:00";
    assert(store.upsert(fortnite));

    Tuning::GameProfile custom;
    custom.name = "Elden Ring";
    custom.config_file_path = "GraphicsConfig.xml";
    custom.capability_requirements.supports_raytracing = true;
    assert(store.upsert(custom));
    assert(store.profiles().size() == 6);

    Tuning::ProfileStore reread(path);
    reread.load_profiles();
    assert(reread.profiles().size() == 6);
    assert(reread.find("fortnite")->target_fps == 240);
    assert(reread.find("fortnite")->last_applied == "2026-01-01T12:00:00");
    assert(reread.find("Elden Ring")->capability_requirements.supports_raytracing);

    std::cout << "  ✓ Profile upsert tests passed" << std::endl;
}

void test_import_export() {
    std::cout << "Testing profile import and export..." << std::endl;

    fs::path dir = make_temp_dir("import");
    Tuning::ProfileStore store((dir / "profiles.json").string());
    store.load_profiles();

    std::string exported = (dir / "export.json").string();
    assert(store.export_profiles(exported));

    Tuning::ProfileStore copy((dir / "copy.json").string());
    write_file(dir / "copy.json", R"({"games": []})");
    copy.load_profiles();
    assert(copy.profiles().empty());

    auto imported = copy.import_profiles(exported);
    assert(imported.has_value());
    assert(*imported == 5);
    assert(copy.profiles().size() == 5);

    // Re-importing replaces by name instead of duplicating
    assert(copy.import_profiles(exported) == size_t{5});
    assert(copy.profiles().size() == 5);

    write_file(dir / "garbage.json", "not json at all");
    assert(!copy.import_profiles((dir / "garbage.json").string()).has_value());
    assert(!copy.import_profiles((dir / "nowhere.json").string()).has_value());
    assert(copy.profiles().size() == 5);

    std::cout << "  ✓ Profile import and export tests passed" << std::endl;
}

int main() {
    std::cout << "\n=== Running Profile Store Tests ===\n" << std::endl;

    Utils::Logger::instance().set_log_directory("logs");
    Utils::Logger::instance().set_console_output(false);

    test_default_profiles_created();
    test_profile_json_format();
    test_malformed_store_kept_on_disk();
    test_target_fps_must_be_positive();
    test_upsert_persists();
    test_import_export();
    test_detect_installed();

    std::cout << "\n=== All Tests Passed ===\n" << std::endl;

    return 0;
}
