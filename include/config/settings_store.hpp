#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace RigTune {
namespace Config {

using json = nlohmann::json;

/**
 * Persistent key-value settings backed by a JSON file.
 *
 * Constructed once by the application and handed by reference to the
 * components that need it. set() rewrites the file synchronously; there is no
 * batching and no atomic rename.
 */
class SettingsStore {
public:
    explicit SettingsStore(const std::string& filepath);

    json get(const std::string& key, const json& default_value = nullptr) const;
    bool contains(const std::string& key) const;

    // Returns false if the value was stored in memory but could not be persisted
    bool set(const std::string& key, const json& value);
    bool erase(const std::string& key);

    const std::string& path() const { return filepath_; }

private:
    void load();
    bool save() const;

    std::string filepath_;
    json values_;
};

} // namespace Config
} // namespace RigTune
