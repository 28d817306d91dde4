#pragma once

#include <cavern/result.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace cavern {

//=============================================================================
// Config
//
// Layered YAML configuration. Later layers win:
//   1. built-in defaults
//   2. config file (explicit path, else $XDG_CONFIG_HOME/cavern/config.yaml)
//   3. environment (CAVERN_WORLD_WIDTH overrides world/width)
//   4. command line overrides
//
// Keys are slash-separated paths, e.g. "generator/drunk-ratio".
//=============================================================================
class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    ~Config() = default;

    // Non-copyable
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Returns nullopt if the key doesn't exist or doesn't convert to T
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Get a value with default fallback
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    // Like get(), but a missing key or a bad value is an error
    template<typename T>
    Result<T> value(const std::string& path) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    // Path of the file actually loaded, empty if none
    const std::string& loadedFrom() const { return _loadedFrom; }

    static std::filesystem::path getXDGConfigPath();
    static std::filesystem::path getDefaultLogPath();

    // Convert slash path to env var name ("world/width" -> "CAVERN_WORLD_WIDTH")
    static std::string pathToEnvVar(const std::string& path);

    static constexpr const char* ENV_PREFIX = "CAVERN_";

    static constexpr const char* KEY_WORLD_WIDTH = "world/width";
    static constexpr const char* KEY_WORLD_HEIGHT = "world/height";
    static constexpr const char* KEY_SIM_TICK_MS = "simulation/tick-ms";
    static constexpr const char* KEY_SIM_SEED = "simulation/seed";
    static constexpr const char* KEY_SIM_MODE = "simulation/mode";
    static constexpr const char* KEY_GEN_FILL_PROBABILITY = "generator/fill-probability";
    static constexpr const char* KEY_GEN_DRUNK_RATIO = "generator/drunk-ratio";
    static constexpr const char* KEY_GEN_INITIAL = "generator/initial";
    static constexpr const char* KEY_LOG_FILE = "log/file";
    static constexpr const char* KEY_LOG_LEVEL = "log/level";
    static constexpr const char* KEY_KEYS = "keys";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    std::string _loadedFrom;
    YAML::Node _cmdOverrides;
};

// Template implementations
template<typename T>
std::optional<T> Config::get(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return std::nullopt;
    }
    try {
        return node.as<T>();
    } catch (const YAML::Exception&) {
        return std::nullopt;
    }
}

template<typename T>
T Config::get(const std::string& path, const T& defaultValue) const {
    auto value = get<T>(path);
    return value.value_or(defaultValue);
}

template<typename T>
Result<T> Config::value(const std::string& path) const {
    YAML::Node node = getNode(path);
    if (!node || node.IsNull()) {
        return Err<T>("Config: missing key " + path);
    }
    try {
        return Ok(node.as<T>());
    } catch (const YAML::Exception& e) {
        return Err<T>("Config: bad value for " + path + ": " + e.what());
    }
}

} // namespace cavern
