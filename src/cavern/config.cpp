#include <cavern/config.h>

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace cavern {

// ─── Helpers ─────────────────────────────────────────────────────────────────

// Split a slash-separated path into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '/')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

static YAML::Node findNode(const YAML::Node& node, const std::vector<std::string>& parts, size_t i) {
    if (i == parts.size()) return node;
    if (!node.IsMap()) return YAML::Node();
    const YAML::Node child = node[parts[i]];
    if (!child) return YAML::Node();
    return findNode(child, parts, i + 1);
}

// ─── Config ──────────────────────────────────────────────────────────────────

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
    try {
        loadDefaults();

        std::string effectivePath = _configPath;
        if (effectivePath.empty()) {
            auto xdgPath = getXDGConfigPath();
            if (std::filesystem::exists(xdgPath)) {
                effectivePath = xdgPath.string();
            }
        }

        if (!effectivePath.empty()) {
            if (auto res = loadFile(effectivePath); !res) {
                // An explicitly requested file must load; the XDG one is optional
                if (!_configPath.empty()) {
                    return Err<void>("Failed to load config file " + effectivePath, res);
                }
                spdlog::warn("Failed to load config file {}: {}", effectivePath, error_msg(res));
            } else {
                _loadedFrom = effectivePath;
                spdlog::debug("Loaded config from: {}", effectivePath);
            }
        }

        applyEnvOverrides(_config, "");

        if (_cmdOverrides && _cmdOverrides.IsMap()) {
            mergeNodes(_config, _cmdOverrides);
        }
    } catch (const YAML::Exception& e) {
        return Err<void>(std::string("YAML error: ") + e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        return Err<void>(std::string("Filesystem error: ") + e.what());
    }
    return Ok();
}

void Config::loadDefaults() {
    _config["world"]["width"] = 160;
    _config["world"]["height"] = 90;

    _config["simulation"]["tick-ms"] = 50;
    _config["simulation"]["seed"] = 1;
    _config["simulation"]["mode"] = "paint";

    _config["generator"]["fill-probability"] = 0.45;
    _config["generator"]["drunk-ratio"] = 0.4;
    _config["generator"]["initial"] = "random";

    _config["log"]["file"] = getDefaultLogPath().string();
    _config["log"]["level"] = "info";

    // key name -> command name, applied on top of the built-in key map
    _config["keys"] = YAML::Node(YAML::NodeType::Map);
}

Result<void> Config::loadFile(const std::string& path) {
    try {
        std::ifstream file(path);
        if (!file.is_open()) {
            return Err<void>("Cannot open config file: " + path);
        }
        YAML::Node fileConfig = YAML::Load(file);
        if (!fileConfig || fileConfig.IsNull()) {
            return Ok();
        }
        if (!fileConfig.IsMap()) {
            return Err<void>("Config file is not a YAML mapping: " + path);
        }
        mergeNodes(_config, fileConfig);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::string> leaves;
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string key = it->first.as<std::string>();
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;

        // Key bindings are a free-form map, not overridable per key
        if (fullPath == KEY_KEYS) continue;

        if (it->second.IsMap()) {
            applyEnvOverrides(it->second, fullPath);
        } else {
            leaves.push_back(key);
        }
    }

    for (const auto& key : leaves) {
        std::string fullPath = prefix.empty() ? key : prefix + "/" + key;
        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            node[key] = std::string(val);
            spdlog::debug("Config override from env: {}={}", envVar, val);
        }
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        YAML::Node existing = target[key];
        if (value.IsMap() && existing.IsMap()) {
            mergeNodes(existing, value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) {
        return _config;
    }
    return findNode(_config, parts, 0);
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '/' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

std::filesystem::path Config::getXDGConfigPath() {
    std::filesystem::path configDir;

    const char* xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && xdgConfig[0] != '\0') {
        configDir = xdgConfig;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            configDir = std::filesystem::path(home) / ".config";
        } else {
            configDir = "/tmp";
        }
    }

    return configDir / "cavern" / "config.yaml";
}

std::filesystem::path Config::getDefaultLogPath() {
    std::filesystem::path stateDir;

    const char* xdgState = std::getenv("XDG_STATE_HOME");
    if (xdgState && xdgState[0] != '\0') {
        stateDir = xdgState;
    } else {
        const char* home = std::getenv("HOME");
        if (home) {
            stateDir = std::filesystem::path(home) / ".local" / "state";
        } else {
            stateDir = "/tmp";
        }
    }

    return stateDir / "cavern" / "cavern.log";
}

} // namespace cavern
