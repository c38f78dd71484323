#include <rivvon/config.h>
#include <ytrace/ytrace.hpp>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <vector>

namespace rivvon {

static const char* DEFAULT_CONFIG = R"(
tiles:
  source: ""
  api-base: https://api.rivvon.ca
  cdn-base: https://cdn.rivvon.ca
  fps: 30
  rotate90: true
  timeout-ms: 30000
ribbon:
  width: 1.2
  subdivisions: 8
wave:
  amplitude: 0.075
  frequency: 0.5
  undulation-period: 3.0
flow:
  speed: 0.25
  state: "off"
path:
  smooth-samples: 150
  target-size: 8.0
  min-distance: 0.001
render:
  width: 1280
  height: 720
  fps: 60
  camera-distance: 14.0
  camera-elevation: 35.0
export:
  ffmpeg: ffmpeg
)";

// Split "a.b.c" into components
static std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream ss(path);
    std::string part;
    while (std::getline(ss, part, '.')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// ─── Construction ────────────────────────────────────────────────────────────

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _configPath(configPath), _cmdOverrides(cmdOverrides) {
}

Result<Config::Ptr> Config::create(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(std::move(config));
}

Result<Config::Ptr> Config::fromString(const std::string& yaml) noexcept {
    auto config = Ptr(new Config("", YAML::Node()));
    config->loadDefaults();
    if (auto res = config->loadString(yaml); !res) {
        return Err<Ptr>("Failed to parse config", res);
    }
    return Ok(std::move(config));
}

Result<void> Config::init() noexcept {
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
            // an explicitly named file must load
            if (!_configPath.empty()) {
                return Err("Config: " + effectivePath, res);
            }
            ywarn("Failed to load config file {}: {}", effectivePath, error_msg(res));
        } else {
            yinfo("Loaded config from: {}", effectivePath);
        }
    }

    applyEnvOverrides(_config, "");

    if (_cmdOverrides && _cmdOverrides.IsMap()) {
        mergeNodes(_config, _cmdOverrides);
    }
    return Ok();
}

void Config::loadDefaults() {
    _config = YAML::Load(DEFAULT_CONFIG);
}

Result<void> Config::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<void>("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadString(buffer.str());
}

Result<void> Config::loadString(const std::string& text) {
    try {
        YAML::Node loaded = YAML::Load(text);
        if (loaded && loaded.IsMap()) {
            mergeNodes(_config, loaded);
        } else if (loaded && !loaded.IsNull()) {
            return Err<void>("config root must be a mapping");
        }
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

// ─── Overrides ───────────────────────────────────────────────────────────────

std::string Config::pathToEnvVar(const std::string& path) {
    std::string envVar = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-') envVar += '_';
        else envVar += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return envVar;
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::string> keys;
    for (auto it = node.begin(); it != node.end(); ++it) {
        keys.push_back(it->first.as<std::string>());
    }

    for (const auto& key : keys) {
        std::string fullPath = prefix.empty() ? key : prefix + "." + key;
        YAML::Node child = node[key];
        if (child.IsMap()) {
            applyEnvOverrides(child, fullPath);
            continue;
        }
        std::string envVar = pathToEnvVar(fullPath);
        if (const char* val = std::getenv(envVar.c_str())) {
            node[key] = std::string(val);
            ydebug("Config override from env: {}={}", envVar, val);
        }
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = value;
        }
    }
}

// ─── Lookup ──────────────────────────────────────────────────────────────────

YAML::Node Config::getNode(const std::string& path) const {
    YAML::Node current;
    current.reset(_config);
    for (const auto& part : splitPath(path)) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node& view = current;
        YAML::Node child = view[part];
        if (!child) {
            return YAML::Node();
        }
        current.reset(child);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
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
    return configDir / "rivvon" / "config.yaml";
}

} // namespace rivvon
