#pragma once

#include <rivvon/result.hpp>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace rivvon {

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults < config file < RIVVON_* environment < command line
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    // Defaults plus the given YAML text only (no file, no environment)
    static Result<Ptr> fromString(const std::string& yaml) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g., "tiles.fps" or "wave.undulation-period")
    // Returns nullopt if key doesn't exist
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    // Get a value with default fallback
    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "RIVVON_";

    static constexpr const char* KEY_TILES_SOURCE = "tiles.source";
    static constexpr const char* KEY_TILES_API_BASE = "tiles.api-base";
    static constexpr const char* KEY_TILES_CDN_BASE = "tiles.cdn-base";
    static constexpr const char* KEY_TILES_FPS = "tiles.fps";
    static constexpr const char* KEY_TILES_ROTATE90 = "tiles.rotate90";
    static constexpr const char* KEY_TILES_TIMEOUT_MS = "tiles.timeout-ms";
    static constexpr const char* KEY_RIBBON_WIDTH = "ribbon.width";
    static constexpr const char* KEY_RIBBON_SUBDIVISIONS = "ribbon.subdivisions";
    static constexpr const char* KEY_WAVE_AMPLITUDE = "wave.amplitude";
    static constexpr const char* KEY_WAVE_FREQUENCY = "wave.frequency";
    static constexpr const char* KEY_WAVE_UNDULATION_PERIOD = "wave.undulation-period";
    static constexpr const char* KEY_FLOW_SPEED = "flow.speed";
    static constexpr const char* KEY_FLOW_STATE = "flow.state";
    static constexpr const char* KEY_PATH_SMOOTH_SAMPLES = "path.smooth-samples";
    static constexpr const char* KEY_PATH_TARGET_SIZE = "path.target-size";
    static constexpr const char* KEY_PATH_MIN_DISTANCE = "path.min-distance";
    static constexpr const char* KEY_RENDER_WIDTH = "render.width";
    static constexpr const char* KEY_RENDER_HEIGHT = "render.height";
    static constexpr const char* KEY_RENDER_FPS = "render.fps";
    static constexpr const char* KEY_RENDER_CAMERA_DISTANCE = "render.camera-distance";
    static constexpr const char* KEY_RENDER_CAMERA_ELEVATION = "render.camera-elevation";
    static constexpr const char* KEY_EXPORT_FFMPEG = "export.ffmpeg";

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    Result<void> loadString(const std::string& text);

    // RIVVON_TILES_FPS overrides tiles.fps, for every key that has a default
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    // Get YAML node by dotted path
    YAML::Node getNode(const std::string& path) const;

    // "tiles.api-base" -> "RIVVON_TILES_API_BASE"
    static std::string pathToEnvVar(const std::string& path);

    // Merge YAML nodes (source into target)
    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
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

} // namespace rivvon
