#pragma once

#include <quadra/canvas-batch.h>
#include <quadra/result.hpp>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace quadra {

enum class WindowMode {
    Windowed,
    Fullscreen,
    Borderless,
};

struct GraphicsConfig {
    std::string title = "quadra";
    uint32_t width = 1920;
    uint32_t height = 1080;
    WindowMode mode = WindowMode::Windowed;
    bool vsync = true;
    uint32_t referenceHeight = 0;
    float cameraSpeed = 100.0f; // world units per second
};

class Config {
public:
    using Ptr = std::shared_ptr<Config>;

    // Defaults, then the YAML file (explicit path or XDG), then QUADRA_*
    // environment variables, then the command-line overrides.
    static Result<Ptr> create(const std::string& configPath = "",
                              const YAML::Node& cmdOverrides = YAML::Node()) noexcept;

    // In-memory config from a YAML document layered over the defaults; no
    // file or environment lookups.
    static Result<Ptr> fromString(const std::string& yaml) noexcept;

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    // Get a value by dotted path (e.g. "canvas.max-elements").
    // Returns nullopt if the key is missing or does not convert to T.
    template<typename T>
    std::optional<T> get(const std::string& path) const;

    template<typename T>
    T get(const std::string& path, const T& defaultValue) const;

    bool has(const std::string& path) const;

    const YAML::Node& root() const { return _config; }

    static std::filesystem::path getXDGConfigPath();

    static constexpr const char* ENV_PREFIX = "QUADRA_";

    static constexpr const char* KEY_CANVAS_MAX_ELEMENTS = "canvas.max-elements";
    static constexpr const char* KEY_CANVAS_MAX_BRUSHES = "canvas.max-brushes";
    static constexpr const char* KEY_CANVAS_MAX_TEXTURES = "canvas.max-textures";
    static constexpr const char* KEY_CANVAS_TEXTURE_LAYER_SIZE = "canvas.texture-layer-size";
    static constexpr const char* KEY_GRAPHICS_TITLE = "graphics.title";
    static constexpr const char* KEY_GRAPHICS_WIDTH = "graphics.width";
    static constexpr const char* KEY_GRAPHICS_HEIGHT = "graphics.height";
    static constexpr const char* KEY_GRAPHICS_MODE = "graphics.mode";
    static constexpr const char* KEY_GRAPHICS_VSYNC = "graphics.vsync";
    static constexpr const char* KEY_GRAPHICS_REFERENCE_HEIGHT = "graphics.reference-height";
    static constexpr const char* KEY_GRAPHICS_CAMERA_SPEED = "graphics.camera-speed";
    static constexpr const char* KEY_LOGGING_LEVEL = "logging.level";

    CanvasBatchConfig canvasBatchConfig() const;
    uint32_t textureLayerSize() const;
    GraphicsConfig graphicsConfig() const;
    std::string logLevel() const;

    // Convert dotted path to env var name ("canvas.max-elements" -> "QUADRA_CANVAS_MAX_ELEMENTS")
    static std::string pathToEnvVar(const std::string& path);

private:
    Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept;
    Result<void> init() noexcept;

    void loadDefaults();
    Result<void> loadFile(const std::string& path);
    Result<void> loadString(const std::string& yaml);

    // Walks every leaf of the current tree and replaces it from the
    // environment when the matching variable is set
    void applyEnvOverrides(YAML::Node node, const std::string& prefix);

    YAML::Node getNode(const std::string& path) const;

    static void mergeNodes(YAML::Node target, const YAML::Node& source);

    YAML::Node _config;
    std::string _configPath;
    YAML::Node _cmdOverrides;
};

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

} // namespace quadra
