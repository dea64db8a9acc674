#include <quadra/config.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>
#include <vector>

namespace quadra {

namespace {

std::vector<std::string> splitPath(const std::string& path) {
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

} // namespace

Config::Config(const std::string& configPath, const YAML::Node& cmdOverrides) noexcept
    : _config(YAML::NodeType::Map), _configPath(configPath), _cmdOverrides(cmdOverrides) {}

Result<Config::Ptr> Config::create(const std::string& configPath,
                                   const YAML::Node& cmdOverrides) noexcept {
    auto config = Ptr(new Config(configPath, cmdOverrides));
    if (auto res = config->init(); !res) {
        return Err<Ptr>("Failed to initialize Config", res);
    }
    return Ok(config);
}

Result<Config::Ptr> Config::fromString(const std::string& yaml) noexcept {
    auto config = Ptr(new Config("", YAML::Node()));
    config->loadDefaults();
    if (auto res = config->loadString(yaml); !res) {
        return Err<Ptr>("Config::fromString", res);
    }
    return Ok(config);
}

Result<void> Config::init() noexcept {
    loadDefaults();

    std::string effectivePath = _configPath;
    if (effectivePath.empty()) {
        auto xdgPath = getXDGConfigPath();
        std::error_code ec;
        if (std::filesystem::exists(xdgPath, ec)) {
            effectivePath = xdgPath.string();
        }
    }

    if (!effectivePath.empty()) {
        if (auto res = loadFile(effectivePath); !res) {
            // An explicitly requested file must load; the XDG one is optional
            if (!_configPath.empty()) {
                return res;
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
    _config["canvas"]["max-elements"] = 4096;
    _config["canvas"]["max-brushes"] = 4096;
    _config["canvas"]["max-textures"] = 256;
    _config["canvas"]["texture-layer-size"] = 1024;

    _config["graphics"]["title"] = "quadra";
    _config["graphics"]["width"] = 1920;
    _config["graphics"]["height"] = 1080;
    _config["graphics"]["mode"] = "windowed";
    _config["graphics"]["vsync"] = true;
    _config["graphics"]["reference-height"] = 0;
    _config["graphics"]["camera-speed"] = 100.0;

    _config["logging"]["level"] = "info";
}

Result<void> Config::loadFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<void>("Cannot open config file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    if (auto res = loadString(buffer.str()); !res) {
        return Err<void>("Config file " + path, res);
    }
    return Ok();
}

Result<void> Config::loadString(const std::string& yaml) {
    try {
        YAML::Node loaded = YAML::Load(yaml);
        if (!loaded || loaded.IsNull()) {
            return Ok();
        }
        if (!loaded.IsMap()) {
            return Err<void>("config root must be a mapping");
        }
        mergeNodes(_config, loaded);
        return Ok();
    } catch (const YAML::Exception& e) {
        return Err<void>("YAML parse error: " + std::string(e.what()));
    }
}

void Config::mergeNodes(YAML::Node target, const YAML::Node& source) {
    for (auto it = source.begin(); it != source.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const YAML::Node& value = it->second;
        if (value.IsMap() && target[key] && target[key].IsMap()) {
            mergeNodes(target[key], value);
        } else {
            target[key] = YAML::Clone(value);
        }
    }
}

void Config::applyEnvOverrides(YAML::Node node, const std::string& prefix) {
    std::vector<std::pair<std::string, std::string>> overrides;
    std::vector<std::pair<std::string, YAML::Node>> children;

    for (auto it = node.begin(); it != node.end(); ++it) {
        const std::string key = it->first.as<std::string>();
        const std::string path = prefix.empty() ? key : prefix + "." + key;
        if (it->second.IsMap()) {
            children.emplace_back(path, it->second);
            continue;
        }
        const std::string envVar = pathToEnvVar(path);
        if (const char* value = std::getenv(envVar.c_str())) {
            ydebug("Config: {} overridden by {}={}", path, envVar, value);
            overrides.emplace_back(key, value);
        }
    }

    for (const auto& [key, value] : overrides) {
        node[key] = value;
    }
    for (auto& [path, child] : children) {
        applyEnvOverrides(child, path);
    }
}

YAML::Node Config::getNode(const std::string& path) const {
    auto parts = splitPath(path);
    if (parts.empty()) {
        return YAML::Node();
    }

    YAML::Node current;
    current.reset(_config);
    for (const auto& part : parts) {
        if (!current.IsMap()) {
            return YAML::Node();
        }
        const YAML::Node& parent = current;
        YAML::Node next = parent[part];
        if (!next) {
            return YAML::Node();
        }
        current.reset(next);
    }
    return current;
}

bool Config::has(const std::string& path) const {
    YAML::Node node = getNode(path);
    return node && !node.IsNull();
}

std::string Config::pathToEnvVar(const std::string& path) {
    std::string result = ENV_PREFIX;
    for (char c : path) {
        if (c == '.' || c == '-' || c == '/') {
            result += '_';
        } else {
            result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }
    return result;
}

std::filesystem::path Config::getXDGConfigPath() {
    if (const char* xdgConfig = std::getenv("XDG_CONFIG_HOME")) {
        return std::filesystem::path(xdgConfig) / "quadra" / "config.yaml";
    }
    if (const char* home = std::getenv("HOME")) {
        return std::filesystem::path(home) / ".config" / "quadra" / "config.yaml";
    }
    return {};
}

CanvasBatchConfig Config::canvasBatchConfig() const {
    CanvasBatchConfig c;
    c.maxElements = get<uint32_t>(KEY_CANVAS_MAX_ELEMENTS, c.maxElements);
    c.maxBrushes = get<uint32_t>(KEY_CANVAS_MAX_BRUSHES, c.maxBrushes);
    c.maxTextures = get<uint32_t>(KEY_CANVAS_MAX_TEXTURES, c.maxTextures);
    return c;
}

uint32_t Config::textureLayerSize() const {
    return get<uint32_t>(KEY_CANVAS_TEXTURE_LAYER_SIZE, 1024);
}

GraphicsConfig Config::graphicsConfig() const {
    GraphicsConfig g;
    g.title = get<std::string>(KEY_GRAPHICS_TITLE, g.title);
    g.width = get<uint32_t>(KEY_GRAPHICS_WIDTH, g.width);
    g.height = get<uint32_t>(KEY_GRAPHICS_HEIGHT, g.height);
    g.vsync = get<bool>(KEY_GRAPHICS_VSYNC, g.vsync);
    g.referenceHeight = get<uint32_t>(KEY_GRAPHICS_REFERENCE_HEIGHT, g.referenceHeight);
    g.cameraSpeed = get<float>(KEY_GRAPHICS_CAMERA_SPEED, g.cameraSpeed);

    std::string mode = get<std::string>(KEY_GRAPHICS_MODE, "windowed");
    if (mode == "fullscreen") {
        g.mode = WindowMode::Fullscreen;
    } else if (mode == "borderless") {
        g.mode = WindowMode::Borderless;
    } else {
        if (mode != "windowed") {
            ywarn("Config: unknown graphics.mode '{}', using windowed", mode);
        }
        g.mode = WindowMode::Windowed;
    }
    return g;
}

std::string Config::logLevel() const {
    return get<std::string>(KEY_LOGGING_LEVEL, "info");
}

} // namespace quadra
