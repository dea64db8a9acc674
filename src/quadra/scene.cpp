#include <quadra/scene.h>
#include <quadra/colors.h>
#include <ytrace/ytrace.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace quadra {

namespace {

const char* DEFAULT_SCENE = R"(
background: "#202028"
size: [560, 160]
textures:
  - name: board
    checker: {size: 64, cell: 8, a: "#e0e0e0", b: "#404040"}
brushes:
  plain: {bg: red}
  ring: {fg: "#00ff00", bg: red, radius: 20, border: 5}
elements:
  - kind: image
    position: [20, 30]
    size: [200, 100]
    texture: board
  - kind: rect
    position: [260, 30]
    size: [100, 100]
    brush: plain
  - kind: rect
    position: [420, 30]
    size: [100, 100]
    brush: ring
)";

Vec2 parseVec2(const YAML::Node& node, Vec2 fallback) {
    if (!node) return fallback;
    if (node.IsSequence() && node.size() == 2) {
        return {node[0].as<float>(), node[1].as<float>()};
    }
    if (node.IsScalar()) {
        return Vec2(node.as<float>());
    }
    throw YAML::RepresentationException(node.Mark(), "expected a scalar or [x, y]");
}

Vec4 parseColorNode(const YAML::Node& node, Vec4 fallback) {
    if (!node) return fallback;
    if (node.IsSequence() && (node.size() == 3 || node.size() == 4)) {
        float a = node.size() == 4 ? node[3].as<float>() : 1.0f;
        return {node[0].as<float>(), node[1].as<float>(), node[2].as<float>(), a};
    }
    return parseColor(node.as<std::string>());
}

Brush parseBrush(const YAML::Node& node) {
    Brush brush;
    brush.fg = parseColorNode(node["fg"], brush.fg);
    brush.bg = parseColorNode(node["bg"], brush.bg);
    if (auto r = node["radius"]) {
        if (r.IsSequence() && r.size() == 4) {
            brush.radius = {r[0].as<float>(), r[1].as<float>(), r[2].as<float>(),
                            r[3].as<float>()};
        } else {
            brush.radius = Vec4(r.as<float>());
        }
    }
    if (auto b = node["border"]) {
        brush.border.x = b.as<float>();
    }
    return brush;
}

Result<TextureImage::Ptr> parseTexture(const YAML::Node& node,
                                       const std::filesystem::path& baseDir) {
    if (auto solid = node["solid"]) {
        return TextureImage::solid(parseColorNode(solid, colors::WHITE));
    }
    if (auto checker = node["checker"]) {
        return TextureImage::checker(checker["size"].as<uint32_t>(64),
                                     checker["cell"].as<uint32_t>(8),
                                     parseColorNode(checker["a"], colors::WHITE),
                                     parseColorNode(checker["b"], colors::BLACK));
    }
    if (auto file = node["file"]) {
        std::filesystem::path path = file.as<std::string>();
        if (path.is_relative() && !baseDir.empty()) {
            path = baseDir / path;
        }
        return TextureImage::loadFile(path.string());
    }
    return Err<TextureImage::Ptr>("texture needs one of solid, checker or file");
}

} // namespace

Result<void> Scene::submit(CanvasBatch& batch) const {
    for (size_t i = 0; i < items.size(); i++) {
        if (auto res = batch.submit(items[i].command, items[i].texture); !res) {
            return Err<void>("Scene: element " + std::to_string(i), res);
        }
    }
    return Ok();
}

Result<Scene> parseScene(const std::string& yaml, const std::filesystem::path& baseDir) {
    Scene scene;
    try {
        YAML::Node root = YAML::Load(yaml);
        if (!root.IsMap()) {
            return Err<Scene>("scene root must be a mapping");
        }

        scene.background = parseColorNode(root["background"], scene.background);
        if (auto size = root["size"]) {
            Vec2 s = parseVec2(size, {0.0f, 0.0f});
            const float limit = static_cast<float>(Scene::MAX_SIZE);
            if (!(s.x >= 0.0f && s.x <= limit && s.y >= 0.0f && s.y <= limit)) {
                return Err<Scene>("size must be within [0, " + std::to_string(Scene::MAX_SIZE) +
                                  "], got [" + std::to_string(s.x) + ", " +
                                  std::to_string(s.y) + "]");
            }
            scene.width = static_cast<uint32_t>(s.x);
            scene.height = static_cast<uint32_t>(s.y);
        }

        if (auto textures = root["textures"]) {
            for (const auto& t : textures) {
                std::string name = t["name"].as<std::string>();
                auto texRes = parseTexture(t, baseDir);
                if (!texRes) {
                    return Err<Scene>("texture '" + name + "'", texRes);
                }
                scene.textures[name] = *texRes;
            }
        }

        if (auto brushes = root["brushes"]) {
            for (auto it = brushes.begin(); it != brushes.end(); ++it) {
                scene.brushes[it->first.as<std::string>()] = parseBrush(it->second);
            }
        }

        TextureImage::Ptr white;

        if (auto elements = root["elements"]) {
            for (size_t i = 0; i < elements.size(); i++) {
                const YAML::Node e = elements[i];
                const std::string where = "element " + std::to_string(i);

                Vec2 position = parseVec2(e["position"], {0.0f, 0.0f});
                Vec2 size = parseVec2(e["size"], {0.0f, 0.0f});
                Vec2 src = parseVec2(e["src"], {0.0f, 0.0f});
                Vec2 uv = parseVec2(e["uv"], {1.0f, 1.0f});
                if (size.y <= 0.0f) {
                    return Err<Scene>(where + ": height must be positive");
                }

                SceneItem item;
                if (auto texName = e["texture"]) {
                    auto it = scene.textures.find(texName.as<std::string>());
                    if (it == scene.textures.end()) {
                        return Err<Scene>(where + ": unknown texture '" +
                                          texName.as<std::string>() + "'");
                    }
                    item.texture = it->second;
                }

                std::string kind = e["kind"].as<std::string>(std::string("rect"));
                if (kind == "image") {
                    if (!item.texture) {
                        return Err<Scene>(where + ": image needs a texture");
                    }
                    item.command = ImageCommand{position, size, src, uv};
                } else if (kind == "rect") {
                    Brush brush;
                    if (auto b = e["brush"]) {
                        if (b.IsMap()) {
                            brush = parseBrush(b);
                        } else {
                            auto it = scene.brushes.find(b.as<std::string>());
                            if (it == scene.brushes.end()) {
                                return Err<Scene>(where + ": unknown brush '" +
                                                  b.as<std::string>() + "'");
                            }
                            brush = it->second;
                        }
                    }
                    if (!item.texture) {
                        if (!white) {
                            auto whiteRes = TextureImage::solid(colors::WHITE);
                            if (!whiteRes) {
                                return Err<Scene>(where, whiteRes);
                            }
                            white = *whiteRes;
                        }
                        item.texture = white;
                    }
                    item.command = RoundedRectCommand{position, size, brush, src, uv};
                } else {
                    return Err<Scene>(where + ": unknown kind '" + kind + "'");
                }
                scene.items.push_back(std::move(item));
            }
        }
    } catch (const YAML::Exception& e) {
        return Err<Scene>(std::string("scene YAML error: ") + e.what());
    }

    ydebug("Scene: {} textures, {} brushes, {} elements", scene.textures.size(),
           scene.brushes.size(), scene.items.size());
    return Ok(std::move(scene));
}

Result<Scene> loadScene(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return Err<Scene>("Cannot open scene file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto res = parseScene(buffer.str(), std::filesystem::path(path).parent_path());
    if (!res) {
        return Err<Scene>("Scene " + path, res);
    }
    yinfo("Loaded scene {} ({} elements)", path, res->items.size());
    return res;
}

Result<Scene> defaultScene() {
    return parseScene(DEFAULT_SCENE);
}

} // namespace quadra
