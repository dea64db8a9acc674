#pragma once

#include <quadra/canvas-batch.h>
#include <quadra/canvas-types.h>
#include <quadra/result.hpp>
#include <quadra/texture-image.h>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace quadra {

struct SceneItem {
    DrawCommand command;
    TextureImage::Ptr texture;
};

// A static canvas described in YAML:
//
//   background: "#202020"
//   size: [640, 240]
//   textures:
//     - {name: board, checker: {size: 64, cell: 8, a: white, b: black}}
//     - {name: photo, file: photo.png}
//     - {name: tint, solid: "#ff8000"}
//   brushes:
//     ring: {fg: "#00ff00", bg: red, radius: 20, border: 5}
//   elements:
//     - {kind: image, position: [10, 10], size: [200, 100], texture: board}
//     - {kind: rect, position: [240, 10], size: [100, 100], brush: ring}
//
// `radius` is a scalar or a 4-list; `brush` is a name or an inline map.
struct Scene {
    // Largest accepted output size per axis
    static constexpr uint32_t MAX_SIZE = 16384;

    Vec4 background{0.0f, 0.0f, 0.0f, 1.0f};
    uint32_t width = 0;   // 0 = take the window size
    uint32_t height = 0;
    std::map<std::string, TextureImage::Ptr> textures;
    std::map<std::string, Brush> brushes;
    std::vector<SceneItem> items;

    // Submit every item in order
    Result<void> submit(CanvasBatch& batch) const;
};

// `baseDir` resolves relative texture file paths
Result<Scene> parseScene(const std::string& yaml, const std::filesystem::path& baseDir = {});

Result<Scene> loadScene(const std::string& path);

// Image, plain rounded-rect and bordered rounded-rect side by side
Result<Scene> defaultScene();

} // namespace quadra
