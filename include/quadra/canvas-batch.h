#pragma once

#include <quadra/canvas-types.h>
#include <quadra/element-storage.h>
#include <quadra/result.hpp>
#include <quadra/shape-compositor.h>
#include <quadra/texture-image.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace quadra {

struct CanvasBatchConfig {
    uint32_t maxElements = 4096;
    uint32_t maxBrushes = 4096;
    uint32_t maxTextures = 256;
};

// One frame's worth of canvas draws: the element arena, the parallel brush
// arena and the texture registry that assigns texture indices.
// Renderers consume it read-only.
class CanvasBatch {
public:
    using Config = CanvasBatchConfig;

    explicit CanvasBatch(Config config = {});

    // Register the texture, push the brush, then push the element with
    // attrs[1]/attrs[2] pointing at them. Returns the instance index.
    Result<uint32_t> render(Element element, const Brush& brush, const TextureImage::Ptr& texture);

    Result<uint32_t> submit(const DrawCommand& command, const TextureImage::Ptr& texture);

    // Index of the texture in the table, registering it on first use
    Result<uint32_t> storeTexture(const TextureImage::Ptr& texture);

    // Drop this frame's elements and brushes; registered textures stay.
    void clear();

    bool empty() const { return _elements.empty(); }
    uint32_t elementCount() const { return _elements.size(); }
    uint32_t brushCount() const { return _brushes.size(); }

    const ElementStorage<Element>& elements() const { return _elements; }
    const ElementStorage<Brush>& brushes() const { return _brushes; }
    const TextureList& textures() const { return _textures; }

    // Views handed to the shading core
    CanvasBindings bindings() const;

private:
    Config _config;
    ElementStorage<Element> _elements;
    ElementStorage<Brush> _brushes;
    TextureList _textures;
    std::unordered_map<TextureId, uint32_t> _textureSlots;
};

} // namespace quadra
