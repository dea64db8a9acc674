#include <quadra/canvas-batch.h>
#include <ytrace/ytrace.hpp>

namespace quadra {

CanvasBatch::CanvasBatch(Config config)
    : _config(config),
      _elements("canvas elements", config.maxElements),
      _brushes("canvas brushes", config.maxBrushes) {}

Result<uint32_t> CanvasBatch::storeTexture(const TextureImage::Ptr& texture) {
    if (!texture) {
        return Err<uint32_t>("CanvasBatch::storeTexture: null texture");
    }
    if (auto it = _textureSlots.find(texture->id()); it != _textureSlots.end()) {
        return Ok(it->second);
    }

    auto& images = _textures.images();
    if (images.size() >= _config.maxTextures) {
        yerror("CanvasBatch: unable to store texture, all {} slots are used up",
               _config.maxTextures);
        return Err<uint32_t>("CanvasBatch: texture table full (" +
                             std::to_string(_config.maxTextures) + " slots)");
    }

    uint32_t index = static_cast<uint32_t>(images.size());
    images.push_back(texture);
    _textureSlots.emplace(texture->id(), index);
    ydebug("CanvasBatch: texture {} ({}x{}) -> slot {}", texture->id(), texture->width(),
           texture->height(), index);
    return Ok(index);
}

Result<uint32_t> CanvasBatch::render(Element element, const Brush& brush,
                                     const TextureImage::Ptr& texture) {
    if (element.size.y <= 0.0f) {
        return Err<uint32_t>("CanvasBatch::render: element height must be positive, got " +
                             std::to_string(element.size.y));
    }
    if (_elements.size() >= _elements.capacity()) {
        yerror("CanvasBatch: element limit {} exceeded", _elements.capacity());
        return Err<uint32_t>("CanvasBatch::render: element limit " +
                             std::to_string(_elements.capacity()) + " exceeded");
    }

    auto textureRes = storeTexture(texture);
    if (!textureRes) {
        return Err<uint32_t>("CanvasBatch::render: texture", textureRes);
    }
    auto brushRes = _brushes.push(brush);
    if (!brushRes) {
        return Err<uint32_t>("CanvasBatch::render: brush", brushRes);
    }

    element.attrs.y = *textureRes;
    element.attrs.z = *brushRes;

    auto elementRes = _elements.push(element);
    if (!elementRes) {
        return Err<uint32_t>("CanvasBatch::render: element", elementRes);
    }
    return elementRes;
}

Result<uint32_t> CanvasBatch::submit(const DrawCommand& command, const TextureImage::Ptr& texture) {
    // Indices are filled in by render()
    return render(encodeElement(command, 0, 0), commandBrush(command), texture);
}

void CanvasBatch::clear() {
    _elements.clear();
    _brushes.clear();
}

CanvasBindings CanvasBatch::bindings() const {
    CanvasBindings b;
    b.elements = _elements.data();
    b.elementCount = _elements.size();
    b.brushes = _brushes.data();
    b.brushCount = _brushes.size();
    b.textures = &_textures;
    return b;
}

} // namespace quadra
