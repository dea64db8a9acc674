#pragma once

#include <quadra/result.hpp>
#include <quadra/shape-compositor.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace quadra {

using TextureId = uint64_t;

// RGBA8 image shared between the canvas batch, the software rasterizer and
// the GPU texture table. The id is process-unique and used for deduplication.
class TextureImage {
public:
    using Ptr = std::shared_ptr<TextureImage>;

    static Result<Ptr> fromPixels(const uint8_t* rgba, uint32_t width, uint32_t height);
    static Result<Ptr> solid(Vec4 color, uint32_t width = 1, uint32_t height = 1);
    static Result<Ptr> checker(uint32_t size, uint32_t cell, Vec4 a, Vec4 b);

    // Decode a PNG/JPG/... file with stb_image (forced to RGBA)
    static Result<Ptr> loadFile(const std::string& path);

    TextureImage(const TextureImage&) = delete;
    TextureImage& operator=(const TextureImage&) = delete;

    TextureId id() const { return _id; }
    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }
    const uint8_t* pixels() const { return _pixels.data(); }
    size_t byteSize() const { return _pixels.size(); }

    // Nearest filtering, mirrored-repeat addressing, normalized RGBA
    Vec4 sample(Vec2 uv) const;

    Vec4 texel(uint32_t x, uint32_t y) const;

private:
    TextureImage(uint32_t width, uint32_t height, std::vector<uint8_t> pixels);

    static TextureId nextId();

    TextureId _id;
    uint32_t _width;
    uint32_t _height;
    std::vector<uint8_t> _pixels;
};

// TextureSource over an ordered list of images; index == position in list
class TextureList : public TextureSource {
public:
    TextureList() = default;
    explicit TextureList(std::vector<TextureImage::Ptr> images) : _images(std::move(images)) {}

    Vec4 sample(uint32_t textureIndex, Vec2 uv) const override {
        return _images[textureIndex]->sample(uv);
    }

    const std::vector<TextureImage::Ptr>& images() const { return _images; }
    std::vector<TextureImage::Ptr>& images() { return _images; }

private:
    std::vector<TextureImage::Ptr> _images;
};

} // namespace quadra
