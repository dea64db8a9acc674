#include <quadra/texture-image.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_IMPLEMENTATION
#include <stb_image.h>

#include <atomic>
#include <cmath>
#include <cstring>

namespace quadra {

static uint8_t toByte(float v) {
    return static_cast<uint8_t>(std::lround(clamp(v, 0.0f, 1.0f) * 255.0f));
}

// Mirrored-repeat texel index for a nearest sample
static uint32_t mirrorTexel(float coord, uint32_t extent) {
    int64_t n = static_cast<int64_t>(extent);
    int64_t i = static_cast<int64_t>(std::floor(coord * static_cast<float>(extent)));
    int64_t period = 2 * n;
    int64_t m = ((i % period) + period) % period;
    if (m >= n) m = period - 1 - m;
    return static_cast<uint32_t>(m);
}

TextureImage::TextureImage(uint32_t width, uint32_t height, std::vector<uint8_t> pixels)
    : _id(nextId()), _width(width), _height(height), _pixels(std::move(pixels)) {}

TextureId TextureImage::nextId() {
    static std::atomic<TextureId> counter{1};
    return counter++;
}

Result<TextureImage::Ptr> TextureImage::fromPixels(const uint8_t* rgba, uint32_t width,
                                                   uint32_t height) {
    if (!rgba) {
        return Err<Ptr>("TextureImage::fromPixels: null pixel data");
    }
    if (width == 0 || height == 0) {
        return Err<Ptr>("TextureImage::fromPixels: empty image " + std::to_string(width) + "x" +
                        std::to_string(height));
    }
    std::vector<uint8_t> pixels(rgba, rgba + static_cast<size_t>(width) * height * 4);
    return Ok(Ptr(new TextureImage(width, height, std::move(pixels))));
}

Result<TextureImage::Ptr> TextureImage::solid(Vec4 color, uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        return Err<Ptr>("TextureImage::solid: empty image");
    }
    const uint8_t px[4] = {toByte(color.x), toByte(color.y), toByte(color.z), toByte(color.w)};
    std::vector<uint8_t> pixels(static_cast<size_t>(width) * height * 4);
    for (size_t i = 0; i < pixels.size(); i += 4) {
        std::memcpy(&pixels[i], px, 4);
    }
    return Ok(Ptr(new TextureImage(width, height, std::move(pixels))));
}

Result<TextureImage::Ptr> TextureImage::checker(uint32_t size, uint32_t cell, Vec4 a, Vec4 b) {
    if (size == 0 || cell == 0) {
        return Err<Ptr>("TextureImage::checker: size and cell must be positive");
    }
    const uint8_t pa[4] = {toByte(a.x), toByte(a.y), toByte(a.z), toByte(a.w)};
    const uint8_t pb[4] = {toByte(b.x), toByte(b.y), toByte(b.z), toByte(b.w)};
    std::vector<uint8_t> pixels(static_cast<size_t>(size) * size * 4);
    for (uint32_t y = 0; y < size; y++) {
        for (uint32_t x = 0; x < size; x++) {
            bool even = ((x / cell) + (y / cell)) % 2 == 0;
            std::memcpy(&pixels[(static_cast<size_t>(y) * size + x) * 4], even ? pa : pb, 4);
        }
    }
    return Ok(Ptr(new TextureImage(size, size, std::move(pixels))));
}

Result<TextureImage::Ptr> TextureImage::loadFile(const std::string& path) {
    int width = 0, height = 0, channels = 0;
    uint8_t* data = stbi_load(path.c_str(), &width, &height, &channels, 4);  // Force RGBA
    if (!data) {
        return Err<Ptr>("TextureImage::loadFile: " + path + ": " + stbi_failure_reason());
    }

    yinfo("TextureImage: loaded {} {}x{} ({} channels -> 4)", path, width, height, channels);

    std::vector<uint8_t> pixels(data, data + static_cast<size_t>(width) * height * 4);
    stbi_image_free(data);
    return Ok(Ptr(new TextureImage(static_cast<uint32_t>(width), static_cast<uint32_t>(height),
                                   std::move(pixels))));
}

Vec4 TextureImage::texel(uint32_t x, uint32_t y) const {
    const uint8_t* p = &_pixels[(static_cast<size_t>(y) * _width + x) * 4];
    return {p[0] / 255.0f, p[1] / 255.0f, p[2] / 255.0f, p[3] / 255.0f};
}

Vec4 TextureImage::sample(Vec2 uv) const {
    return texel(mirrorTexel(uv.x, _width), mirrorTexel(uv.y, _height));
}

} // namespace quadra
