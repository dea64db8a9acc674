#pragma once

#include <quadra/canvas-batch.h>
#include <quadra/canvas-types.h>
#include <quadra/quad-generator.h>
#include <quadra/result.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace quadra {

// Straight (unassociated) RGBA float render target
class Framebuffer {
public:
    Framebuffer(uint32_t width, uint32_t height, Vec4 clearColor = Vec4(0.0f));

    void clear(Vec4 color);

    uint32_t width() const { return _width; }
    uint32_t height() const { return _height; }

    Vec4& at(uint32_t x, uint32_t y) { return _pixels[static_cast<size_t>(y) * _width + x]; }
    const Vec4& at(uint32_t x, uint32_t y) const {
        return _pixels[static_cast<size_t>(y) * _width + x];
    }

    std::vector<uint8_t> toRGBA8() const;

    // PNG via stb_image_write
    Result<void> savePng(const std::string& path) const;

private:
    uint32_t _width;
    uint32_t _height;
    std::vector<Vec4> _pixels;
};

// CPU dispatch of the canvas pipeline: Quad Generator per (instance, vertex),
// triangle rasterization at pixel centres, Shape Compositor per covered pixel,
// then the same alpha blend the GPU pipeline is configured with.
class SoftwareRasterizer {
public:
    struct Stats {
        uint32_t instances = 0;
        uint32_t triangles = 0;
        uint64_t fragments = 0;
    };

    Result<void> draw(const CanvasBatch& batch, const Transform& transform, Framebuffer& target);

    const Stats& stats() const { return _stats; }

private:
    void rasterizeTriangle(const QuadVertex& a, const QuadVertex& b, const QuadVertex& c,
                           const CanvasBindings& bindings, Framebuffer& target);

    Stats _stats;
};

} // namespace quadra
