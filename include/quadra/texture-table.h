#pragma once

#include <quadra/gpu-allocator.h>
#include <quadra/math.h>
#include <quadra/result.hpp>
#include <quadra/texture-image.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <unordered_map>
#include <vector>

namespace quadra {

// GPU side of the texture registry: one texture_2d_array whose layers hold
// one image each. An image smaller than a layer sits in its top-left corner
// and uvExtent() maps image-relative UVs onto the layer.
class TextureTable {
public:
    struct Config {
        uint32_t maxLayers = 256;
        uint32_t layerSize = 1024;
        uint32_t initialLayers = 4;
    };

    TextureTable(WGPUDevice device, WGPUQueue queue, GpuAllocator& allocator, Config config);
    ~TextureTable();

    TextureTable(const TextureTable&) = delete;
    TextureTable& operator=(const TextureTable&) = delete;

    Result<void> init();

    // Layer of the image, uploading it on first use
    Result<uint32_t> store(const TextureImage::Ptr& image);

    Vec2 uvExtent(uint32_t layer) const { return _extents[layer]; }

    WGPUTextureView view() const { return _view; }
    WGPUSampler sampler() const { return _sampler; }

    // Bumped whenever the view is recreated; bind groups must follow
    uint32_t generation() const { return _generation; }

    uint32_t layerCount() const { return static_cast<uint32_t>(_images.size()); }
    uint32_t layerCapacity() const { return _capacity; }

private:
    Result<void> createTexture(uint32_t layers);
    Result<void> grow();
    void upload(const TextureImage& image, uint32_t layer);

    WGPUDevice _device;
    WGPUQueue _queue;
    GpuAllocator& _allocator;
    Config _config;

    WGPUTexture _texture = nullptr;
    WGPUTextureView _view = nullptr;
    WGPUSampler _sampler = nullptr;
    uint32_t _capacity = 0;
    uint32_t _generation = 0;

    std::vector<TextureImage::Ptr> _images;
    std::vector<Vec2> _extents;
    std::unordered_map<TextureId, uint32_t> _layers;
};

} // namespace quadra
