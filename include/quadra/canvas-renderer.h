#pragma once

#include <quadra/canvas-batch.h>
#include <quadra/canvas-types.h>
#include <quadra/result.hpp>
#include <quadra/texture-table.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <memory>
#include <vector>

namespace quadra {

class WebGPUContext;

// Draws a CanvasBatch as instanced quads: six vertices per element, no
// vertex buffers, everything else read from the group-0 bindings.
class CanvasRenderer {
public:
    struct Config {
        CanvasBatchConfig batch;
        uint32_t textureLayerSize = 1024;
    };

    static Result<std::unique_ptr<CanvasRenderer>> create(WebGPUContext& ctx, Config config);

    ~CanvasRenderer();

    CanvasRenderer(const CanvasRenderer&) = delete;
    CanvasRenderer& operator=(const CanvasRenderer&) = delete;

    // Write the per-batch uniform
    void bind(const Transform& transform);

    // Upload textures, elements and brushes, then draw(6, count).
    // Buffers are rewritten on every call, so one draw per frame.
    Result<void> draw(WGPURenderPassEncoder pass, const CanvasBatch& batch);

    const TextureTable& textures() const { return *_textures; }

private:
    CanvasRenderer(WebGPUContext& ctx, Config config);

    Result<void> init();
    Result<void> createPipeline();
    Result<void> createBuffers();
    Result<void> updateBindGroup();

    WebGPUContext& _ctx;
    Config _config;

    std::unique_ptr<TextureTable> _textures;

    WGPUBindGroupLayout _bindGroupLayout = nullptr;
    WGPURenderPipeline _pipeline = nullptr;
    WGPUBindGroup _bindGroup = nullptr;
    uint32_t _bindGroupGeneration = 0;

    WGPUBuffer _elementBuffer = nullptr;
    WGPUBuffer _brushBuffer = nullptr;
    WGPUBuffer _transformBuffer = nullptr;

    // GPU-ready copy of the batch elements (texture layer and UV rescale applied)
    std::vector<Element> _staging;
    std::vector<int64_t> _layerOfSlot;
};

} // namespace quadra
