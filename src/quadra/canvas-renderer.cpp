#include <quadra/canvas-renderer.h>
#include <quadra/canvas-shader.h>
#include <quadra/webgpu-context.h>
#include <quadra/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <array>

namespace quadra {

//-----------------------------------------------------------------------------
// Creation and initialization
//-----------------------------------------------------------------------------

Result<std::unique_ptr<CanvasRenderer>> CanvasRenderer::create(WebGPUContext& ctx, Config config) {
    auto renderer = std::unique_ptr<CanvasRenderer>(new CanvasRenderer(ctx, config));
    if (auto res = renderer->init(); !res) {
        return Err<std::unique_ptr<CanvasRenderer>>("Failed to init CanvasRenderer", res);
    }
    return Ok(std::move(renderer));
}

CanvasRenderer::CanvasRenderer(WebGPUContext& ctx, Config config)
    : _ctx(ctx), _config(config) {}

CanvasRenderer::~CanvasRenderer() {
    if (_bindGroup) wgpuBindGroupRelease(_bindGroup);
    if (_pipeline) wgpuRenderPipelineRelease(_pipeline);
    if (_bindGroupLayout) wgpuBindGroupLayoutRelease(_bindGroupLayout);
    _ctx.allocator().releaseBuffer(_elementBuffer);
    _ctx.allocator().releaseBuffer(_brushBuffer);
    _ctx.allocator().releaseBuffer(_transformBuffer);
}

Result<void> CanvasRenderer::init() {
    if (_config.batch.maxElements == 0 || _config.batch.maxBrushes == 0) {
        return Err<void>("CanvasRenderer: element and brush capacity must be positive");
    }

    TextureTable::Config tableConfig;
    tableConfig.maxLayers = _config.batch.maxTextures;
    tableConfig.layerSize = _config.textureLayerSize;
    _textures = std::make_unique<TextureTable>(_ctx.getDevice(), _ctx.getQueue(),
                                               _ctx.allocator(), tableConfig);
    if (auto res = _textures->init(); !res) {
        return Err<void>("CanvasRenderer: texture table", res);
    }

    if (auto res = createBuffers(); !res) {
        return res;
    }
    if (auto res = createPipeline(); !res) {
        return res;
    }
    bind(Transform{});

    const AllocationLedger& ledger = _ctx.allocator().ledger();
    yinfo("CanvasRenderer initialized: {} elements, {} brushes, {} textures of {}px",
          _config.batch.maxElements, _config.batch.maxBrushes, _config.batch.maxTextures,
          _config.textureLayerSize);
    yinfo("CanvasRenderer: {} GPU resources, {} bytes in buffers, {} bytes in textures",
          ledger.liveCount(), ledger.bytes(GpuResource::Buffer),
          ledger.bytes(GpuResource::Texture));
    return Ok();
}

Result<void> CanvasRenderer::createBuffers() {
    GpuAllocator& allocator = _ctx.allocator();

    WGPUBufferDescriptor elementDesc = {};
    elementDesc.label = WGPU_STR("canvas elements");
    elementDesc.size = static_cast<uint64_t>(_config.batch.maxElements) * sizeof(Element);
    elementDesc.usage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst;
    _elementBuffer = allocator.createBuffer(elementDesc);

    WGPUBufferDescriptor brushDesc = {};
    brushDesc.label = WGPU_STR("canvas brushes");
    brushDesc.size = static_cast<uint64_t>(_config.batch.maxBrushes) * sizeof(Brush);
    brushDesc.usage = WGPUBufferUsage_Storage | WGPUBufferUsage_CopyDst;
    _brushBuffer = allocator.createBuffer(brushDesc);

    WGPUBufferDescriptor transformDesc = {};
    transformDesc.label = WGPU_STR("canvas transform");
    transformDesc.size = sizeof(Transform);
    transformDesc.usage = WGPUBufferUsage_Uniform | WGPUBufferUsage_CopyDst;
    _transformBuffer = allocator.createBuffer(transformDesc);

    if (!_elementBuffer || !_brushBuffer || !_transformBuffer) {
        return Err<void>("Failed to create canvas buffers");
    }
    return Ok();
}

Result<void> CanvasRenderer::createPipeline() {
    WGPUDevice device = _ctx.getDevice();
    const std::string_view source = canvasShaderSource();

    WGPUShaderSourceWGSL wgslDesc = {};
    wgslDesc.chain.sType = WGPUSType_ShaderSourceWGSL;
    WGPU_SHADER_CODE(wgslDesc, source);
    WGPUShaderModuleDescriptor shaderDesc = {};
    shaderDesc.label = WGPU_STR("canvas shader");
    shaderDesc.nextInChain = &wgslDesc.chain;
    WGPUShaderModule shaderModule = wgpuDeviceCreateShaderModule(device, &shaderDesc);
    if (!shaderModule) {
        return Err<void>("Failed to create canvas shader module");
    }

    std::array<WGPUBindGroupLayoutEntry, binding::COUNT> entries = {};

    entries[0].binding = binding::ELEMENTS;
    entries[0].visibility = WGPUShaderStage_Vertex | WGPUShaderStage_Fragment;
    entries[0].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;

    entries[1].binding = binding::TEXTURES;
    entries[1].visibility = WGPUShaderStage_Fragment;
    entries[1].texture.sampleType = WGPUTextureSampleType_Float;
    entries[1].texture.viewDimension = WGPUTextureViewDimension_2DArray;

    entries[2].binding = binding::SAMPLER;
    entries[2].visibility = WGPUShaderStage_Fragment;
    entries[2].sampler.type = WGPUSamplerBindingType_Filtering;

    entries[3].binding = binding::TRANSFORM;
    entries[3].visibility = WGPUShaderStage_Vertex;
    entries[3].buffer.type = WGPUBufferBindingType_Uniform;
    entries[3].buffer.minBindingSize = sizeof(Transform);

    entries[4].binding = binding::BRUSHES;
    entries[4].visibility = WGPUShaderStage_Fragment;
    entries[4].buffer.type = WGPUBufferBindingType_ReadOnlyStorage;

    WGPUBindGroupLayoutDescriptor layoutDesc = {};
    layoutDesc.label = WGPU_STR("canvas bind group layout");
    layoutDesc.entryCount = entries.size();
    layoutDesc.entries = entries.data();
    _bindGroupLayout = wgpuDeviceCreateBindGroupLayout(device, &layoutDesc);
    if (!_bindGroupLayout) {
        wgpuShaderModuleRelease(shaderModule);
        return Err<void>("Failed to create canvas bind group layout");
    }

    WGPUPipelineLayoutDescriptor pipelineLayoutDesc = {};
    pipelineLayoutDesc.bindGroupLayoutCount = 1;
    pipelineLayoutDesc.bindGroupLayouts = &_bindGroupLayout;
    WGPUPipelineLayout pipelineLayout = wgpuDeviceCreatePipelineLayout(device, &pipelineLayoutDesc);

    // Straight alpha over the target; alpha channel accumulates coverage
    WGPUBlendState blend = {};
    blend.color.srcFactor = WGPUBlendFactor_SrcAlpha;
    blend.color.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blend.color.operation = WGPUBlendOperation_Add;
    blend.alpha.srcFactor = WGPUBlendFactor_One;
    blend.alpha.dstFactor = WGPUBlendFactor_OneMinusSrcAlpha;
    blend.alpha.operation = WGPUBlendOperation_Add;

    WGPUColorTargetState colorTarget = {};
    colorTarget.format = _ctx.getSurfaceFormat();
    colorTarget.blend = &blend;
    colorTarget.writeMask = WGPUColorWriteMask_All;

    WGPUFragmentState fragment = {};
    fragment.module = shaderModule;
    fragment.entryPoint = WGPU_STR("fs_main");
    fragment.targetCount = 1;
    fragment.targets = &colorTarget;

    WGPURenderPipelineDescriptor pipelineDesc = {};
    pipelineDesc.label = WGPU_STR("canvas pipeline");
    pipelineDesc.layout = pipelineLayout;
    pipelineDesc.vertex.module = shaderModule;
    pipelineDesc.vertex.entryPoint = WGPU_STR("vs_main");
    pipelineDesc.vertex.bufferCount = 0;
    pipelineDesc.primitive.topology = WGPUPrimitiveTopology_TriangleList;
    pipelineDesc.primitive.cullMode = WGPUCullMode_None;
    pipelineDesc.fragment = &fragment;
    pipelineDesc.multisample.count = 1;
    pipelineDesc.multisample.mask = 0xFFFFFFFF;

    _pipeline = wgpuDeviceCreateRenderPipeline(device, &pipelineDesc);

    wgpuPipelineLayoutRelease(pipelineLayout);
    wgpuShaderModuleRelease(shaderModule);

    if (!_pipeline) {
        return Err<void>("Failed to create canvas pipeline");
    }
    return Ok();
}

Result<void> CanvasRenderer::updateBindGroup() {
    if (_bindGroup && _bindGroupGeneration == _textures->generation()) {
        return Ok();
    }

    std::array<WGPUBindGroupEntry, binding::COUNT> entries = {};

    entries[0].binding = binding::ELEMENTS;
    entries[0].buffer = _elementBuffer;
    entries[0].size = static_cast<uint64_t>(_config.batch.maxElements) * sizeof(Element);

    entries[1].binding = binding::TEXTURES;
    entries[1].textureView = _textures->view();

    entries[2].binding = binding::SAMPLER;
    entries[2].sampler = _textures->sampler();

    entries[3].binding = binding::TRANSFORM;
    entries[3].buffer = _transformBuffer;
    entries[3].size = sizeof(Transform);

    entries[4].binding = binding::BRUSHES;
    entries[4].buffer = _brushBuffer;
    entries[4].size = static_cast<uint64_t>(_config.batch.maxBrushes) * sizeof(Brush);

    WGPUBindGroupDescriptor bgDesc = {};
    bgDesc.label = WGPU_STR("canvas bind group");
    bgDesc.layout = _bindGroupLayout;
    bgDesc.entryCount = entries.size();
    bgDesc.entries = entries.data();

    WGPUBindGroup bindGroup = wgpuDeviceCreateBindGroup(_ctx.getDevice(), &bgDesc);
    if (!bindGroup) {
        return Err<void>("Failed to create canvas bind group");
    }
    if (_bindGroup) wgpuBindGroupRelease(_bindGroup);
    _bindGroup = bindGroup;
    _bindGroupGeneration = _textures->generation();
    ydebug("CanvasRenderer: bind group rebuilt (texture generation {})", _bindGroupGeneration);
    return Ok();
}

//-----------------------------------------------------------------------------
// Per-frame
//-----------------------------------------------------------------------------

void CanvasRenderer::bind(const Transform& transform) {
    wgpuQueueWriteBuffer(_ctx.getQueue(), _transformBuffer, 0, &transform, sizeof(Transform));
}

Result<void> CanvasRenderer::draw(WGPURenderPassEncoder pass, const CanvasBatch& batch) {
    if (!pass) {
        return Err<void>("CanvasRenderer::draw: null render pass");
    }
    if (batch.empty()) {
        return Ok();
    }
    if (batch.elementCount() > _config.batch.maxElements ||
        batch.brushCount() > _config.batch.maxBrushes) {
        return Err<void>("CanvasRenderer::draw: batch exceeds buffer capacity (" +
                         std::to_string(batch.elementCount()) + " elements, " +
                         std::to_string(batch.brushCount()) + " brushes)");
    }

    // Batch texture slots -> texture array layers
    const auto& images = batch.textures().images();
    _layerOfSlot.assign(images.size(), -1);

    _staging.resize(batch.elementCount());
    for (uint32_t i = 0; i < batch.elementCount(); i++) {
        Element element = batch.elements()[i];
        uint32_t slot = element.textureIndex();
        if (slot >= images.size()) {
            return Err<void>("CanvasRenderer::draw: element " + std::to_string(i) +
                             " references texture slot " + std::to_string(slot) +
                             " out of " + std::to_string(images.size()));
        }
        if (_layerOfSlot[slot] < 0) {
            auto layerRes = _textures->store(images[slot]);
            if (!layerRes) {
                return Err<void>("CanvasRenderer::draw", layerRes);
            }
            _layerOfSlot[slot] = *layerRes;
        }
        uint32_t layer = static_cast<uint32_t>(_layerOfSlot[slot]);
        Vec2 extent = _textures->uvExtent(layer);
        element.src = element.src * extent;
        element.uv = element.uv * extent;
        element.attrs.y = layer;
        _staging[i] = element;
    }

    if (auto res = updateBindGroup(); !res) {
        return res;
    }

    WGPUQueue queue = _ctx.getQueue();
    wgpuQueueWriteBuffer(queue, _elementBuffer, 0, _staging.data(),
                         _staging.size() * sizeof(Element));
    wgpuQueueWriteBuffer(queue, _brushBuffer, 0, batch.brushes().data(),
                         batch.brushes().byteSize());

    wgpuRenderPassEncoderSetPipeline(pass, _pipeline);
    wgpuRenderPassEncoderSetBindGroup(pass, 0, _bindGroup, 0, nullptr);
    wgpuRenderPassEncoderDraw(pass, 6, batch.elementCount(), 0, 0);
    return Ok();
}

} // namespace quadra
