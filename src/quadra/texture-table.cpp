#include <quadra/texture-table.h>
#include <quadra/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace quadra {

TextureTable::TextureTable(WGPUDevice device, WGPUQueue queue, GpuAllocator& allocator,
                           Config config)
    : _device(device), _queue(queue), _allocator(allocator), _config(config) {}

TextureTable::~TextureTable() {
    if (_sampler) wgpuSamplerRelease(_sampler);
    if (_view) wgpuTextureViewRelease(_view);
    if (_texture) _allocator.releaseTexture(_texture);
}

Result<void> TextureTable::init() {
    if (_config.maxLayers == 0 || _config.layerSize == 0) {
        return Err<void>("TextureTable: max-textures and layer size must be positive");
    }

    WGPUSamplerDescriptor samplerDesc = {};
    samplerDesc.label = WGPU_STR("canvas sampler");
    samplerDesc.minFilter = WGPUFilterMode_Nearest;
    samplerDesc.magFilter = WGPUFilterMode_Nearest;
    samplerDesc.mipmapFilter = WGPUMipmapFilterMode_Nearest;
    samplerDesc.addressModeU = WGPUAddressMode_MirrorRepeat;
    samplerDesc.addressModeV = WGPUAddressMode_MirrorRepeat;
    samplerDesc.addressModeW = WGPUAddressMode_MirrorRepeat;
    samplerDesc.lodMinClamp = 0.0f;
    samplerDesc.lodMaxClamp = 1.0f;
    samplerDesc.maxAnisotropy = 1;

    _sampler = wgpuDeviceCreateSampler(_device, &samplerDesc);
    if (!_sampler) {
        return Err<void>("Failed to create canvas sampler");
    }

    return createTexture(std::min(_config.initialLayers, _config.maxLayers));
}

Result<void> TextureTable::createTexture(uint32_t layers) {
    WGPUTextureDescriptor texDesc = {};
    texDesc.label = WGPU_STR("canvas textures");
    texDesc.size.width = _config.layerSize;
    texDesc.size.height = _config.layerSize;
    texDesc.size.depthOrArrayLayers = layers;
    texDesc.mipLevelCount = 1;
    texDesc.sampleCount = 1;
    texDesc.dimension = WGPUTextureDimension_2D;
    texDesc.format = WGPUTextureFormat_RGBA8Unorm;
    texDesc.usage = WGPUTextureUsage_TextureBinding | WGPUTextureUsage_CopyDst;

    WGPUTexture texture = _allocator.createTexture(texDesc);
    if (!texture) {
        return Err<void>("Failed to create canvas texture array (" + std::to_string(layers) +
                         " layers)");
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = WGPUTextureFormat_RGBA8Unorm;
    viewDesc.dimension = WGPUTextureViewDimension_2DArray;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = layers;
    viewDesc.aspect = WGPUTextureAspect_All;

    WGPUTextureView view = wgpuTextureCreateView(texture, &viewDesc);
    if (!view) {
        _allocator.releaseTexture(texture);
        return Err<void>("Failed to create canvas texture array view");
    }

    if (_view) wgpuTextureViewRelease(_view);
    if (_texture) _allocator.releaseTexture(_texture);
    _texture = texture;
    _view = view;
    _capacity = layers;
    _generation++;

    // A fresh texture starts empty; replay everything already stored
    for (uint32_t layer = 0; layer < _images.size(); layer++) {
        upload(*_images[layer], layer);
    }
    return Ok();
}

Result<void> TextureTable::grow() {
    uint32_t newCapacity = std::min(std::max(_capacity * 2, 1u), _config.maxLayers);
    if (newCapacity <= _capacity) {
        yerror("TextureTable: cannot grow beyond {} layers", _config.maxLayers);
        return Err<void>("TextureTable: all " + std::to_string(_config.maxLayers) +
                         " layers are used up");
    }
    yinfo("TextureTable: growing from {} to {} layers", _capacity, newCapacity);
    return createTexture(newCapacity);
}

Result<uint32_t> TextureTable::store(const TextureImage::Ptr& image) {
    if (!image) {
        return Err<uint32_t>("TextureTable::store: null image");
    }
    if (auto it = _layers.find(image->id()); it != _layers.end()) {
        return Ok(it->second);
    }
    if (image->width() > _config.layerSize || image->height() > _config.layerSize) {
        return Err<uint32_t>("TextureTable::store: image " + std::to_string(image->width()) + "x" +
                             std::to_string(image->height()) + " exceeds layer size " +
                             std::to_string(_config.layerSize));
    }
    if (_images.size() >= _capacity) {
        if (auto res = grow(); !res) {
            return Err<uint32_t>("TextureTable::store", res);
        }
    }

    uint32_t layer = static_cast<uint32_t>(_images.size());
    _images.push_back(image);
    _extents.push_back({static_cast<float>(image->width()) / _config.layerSize,
                        static_cast<float>(image->height()) / _config.layerSize});
    _layers.emplace(image->id(), layer);
    upload(*image, layer);
    return Ok(layer);
}

void TextureTable::upload(const TextureImage& image, uint32_t layer) {
    WGPUTexelCopyTextureInfo destination = {};
    destination.texture = _texture;
    destination.mipLevel = 0;
    destination.origin = {0, 0, layer};
    destination.aspect = WGPUTextureAspect_All;

    WGPUTexelCopyBufferLayout dataLayout = {};
    dataLayout.offset = 0;
    dataLayout.bytesPerRow = image.width() * 4;  // RGBA8
    dataLayout.rowsPerImage = image.height();

    WGPUExtent3D writeSize = {image.width(), image.height(), 1};
    wgpuQueueWriteTexture(_queue, &destination, image.pixels(), image.byteSize(), &dataLayout,
                          &writeSize);

    ydebug("TextureTable: uploaded {}x{} image {} to layer {}", image.width(), image.height(),
           image.id(), layer);
}

} // namespace quadra
