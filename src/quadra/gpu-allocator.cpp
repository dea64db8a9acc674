#include <quadra/gpu-allocator.h>
#include <ytrace/ytrace.hpp>

namespace quadra {

namespace {

double toMB(uint64_t bytes) {
    return bytes / (1024.0 * 1024.0);
}

std::string labelOf(WGPUStringView label) {
    if (!label.data) return "(unnamed)";
    if (label.length == WGPU_STRLEN) return std::string(label.data);
    return std::string(label.data, label.length);
}

// Formats the canvas actually creates; anything else is counted at 4 bytes
uint64_t texelBytes(WGPUTextureFormat format) {
    switch (format) {
        case WGPUTextureFormat_R8Unorm:
            return 1;
        case WGPUTextureFormat_RGBA16Float:
            return 8;
        case WGPUTextureFormat_RGBA32Float:
            return 16;
        default:
            return 4;
    }
}

} // namespace

GpuAllocator::GpuAllocator(WGPUDevice device)
    : _device(device) {}

WGPUBuffer GpuAllocator::createBuffer(const WGPUBufferDescriptor& desc) {
    std::string name = labelOf(desc.label);

    WGPUBuffer buffer = wgpuDeviceCreateBuffer(_device, &desc);
    if (!buffer) {
        yerror("GpuAllocator: failed to create buffer '{}' ({} bytes)", name, desc.size);
        return nullptr;
    }

    _ledger.add(buffer, name, desc.size, GpuResource::Buffer);
    yinfo("GPU [+] buffer '{}': {} bytes, total {:.2f} MB", name, desc.size,
          toMB(_ledger.totalBytes()));
    return buffer;
}

void GpuAllocator::releaseBuffer(WGPUBuffer buffer) {
    if (!buffer) return;
    forget(buffer, GpuResource::Buffer);
    wgpuBufferRelease(buffer);
}

WGPUTexture GpuAllocator::createTexture(const WGPUTextureDescriptor& desc) {
    std::string name = labelOf(desc.label);

    WGPUTexture texture = wgpuDeviceCreateTexture(_device, &desc);
    if (!texture) {
        yerror("GpuAllocator: failed to create texture '{}' {}x{}x{}", name, desc.size.width,
               desc.size.height, desc.size.depthOrArrayLayers);
        return nullptr;
    }

    uint64_t size = static_cast<uint64_t>(desc.size.width) * desc.size.height *
                    desc.size.depthOrArrayLayers * texelBytes(desc.format);
    _ledger.add(texture, name, size, GpuResource::Texture);
    yinfo("GPU [+] texture '{}': {}x{}x{} = {:.2f} MB, total {:.2f} MB", name, desc.size.width,
          desc.size.height, desc.size.depthOrArrayLayers, toMB(size), toMB(_ledger.totalBytes()));
    return texture;
}

void GpuAllocator::releaseTexture(WGPUTexture texture) {
    if (!texture) return;
    forget(texture, GpuResource::Texture);
    wgpuTextureRelease(texture);
}

void GpuAllocator::forget(const void* handle, GpuResource kind) {
    auto entry = _ledger.remove(handle);
    if (!entry) {
        ywarn("GpuAllocator: release called for untracked {}", toString(kind));
        return;
    }
    yinfo("GPU [-] {} '{}': {} bytes, total {:.2f} MB", toString(kind), entry->name, entry->size,
          toMB(_ledger.totalBytes()));
}

} // namespace quadra
