#pragma once

#include <quadra/allocation-ledger.h>
#include <webgpu/webgpu.h>
#include <cstdint>
#include <string>

namespace quadra {

// Creates and releases the renderer's buffers and textures, logging each one
// with its label and size.
class GpuAllocator {
public:
    explicit GpuAllocator(WGPUDevice device);

    // Label taken from desc.label; nullptr on failure
    WGPUBuffer createBuffer(const WGPUBufferDescriptor& desc);
    void releaseBuffer(WGPUBuffer buffer);

    WGPUTexture createTexture(const WGPUTextureDescriptor& desc);
    void releaseTexture(WGPUTexture texture);

    const AllocationLedger& ledger() const { return _ledger; }

private:
    void forget(const void* handle, GpuResource kind);

    WGPUDevice _device;
    AllocationLedger _ledger;
};

} // namespace quadra
