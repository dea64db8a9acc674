#pragma once

#include <quadra/gpu-allocator.h>
#include <quadra/result.hpp>
#include <webgpu/webgpu.h>
#include <GLFW/glfw3.h>
#include <cstdint>
#include <memory>

namespace quadra {

class WebGPUContext {
public:
    using Ptr = std::shared_ptr<WebGPUContext>;

    static Result<Ptr> create(GLFWwindow* window, uint32_t width, uint32_t height,
                              bool vsync = true) noexcept;

    ~WebGPUContext();

    WebGPUContext(const WebGPUContext&) = delete;
    WebGPUContext& operator=(const WebGPUContext&) = delete;

    void resize(uint32_t width, uint32_t height) noexcept;

    WGPUDevice getDevice() const noexcept { return device_; }
    WGPUQueue getQueue() const noexcept { return queue_; }
    WGPUSurface getSurface() const noexcept { return surface_; }
    WGPUTextureFormat getSurfaceFormat() const noexcept { return surfaceFormat_; }
    uint32_t width() const noexcept { return width_; }
    uint32_t height() const noexcept { return height_; }

    GpuAllocator& allocator() noexcept { return *allocator_; }

    // Acquired once per frame; released by present()
    Result<WGPUTextureView> getCurrentTextureView() noexcept;
    void present() noexcept;

private:
    WebGPUContext(GLFWwindow* window, uint32_t width, uint32_t height, bool vsync) noexcept;

    Result<void> init() noexcept;
    void configureSurface(uint32_t width, uint32_t height) noexcept;

    GLFWwindow* window_ = nullptr;

    WGPUInstance instance_ = nullptr;
    WGPUAdapter adapter_ = nullptr;
    WGPUDevice device_ = nullptr;
    WGPUQueue queue_ = nullptr;
    WGPUSurface surface_ = nullptr;
    WGPUTextureFormat surfaceFormat_ = WGPUTextureFormat_BGRA8Unorm;

    std::unique_ptr<GpuAllocator> allocator_;

    uint32_t width_ = 0;
    uint32_t height_ = 0;
    bool vsync_ = true;

    WGPUTextureView currentTextureView_ = nullptr;
};

} // namespace quadra
