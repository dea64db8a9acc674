#include <quadra/webgpu-context.h>
#include <quadra/wgpu-compat.h>
#include <ytrace/ytrace.hpp>
#include <glfw3webgpu.h>
#include <string>

namespace quadra {

static std::string viewToString(WGPUStringView message) {
    if (!message.data) return "unknown";
    if (message.length == WGPU_STRLEN) return std::string(message.data);
    return std::string(message.data, message.length);
}

Result<WebGPUContext::Ptr> WebGPUContext::create(GLFWwindow* window, uint32_t width,
                                                 uint32_t height, bool vsync) noexcept {
    auto ctx = Ptr(new WebGPUContext(window, width, height, vsync));
    if (auto res = ctx->init(); !res) {
        return Err<Ptr>("Failed to initialize WebGPUContext", res);
    }
    return Ok(std::move(ctx));
}

WebGPUContext::WebGPUContext(GLFWwindow* window, uint32_t width, uint32_t height,
                             bool vsync) noexcept
    : window_(window), width_(width), height_(height), vsync_(vsync) {}

WebGPUContext::~WebGPUContext() {
    if (currentTextureView_) wgpuTextureViewRelease(currentTextureView_);
    if (allocator_) {
        allocator_->ledger().reportLive("WebGPUContext shutdown");
    }
    allocator_.reset();
    if (queue_) wgpuQueueRelease(queue_);
    if (device_) wgpuDeviceRelease(device_);
    if (adapter_) wgpuAdapterRelease(adapter_);
    if (surface_) {
        wgpuSurfaceUnconfigure(surface_);
        wgpuSurfaceRelease(surface_);
    }
    if (instance_) wgpuInstanceRelease(instance_);
}

Result<void> WebGPUContext::init() noexcept {
    WGPUInstanceDescriptor instanceDesc = {};
    instance_ = wgpuCreateInstance(&instanceDesc);
    if (!instance_) {
        return Err<void>("Failed to create WebGPU instance");
    }

    surface_ = glfwCreateWindowWGPUSurface(instance_, window_);
    if (!surface_) {
        return Err<void>("Failed to create WebGPU surface");
    }

    WGPURequestAdapterOptions adapterOpts = {};
    adapterOpts.compatibleSurface = surface_;
    adapterOpts.powerPreference = WGPUPowerPreference_HighPerformance;

    WGPURequestAdapterCallbackInfo adapterCallbackInfo = {};
    adapterCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    adapterCallbackInfo.callback = [](WGPURequestAdapterStatus status, WGPUAdapter adapter,
                                      WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestAdapterStatus_Success) {
            *static_cast<WGPUAdapter*>(userdata1) = adapter;
        } else {
            yerror("Failed to get WebGPU adapter: {}", viewToString(message));
        }
    };
    adapterCallbackInfo.userdata1 = &adapter_;
    wgpuInstanceRequestAdapter(instance_, &adapterOpts, adapterCallbackInfo);

    if (!adapter_) {
        return Err<void>("Failed to get WebGPU adapter");
    }

    WGPUDeviceDescriptor deviceDesc = {};
    deviceDesc.label = WGPU_STR("quadra device");
    deviceDesc.requiredFeatureCount = 0;
    deviceDesc.requiredLimits = nullptr;
    deviceDesc.defaultQueue.label = WGPU_STR("quadra queue");
    deviceDesc.uncapturedErrorCallbackInfo.callback = [](WGPUDevice const*, WGPUErrorType type,
                                                         WGPUStringView message, void*, void*) {
        yerror("WebGPU error ({}): {}", static_cast<int>(type), viewToString(message));
    };

    WGPURequestDeviceCallbackInfo deviceCallbackInfo = {};
    deviceCallbackInfo.mode = WGPUCallbackMode_AllowSpontaneous;
    deviceCallbackInfo.callback = [](WGPURequestDeviceStatus status, WGPUDevice device,
                                     WGPUStringView message, void* userdata1, void*) {
        if (status == WGPURequestDeviceStatus_Success) {
            *static_cast<WGPUDevice*>(userdata1) = device;
        } else {
            yerror("Failed to get WebGPU device: {}", viewToString(message));
        }
    };
    deviceCallbackInfo.userdata1 = &device_;
    wgpuAdapterRequestDevice(adapter_, &deviceDesc, deviceCallbackInfo);

    if (!device_) {
        return Err<void>("Failed to get WebGPU device");
    }

    queue_ = wgpuDeviceGetQueue(device_);
    allocator_ = std::make_unique<GpuAllocator>(device_);

    WGPUSurfaceCapabilities caps = {};
    wgpuSurfaceGetCapabilities(surface_, adapter_, &caps);
    if (caps.formatCount > 0) {
        surfaceFormat_ = caps.formats[0];
    }
    wgpuSurfaceCapabilitiesFreeMembers(caps);

    configureSurface(width_, height_);

    yinfo("WebGPU initialized: {}x{} format {} vsync {}", width_, height_,
          static_cast<int>(surfaceFormat_), vsync_);
    return Ok();
}

void WebGPUContext::configureSurface(uint32_t width, uint32_t height) noexcept {
    WGPUSurfaceConfiguration config = {};
    config.device = device_;
    config.format = surfaceFormat_;
    config.usage = WGPUTextureUsage_RenderAttachment;
    config.viewFormatCount = 0;
    config.viewFormats = nullptr;
    config.alphaMode = WGPUCompositeAlphaMode_Auto;
    config.presentMode = vsync_ ? WGPUPresentMode_Fifo : WGPUPresentMode_Immediate;
    config.width = width;
    config.height = height;
    wgpuSurfaceConfigure(surface_, &config);
}

void WebGPUContext::resize(uint32_t width, uint32_t height) noexcept {
    if (width == 0 || height == 0) return;
    if (width == width_ && height == height_) return;
    width_ = width;
    height_ = height;
    ydebug("WebGPUContext: resize to {}x{}", width, height);
    configureSurface(width, height);
}

Result<WGPUTextureView> WebGPUContext::getCurrentTextureView() noexcept {
    if (currentTextureView_) {
        return Ok(currentTextureView_);
    }

    WGPUSurfaceTexture surfaceTexture = {};
    wgpuSurfaceGetCurrentTexture(surface_, &surfaceTexture);

    if (surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessOptimal &&
        surfaceTexture.status != WGPUSurfaceGetCurrentTextureStatus_SuccessSuboptimal) {
        return Err<WGPUTextureView>("Failed to get surface texture (status " +
                                    std::to_string(static_cast<int>(surfaceTexture.status)) + ")");
    }

    WGPUTextureViewDescriptor viewDesc = {};
    viewDesc.format = surfaceFormat_;
    viewDesc.dimension = WGPUTextureViewDimension_2D;
    viewDesc.baseMipLevel = 0;
    viewDesc.mipLevelCount = 1;
    viewDesc.baseArrayLayer = 0;
    viewDesc.arrayLayerCount = 1;
    viewDesc.aspect = WGPUTextureAspect_All;

    currentTextureView_ = wgpuTextureCreateView(surfaceTexture.texture, &viewDesc);
    if (!currentTextureView_) {
        return Err<WGPUTextureView>("Failed to create texture view");
    }
    return Ok(currentTextureView_);
}

void WebGPUContext::present() noexcept {
    if (currentTextureView_) {
        wgpuTextureViewRelease(currentTextureView_);
        currentTextureView_ = nullptr;
    }
    wgpuSurfacePresent(surface_);
}

} // namespace quadra
