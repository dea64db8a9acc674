#pragma once

// Helpers over Dawn's webgpu.h (WGPUStringView based API)

#include <webgpu/webgpu.h>

#define WGPU_DEVICE_TICK(device) wgpuDeviceTick(device)

#define WGPU_STR(s) (WGPUStringView{.data = (s), .length = WGPU_STRLEN})

// Shader code: WGPUStringView over a std::string / std::string_view
#define WGPU_SHADER_CODE(desc, src)                                            \
  (desc).code = {.data = (src).data(), .length = (src).size()}

#define WGPU_COLOR_ATTACHMENT_CLEAR(attachment, r, g, b, a)                    \
  (attachment).clearValue = {(r), (g), (b), (a)}
