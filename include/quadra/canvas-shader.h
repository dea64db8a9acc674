#pragma once

#include <cstdint>
#include <string_view>

namespace quadra {

// Group 0 layout shared by the pipeline and the WGSL module
namespace binding {
constexpr uint32_t ELEMENTS = 0;   // storage, read: array<Element>
constexpr uint32_t TEXTURES = 1;   // texture_2d_array<f32>
constexpr uint32_t SAMPLER = 2;    // nearest, mirror-repeat
constexpr uint32_t TRANSFORM = 3;  // uniform Transform
constexpr uint32_t BRUSHES = 4;    // storage, read: array<Brush>
constexpr uint32_t COUNT = 5;
} // namespace binding

// WGSL module with `vs_main` (quad generator) and `fs_main` (shape compositor)
std::string_view canvasShaderSource();

} // namespace quadra
