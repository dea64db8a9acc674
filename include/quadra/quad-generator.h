#pragma once

#include <quadra/canvas-types.h>
#include <array>
#include <cstdint>

namespace quadra {

// Vertices emitted per element instance (two triangles, triangle list)
constexpr uint32_t QUAD_VERTEX_COUNT = 6;

struct QuadCorner {
    Vec2 unit;          // corner of the unit square
    uint32_t cornerId;  // 0..3
};

// Corners 0=(0,0) 1=(1,0) 2=(1,1) 3=(0,1), emitted as 0,1,2 / 2,3,0.
// Both triangles share the 0-2 diagonal.
const std::array<QuadCorner, QUAD_VERTEX_COUNT>& quadCorners();

// Per-vertex output of the vertex stage; everything the fragment stage reads
// after interpolation.
struct QuadVertex {
    Vec4 position;          // clip space
    Vec4 color;             // constant opaque white
    Vec2 texCoord;          // src + corner * uv
    uint32_t textureIndex;  // attrs[1], flat
    uint32_t instance;      // flat
    uint32_t cornerId;      // flat
    Vec2 localPosition;     // corner * size, pixel space
};

// Vertex stage for one (instance, vertex) pair. `camera` is the combined
// projection × view × model matrix of the batch.
QuadVertex generateVertex(const Element& element, const Mat4& camera,
                          uint32_t instanceIndex, uint32_t vertexIndex);

std::array<QuadVertex, QUAD_VERTEX_COUNT> generateQuad(const Element& element, const Mat4& camera,
                                                       uint32_t instanceIndex);

} // namespace quadra
