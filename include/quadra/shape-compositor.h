#pragma once

#include <quadra/canvas-types.h>
#include <cstddef>
#include <cstdint>

namespace quadra {

// Texture array seen by the fragment stage. Indexing may diverge per
// invocation; callers guarantee the index is in range.
class TextureSource {
public:
    virtual ~TextureSource() = default;
    virtual Vec4 sample(uint32_t textureIndex, Vec2 uv) const = 0;
};

// Read-only views into the arenas bound for one draw. The compositor only
// ever indexes into them.
struct CanvasBindings {
    const Element* elements = nullptr;
    size_t elementCount = 0;
    const Brush* brushes = nullptr;
    size_t brushCount = 0;
    const TextureSource* textures = nullptr;
};

// Interpolated vertex-stage outputs for one fragment
struct FragmentInput {
    Vec4 color;
    Vec2 texCoord;
    uint32_t textureIndex = 0;
    uint32_t instance = 0;
    uint32_t cornerId = 0;
    Vec2 localPosition;
};

// Per-quadrant rounded box distance: negative inside, zero on the boundary,
// positive outside. radius = (x>0 pair, x<=0 pair), each pair (y>0, y<=0).
float roundedBoxSdf(Vec2 p, Vec2 halfExtent, Vec4 radius);

// Image mode: the texture sample is the final colour.
Vec4 composeImage(Vec4 texColor);

// Rounded-rectangle mode with border and edge anti-aliasing.
// Requires element.size.y > 0.
Vec4 composeRoundedRect(Vec4 texColor, const Element& element, const Brush& brush,
                        Vec2 localPosition);

// Full fragment stage: element lookup, texture sample, mode dispatch.
Vec4 shadeFragment(const FragmentInput& input, const CanvasBindings& bindings);

} // namespace quadra
