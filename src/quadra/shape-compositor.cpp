#include <quadra/shape-compositor.h>
#include <algorithm>
#include <cmath>

namespace quadra {

// Edge softness of a 100px-tall element; scales inversely with height
static constexpr float REFERENCE_HEIGHT = 100.0f;
static constexpr float REFERENCE_SMOOTHNESS = 0.001f;

float roundedBoxSdf(Vec2 p, Vec2 halfExtent, Vec4 radius) {
    Vec2 pair = p.x > 0.0f ? radius.xy() : radius.zw();
    float r = p.y > 0.0f ? pair.x : pair.y;
    Vec2 q = abs(p) - halfExtent + r;
    return std::min(std::max(q.x, q.y), 0.0f) + length(max(q, 0.0f)) - r;
}

Vec4 composeImage(Vec4 texColor) {
    return texColor;
}

Vec4 composeRoundedRect(Vec4 texColor, const Element& element, const Brush& brush,
                        Vec2 localPosition) {
    Vec4 fg = brush.fg * texColor;
    Vec4 bg = brush.bg * texColor;

    float res = element.size.y;
    float border = brush.border.x;
    float borderFix = border / res;
    Vec3 borderColor = border > 0.0f ? fg.rgb() : bg.rgb();

    // the ring hugs the declared radius, not radius + border
    Vec4 radius = brush.radius - border;
    float smoothness = (REFERENCE_HEIGHT / res) * REFERENCE_SMOOTHNESS;

    Vec2 offset = (localPosition - element.size / 2.0f) / res;
    Vec2 halfExtent = Vec2(element.size.x / 2.0f / res, 0.5f) - borderFix;

    float d = roundedBoxSdf(offset, halfExtent, Vec4(radius.x / res, radius.y / res,
                                                     radius.z / res, radius.w / res));

    Vec3 rgb = d > 0.0f ? Vec3(1.0f, 1.0f, 1.0f) : bg.rgb();
    float borderCoverage =
        1.0f - smoothstep(borderFix - smoothness, borderFix + smoothness, std::fabs(d));
    rgb = mix(rgb, borderColor, borderCoverage);

    float alpha = d > 0.0f ? borderCoverage : 1.0f;
    return Vec4(rgb, alpha);
}

Vec4 shadeFragment(const FragmentInput& input, const CanvasBindings& bindings) {
    const Element& element = bindings.elements[input.instance];
    Vec4 texColor = bindings.textures->sample(input.textureIndex, input.texCoord) * input.color;

    switch (elementKind(element)) {
        case ElementKind::RoundedRect:
            return composeRoundedRect(texColor, element, bindings.brushes[element.attrs.z],
                                      input.localPosition);
        case ElementKind::Image:
            break;
    }
    return composeImage(texColor);
}

} // namespace quadra
