#include <quadra/quad-generator.h>

namespace quadra {

const std::array<QuadCorner, QUAD_VERTEX_COUNT>& quadCorners() {
    static const std::array<QuadCorner, QUAD_VERTEX_COUNT> corners = {{
        {{0.0f, 0.0f}, 0},
        {{1.0f, 0.0f}, 1},
        {{1.0f, 1.0f}, 2},
        {{1.0f, 1.0f}, 2},
        {{0.0f, 1.0f}, 3},
        {{0.0f, 0.0f}, 0},
    }};
    return corners;
}

QuadVertex generateVertex(const Element& element, const Mat4& camera,
                          uint32_t instanceIndex, uint32_t vertexIndex) {
    const QuadCorner& corner = quadCorners()[vertexIndex % QUAD_VERTEX_COUNT];

    Vec2 local = corner.unit * element.size;
    Vec2 world = local + element.position;

    QuadVertex out{};
    out.position = camera * Vec4(world.x, world.y, 0.0f, 1.0f);
    out.color = Vec4(1.0f);
    out.texCoord = element.src + corner.unit * element.uv;
    out.textureIndex = element.attrs.y;
    out.instance = instanceIndex;
    out.cornerId = corner.cornerId;
    out.localPosition = local;
    return out;
}

std::array<QuadVertex, QUAD_VERTEX_COUNT> generateQuad(const Element& element, const Mat4& camera,
                                                       uint32_t instanceIndex) {
    std::array<QuadVertex, QUAD_VERTEX_COUNT> quad{};
    for (uint32_t v = 0; v < QUAD_VERTEX_COUNT; v++) {
        quad[v] = generateVertex(element, camera, instanceIndex, v);
    }
    return quad;
}

} // namespace quadra
