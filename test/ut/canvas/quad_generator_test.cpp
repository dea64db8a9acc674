//=============================================================================
// Quad Generator Tests
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/quad-generator.h>
#include "../test-util.h"

using namespace boost::ut;
using namespace quadra;
using quadra::test::near;

namespace {

Element sampleElement() {
    Element e{};
    e.position = {10.0f, 20.0f};
    e.size = {200.0f, 100.0f};
    e.src = {0.25f, 0.5f};
    e.uv = {0.5f, 0.25f};
    e.attrs = {1, 4, 2, 0};
    return e;
}

} // namespace

suite quad_corner_tests = [] {
    "six vertices, two triangles sharing the 0-2 diagonal"_test = [] {
        const auto& corners = quadCorners();
        const uint32_t expected[QUAD_VERTEX_COUNT] = {0, 1, 2, 2, 3, 0};
        for (uint32_t i = 0; i < QUAD_VERTEX_COUNT; i++) {
            expect(corners[i].cornerId == expected[i]) << "vertex" << i;
        }
        expect(corners[0].unit == Vec2(0.0f, 0.0f));
        expect(corners[1].unit == Vec2(1.0f, 0.0f));
        expect(corners[2].unit == Vec2(1.0f, 1.0f));
        expect(corners[4].unit == Vec2(0.0f, 1.0f));
    };
};

suite quad_vertex_tests = [] {
    "identity camera passes world positions through"_test = [] {
        Element e = sampleElement();
        auto quad = generateQuad(e, Mat4::identity(), 7);

        expect(near(quad[0].position, Vec4(10.0f, 20.0f, 0.0f, 1.0f)));
        expect(near(quad[1].position, Vec4(210.0f, 20.0f, 0.0f, 1.0f)));
        expect(near(quad[2].position, Vec4(210.0f, 120.0f, 0.0f, 1.0f)));
        expect(near(quad[4].position, Vec4(10.0f, 120.0f, 0.0f, 1.0f)));
    };

    "texture coordinates span src to src + uv"_test = [] {
        Element e = sampleElement();
        auto quad = generateQuad(e, Mat4::identity(), 0);
        expect(near(quad[0].texCoord, Vec2(0.25f, 0.5f)));
        expect(near(quad[1].texCoord, Vec2(0.75f, 0.5f)));
        expect(near(quad[2].texCoord, Vec2(0.75f, 0.75f)));
        expect(near(quad[4].texCoord, Vec2(0.25f, 0.75f)));
    };

    "local position is corner times size, independent of position"_test = [] {
        Element e = sampleElement();
        auto quad = generateQuad(e, Mat4::identity(), 0);
        expect(near(quad[0].localPosition, Vec2(0.0f, 0.0f)));
        expect(near(quad[2].localPosition, Vec2(200.0f, 100.0f)));
        expect(near(quad[4].localPosition, Vec2(0.0f, 100.0f)));
    };

    "flat fields"_test = [] {
        Element e = sampleElement();
        auto quad = generateQuad(e, Mat4::identity(), 7);
        for (const auto& v : quad) {
            expect(v.instance == 7_u);
            expect(v.textureIndex == 4_u);
            expect(v.color == Vec4(1.0f)) << "opaque white";
        }
        expect(quad[3].cornerId == 2_u);
        expect(quad[5].cornerId == 0_u);
    };

    "camera matrix is applied"_test = [] {
        Element e = sampleElement();
        Mat4 camera = mat4Translation({-10.0f, -20.0f, 0.0f});
        QuadVertex v = generateVertex(e, camera, 0, 0);
        expect(near(v.position, Vec4(0.0f, 0.0f, 0.0f, 1.0f)));
    };
};
