//=============================================================================
// Canvas Types Tests
//
// Buffer record layouts and draw command encoding.
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/canvas-types.h>
#include <cstddef>

using namespace boost::ut;
using namespace quadra;

suite canvas_layout_tests = [] {
    "records match the WGSL std430 sizes"_test = [] {
        expect(sizeof(Element) == 64_u);
        expect(sizeof(Brush) == 64_u);
        expect(sizeof(Transform) == 192_u);
    };

    "element field offsets"_test = [] {
        expect(offsetof(Element, position) == 0_u);
        expect(offsetof(Element, src) == 16_u);
        expect(offsetof(Element, uv) == 24_u);
        expect(offsetof(Element, size) == 32_u);
        expect(offsetof(Element, attrs) == 48_u);
    };

    "default brush is white with square corners and no border"_test = [] {
        Brush b;
        expect(b.fg == Vec4(1.0f)) << "fg";
        expect(b.bg == Vec4(1.0f)) << "bg";
        expect(b.radius == Vec4(0.0f)) << "radius";
        expect(b.border == Vec4(0.0f)) << "border";
    };
};

suite element_kind_tests = [] {
    "kind tag selects the compositing mode"_test = [] {
        Element e{};
        e.attrs.x = 0;
        expect(elementKind(e) == ElementKind::Image);
        e.attrs.x = 1;
        expect(elementKind(e) == ElementKind::RoundedRect);
    };

    "unknown tags fall back to image"_test = [] {
        Element e{};
        e.attrs.x = 7;
        expect(elementKind(e) == ElementKind::Image);
    };
};

suite command_encoding_tests = [] {
    "image command"_test = [] {
        ImageCommand cmd{{10.0f, 20.0f}, {200.0f, 100.0f}, {0.25f, 0.5f}, {0.5f, 0.5f}};
        Element e = encodeElement(cmd, 3, 9);
        expect(e.position == Vec2(10.0f, 20.0f));
        expect(e.size == Vec2(200.0f, 100.0f));
        expect(e.src == Vec2(0.25f, 0.5f));
        expect(e.uv == Vec2(0.5f, 0.5f));
        expect(e.kind() == 0_u);
        expect(e.textureIndex() == 3_u);
        expect(e.brushIndex() == 9_u);
        expect(e.attrs.w == 0_u);
    };

    "rounded rect command"_test = [] {
        Brush brush;
        brush.bg = {1.0f, 0.0f, 0.0f, 1.0f};
        brush.radius = Vec4(20.0f);
        RoundedRectCommand cmd{{5.0f, 6.0f}, {100.0f, 50.0f}, brush};
        Element e = encodeElement(cmd, 1, 2);
        expect(e.kind() == 1_u);
        expect(e.textureIndex() == 1_u);
        expect(e.brushIndex() == 2_u);
        expect(e.src == Vec2(0.0f, 0.0f)) << "full texture by default";
        expect(e.uv == Vec2(1.0f, 1.0f));
        expect(commandBrush(cmd).radius == Vec4(20.0f));
        expect(commandHeight(cmd) == 50.0_f);
    };

    "image commands carry the default brush"_test = [] {
        ImageCommand cmd{{0.0f, 0.0f}, {8.0f, 4.0f}};
        Brush b = commandBrush(cmd);
        expect(b.fg == Vec4(1.0f));
        expect(b.radius == Vec4(0.0f));
        expect(commandHeight(cmd) == 4.0_f);
    };
};
