//=============================================================================
// Canvas Shader Source Tests
//
// The WGSL module must agree with the host-side binding layout.
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/canvas-shader.h>
#include <string>

using namespace boost::ut;
using namespace quadra;

namespace {

bool contains(std::string_view haystack, const std::string& needle) {
    return haystack.find(needle) != std::string_view::npos;
}

} // namespace

suite canvas_shader_tests = [] {
    "entry points"_test = [] {
        auto src = canvasShaderSource();
        expect(contains(src, "fn vs_main("));
        expect(contains(src, "fn fs_main("));
        expect(contains(src, "@vertex"));
        expect(contains(src, "@fragment"));
    };

    "every group 0 binding is declared once"_test = [] {
        auto src = canvasShaderSource();
        for (uint32_t b = 0; b < binding::COUNT; b++) {
            std::string decl = "@binding(" + std::to_string(b) + ")";
            auto first = src.find(decl);
            expect(first != std::string_view::npos) << decl;
            expect(src.find(decl, first + 1) == std::string_view::npos) << decl << "duplicated";
        }
    };

    "textures are a 2D array"_test = [] {
        expect(contains(canvasShaderSource(), "texture_2d_array<f32>"));
    };

    "record structs"_test = [] {
        auto src = canvasShaderSource();
        expect(contains(src, "struct Element"));
        expect(contains(src, "struct Brush"));
        expect(contains(src, "struct Transform"));
    };
};
