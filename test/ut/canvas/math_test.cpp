//=============================================================================
// Math Tests
//
// Shading-language builtins and the camera matrices.
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/math.h>
#include "../test-util.h"

using namespace boost::ut;
using namespace quadra;
using quadra::test::near;

suite math_builtin_tests = [] {
    "smoothstep clamps below and above the edges"_test = [] {
        expect(smoothstep(0.0f, 1.0f, -1.0f) == 0.0_f);
        expect(smoothstep(0.0f, 1.0f, 2.0f) == 1.0_f);
        expect(near(smoothstep(0.0f, 1.0f, 0.5f), 0.5f));
        expect(near(smoothstep(0.0f, 1.0f, 0.25f), 0.15625f));
    };

    "mix interpolates linearly"_test = [] {
        expect(near(mix(2.0f, 4.0f, 0.25f), 2.5f));
        Vec3 m = mix(Vec3(0, 0, 0), Vec3(1, 2, 4), 0.5f);
        expect(near(m.x, 0.5f) && near(m.y, 1.0f) && near(m.z, 2.0f));
    };

    "clamp keeps values in range"_test = [] {
        expect(clamp(-3.0f, 0.0f, 1.0f) == 0.0_f);
        expect(clamp(3.0f, 0.0f, 1.0f) == 1.0_f);
        expect(clamp(0.3f, 0.0f, 1.0f) == 0.3_f);
    };

    "abs and max are component-wise"_test = [] {
        Vec2 a = abs(Vec2(-1.5f, 2.0f));
        expect(a == Vec2(1.5f, 2.0f));
        Vec2 m = max(Vec2(-1.0f, 3.0f), 0.0f);
        expect(m == Vec2(0.0f, 3.0f));
    };
};

suite math_matrix_tests = [] {
    "orthographic maps the top-left corner to clip (-1, 1)"_test = [] {
        Mat4 proj = mat4Orthographic(0.0f, 100.0f, 50.0f, 0.0f, 0.0f, 2.0f);
        Vec4 clip = proj * Vec4(0.0f, 0.0f, -1.0f, 1.0f);
        expect(near(clip, Vec4(-1.0f, 1.0f, 0.0f, 1.0f))) << "top-left";

        clip = proj * Vec4(100.0f, 50.0f, -1.0f, 1.0f);
        expect(near(clip, Vec4(1.0f, -1.0f, 0.0f, 1.0f))) << "bottom-right";
    };

    "look-at from +z moves the z=0 plane to eye depth -1"_test = [] {
        Mat4 view = mat4LookAtRH({0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
        Vec4 v = view * Vec4(3.0f, 4.0f, 0.0f, 1.0f);
        expect(near(v, Vec4(3.0f, 4.0f, -1.0f, 1.0f)));
    };

    "scale after translate"_test = [] {
        Mat4 m = mat4Scale({2.0f, 3.0f, 1.0f}) * mat4Translation({-10.0f, -20.0f, 0.0f});
        Vec4 v = m * Vec4(15.0f, 30.0f, 0.0f, 1.0f);
        expect(near(v, Vec4(10.0f, 30.0f, 0.0f, 1.0f)));
    };

    "identity is neutral"_test = [] {
        Mat4 t = mat4Translation({1.0f, 2.0f, 3.0f});
        expect(Mat4::identity() * t == t);
        expect(t * Mat4::identity() == t);
    };
};
