//=============================================================================
// User Input Tests
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/camera.h>
#include <quadra/user-input.h>
#include "../test-util.h"

using namespace boost::ut;
using namespace quadra;
using quadra::test::near;

suite user_input_tests = [] {
    "key press sets down and pressed"_test = [] {
        UserInput input;
        input.onKey(Key::A, true);
        expect(input.keys.isDown(Key::A));
        expect(input.keys.pressed.contains(Key::A));

        input.endFrame();
        expect(input.keys.isDown(Key::A)) << "held across frames";
        expect(input.keys.pressed.empty());

        input.onKey(Key::A, false);
        expect(!input.keys.isDown(Key::A));
    };

    "held key is not pressed again"_test = [] {
        UserInput input;
        input.onKey(Key::S, true);
        input.endFrame();
        input.onKey(Key::S, true);
        expect(input.keys.pressed.empty());
    };

    "wasd direction is y down"_test = [] {
        UserInput input;
        input.onKey(Key::W, true);
        input.onKey(Key::D, true);
        expect(near(input.keys.wasd(), Vec2(1.0f, -1.0f)));
    };

    "click lasts one frame"_test = [] {
        UserInput input;
        input.onMouseButton(MouseButton::Left, true);
        expect(input.mouse.left.click);
        expect(input.mouse.left.down);
        expect(!input.mouse.right.down);

        input.endFrame();
        expect(!input.mouse.left.click);
        expect(input.mouse.left.down);

        input.onMouseButton(MouseButton::Left, false);
        expect(!input.mouse.left.down);
    };

    "wheel accumulates until the frame ends"_test = [] {
        UserInput input;
        input.onScroll(0.0, 1.0);
        input.onScroll(0.5, 1.0);
        expect(near(input.mouse.wheel, Vec2(0.5f, 2.0f)));
        input.endFrame();
        expect(near(input.mouse.wheel, Vec2(0.0f, 0.0f)));
    };

    "mouse position in world space"_test = [] {
        Camera camera;
        camera.update({800.0f, 600.0f});
        camera.setEye({100.0f, 50.0f, 0.0f});
        camera.setZoom(2.0f);

        UserInput input;
        input.onMouseMove(400.0, 300.0);
        expect(near(input.mouse.raw, Vec2(400.0f, 300.0f)));
        expect(near(input.mouse.position(camera), Vec2(300.0f, 200.0f)));
    };
};
