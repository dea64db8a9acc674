//=============================================================================
// Camera Tests
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/camera.h>
#include "../test-util.h"

using namespace boost::ut;
using namespace quadra;
using quadra::test::near;

namespace {

// Clip-space position of a world point through the camera transform
Vec4 project(const Camera& camera, Vec2 world) {
    return camera.transform().combined() * Vec4(world.x, world.y, 0.0f, 1.0f);
}

} // namespace

suite camera_tests = [] {
    "pixel space, origin top-left, y down"_test = [] {
        Camera camera;
        camera.update({800.0f, 600.0f});
        expect(near(project(camera, {0.0f, 0.0f}), Vec4(-1.0f, 1.0f, 0.0f, 1.0f)));
        expect(near(project(camera, {800.0f, 600.0f}), Vec4(1.0f, -1.0f, 0.0f, 1.0f)));
        expect(near(project(camera, {400.0f, 300.0f}), Vec4(0.0f, 0.0f, 0.0f, 1.0f)));
    };

    "defaults"_test = [] {
        Camera camera;
        expect(camera.zoom() == 1.0_f);
        expect(camera.resolutionScale() == 1.0_f);
        expect(camera.eye() == Vec3(0.0f, 0.0f, 0.0f));
    };

    "reference height scales with the screen"_test = [] {
        Camera camera;
        camera.setReference(300);
        camera.update({800.0f, 600.0f});
        expect(camera.resolutionScale() == 2.0_f);
        expect(near(camera.viewport(), Vec2(400.0f, 300.0f)));
        // world (100, 50) lands on pixel (200, 100)
        expect(near(project(camera, {100.0f, 50.0f}), Vec4(-0.5f, 1.0f - 200.0f / 600.0f, 0.0f, 1.0f)));

        camera.update({800.0f, 300.0f});
        expect(camera.resolutionScale() == 1.0_f) << "recomputed on resize";

        camera.setReference(0);
        camera.update({800.0f, 600.0f});
        expect(camera.resolutionScale() == 1.0_f) << "zero clears the reference";
    };

    "look at centres the point"_test = [] {
        Camera camera;
        camera.update({800.0f, 600.0f});
        camera.lookAt({1000.0f, 1000.0f});
        expect(near(camera.eye().x, 600.0f) && near(camera.eye().y, 700.0f));
        expect(near(project(camera, {1000.0f, 1000.0f}), Vec4(0.0f, 0.0f, 0.0f, 1.0f), 1e-3f));
    };

    "zoom scales around the eye"_test = [] {
        Camera camera;
        camera.update({800.0f, 600.0f});
        camera.setZoom(2.0f);
        expect(near(project(camera, {200.0f, 150.0f}), Vec4(0.0f, 0.0f, 0.0f, 1.0f)));
    };

    "screen transform ignores eye and zoom"_test = [] {
        Camera camera;
        camera.update({800.0f, 600.0f});
        camera.setEye({50.0f, 50.0f, 0.0f});
        camera.setZoom(3.0f);
        Vec4 clip = camera.screenTransform().combined() * Vec4(0.0f, 0.0f, 0.0f, 1.0f);
        expect(near(clip, Vec4(-1.0f, 1.0f, 0.0f, 1.0f)));
    };

    "look at moves the control target too"_test = [] {
        Camera camera;
        camera.update({800.0f, 600.0f});
        camera.lookAt({1000.0f, 1000.0f});
        expect(near(camera.eyeTarget(), Vec2(600.0f, 700.0f)));

        // No input: the eye stays put
        camera.control(UserInput{}, 0.5f);
        expect(near(camera.eye().x, 600.0f) && near(camera.eye().y, 700.0f));
    };

    "zoom never reaches zero"_test = [] {
        Camera camera;
        camera.setZoom(0.0f);
        expect(camera.zoom() == Camera::MIN_ZOOM);
    };

    "screen to world follows eye and zoom"_test = [] {
        Camera camera;
        camera.setReference(300);
        camera.update({800.0f, 600.0f});
        camera.setEye({10.0f, 20.0f, 0.0f});
        camera.setZoom(0.5f);
        // 200 px / (2 * 0.5) + 10
        expect(near(camera.screenToWorld({200.0f, 100.0f}), Vec2(210.0f, 120.0f)));
    };
};

suite camera_control_tests = [] {
    "W moves the target up at control speed"_test = [] {
        Camera camera;
        camera.setControlSpeed(200.0f);
        UserInput input;
        input.onKey(Key::W, true);

        camera.control(input, 0.5f);
        expect(near(camera.eyeTarget(), Vec2(0.0f, -100.0f)));
    };

    "diagonal panning is normalized"_test = [] {
        Camera camera;
        UserInput input;
        input.onKey(Key::S, true);
        input.onKey(Key::D, true);

        camera.control(input, 1.0f);
        expect(near(length(camera.eyeTarget()), 100.0f, 1e-3f));
        expect(near(camera.eyeTarget().x, camera.eyeTarget().y));
    };

    "opposite keys cancel"_test = [] {
        Camera camera;
        UserInput input;
        input.onKey(Key::A, true);
        input.onKey(Key::D, true);
        camera.control(input, 1.0f);
        expect(near(camera.eyeTarget(), Vec2(0.0f, 0.0f)));
    };

    "eye moves at most speed * dt towards the target"_test = [] {
        Camera camera;
        camera.setSpeed(100.0f);
        camera.setEyeTarget({300.0f, 400.0f});

        camera.control(UserInput{}, 0.1f);
        Vec2 eye{camera.eye().x, camera.eye().y};
        expect(near(length(eye), 10.0f, 1e-3f));
        // Along the line to the target
        expect(near(eye, Vec2(6.0f, 8.0f), 1e-3f));
        expect(camera.eyeTarget() == Vec2(300.0f, 400.0f)) << "target unchanged";
    };

    "eye snaps onto a target within one step"_test = [] {
        Camera camera;
        camera.setSpeed(100.0f);
        camera.setEyeTarget({3.0f, 4.0f});
        camera.control(UserInput{}, 0.1f);
        expect(camera.eye() == Vec3(3.0f, 4.0f, 0.0f));
    };

    "eye keeps converging over frames"_test = [] {
        Camera camera;
        camera.setSpeed(100.0f);
        camera.setEyeTarget({50.0f, 0.0f});
        for (int i = 0; i < 4; ++i) {
            camera.control(UserInput{}, 0.1f);
        }
        expect(near(camera.eye().x, 40.0f));
        camera.control(UserInput{}, 0.1f);
        expect(near(camera.eye().x, 50.0f));
        camera.control(UserInput{}, 0.1f);
        expect(near(camera.eye().x, 50.0f)) << "no overshoot";
    };

    "wheel zooms in fixed steps"_test = [] {
        Camera camera;
        UserInput input;

        input.onScroll(0.0, 1.0);
        camera.control(input, 0.016f);
        expect(near(camera.zoom(), 0.95f)) << "wheel up zooms out";

        input.endFrame();
        input.onScroll(0.0, -3.0);
        camera.control(input, 0.016f);
        expect(near(camera.zoom(), 1.0f)) << "one step per frame regardless of magnitude";

        input.endFrame();
        camera.control(input, 0.016f);
        expect(near(camera.zoom(), 1.0f)) << "no wheel, no change";
    };

    "wheel cannot zoom below the minimum"_test = [] {
        Camera camera;
        camera.setZoom(Camera::MIN_ZOOM);
        UserInput input;
        input.onScroll(0.0, 1.0);
        camera.control(input, 0.016f);
        expect(camera.zoom() >= Camera::MIN_ZOOM);
    };

    "set speed drives both speeds"_test = [] {
        Camera camera;
        expect(camera.speed() == 100.0_f);
        expect(camera.controlSpeed() == 100.0_f);
        camera.setSpeed(40.0f);
        expect(camera.speed() == 40.0_f);
        expect(camera.controlSpeed() == 40.0_f);
    };
};
