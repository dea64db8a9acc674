#include <quadra/user-input.h>
#include <quadra/camera.h>

namespace quadra {

Vec2 MouseInput::position(const Camera& camera) const {
    return camera.screenToWorld(raw);
}

Vec2 KeysInput::wasd() const {
    Vec2 dir{0.0f, 0.0f};
    if (isDown(Key::W)) dir.y -= 1.0f;
    if (isDown(Key::A)) dir.x -= 1.0f;
    if (isDown(Key::S)) dir.y += 1.0f;
    if (isDown(Key::D)) dir.x += 1.0f;
    return dir;
}

void UserInput::onKey(Key key, bool down) {
    if (down) {
        if (keys.down.insert(key).second) {
            keys.pressed.insert(key);
        }
    } else {
        keys.down.erase(key);
    }
}

void UserInput::onMouseMove(double x, double y) {
    mouse.raw = {static_cast<float>(x), static_cast<float>(y)};
}

void UserInput::onMouseButton(MouseButton button, bool down) {
    MouseButtonInput& state = button == MouseButton::Left ? mouse.left : mouse.right;
    if (down && !state.down) {
        state.click = true;
    }
    state.down = down;
}

void UserInput::onScroll(double dx, double dy) {
    mouse.wheel = mouse.wheel + Vec2(static_cast<float>(dx), static_cast<float>(dy));
}

void UserInput::endFrame() {
    mouse.left.click = false;
    mouse.right.click = false;
    mouse.wheel = {0.0f, 0.0f};
    keys.pressed.clear();
}

} // namespace quadra
