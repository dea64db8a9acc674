#pragma once

#include <quadra/math.h>
#include <set>

namespace quadra {

class Camera;

// Keys the viewer reacts to; the window layer maps its own key codes onto these
enum class Key { W, A, S, D };

enum class MouseButton { Left, Right };

struct MouseButtonInput {
    bool click = false; // pressed during this frame
    bool down = false;
};

struct MouseInput {
    Vec2 raw{0.0f, 0.0f}; // window pixels
    Vec2 wheel{0.0f, 0.0f};
    MouseButtonInput left;
    MouseButtonInput right;

    // Cursor in world space: raw / resolutionScale / zoom + eye
    Vec2 position(const Camera& camera) const;
};

struct KeysInput {
    std::set<Key> down;
    std::set<Key> pressed; // went down during this frame

    bool isDown(Key key) const { return down.contains(key); }

    // Unnormalized WASD direction, y down
    Vec2 wasd() const;
};

// Input state accumulated from window events between two frames
struct UserInput {
    MouseInput mouse;
    KeysInput keys;

    void onKey(Key key, bool down);
    void onMouseMove(double x, double y);
    void onMouseButton(MouseButton button, bool down);
    void onScroll(double dx, double dy);

    // Drop the per-frame edges (clicks, wheel, pressed keys)
    void endFrame();
};

} // namespace quadra
