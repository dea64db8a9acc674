#pragma once

#include <quadra/canvas-types.h>
#include <quadra/math.h>
#include <quadra/user-input.h>
#include <cstdint>
#include <optional>

namespace quadra {

// 2D camera producing the per-batch Transform. Pixel coordinates with the
// origin at the top-left and y growing downward.
class Camera {
public:
    static constexpr float ZOOM_STEP = 0.05f;
    static constexpr float MIN_ZOOM = 0.05f;

    Camera() = default;

    // Scale everything so `referenceHeight` pixels fill the screen height
    void setReference(uint32_t referenceHeight);
    void clearReference();

    // Rebuild projection/view when the surface size changes
    void update(Vec2 screen);

    // Centre the view on a world-space point
    void lookAt(Vec2 point);

    // Moves the eye immediately; the control target follows
    void setEye(Vec3 eye);
    void setEyeTarget(Vec2 target) { _eyeTarget = target; }
    void setZoom(float zoom);

    // Sets both the eye easing speed and the WASD pan speed, in world units/s
    void setSpeed(float speed);
    void setControlSpeed(float speed) { _controlSpeed = speed; }

    // Per-frame interactive control: the wheel zooms in fixed steps, WASD pans
    // the target, and the eye eases towards the target at `speed`.
    void control(const UserInput& input, float dt);

    // Window pixels to world coordinates
    Vec2 screenToWorld(Vec2 pixel) const;

    Vec3 eye() const { return _eye; }
    Vec2 eyeTarget() const { return _eyeTarget; }
    float zoom() const { return _zoom; }
    float speed() const { return _speed; }
    float controlSpeed() const { return _controlSpeed; }
    float resolutionScale() const { return _resolutionScale; }
    Vec2 screen() const { return _screen; }

    // World-space size of the visible area at zoom 1
    Vec2 viewport() const { return _screen / _resolutionScale; }

    // model = scale(resolutionScale * zoom) * translate(-eye)
    Transform transform() const;

    // Screen-anchored transform (UI overlays): model = scale(resolutionScale)
    Transform screenTransform() const;

private:
    Vec3 scaling() const;

    Vec3 _eye{0.0f, 0.0f, 0.0f};
    Vec2 _eyeTarget{0.0f, 0.0f};
    float _zoom = 1.0f;
    float _speed = 100.0f;
    float _controlSpeed = 100.0f;
    float _resolutionScale = 1.0f;
    Vec2 _screen{0.0f, 0.0f};
    std::optional<uint32_t> _referenceHeight;
    Mat4 _proj = Mat4::identity();
    Mat4 _view = Mat4::identity();
};

} // namespace quadra
