#include <quadra/camera.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>

namespace quadra {

void Camera::setReference(uint32_t referenceHeight) {
    if (referenceHeight == 0) {
        clearReference();
        return;
    }
    _referenceHeight = referenceHeight;
    if (_screen.y > 0.0f) {
        _resolutionScale = _screen.y / static_cast<float>(referenceHeight);
    }
}

void Camera::clearReference() {
    _referenceHeight.reset();
    _resolutionScale = 1.0f;
}

void Camera::update(Vec2 screen) {
    if (screen != _screen) {
        _screen = screen;
        // y down, near/far chosen so the eye-space z of -1 maps inside the clip volume
        _proj = mat4Orthographic(0.0f, screen.x, screen.y, 0.0f, 0.0f, 2.0f);
        _view = mat4LookAtRH({0.0f, 0.0f, 1.0f}, {0.0f, 0.0f, 0.0f}, {0.0f, 1.0f, 0.0f});
        ydebug("Camera: screen {}x{}", screen.x, screen.y);
    }
    if (_referenceHeight && _screen.y > 0.0f) {
        _resolutionScale = _screen.y / static_cast<float>(*_referenceHeight);
    }
}

Vec3 Camera::scaling() const {
    return Vec3(_resolutionScale, _resolutionScale, 1.0f) * _zoom;
}

void Camera::lookAt(Vec2 point) {
    Vec3 s = scaling();
    Vec3 halfScreen{_screen.x / s.x * 0.5f, _screen.y / s.y * 0.5f, 0.0f};
    setEye(Vec3(point.x, point.y, 0.0f) - halfScreen);
}

void Camera::setEye(Vec3 eye) {
    _eye = eye;
    _eyeTarget = {eye.x, eye.y};
}

void Camera::setZoom(float zoom) {
    _zoom = std::max(zoom, MIN_ZOOM);
}

void Camera::setSpeed(float speed) {
    _speed = speed;
    _controlSpeed = speed;
}

void Camera::control(const UserInput& input, float dt) {
    // Wheel up zooms out
    if (input.mouse.wheel.y > 0.0f) {
        setZoom(_zoom - ZOOM_STEP);
    } else if (input.mouse.wheel.y < 0.0f) {
        setZoom(_zoom + ZOOM_STEP);
    }

    Vec2 dir = input.keys.wasd();
    if (float len = length(dir); len > 0.0f) {
        _eyeTarget = _eyeTarget + dir / len * (dt * _controlSpeed);
    }

    Vec2 eye{_eye.x, _eye.y};
    Vec2 toTarget = _eyeTarget - eye;
    float distance = length(toTarget);
    float step = _speed * dt;
    if (distance <= step) {
        eye = _eyeTarget;
    } else {
        eye = eye + toTarget / distance * step;
    }
    _eye.x = eye.x;
    _eye.y = eye.y;
}

Vec2 Camera::screenToWorld(Vec2 pixel) const {
    return pixel / _resolutionScale / _zoom + Vec2(_eye.x, _eye.y);
}

Transform Camera::transform() const {
    Transform t;
    t.model = mat4Scale(scaling()) * mat4Translation(-_eye);
    t.view = _view;
    t.proj = _proj;
    return t;
}

Transform Camera::screenTransform() const {
    Transform t;
    t.model = mat4Scale({_resolutionScale, _resolutionScale, 1.0f});
    t.view = _view;
    t.proj = _proj;
    return t;
}

} // namespace quadra
