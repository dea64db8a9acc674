#pragma once

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdint>

namespace quadra {

//=============================================================================
// Small vector types mirroring the WGSL vec2/vec3/vec4 used by the shaders.
// Arithmetic is component-wise, like the shading language.
//=============================================================================

struct Vec2 {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Vec2() = default;
    constexpr Vec2(float x_, float y_) : x(x_), y(y_) {}
    constexpr explicit Vec2(float s) : x(s), y(s) {}

    bool operator==(const Vec2&) const = default;
};

struct Vec3 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;

    constexpr Vec3() = default;
    constexpr Vec3(float x_, float y_, float z_) : x(x_), y(y_), z(z_) {}

    bool operator==(const Vec3&) const = default;
};

struct Vec4 {
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    float w = 0.0f;

    constexpr Vec4() = default;
    constexpr Vec4(float x_, float y_, float z_, float w_) : x(x_), y(y_), z(z_), w(w_) {}
    constexpr Vec4(Vec3 v, float w_) : x(v.x), y(v.y), z(v.z), w(w_) {}
    constexpr explicit Vec4(float s) : x(s), y(s), z(s), w(s) {}

    constexpr Vec3 rgb() const { return {x, y, z}; }
    constexpr Vec2 xy() const { return {x, y}; }
    constexpr Vec2 zw() const { return {z, w}; }

    bool operator==(const Vec4&) const = default;
};

struct UVec4 {
    uint32_t x = 0;
    uint32_t y = 0;
    uint32_t z = 0;
    uint32_t w = 0;

    constexpr uint32_t operator[](int i) const {
        return i == 0 ? x : i == 1 ? y : i == 2 ? z : w;
    }

    bool operator==(const UVec4&) const = default;
};

// --- Vec2 ---
constexpr Vec2 operator+(Vec2 a, Vec2 b) { return {a.x + b.x, a.y + b.y}; }
constexpr Vec2 operator-(Vec2 a, Vec2 b) { return {a.x - b.x, a.y - b.y}; }
constexpr Vec2 operator*(Vec2 a, Vec2 b) { return {a.x * b.x, a.y * b.y}; }
constexpr Vec2 operator/(Vec2 a, Vec2 b) { return {a.x / b.x, a.y / b.y}; }
constexpr Vec2 operator*(Vec2 a, float s) { return {a.x * s, a.y * s}; }
constexpr Vec2 operator/(Vec2 a, float s) { return {a.x / s, a.y / s}; }
constexpr Vec2 operator-(Vec2 a, float s) { return {a.x - s, a.y - s}; }
constexpr Vec2 operator+(Vec2 a, float s) { return {a.x + s, a.y + s}; }
constexpr Vec2 operator-(Vec2 a) { return {-a.x, -a.y}; }

// --- Vec3 ---
constexpr Vec3 operator+(Vec3 a, Vec3 b) { return {a.x + b.x, a.y + b.y, a.z + b.z}; }
constexpr Vec3 operator-(Vec3 a, Vec3 b) { return {a.x - b.x, a.y - b.y, a.z - b.z}; }
constexpr Vec3 operator*(Vec3 a, Vec3 b) { return {a.x * b.x, a.y * b.y, a.z * b.z}; }
constexpr Vec3 operator*(Vec3 a, float s) { return {a.x * s, a.y * s, a.z * s}; }
constexpr Vec3 operator-(Vec3 a) { return {-a.x, -a.y, -a.z}; }

// --- Vec4 ---
constexpr Vec4 operator+(Vec4 a, Vec4 b) { return {a.x + b.x, a.y + b.y, a.z + b.z, a.w + b.w}; }
constexpr Vec4 operator-(Vec4 a, Vec4 b) { return {a.x - b.x, a.y - b.y, a.z - b.z, a.w - b.w}; }
constexpr Vec4 operator*(Vec4 a, Vec4 b) { return {a.x * b.x, a.y * b.y, a.z * b.z, a.w * b.w}; }
constexpr Vec4 operator*(Vec4 a, float s) { return {a.x * s, a.y * s, a.z * s, a.w * s}; }
constexpr Vec4 operator-(Vec4 a, float s) { return {a.x - s, a.y - s, a.z - s, a.w - s}; }

//=============================================================================
// Shading-language builtins
//=============================================================================

inline Vec2 abs(Vec2 v) { return {std::fabs(v.x), std::fabs(v.y)}; }
inline Vec2 max(Vec2 v, float s) { return {std::max(v.x, s), std::max(v.y, s)}; }
inline Vec2 min(Vec2 v, float s) { return {std::min(v.x, s), std::min(v.y, s)}; }
inline float length(Vec2 v) { return std::sqrt(v.x * v.x + v.y * v.y); }
inline float length(Vec3 v) { return std::sqrt(v.x * v.x + v.y * v.y + v.z * v.z); }

constexpr float dot(Vec3 a, Vec3 b) { return a.x * b.x + a.y * b.y + a.z * b.z; }
constexpr float dot(Vec4 a, Vec4 b) { return a.x * b.x + a.y * b.y + a.z * b.z + a.w * b.w; }

constexpr Vec3 cross(Vec3 a, Vec3 b) {
    return {a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x};
}

inline Vec3 normalize(Vec3 v) {
    float len = length(v);
    return len > 0.0f ? v * (1.0f / len) : v;
}

constexpr float clamp(float v, float lo, float hi) { return std::min(std::max(v, lo), hi); }

// Cubic Hermite step, WGSL smoothstep semantics
constexpr float smoothstep(float edge0, float edge1, float x) {
    float t = clamp((x - edge0) / (edge1 - edge0), 0.0f, 1.0f);
    return t * t * (3.0f - 2.0f * t);
}

constexpr float mix(float a, float b, float t) { return a + (b - a) * t; }
constexpr Vec3 mix(Vec3 a, Vec3 b, float t) {
    return {mix(a.x, b.x, t), mix(a.y, b.y, t), mix(a.z, b.z, t)};
}

//=============================================================================
// Mat4 - column-major, four Vec4 columns (same memory layout as WGSL mat4x4<f32>)
//=============================================================================

struct Mat4 {
    std::array<Vec4, 4> cols{};

    static constexpr Mat4 identity() {
        Mat4 m;
        m.cols[0] = {1, 0, 0, 0};
        m.cols[1] = {0, 1, 0, 0};
        m.cols[2] = {0, 0, 1, 0};
        m.cols[3] = {0, 0, 0, 1};
        return m;
    }

    constexpr Vec4 row(int r) const {
        auto pick = [r](const Vec4& c) { return r == 0 ? c.x : r == 1 ? c.y : r == 2 ? c.z : c.w; };
        return {pick(cols[0]), pick(cols[1]), pick(cols[2]), pick(cols[3])};
    }

    bool operator==(const Mat4&) const = default;
};

constexpr Vec4 operator*(const Mat4& m, Vec4 v) {
    return {dot(m.row(0), v), dot(m.row(1), v), dot(m.row(2), v), dot(m.row(3), v)};
}

constexpr Mat4 operator*(const Mat4& a, const Mat4& b) {
    Mat4 out;
    for (int i = 0; i < 4; i++) {
        out.cols[i] = a * b.cols[i];
    }
    return out;
}

constexpr Mat4 mat4Scale(Vec3 s) {
    Mat4 m = Mat4::identity();
    m.cols[0].x = s.x;
    m.cols[1].y = s.y;
    m.cols[2].z = s.z;
    return m;
}

constexpr Mat4 mat4Translation(Vec3 d) {
    Mat4 m = Mat4::identity();
    m.cols[3] = {d.x, d.y, d.z, 1.0f};
    return m;
}

// Right-handed look-at view matrix
inline Mat4 mat4LookAtRH(Vec3 eye, Vec3 target, Vec3 up) {
    Vec3 z = normalize(eye - target);
    Vec3 x = normalize(cross(up, z));
    Vec3 y = cross(z, x);
    Mat4 m;
    m.cols[0] = {x.x, y.x, z.x, 0.0f};
    m.cols[1] = {x.y, y.y, z.y, 0.0f};
    m.cols[2] = {x.z, y.z, z.z, 0.0f};
    m.cols[3] = {-dot(x, eye), -dot(y, eye), -dot(z, eye), 1.0f};
    return m;
}

constexpr Mat4 mat4Orthographic(float left, float right, float bottom, float top,
                                float zNear, float zFar) {
    Mat4 m = Mat4::identity();
    m.cols[0].x = 2.0f / (right - left);
    m.cols[3].x = -(right + left) / (right - left);
    m.cols[1].y = 2.0f / (top - bottom);
    m.cols[3].y = -(top + bottom) / (top - bottom);
    m.cols[2].z = -2.0f / (zFar - zNear);
    m.cols[3].z = -(zFar + zNear) / (zFar - zNear);
    return m;
}

} // namespace quadra
