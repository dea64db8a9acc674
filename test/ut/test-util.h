#pragma once

#include <quadra/math.h>
#include <cmath>

namespace quadra::test {

inline bool near(float a, float b, float eps = 1e-4f) {
    return std::fabs(a - b) <= eps;
}

inline bool near(Vec2 a, Vec2 b, float eps = 1e-4f) {
    return near(a.x, b.x, eps) && near(a.y, b.y, eps);
}

inline bool near(Vec4 a, Vec4 b, float eps = 1e-4f) {
    return near(a.x, b.x, eps) && near(a.y, b.y, eps) && near(a.z, b.z, eps) &&
           near(a.w, b.w, eps);
}

constexpr Vec4 RED{1.0f, 0.0f, 0.0f, 1.0f};
constexpr Vec4 GREEN{0.0f, 1.0f, 0.0f, 1.0f};
constexpr Vec4 BLUE{0.0f, 0.0f, 1.0f, 1.0f};
constexpr Vec4 WHITE{1.0f, 1.0f, 1.0f, 1.0f};
constexpr Vec4 CLEAR{0.0f, 0.0f, 0.0f, 0.0f};

} // namespace quadra::test
