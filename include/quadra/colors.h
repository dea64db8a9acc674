#pragma once

#include <quadra/math.h>
#include <cstdint>
#include <string>

namespace quadra {

namespace colors {
constexpr Vec4 WHITE{1.0f, 1.0f, 1.0f, 1.0f};
constexpr Vec4 BLACK{0.0f, 0.0f, 0.0f, 1.0f};
constexpr Vec4 RED{1.0f, 0.0f, 0.0f, 1.0f};
constexpr Vec4 GREEN{0.0f, 1.0f, 0.0f, 1.0f};
constexpr Vec4 BLUE{0.0f, 0.0f, 1.0f, 1.0f};
constexpr Vec4 TRANSPARENT{0.0f, 0.0f, 0.0f, 0.0f};
} // namespace colors

constexpr Vec4 fromBytes(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255) {
    return {r / 255.0f, g / 255.0f, b / 255.0f, a / 255.0f};
}

// "#rrggbb", "#rrggbbaa", "#rgb" or a name (white, black, red, green, blue,
// transparent, none). Malformed hex digits read as 0, unknown names as white.
Vec4 parseColor(const std::string& text);

} // namespace quadra
