#pragma once

#include <quadra/math.h>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace quadra {

//=============================================================================
// Element: one drawable instance in the canvas buffer (binding 0).
// Layout matches the WGSL `Element` struct under std430 rules: 64 bytes.
//=============================================================================
struct Element {
    Vec2 position;     // origin offset in layout units
    Vec2 image;        // reserved
    Vec2 src;          // texture region origin (normalized UV)
    Vec2 uv;           // texture region extent (normalized UV)
    Vec2 size;         // quad extent in pixels
    Vec2 _unused;      // reserved
    UVec4 attrs;       // [kind, textureIndex, brushIndex, reserved]

    uint32_t kind() const { return attrs.x; }
    uint32_t textureIndex() const { return attrs.y; }
    uint32_t brushIndex() const { return attrs.z; }
};

static_assert(sizeof(Element) == 64, "Element must match the std430 WGSL layout");
static_assert(std::is_trivially_copyable_v<Element>);

//=============================================================================
// Brush: style record in the style buffer (binding 4), 64 bytes.
// Only border.x (border width in pixels) is read; border.yzw are reserved.
//=============================================================================
struct Brush {
    Vec4 fg{1.0f};
    Vec4 bg{1.0f};
    Vec4 radius{0.0f};
    Vec4 border{0.0f};
};

static_assert(sizeof(Brush) == 64, "Brush must match the std430 WGSL layout");
static_assert(std::is_trivially_copyable_v<Brush>);

//=============================================================================
// Transform: per-batch uniform (binding 3)
//=============================================================================
struct Transform {
    Mat4 model = Mat4::identity();
    Mat4 view = Mat4::identity();
    Mat4 proj = Mat4::identity();

    // projection × view × model
    Mat4 combined() const { return proj * view * model; }
};

static_assert(sizeof(Transform) == 192, "Transform must match the WGSL uniform layout");

//=============================================================================
// Mode tag carried in attrs[0]
//=============================================================================
enum class ElementKind : uint32_t {
    Image = 0,
    RoundedRect = 1,
};

// Any tag other than RoundedRect composites as a plain image.
inline ElementKind elementKind(const Element& element) {
    return element.attrs.x == static_cast<uint32_t>(ElementKind::RoundedRect)
        ? ElementKind::RoundedRect
        : ElementKind::Image;
}

//=============================================================================
// Draw commands: typed host-side requests, encoded into Elements
//=============================================================================

struct ImageCommand {
    Vec2 position;
    Vec2 size;
    Vec2 src{0.0f, 0.0f};
    Vec2 uv{1.0f, 1.0f};
};

struct RoundedRectCommand {
    Vec2 position;
    Vec2 size;
    Brush brush;
    Vec2 src{0.0f, 0.0f};
    Vec2 uv{1.0f, 1.0f};
};

using DrawCommand = std::variant<ImageCommand, RoundedRectCommand>;

Element encodeElement(const DrawCommand& command, uint32_t textureIndex, uint32_t brushIndex);

// Brush that goes into the style buffer for this command
Brush commandBrush(const DrawCommand& command);

// Quad height of a command (the reference length of the shape math)
float commandHeight(const DrawCommand& command);

} // namespace quadra
