#include <quadra/canvas-types.h>

namespace quadra {

namespace {

template<class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

Element encodeElement(const DrawCommand& command, uint32_t textureIndex, uint32_t brushIndex) {
    return std::visit(overloaded{
        [&](const ImageCommand& c) {
            Element e{};
            e.position = c.position;
            e.src = c.src;
            e.uv = c.uv;
            e.size = c.size;
            e.attrs = {static_cast<uint32_t>(ElementKind::Image), textureIndex, brushIndex, 0};
            return e;
        },
        [&](const RoundedRectCommand& c) {
            Element e{};
            e.position = c.position;
            e.src = c.src;
            e.uv = c.uv;
            e.size = c.size;
            e.attrs = {static_cast<uint32_t>(ElementKind::RoundedRect), textureIndex, brushIndex, 0};
            return e;
        },
    }, command);
}

Brush commandBrush(const DrawCommand& command) {
    if (auto* rect = std::get_if<RoundedRectCommand>(&command)) {
        return rect->brush;
    }
    return Brush{};
}

float commandHeight(const DrawCommand& command) {
    return std::visit([](const auto& c) { return c.size.y; }, command);
}

} // namespace quadra
