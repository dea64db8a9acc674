#include <quadra/software-rasterizer.h>
#include <quadra/shape-compositor.h>
#include <ytrace/ytrace.hpp>

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <algorithm>
#include <cmath>

namespace quadra {

//-----------------------------------------------------------------------------
// Framebuffer
//-----------------------------------------------------------------------------

Framebuffer::Framebuffer(uint32_t width, uint32_t height, Vec4 clearColor)
    : _width(width), _height(height),
      _pixels(static_cast<size_t>(width) * height, clearColor) {}

void Framebuffer::clear(Vec4 color) {
    std::fill(_pixels.begin(), _pixels.end(), color);
}

std::vector<uint8_t> Framebuffer::toRGBA8() const {
    std::vector<uint8_t> out(_pixels.size() * 4);
    auto toByte = [](float v) {
        return static_cast<uint8_t>(std::lround(clamp(v, 0.0f, 1.0f) * 255.0f));
    };
    for (size_t i = 0; i < _pixels.size(); i++) {
        out[i * 4 + 0] = toByte(_pixels[i].x);
        out[i * 4 + 1] = toByte(_pixels[i].y);
        out[i * 4 + 2] = toByte(_pixels[i].z);
        out[i * 4 + 3] = toByte(_pixels[i].w);
    }
    return out;
}

Result<void> Framebuffer::savePng(const std::string& path) const {
    auto rgba = toRGBA8();
    if (!stbi_write_png(path.c_str(), static_cast<int>(_width), static_cast<int>(_height), 4,
                        rgba.data(), static_cast<int>(_width * 4))) {
        return Err<void>("Framebuffer::savePng: failed to write " + path);
    }
    yinfo("Framebuffer: wrote {}x{} PNG to {}", _width, _height, path);
    return Ok();
}

//-----------------------------------------------------------------------------
// Rasterization helpers
//-----------------------------------------------------------------------------

namespace {

struct ScreenVertex {
    Vec2 p;         // pixel space, y down
    float invW;
    const QuadVertex* v;
};

float edge(Vec2 a, Vec2 b, Vec2 p) {
    return (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
}

// Tie-break for pixel centres exactly on an edge. A shared edge shows up
// with opposite directions in its two (positively oriented) triangles, so
// exactly one of them owns the centre.
bool ownsEdge(Vec2 a, Vec2 b) {
    Vec2 e = b - a;
    return e.y > 0.0f || (e.y == 0.0f && e.x < 0.0f);
}

bool covers(float w, Vec2 a, Vec2 b) {
    return w > 0.0f || (w == 0.0f && ownsEdge(a, b));
}

ScreenVertex toScreen(const QuadVertex& v, uint32_t width, uint32_t height) {
    float invW = 1.0f / v.position.w;
    float ndcX = v.position.x * invW;
    float ndcY = v.position.y * invW;
    ScreenVertex s;
    s.p = {(ndcX + 1.0f) * 0.5f * static_cast<float>(width),
           (1.0f - ndcY) * 0.5f * static_cast<float>(height)};
    s.invW = invW;
    s.v = &v;
    return s;
}

Vec4 blendOver(Vec4 src, Vec4 dst) {
    // color: SrcAlpha / OneMinusSrcAlpha, alpha: One / OneMinusSrcAlpha
    Vec3 rgb = src.rgb() * src.w + dst.rgb() * (1.0f - src.w);
    float a = src.w + dst.w * (1.0f - src.w);
    return Vec4(rgb, a);
}

} // namespace

//-----------------------------------------------------------------------------
// SoftwareRasterizer
//-----------------------------------------------------------------------------

Result<void> SoftwareRasterizer::draw(const CanvasBatch& batch, const Transform& transform,
                                      Framebuffer& target) {
    if (target.width() == 0 || target.height() == 0) {
        return Err<void>("SoftwareRasterizer::draw: empty framebuffer");
    }
    _stats = {};
    if (batch.empty()) {
        return Ok();
    }

    const Mat4 camera = transform.combined();
    const CanvasBindings bindings = batch.bindings();

    for (uint32_t instance = 0; instance < batch.elementCount(); instance++) {
        const Element& element = batch.elements()[instance];
        auto quad = generateQuad(element, camera, instance);
        rasterizeTriangle(quad[0], quad[1], quad[2], bindings, target);
        rasterizeTriangle(quad[3], quad[4], quad[5], bindings, target);
        _stats.instances++;
    }

    ydebug("SoftwareRasterizer: {} instances, {} triangles, {} fragments", _stats.instances,
           _stats.triangles, _stats.fragments);
    return Ok();
}

void SoftwareRasterizer::rasterizeTriangle(const QuadVertex& a, const QuadVertex& b,
                                           const QuadVertex& c, const CanvasBindings& bindings,
                                           Framebuffer& target) {
    // Nothing behind the eye in a 2D batch; drop rather than clip
    if (a.position.w <= 0.0f || b.position.w <= 0.0f || c.position.w <= 0.0f) {
        return;
    }

    const uint32_t width = target.width();
    const uint32_t height = target.height();

    ScreenVertex v0 = toScreen(a, width, height);
    ScreenVertex v1 = toScreen(b, width, height);
    ScreenVertex v2 = toScreen(c, width, height);

    float area = edge(v0.p, v1.p, v2.p);
    if (area == 0.0f || !std::isfinite(area)) {
        return;
    }
    if (area < 0.0f) {
        std::swap(v1, v2);
        area = -area;
    }
    _stats.triangles++;

    float minX = std::min({v0.p.x, v1.p.x, v2.p.x});
    float maxX = std::max({v0.p.x, v1.p.x, v2.p.x});
    float minY = std::min({v0.p.y, v1.p.y, v2.p.y});
    float maxY = std::max({v0.p.y, v1.p.y, v2.p.y});

    const float fw = static_cast<float>(width);
    const float fh = static_cast<float>(height);
    if (maxX < 0.0f || maxY < 0.0f || minX >= fw || minY >= fh) {
        return;
    }

    // Clamp while still in float so off-screen vertices never overflow the int cast
    int x0 = static_cast<int>(std::clamp(std::floor(minX), 0.0f, fw - 1.0f));
    int x1 = static_cast<int>(std::clamp(std::ceil(maxX), 0.0f, fw - 1.0f));
    int y0 = static_cast<int>(std::clamp(std::floor(minY), 0.0f, fh - 1.0f));
    int y1 = static_cast<int>(std::clamp(std::ceil(maxY), 0.0f, fh - 1.0f));

    // Flat attributes come from the provoking (first) vertex
    const QuadVertex& provoking = a;

    for (int py = y0; py <= y1; py++) {
        for (int px = x0; px <= x1; px++) {
            Vec2 p(static_cast<float>(px) + 0.5f, static_cast<float>(py) + 0.5f);

            float w0 = edge(v1.p, v2.p, p);
            float w1 = edge(v2.p, v0.p, p);
            float w2 = edge(v0.p, v1.p, p);
            if (!covers(w0, v1.p, v2.p) || !covers(w1, v2.p, v0.p) || !covers(w2, v0.p, v1.p)) {
                continue;
            }

            // Perspective-correct barycentrics
            float l0 = (w0 / area) * v0.invW;
            float l1 = (w1 / area) * v1.invW;
            float l2 = (w2 / area) * v2.invW;
            float sum = l0 + l1 + l2;
            l0 /= sum;
            l1 /= sum;
            l2 /= sum;

            const QuadVertex& q0 = *v0.v;
            const QuadVertex& q1 = *v1.v;
            const QuadVertex& q2 = *v2.v;

            FragmentInput in;
            in.color = q0.color * l0 + q1.color * l1 + q2.color * l2;
            in.texCoord = q0.texCoord * l0 + q1.texCoord * l1 + q2.texCoord * l2;
            in.localPosition = q0.localPosition * l0 + q1.localPosition * l1 + q2.localPosition * l2;
            in.textureIndex = provoking.textureIndex;
            in.instance = provoking.instance;
            in.cornerId = provoking.cornerId;

            Vec4 color = shadeFragment(in, bindings);
            Vec4& dst = target.at(static_cast<uint32_t>(px), static_cast<uint32_t>(py));
            dst = blendOver(color, dst);
            _stats.fragments++;
        }
    }
}

} // namespace quadra
