#include <quadra/canvas-shader.h>

namespace quadra {

//-----------------------------------------------------------------------------
// Canvas WGSL. Kept in lockstep with quad-generator.cpp and
// shape-compositor.cpp, which the software rasterizer runs.
//-----------------------------------------------------------------------------
static constexpr std::string_view CANVAS_SHADER = R"(
struct Element {
    position: vec2<f32>,
    image: vec2<f32>,
    src: vec2<f32>,
    uv: vec2<f32>,
    size: vec2<f32>,
    _unused: vec2<f32>,
    attrs: vec4<u32>,      // kind, texture, brush, reserved
}

struct Brush {
    fg: vec4<f32>,
    bg: vec4<f32>,
    radius: vec4<f32>,
    border: vec4<f32>,
}

struct Transform {
    model: mat4x4<f32>,
    view: mat4x4<f32>,
    proj: mat4x4<f32>,
}

@group(0) @binding(0) var<storage, read> elements: array<Element>;
@group(0) @binding(1) var textures: texture_2d_array<f32>;
@group(0) @binding(2) var textureSampler: sampler;
@group(0) @binding(3) var<uniform> transform: Transform;
@group(0) @binding(4) var<storage, read> brushes: array<Brush>;

const KIND_ROUNDED_RECT: u32 = 1u;
const REFERENCE_HEIGHT: f32 = 100.0;
const REFERENCE_SMOOTHNESS: f32 = 0.001;

struct VertexOutput {
    @builtin(position) position: vec4<f32>,
    @location(0) color: vec4<f32>,
    @location(1) texCoord: vec2<f32>,
    @location(2) @interpolate(flat) textureIndex: u32,
    @location(3) @interpolate(flat) instance: u32,
    @location(4) @interpolate(flat) cornerId: u32,
    @location(5) localPosition: vec2<f32>,
}

@vertex fn vs_main(@builtin(vertex_index) vi: u32,
                   @builtin(instance_index) ii: u32) -> VertexOutput {
    var corners = array<vec2<f32>, 4>(
        vec2<f32>(0.0, 0.0), vec2<f32>(1.0, 0.0),
        vec2<f32>(1.0, 1.0), vec2<f32>(0.0, 1.0)
    );
    var order = array<u32, 6>(0u, 1u, 2u, 2u, 3u, 0u);

    let cornerId = order[vi % 6u];
    let corner = corners[cornerId];
    let element = elements[ii];

    let localPos = corner * element.size;
    let world = localPos + element.position;
    let camera = transform.proj * transform.view * transform.model;

    var out: VertexOutput;
    out.position = camera * vec4<f32>(world, 0.0, 1.0);
    out.color = vec4<f32>(1.0, 1.0, 1.0, 1.0);
    out.texCoord = element.src + corner * element.uv;
    out.textureIndex = element.attrs.y;
    out.instance = ii;
    out.cornerId = cornerId;
    out.localPosition = localPos;
    return out;
}

// r4 = (x>0: (y>0, y<=0), x<=0: (y>0, y<=0))
fn roundedBoxSdf(p: vec2<f32>, b: vec2<f32>, r4: vec4<f32>) -> f32 {
    let pair = select(r4.zw, r4.xy, p.x > 0.0);
    let r = select(pair.y, pair.x, p.y > 0.0);
    let q = abs(p) - b + vec2<f32>(r);
    return min(max(q.x, q.y), 0.0) + length(max(q, vec2<f32>(0.0))) - r;
}

fn composeImage(texColor: vec4<f32>) -> vec4<f32> {
    return texColor;
}

fn composeRoundedRect(texColor: vec4<f32>, element: Element, brush: Brush,
                      localPosition: vec2<f32>) -> vec4<f32> {
    let fg = brush.fg * texColor;
    let bg = brush.bg * texColor;

    let res = element.size.y;
    let border = brush.border.x;
    let borderFix = border / res;
    let borderColor = select(bg.rgb, fg.rgb, border > 0.0);

    let radius = brush.radius - vec4<f32>(border);
    let smoothness = (REFERENCE_HEIGHT / res) * REFERENCE_SMOOTHNESS;

    let offset = (localPosition - element.size / 2.0) / res;
    let halfExtent = vec2<f32>(element.size.x / 2.0 / res, 0.5) - vec2<f32>(borderFix);

    let d = roundedBoxSdf(offset, halfExtent, radius / res);

    var rgb = select(bg.rgb, vec3<f32>(1.0), d > 0.0);
    let borderCoverage = 1.0 - smoothstep(borderFix - smoothness, borderFix + smoothness, abs(d));
    rgb = mix(rgb, borderColor, borderCoverage);

    let alpha = select(1.0, borderCoverage, d > 0.0);
    return vec4<f32>(rgb, alpha);
}

@fragment fn fs_main(input: VertexOutput) -> @location(0) vec4<f32> {
    let element = elements[input.instance];
    let texColor = textureSample(textures, textureSampler, input.texCoord,
                                 input.textureIndex) * input.color;

    if (element.attrs.x == KIND_ROUNDED_RECT) {
        return composeRoundedRect(texColor, element, brushes[element.attrs.z],
                                  input.localPosition);
    }
    return composeImage(texColor);
}
)";

std::string_view canvasShaderSource() {
    return CANVAS_SHADER;
}

} // namespace quadra
