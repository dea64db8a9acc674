//=============================================================================
// Scene Tests
//
// YAML scene parsing and submission into a batch.
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/scene.h>
#include "../test-util.h"
#include <filesystem>
#include <fstream>
#include <variant>

using namespace boost::ut;
using namespace quadra;
using namespace quadra::test;

suite default_scene_tests = [] {
    "built-in demo"_test = [] {
        auto res = defaultScene();
        expect(res.has_value() >> fatal);
        const Scene& scene = *res;

        expect(scene.width == 560_u);
        expect(scene.height == 160_u);
        expect((scene.items.size() == 3_u) >> fatal);
        expect(std::holds_alternative<ImageCommand>(scene.items[0].command));
        expect(std::holds_alternative<RoundedRectCommand>(scene.items[1].command));
        expect(std::holds_alternative<RoundedRectCommand>(scene.items[2].command));

        const auto& ring = std::get<RoundedRectCommand>(scene.items[2].command);
        expect(near(ring.brush.fg, GREEN));
        expect(near(ring.brush.bg, RED));
        expect(ring.brush.radius == Vec4(20.0f));
        expect(ring.brush.border.x == 5.0_f);
    };

    "demo submits into a batch"_test = [] {
        auto res = defaultScene();
        expect(res.has_value() >> fatal);
        CanvasBatch batch;
        expect(res->submit(batch).has_value() >> fatal);
        expect(batch.elementCount() == 3_u);
        expect(batch.brushCount() == 3_u);
        expect(batch.textures().images().size() == 2_u) << "checker board and shared white";
        expect(batch.elements()[0].kind() == 0_u);
        expect(batch.elements()[2].kind() == 1_u);
    };
};

suite scene_parse_tests = [] {
    "inline brushes and per-corner radius"_test = [] {
        auto res = parseScene(R"(
background: [0.5, 0.5, 0.5]
elements:
  - position: 10
    size: [40, 20]
    brush: {bg: "#0000ff", radius: [1, 2, 3, 4]}
)");
        expect(res.has_value() >> fatal);
        expect(near(res->background, Vec4(0.5f, 0.5f, 0.5f, 1.0f)));
        expect(res->width == 0_u) << "size is optional";
        expect((res->items.size() == 1_u) >> fatal);

        const auto& cmd = std::get<RoundedRectCommand>(res->items[0].command);
        expect(cmd.position == Vec2(10.0f, 10.0f)) << "scalar vec2";
        expect(cmd.size == Vec2(40.0f, 20.0f));
        expect(near(cmd.brush.bg, BLUE));
        expect(cmd.brush.radius == Vec4(1.0f, 2.0f, 3.0f, 4.0f));
        expect(res->items[0].texture != nullptr) << "plain rect gets a white texture";
    };

    "rects without a texture share one"_test = [] {
        auto res = parseScene(R"(
elements:
  - {size: [10, 10]}
  - {size: [10, 10]}
)");
        expect(res.has_value() >> fatal);
        expect((res->items.size() == 2_u) >> fatal);
        expect(res->items[0].texture == res->items[1].texture);
    };

    "textured rect uses the named texture"_test = [] {
        auto res = parseScene(R"(
textures:
  - {name: tint, solid: "#ff0000"}
elements:
  - {kind: rect, size: [10, 10], texture: tint}
)");
        expect(res.has_value() >> fatal);
        expect(res->items[0].texture == res->textures.at("tint"));
    };

    "errors"_test = [] {
        expect(!parseScene("elements: [{kind: image, size: [1, 1]}]").has_value())
            << "image without texture";
        expect(!parseScene("elements: [{kind: circle, size: [1, 1]}]").has_value())
            << "unknown kind";
        expect(!parseScene("elements: [{size: [1, 1], texture: nope}]").has_value())
            << "unknown texture";
        expect(!parseScene("elements: [{size: [1, 1], brush: nope}]").has_value())
            << "unknown brush";
        expect(!parseScene("elements: [{size: [1, 0]}]").has_value()) << "zero height";
        expect(!parseScene("elements: [{size: [1, 2, 3]}]").has_value()) << "bad vec2";
        expect(!parseScene("textures: [{name: t}]").has_value()) << "texture without source";
        expect(!parseScene("[1, 2]").has_value()) << "root not a mapping";
        expect(!parseScene("elements: [").has_value()) << "bad YAML";
    };

    "scene size is range checked"_test = [] {
        auto negative = parseScene("size: [-10, 5]");
        expect(!negative.has_value()) << "negative width";
        expect(!parseScene("size: [10, -1]").has_value()) << "negative height";
        expect(!parseScene("size: [1e12, 10]").has_value()) << "too large for the output";
        expect(!parseScene("size: [.nan, 10]").has_value()) << "not a number";

        auto ok = parseScene("size: [640, 480]");
        expect(ok.has_value() >> fatal);
        expect(ok->width == 640_u);
        expect(ok->height == 480_u);

        auto limit = parseScene("size: [16384, 0]");
        expect(limit.has_value() >> fatal);
        expect(limit->width == Scene::MAX_SIZE);
        expect(limit->height == 0_u) << "zero keeps the window size";
    };

    "texture files resolve against the scene directory"_test = [] {
        auto dir = std::filesystem::temp_directory_path() / "quadra_scene_test";
        std::filesystem::create_directories(dir);
        {
            std::ofstream out(dir / "scene.yaml");
            out << "textures: [{name: photo, file: missing.png}]\n";
        }
        auto res = loadScene((dir / "scene.yaml").string());
        std::filesystem::remove_all(dir);
        expect(!res.has_value()) << "missing image reported";
    };

    "missing scene file"_test = [] {
        expect(!loadScene("/nonexistent/quadra/scene.yaml").has_value());
    };
};
