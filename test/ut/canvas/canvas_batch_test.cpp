//=============================================================================
// Canvas Batch Tests
//
// Element/brush arenas and texture slot assignment.
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/canvas-batch.h>
#include <quadra/element-storage.h>
#include "../test-util.h"

using namespace boost::ut;
using namespace quadra;
using namespace quadra::test;

namespace {

TextureImage::Ptr makeTexture(Vec4 color) {
    auto res = TextureImage::solid(color);
    return res ? *res : nullptr;
}

RoundedRectCommand rect(float x) {
    Brush brush;
    brush.bg = RED;
    brush.radius = Vec4(x);
    return RoundedRectCommand{{x, 0.0f}, {10.0f, 10.0f}, brush};
}

} // namespace

//=============================================================================
// ElementStorage
//=============================================================================

suite element_storage_tests = [] {
    "push hands out consecutive indices"_test = [] {
        ElementStorage<int> storage("ints", 3);
        expect(storage.empty());
        expect(*storage.push(10) == 0_u);
        expect(*storage.push(20) == 1_u);
        expect(storage.size() == 2_u);
        expect(storage[1] == 20_i);
        expect(storage.byteSize() == 2 * sizeof(int));
        expect(storage.byteCapacity() == 3 * sizeof(int));
    };

    "push past capacity fails and leaves the arena unchanged"_test = [] {
        ElementStorage<int> storage("ints", 1);
        expect(storage.push(1).has_value());
        auto res = storage.push(2);
        expect(!res.has_value());
        expect(storage.size() == 1_u);
    };

    "extend appends a run"_test = [] {
        ElementStorage<int> storage("ints", 4);
        const int values[3] = {7, 8, 9};
        expect(storage.push(1).has_value());
        auto res = storage.extend(values, 3);
        expect(res.has_value() >> fatal);
        expect(*res == 1_u);
        expect(storage[3] == 9_i);
        expect(!storage.extend(values, 1).has_value()) << "full";
    };

    "clear empties but keeps capacity"_test = [] {
        ElementStorage<int> storage("ints", 2);
        expect(storage.push(1).has_value());
        storage.clear();
        expect(storage.empty());
        expect(storage.capacity() == 2_u);
        expect(*storage.push(5) == 0_u);
    };
};

//=============================================================================
// CanvasBatch
//=============================================================================

suite canvas_batch_tests = [] {
    "submit wires texture and brush indices into the element"_test = [] {
        CanvasBatch batch;
        auto red = makeTexture(RED);
        auto blue = makeTexture(BLUE);

        auto a = batch.submit(rect(1.0f), red);
        auto b = batch.submit(rect(2.0f), blue);
        auto c = batch.submit(rect(3.0f), red);
        expect((a.has_value() && b.has_value() && c.has_value()) >> fatal);

        expect(*a == 0_u);
        expect(*b == 1_u);
        expect(*c == 2_u);
        expect(batch.elementCount() == 3_u);
        expect(batch.brushCount() == 3_u);
        expect(batch.textures().images().size() == 2_u) << "textures are deduplicated";

        const auto& elements = batch.elements();
        expect(elements[0].textureIndex() == 0_u);
        expect(elements[1].textureIndex() == 1_u);
        expect(elements[2].textureIndex() == 0_u);
        expect(elements[2].brushIndex() == 2_u);
        expect(batch.brushes()[elements[2].brushIndex()].radius == Vec4(3.0f));
    };

    "image commands get a brush slot too"_test = [] {
        CanvasBatch batch;
        auto res = batch.submit(ImageCommand{{0.0f, 0.0f}, {4.0f, 4.0f}}, makeTexture(WHITE));
        expect(res.has_value() >> fatal);
        expect(batch.brushCount() == 1_u);
        expect(batch.elements()[0].kind() == 0_u);
    };

    "element overflow is an error and pushes no brush"_test = [] {
        CanvasBatch batch({2, 8, 8});
        auto tex = makeTexture(WHITE);
        expect(batch.submit(rect(0.0f), tex).has_value());
        expect(batch.submit(rect(1.0f), tex).has_value());
        auto res = batch.submit(rect(2.0f), tex);
        expect(!res.has_value());
        expect(batch.elementCount() == 2_u);
        expect(batch.brushCount() == 2_u);
    };

    "brush overflow is an error"_test = [] {
        CanvasBatch batch({8, 1, 8});
        auto tex = makeTexture(WHITE);
        expect(batch.submit(rect(0.0f), tex).has_value());
        expect(!batch.submit(rect(1.0f), tex).has_value());
        expect(batch.elementCount() == 1_u);
    };

    "texture table overflow is an error"_test = [] {
        CanvasBatch batch({8, 8, 1});
        expect(batch.submit(rect(0.0f), makeTexture(RED)).has_value());
        expect(!batch.submit(rect(1.0f), makeTexture(BLUE)).has_value());
        expect(batch.elementCount() == 1_u);
    };

    "null texture is rejected"_test = [] {
        CanvasBatch batch;
        expect(!batch.submit(rect(0.0f), nullptr).has_value());
        expect(batch.empty());
    };

    "non-positive height is rejected"_test = [] {
        CanvasBatch batch;
        auto tex = makeTexture(WHITE);
        RoundedRectCommand flat{{0.0f, 0.0f}, {10.0f, 0.0f}, Brush{}};
        expect(!batch.submit(flat, tex).has_value());
        RoundedRectCommand negative{{0.0f, 0.0f}, {10.0f, -1.0f}, Brush{}};
        expect(!batch.submit(negative, tex).has_value());
        expect(batch.empty());
        expect(batch.textures().images().empty()) << "nothing registered on failure";
    };

    "clear drops elements and brushes but keeps textures"_test = [] {
        CanvasBatch batch;
        auto tex = makeTexture(RED);
        expect(batch.submit(rect(0.0f), tex).has_value());
        batch.clear();
        expect(batch.empty());
        expect(batch.brushCount() == 0_u);
        expect(batch.textures().images().size() == 1_u);

        auto res = batch.submit(rect(0.0f), tex);
        expect(res.has_value() >> fatal);
        expect(*res == 0_u);
        expect(batch.elements()[0].textureIndex() == 0_u) << "same slot after clear";
    };

    "bindings view the arenas"_test = [] {
        CanvasBatch batch;
        expect(batch.submit(rect(0.0f), makeTexture(RED)).has_value());
        CanvasBindings b = batch.bindings();
        expect(b.elementCount == 1_u);
        expect(b.brushCount == 1_u);
        expect(b.elements == batch.elements().data());
        expect(b.textures == &batch.textures());
    };
};
