//=============================================================================
// Color Parsing Tests
//=============================================================================

#include <boost/ut.hpp>
#include <quadra/colors.h>
#include "../test-util.h"

using namespace boost::ut;
using namespace quadra;
using quadra::test::near;

suite color_parse_tests = [] {
    "hex forms"_test = [] {
        expect(near(parseColor("#ff0000"), colors::RED));
        expect(near(parseColor("#00FF00"), colors::GREEN));
        expect(near(parseColor("#00f"), colors::BLUE)) << "short form";
        expect(near(parseColor("#ffffff80"), Vec4(1.0f, 1.0f, 1.0f, 128.0f / 255.0f)));
        expect(near(parseColor("#202028"), fromBytes(0x20, 0x20, 0x28)));
    };

    "names are case-insensitive"_test = [] {
        expect(parseColor("Red") == colors::RED);
        expect(parseColor("BLACK") == colors::BLACK);
        expect(parseColor("none") == colors::TRANSPARENT);
        expect(parseColor("transparent") == colors::TRANSPARENT);
    };

    "malformed input"_test = [] {
        expect(parseColor("") == colors::WHITE);
        expect(parseColor("chartreuse") == colors::WHITE) << "unknown name";
        expect(parseColor("#12345") == colors::WHITE) << "bad length";
        expect(near(parseColor("#zz0000"), colors::BLACK)) << "bad digits read as zero";
    };

    "fromBytes normalizes"_test = [] {
        constexpr Vec4 c = fromBytes(255, 0, 51, 0);
        expect(near(c, Vec4(1.0f, 0.0f, 0.2f, 0.0f)));
    };
};
