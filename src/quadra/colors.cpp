#include <quadra/colors.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <cctype>

namespace quadra {

namespace {

uint8_t hexDigit(char c) {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    if (c >= 'A' && c <= 'F') return static_cast<uint8_t>(c - 'A' + 10);
    return 0;
}

uint8_t hexByte(const std::string& s, size_t at) {
    return static_cast<uint8_t>((hexDigit(s[at]) << 4) | hexDigit(s[at + 1]));
}

} // namespace

Vec4 parseColor(const std::string& text) {
    if (text.empty()) return colors::WHITE;

    if (text[0] == '#') {
        std::string hex = text.substr(1);
        if (hex.size() == 3) {
            hex = std::string{hex[0], hex[0], hex[1], hex[1], hex[2], hex[2]};
        }
        if (hex.size() == 6) {
            hex += "ff";
        }
        if (hex.size() != 8) {
            ywarn("parseColor: bad hex color '{}'", text);
            return colors::WHITE;
        }
        return fromBytes(hexByte(hex, 0), hexByte(hex, 2), hexByte(hex, 4), hexByte(hex, 6));
    }

    std::string name = text;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "white") return colors::WHITE;
    if (name == "black") return colors::BLACK;
    if (name == "red") return colors::RED;
    if (name == "green") return colors::GREEN;
    if (name == "blue") return colors::BLUE;
    if (name == "transparent" || name == "none") return colors::TRANSPARENT;

    ywarn("parseColor: unknown color '{}'", text);
    return colors::WHITE;
}

} // namespace quadra
