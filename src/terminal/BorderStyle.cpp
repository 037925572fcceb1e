#include "terminal/BorderStyle.h"
#include <algorithm>
#include <cctype>

namespace TermCanvas::Terminal {

using namespace GraphicsChars;

const BorderStyle BorderStyle::None = {U' ', U' ', U' ', U' ', U' ', U' '};

const BorderStyle BorderStyle::Single = {
    SINGLE_BAR, WINDOW_SIDE, ULCORNER, URCORNER, LLCORNER, LRCORNER
};

const BorderStyle BorderStyle::Double = {
    DOUBLE_BAR, WINDOW_SIDE_DOUBLE,
    WINDOW_LEFT_TOP_DOUBLE, WINDOW_RIGHT_TOP_DOUBLE,
    WINDOW_LEFT_BOTTOM_DOUBLE, WINDOW_RIGHT_BOTTOM_DOUBLE
};

const BorderStyle BorderStyle::SingleVDoubleH = {
    WINDOW_TOP, WINDOW_SIDE,
    WINDOW_LEFT_TOP, WINDOW_RIGHT_TOP,
    WINDOW_LEFT_BOTTOM, WINDOW_RIGHT_BOTTOM
};

const BorderStyle BorderStyle::SingleHDoubleV = {
    SINGLE_BAR, WINDOW_SIDE_DOUBLE, 0x2553, 0x2556, 0x2559, 0x255C
};

const BorderStyle BorderStyle::Round = {
    SINGLE_BAR, WINDOW_SIDE, 0x256D, 0x256E, 0x2570, 0x256F
};

const BorderStyle& BorderStyle::FromBoxStyle(BoxStyle style) {
    switch (style) {
        case BoxStyle::Double:
            return Double;
        case BoxStyle::Mixed:
            return SingleVDoubleH;
        case BoxStyle::Single:
        default:
            return Single;
    }
}

const BorderStyle& BorderStyle::FromName(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "none") return None;
    if (lower == "double") return Double;
    if (lower == "round") return Round;
    if (lower == "singlevdoubleh") return SingleVDoubleH;
    if (lower == "singlehdoublev") return SingleHDoubleV;
    // "default", "single" and anything unrecognized
    return Single;
}

} // namespace TermCanvas::Terminal
