#pragma once

#include <string>

namespace TermCanvas::Terminal {

// Box-drawing codepoints
namespace GraphicsChars {
    constexpr char32_t SINGLE_BAR                 = 0x2500;  // ─
    constexpr char32_t WINDOW_SIDE                = 0x2502;  // │
    constexpr char32_t ULCORNER                   = 0x250C;  // ┌
    constexpr char32_t URCORNER                   = 0x2510;  // ┐
    constexpr char32_t LLCORNER                   = 0x2514;  // └
    constexpr char32_t LRCORNER                   = 0x2518;  // ┘
    constexpr char32_t DOUBLE_BAR                 = 0x2550;  // ═
    constexpr char32_t WINDOW_SIDE_DOUBLE         = 0x2551;  // ║
    constexpr char32_t WINDOW_LEFT_TOP            = 0x2552;  // ╒
    constexpr char32_t WINDOW_LEFT_TOP_DOUBLE     = 0x2554;  // ╔
    constexpr char32_t WINDOW_RIGHT_TOP           = 0x2555;  // ╕
    constexpr char32_t WINDOW_RIGHT_TOP_DOUBLE    = 0x2557;  // ╗
    constexpr char32_t WINDOW_LEFT_BOTTOM         = 0x2558;  // ╘
    constexpr char32_t WINDOW_LEFT_BOTTOM_DOUBLE  = 0x255A;  // ╚
    constexpr char32_t WINDOW_RIGHT_BOTTOM        = 0x255B;  // ╛
    constexpr char32_t WINDOW_RIGHT_BOTTOM_DOUBLE = 0x255D;  // ╝
    constexpr char32_t WINDOW_TOP                 = DOUBLE_BAR;
}

// The three box styles every screen supports directly
enum class BoxStyle {
    Single,
    Double,
    Mixed      // Double top/bottom edges, single left/right edges
};

/**
 * @brief Glyph set used to draw a box border
 */
struct BorderStyle {
    char32_t horizontal;
    char32_t vertical;
    char32_t topLeft;
    char32_t topRight;
    char32_t bottomLeft;
    char32_t bottomRight;

    static const BorderStyle None;
    static const BorderStyle Single;
    static const BorderStyle Double;
    static const BorderStyle SingleVDoubleH;
    static const BorderStyle SingleHDoubleV;
    static const BorderStyle Round;

    static const BorderStyle& FromBoxStyle(BoxStyle style);

    /**
     * @brief Look up a style by name
     *
     * Accepts none, default, single, double, round, singlevdoubleh and
     * singlehdoublev (case-insensitive). Unknown names give Single.
     */
    static const BorderStyle& FromName(const std::string& name);

    bool operator==(const BorderStyle& other) const {
        return horizontal == other.horizontal && vertical == other.vertical &&
               topLeft == other.topLeft && topRight == other.topRight &&
               bottomLeft == other.bottomLeft && bottomRight == other.bottomRight;
    }
    bool operator!=(const BorderStyle& other) const { return !(*this == other); }
};

} // namespace TermCanvas::Terminal
