#pragma once

#include <cstdint>
#include <string>

namespace TermCanvas::Terminal {

/**
 * @brief A foreground or background color in exactly one color mode
 *
 * Ansi covers the 8/16 SGR colors (0-15), Indexed the xterm 256-color
 * palette (0-255) and Rgb a 24-bit 0xRRGGBB value.
 */
struct CellColor {
    enum class Mode : uint8_t {
        Ansi,
        Indexed,
        Rgb
    };

    Mode mode = Mode::Ansi;
    uint32_t value = 7;

    // SGR color numbers
    static constexpr uint32_t BLACK   = 0;
    static constexpr uint32_t RED     = 1;
    static constexpr uint32_t GREEN   = 2;
    static constexpr uint32_t YELLOW  = 3;
    static constexpr uint32_t BLUE    = 4;
    static constexpr uint32_t MAGENTA = 5;
    static constexpr uint32_t CYAN    = 6;
    static constexpr uint32_t WHITE   = 7;

    CellColor() = default;
    CellColor(Mode m, uint32_t v) : mode(m), value(v) {}

    static CellColor Ansi(uint32_t index) { return CellColor(Mode::Ansi, index & 0x0F); }
    static CellColor Indexed(uint32_t index) { return CellColor(Mode::Indexed, index & 0xFF); }
    static CellColor Rgb(uint32_t rgb) { return CellColor(Mode::Rgb, rgb & 0xFFFFFF); }
    static CellColor Rgb(uint8_t r, uint8_t g, uint8_t b) {
        return CellColor(Mode::Rgb, (static_cast<uint32_t>(r) << 16) |
                                    (static_cast<uint32_t>(g) << 8) | b);
    }

    bool IsAnsi() const { return mode == Mode::Ansi; }
    bool IsIndexed() const { return mode == Mode::Indexed; }
    bool IsRgb() const { return mode == Mode::Rgb; }

    // Color used when a cell is shown inverted (selection highlight)
    CellColor Inverted() const;

    std::string ToString() const;

    bool operator==(const CellColor& other) const {
        return mode == other.mode && value == other.value;
    }
    bool operator!=(const CellColor& other) const { return !(*this == other); }
};

// Cell attributes (colors and style flags)
struct CellAttributes {
    CellColor foreground;    // White
    CellColor background;    // Black
    uint8_t flags;

    // Flags
    static constexpr uint8_t FLAG_BOLD       = 0x01;
    static constexpr uint8_t FLAG_BLINK      = 0x02;
    static constexpr uint8_t FLAG_UNDERLINE  = 0x04;
    static constexpr uint8_t FLAG_REVERSE    = 0x08;
    static constexpr uint8_t FLAG_PROTECT    = 0x10;
    static constexpr uint8_t FLAG_WIDE_LEFT  = 0x20;  // Left half of a double-width glyph
    static constexpr uint8_t FLAG_WIDE_RIGHT = 0x40;  // Right half of a double-width glyph

    CellAttributes()
        : foreground(CellColor::Ansi(CellColor::WHITE))
        , background(CellColor::Ansi(CellColor::BLACK))
        , flags(0)
    {}

    CellAttributes(const CellColor& fore, const CellColor& back, uint8_t f = 0)
        : foreground(fore)
        , background(back)
        , flags(f)
    {}

    bool IsBold() const { return (flags & FLAG_BOLD) != 0; }
    bool IsBlink() const { return (flags & FLAG_BLINK) != 0; }
    bool IsUnderline() const { return (flags & FLAG_UNDERLINE) != 0; }
    bool IsReverse() const { return (flags & FLAG_REVERSE) != 0; }
    bool IsProtect() const { return (flags & FLAG_PROTECT) != 0; }
    bool IsWideLeft() const { return (flags & FLAG_WIDE_LEFT) != 0; }
    bool IsWideRight() const { return (flags & FLAG_WIDE_RIGHT) != 0; }

    void SetFlag(uint8_t flag, bool on) {
        if (on) {
            flags |= flag;
        } else {
            flags &= static_cast<uint8_t>(~flag);
        }
    }

    void Reset() { *this = CellAttributes(); }

    bool operator==(const CellAttributes& other) const {
        return foreground == other.foreground &&
               background == other.background &&
               flags == other.flags;
    }
    bool operator!=(const CellAttributes& other) const { return !(*this == other); }
};

// Single cell in the screen grid
struct Cell {
    char32_t ch;             // Unicode codepoint
    uint32_t imageId;        // 0 = text cell, otherwise an embedded bitmap fragment tag
    CellAttributes attr;

    Cell() : ch(U' '), imageId(0) {}
    explicit Cell(char32_t c) : ch(c), imageId(0) {}
    Cell(char32_t c, const CellAttributes& a) : ch(c), imageId(0), attr(a) {}

    void Reset() { *this = Cell(); }

    bool IsImage() const { return imageId != 0; }

    // White-on-black space with no flags
    bool IsBlank() const { return *this == Cell(); }

    bool operator==(const Cell& other) const {
        return ch == other.ch && imageId == other.imageId && attr == other.attr;
    }
    bool operator!=(const Cell& other) const { return !(*this == other); }
};

// Codepoints that may be stored in a cell (no C0 controls, no DEL)
inline bool IsPrintable(char32_t ch) {
    return ch >= 0x20 && ch != 0x7F;
}

} // namespace TermCanvas::Terminal
