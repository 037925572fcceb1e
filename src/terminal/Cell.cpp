#include "terminal/Cell.h"
#include <cstdio>

namespace TermCanvas::Terminal {

namespace {

// SGR inversion: black<->white, red<->cyan, green<->magenta, blue<->yellow
constexpr uint32_t kAnsiInverse[8] = {
    CellColor::WHITE,    // black
    CellColor::CYAN,     // red
    CellColor::MAGENTA,  // green
    CellColor::BLUE,     // yellow
    CellColor::YELLOW,   // blue
    CellColor::GREEN,    // magenta
    CellColor::RED,      // cyan
    CellColor::BLACK     // white
};

const char* const kAnsiNames[8] = {
    "black", "red", "green", "yellow", "blue", "magenta", "cyan", "white"
};

} // namespace

CellColor CellColor::Inverted() const {
    switch (mode) {
        case Mode::Ansi: {
            uint32_t bright = value & 0x08;
            return CellColor::Ansi(kAnsiInverse[value & 0x07] | bright);
        }
        case Mode::Indexed:
            if (value < 16) {
                uint32_t bright = value & 0x08;
                return CellColor::Indexed(kAnsiInverse[value & 0x07] | bright);
            }
            if (value < 232) {
                // 6x6x6 cube: mirror each axis
                return CellColor::Indexed(16 + (215 - (value - 16)));
            }
            // 24-step gray ramp
            return CellColor::Indexed(232 + (23 - (value - 232)));
        case Mode::Rgb:
            return CellColor::Rgb(value ^ 0xFFFFFF);
    }
    return *this;
}

std::string CellColor::ToString() const {
    char buf[32];
    switch (mode) {
        case Mode::Ansi:
            if (value < 8) {
                return kAnsiNames[value];
            }
            return std::string("bright ") + kAnsiNames[value & 0x07];
        case Mode::Indexed:
            std::snprintf(buf, sizeof(buf), "index %u", static_cast<unsigned>(value));
            return buf;
        case Mode::Rgb:
            std::snprintf(buf, sizeof(buf), "#%06X", static_cast<unsigned>(value));
            return buf;
    }
    return {};
}

} // namespace TermCanvas::Terminal
