#pragma once

namespace TermCanvas::Graphics {

// Tunables recognized when a SixelEncoder is constructed or reloaded
struct SixelOptions {
    int paletteSize = 1024;       // Power of two, 2..2048
    bool fastMode = false;        // Caps the effective palette at 64 colors
    int alphaThreshold = 102;     // Alpha below this is transparent (~40% of 255)
    int samplesPerColor = 64;     // Sampling window per target color, 0 = every pixel
    int colorCacheSize = 256;     // Nearest-color FIFO cache entries, 0 = off
    bool dither = true;
    bool allowTransparency = true;

    static constexpr int MIN_PALETTE_SIZE = 2;
    static constexpr int MAX_PALETTE_SIZE = 2048;
    static constexpr int FAST_MODE_PALETTE_SIZE = 64;

    static bool IsValidPaletteSize(int size) {
        return size >= MIN_PALETTE_SIZE && size <= MAX_PALETTE_SIZE && (size & (size - 1)) == 0;
    }

    int EffectivePaletteSize() const {
        return fastMode && paletteSize > FAST_MODE_PALETTE_SIZE ? FAST_MODE_PALETTE_SIZE : paletteSize;
    }
};

} // namespace TermCanvas::Graphics
