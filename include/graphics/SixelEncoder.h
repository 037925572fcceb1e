#pragma once

#include "graphics/Bitmap.h"
#include "graphics/SixelOptions.h"
#include "graphics/SixelPalette.h"
#include <atomic>
#include <string>
#include <vector>

namespace TermCanvas::Graphics {

// Outcome of one encode; data is empty unless status is Ok
struct SixelResult {
    SixelStatus status = SixelStatus::Ok;
    std::string errorMessage;
    std::string data;             // Raster header, palette and bands
    bool transparent = false;     // Some pixel maps to no color
    QuantizationType quantization = QuantizationType::DirectMap;
    int paletteColors = 0;

    bool IsOk() const { return status == SixelStatus::Ok; }
};

/**
 * @brief Converts bitmaps into sixel data
 *
 * Each call to Encode builds its own palette and buffers, so one encoder
 * can serve several threads as long as the options are not changed at
 * the same time.
 */
class SixelEncoder {
public:
    explicit SixelEncoder(const SixelOptions& options = SixelOptions());

    // Replace the options; an invalid palette size keeps the current one
    void ReloadOptions(const SixelOptions& options);
    const SixelOptions& GetOptions() const { return m_options; }

    int GetPaletteSize() const { return m_options.paletteSize; }
    [[nodiscard]] bool SetPaletteSize(int paletteSize);
    int GetEffectivePaletteSize() const { return m_options.EffectivePaletteSize(); }
    bool IsFastMode() const { return m_options.fastMode; }
    void SetFastMode(bool fastMode) { m_options.fastMode = fastMode; }

    SixelResult Encode(const Bitmap& bitmap);

    // Transparency flag of the last successful encode
    bool IsTransparent() const { return m_lastTransparent; }

    // Wrap the data in a device control string (ESC P ... ESC \)
    static std::string ToDcs(const SixelResult& result);

private:
    // Palette index per pixel, SixelPalette::TRANSPARENT_INDEX for none
    std::vector<int> MapPixels(const Bitmap& bitmap, SixelPalette& palette) const;
    std::vector<int> DitherPixels(const Bitmap& bitmap, SixelPalette& palette) const;

    static std::string Serialize(const std::vector<int>& indices, int width, int height,
                                 const SixelPalette& palette);

    SixelOptions m_options;
    std::atomic<bool> m_lastTransparent;
};

} // namespace TermCanvas::Graphics
