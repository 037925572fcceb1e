#pragma once

#include "graphics/Bitmap.h"
#include "graphics/PcaColorSearch.h"
#include "graphics/SixelOptions.h"
#include <cstdint>
#include <deque>
#include <string>
#include <unordered_map>
#include <vector>

namespace TermCanvas::Graphics {

enum class QuantizationType {
    DirectIndexed,   // Source color table reused as-is
    DirectMap,       // One slot per distinct color
    MedianCut
};

enum class SixelStatus {
    Ok,
    EmptyImage,
    FormatUnsupported
};

const char* ToString(QuantizationType type);
const char* ToString(SixelStatus status);

/**
 * @brief Color table built for one encode
 *
 * Chooses the cheapest exact strategy that fits the requested size and
 * falls back to median cut. Colors are stored in sixel space: 0x00RRGGBB
 * with each channel scaled to 0-100.
 *
 * Not thread-safe; MatchColor updates the lookup cache.
 */
class SixelPalette {
public:
    static constexpr int TRANSPARENT_INDEX = -1;
    static constexpr uint32_t SIXEL_BLACK = 0x000000;
    static constexpr uint32_t SIXEL_WHITE = 0x646464;

    // Squared distance within which a color is treated as pure black/white
    static constexpr int BLACK_WHITE_THRESHOLD_SQ = 64;

    SixelPalette(const Bitmap& bitmap, int paletteSize, const SixelOptions& options);

    SixelStatus GetStatus() const { return m_status; }
    const std::string& GetErrorMessage() const { return m_errorMessage; }
    bool IsValid() const { return m_status == SixelStatus::Ok; }

    QuantizationType GetQuantizationType() const { return m_type; }
    const std::vector<uint32_t>& GetColors() const { return m_colors; }
    size_t GetColorCount() const { return m_colors.size(); }

    // True once any pixel has been classified as transparent
    bool IsTransparent() const { return m_transparent; }

    // True if this ARGB pixel is mapped to TRANSPARENT_INDEX
    bool IsTransparentPixel(uint32_t argb) const;

    // Palette index for an indexed bitmap's own index
    int MapSourceIndex(int sourceIndex) const;

    /**
     * @brief Palette index for a sixel color
     *
     * Exact sampled colors resolve through the color map; near-black and
     * near-white go to the pure entries when present; anything else uses
     * the cache and then the nearest-color search.
     */
    int MatchColor(uint32_t sixelColor);

    // True nearest palette entry by Euclidean distance, -1 if empty
    int FindNearestColor(uint32_t sixelColor) const;

    // 8-bit ARGB to sixel space (c * 100 / 255), alpha dropped
    static uint32_t ToSixelColor(uint32_t argb);
    static uint32_t PackSixelColor(int r, int g, int b);
    static int SixelRed(uint32_t color) { return static_cast<int>((color >> 16) & 0xFF); }
    static int SixelGreen(uint32_t color) { return static_cast<int>((color >> 8) & 0xFF); }
    static int SixelBlue(uint32_t color) { return static_cast<int>(color & 0xFF); }
    static int DistanceSq(uint32_t a, uint32_t b);

private:
    struct ColorCount {
        uint32_t color;
        uint32_t count;
    };
    using Bucket = std::vector<ColorCount>;

    void BuildDirectIndexed(const Bitmap& bitmap, int paletteSize);
    bool TryDirectMap(const Bitmap& bitmap, int paletteSize);
    void BuildMedianCut(const Bitmap& bitmap, int paletteSize);

    std::unordered_map<uint32_t, uint32_t> CountColors(const Bitmap& bitmap, int step) const;
    static std::pair<Bucket, Bucket> SplitBucket(Bucket bucket);
    static uint32_t AverageColor(const Bucket& bucket);
    void SnapBlackAndWhite();
    void FindPureEntries();

    void CacheStore(uint32_t color, int index);

    SixelOptions m_options;
    SixelStatus m_status;
    std::string m_errorMessage;
    QuantizationType m_type;
    bool m_transparent;

    std::vector<uint32_t> m_colors;
    std::unordered_map<uint32_t, int> m_colorMap;   // Exact sampled color -> index
    std::vector<int> m_sourceIndexMap;              // Direct-indexed only
    int m_blackIndex;
    int m_whiteIndex;

    PcaColorSearch m_search;                        // Median cut only
    std::unordered_map<uint32_t, int> m_cache;
    std::deque<uint32_t> m_cacheOrder;
};

} // namespace TermCanvas::Graphics
