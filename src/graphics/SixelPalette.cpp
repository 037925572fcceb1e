#include "graphics/SixelPalette.h"
#include <algorithm>
#include <cassert>
#include <spdlog/spdlog.h>

namespace TermCanvas::Graphics {

namespace {

int LargestPowerOfTwo(int n) {
    int p = 1;
    while (p * 2 <= n) {
        p *= 2;
    }
    return p;
}

} // namespace

const char* ToString(QuantizationType type) {
    switch (type) {
        case QuantizationType::DirectIndexed: return "direct-indexed";
        case QuantizationType::DirectMap:     return "direct-map";
        case QuantizationType::MedianCut:     return "median-cut";
    }
    return "unknown";
}

const char* ToString(SixelStatus status) {
    switch (status) {
        case SixelStatus::Ok:                return "ok";
        case SixelStatus::EmptyImage:        return "empty image";
        case SixelStatus::FormatUnsupported: return "format unsupported";
    }
    return "unknown";
}

SixelPalette::SixelPalette(const Bitmap& bitmap, int paletteSize, const SixelOptions& options)
    : m_options(options)
    , m_status(SixelStatus::Ok)
    , m_type(QuantizationType::DirectMap)
    , m_transparent(false)
    , m_blackIndex(-1)
    , m_whiteIndex(-1)
{
    if (bitmap.IsEmpty()) {
        m_status = SixelStatus::EmptyImage;
        m_errorMessage = "Image has no pixels";
        return;
    }

    if (bitmap.IsIndexed() &&
        static_cast<int>(bitmap.GetColorTable().size()) <= paletteSize) {
        if (bitmap.GetIndexStorage() != Bitmap::IndexStorage::Byte) {
            m_status = SixelStatus::FormatUnsupported;
            m_errorMessage = "Indexed image uses an unsupported index layout";
            return;
        }
        BuildDirectIndexed(bitmap, paletteSize);
    } else {
        for (int y = 0; y < bitmap.GetHeight() && !m_transparent; ++y) {
            for (int x = 0; x < bitmap.GetWidth(); ++x) {
                if (IsTransparentPixel(bitmap.GetPixel(x, y))) {
                    m_transparent = true;
                    break;
                }
            }
        }

        if (TryDirectMap(bitmap, paletteSize)) {
            m_type = QuantizationType::DirectMap;
        } else {
            m_type = QuantizationType::MedianCut;
            BuildMedianCut(bitmap, paletteSize);
        }
    }

    FindPureEntries();
    spdlog::debug("SixelPalette: {} with {} colors (requested {})",
                  ToString(m_type), m_colors.size(), paletteSize);
}

bool SixelPalette::IsTransparentPixel(uint32_t argb) const {
    return m_options.allowTransparency && Bitmap::Alpha(argb) < m_options.alphaThreshold;
}

// ============================================================================
// Strategies
// ============================================================================

void SixelPalette::BuildDirectIndexed(const Bitmap& bitmap, int paletteSize) {
    m_type = QuantizationType::DirectIndexed;

    const auto& table = bitmap.GetColorTable();
    const int transparentIndex = bitmap.GetTransparentIndex();

    m_colors.reserve(table.size());
    m_sourceIndexMap.resize(table.size());
    for (size_t i = 0; i < table.size(); ++i) {
        m_colors.push_back(ToSixelColor(table[i]));
        m_sourceIndexMap[i] = static_cast<int>(i) == transparentIndex
            ? TRANSPARENT_INDEX : static_cast<int>(i);
    }

    // Indices outside the table are holes as well as the transparent index
    for (int y = 0; y < bitmap.GetHeight() && !m_transparent; ++y) {
        for (int x = 0; x < bitmap.GetWidth(); ++x) {
            if (MapSourceIndex(bitmap.GetIndex(x, y)) == TRANSPARENT_INDEX) {
                m_transparent = true;
                break;
            }
        }
    }

    spdlog::trace("SixelPalette: reusing {}-entry color table (limit {})", table.size(), paletteSize);
}

bool SixelPalette::TryDirectMap(const Bitmap& bitmap, int paletteSize) {
    for (int y = 0; y < bitmap.GetHeight(); ++y) {
        for (int x = 0; x < bitmap.GetWidth(); ++x) {
            uint32_t argb = bitmap.GetPixel(x, y);
            if (IsTransparentPixel(argb)) {
                continue;
            }

            uint32_t color = ToSixelColor(argb);
            if (m_colorMap.count(color)) {
                continue;
            }
            if (static_cast<int>(m_colors.size()) == paletteSize) {
                // Too many colors, stop counting
                m_colors.clear();
                m_colorMap.clear();
                return false;
            }
            m_colorMap.emplace(color, static_cast<int>(m_colors.size()));
            m_colors.push_back(color);
        }
    }
    return true;
}

std::unordered_map<uint32_t, uint32_t> SixelPalette::CountColors(const Bitmap& bitmap, int step) const {
    std::unordered_map<uint32_t, uint32_t> histogram;
    const int width = bitmap.GetWidth();
    const int64_t total = static_cast<int64_t>(width) * bitmap.GetHeight();

    for (int64_t i = 0; i < total; i += step) {
        uint32_t argb = bitmap.GetPixel(static_cast<int>(i % width), static_cast<int>(i / width));
        if (IsTransparentPixel(argb)) {
            continue;
        }
        histogram[ToSixelColor(argb)]++;
    }
    return histogram;
}

void SixelPalette::BuildMedianCut(const Bitmap& bitmap, int paletteSize) {
    const int target = LargestPowerOfTwo(paletteSize);
    const int64_t total = static_cast<int64_t>(bitmap.GetWidth()) * bitmap.GetHeight();

    int step = 1;
    const int64_t window = static_cast<int64_t>(paletteSize) * m_options.samplesPerColor;
    if (m_options.samplesPerColor > 0 && total > window) {
        step = static_cast<int>(total / window);
    }

    auto histogram = CountColors(bitmap, step);
    if (step > 1 && static_cast<int>(histogram.size()) < target) {
        spdlog::debug("SixelPalette: sample has {} colors, using full population", histogram.size());
        histogram = CountColors(bitmap, 1);
    }

    Bucket all;
    all.reserve(histogram.size());
    for (const auto& [color, count] : histogram) {
        all.push_back({color, count});
    }
    // Deterministic results regardless of hash order
    std::sort(all.begin(), all.end(),
              [](const ColorCount& a, const ColorCount& b) { return a.color < b.color; });

    // Breadth-first: split buckets in the order they were created
    std::deque<Bucket> buckets;
    buckets.push_back(std::move(all));
    while (static_cast<int>(buckets.size()) < target) {
        bool splittable = std::any_of(buckets.begin(), buckets.end(),
                                      [](const Bucket& b) { return b.size() >= 2; });
        if (!splittable) {
            break;
        }

        Bucket bucket = std::move(buckets.front());
        buckets.pop_front();
        if (bucket.size() < 2) {
            buckets.push_back(std::move(bucket));
            continue;
        }

        auto halves = SplitBucket(std::move(bucket));
        buckets.push_back(std::move(halves.first));
        buckets.push_back(std::move(halves.second));
    }

    m_colors.reserve(buckets.size());
    for (const auto& bucket : buckets) {
        assert(!bucket.empty());
        int index = static_cast<int>(m_colors.size());
        m_colors.push_back(AverageColor(bucket));
        for (const auto& entry : bucket) {
            m_colorMap[entry.color] = index;
        }
    }

    SnapBlackAndWhite();
    m_search = PcaColorSearch(m_colors);
}

std::pair<SixelPalette::Bucket, SixelPalette::Bucket> SixelPalette::SplitBucket(Bucket bucket) {
    assert(bucket.size() >= 2);

    int minC[3] = {255, 255, 255};
    int maxC[3] = {0, 0, 0};
    for (const auto& entry : bucket) {
        int channels[3] = {SixelRed(entry.color), SixelGreen(entry.color), SixelBlue(entry.color)};
        for (int c = 0; c < 3; ++c) {
            minC[c] = std::min(minC[c], channels[c]);
            maxC[c] = std::max(maxC[c], channels[c]);
        }
    }

    int widest = 0;
    for (int c = 1; c < 3; ++c) {
        if (maxC[c] - minC[c] > maxC[widest] - minC[widest]) {
            widest = c;
        }
    }

    const int shift = 16 - widest * 8;
    std::sort(bucket.begin(), bucket.end(), [shift](const ColorCount& a, const ColorCount& b) {
        uint32_t ka = (a.color >> shift) & 0xFF;
        uint32_t kb = (b.color >> shift) & 0xFF;
        return ka < kb || (ka == kb && a.color < b.color);
    });

    uint64_t population = 0;
    for (const auto& entry : bucket) {
        population += entry.count;
    }

    size_t split = 1;
    uint64_t running = 0;
    for (size_t i = 0; i < bucket.size(); ++i) {
        running += bucket[i].count;
        if (running * 2 >= population) {
            split = i + 1;
            break;
        }
    }
    split = std::clamp<size_t>(split, 1, bucket.size() - 1);

    Bucket upper(bucket.begin() + static_cast<std::ptrdiff_t>(split), bucket.end());
    bucket.resize(split);
    return {std::move(bucket), std::move(upper)};
}

uint32_t SixelPalette::AverageColor(const Bucket& bucket) {
    uint64_t sum[3] = {0, 0, 0};
    uint64_t population = 0;
    for (const auto& entry : bucket) {
        sum[0] += static_cast<uint64_t>(SixelRed(entry.color)) * entry.count;
        sum[1] += static_cast<uint64_t>(SixelGreen(entry.color)) * entry.count;
        sum[2] += static_cast<uint64_t>(SixelBlue(entry.color)) * entry.count;
        population += entry.count;
    }
    assert(population > 0);

    return PackSixelColor(static_cast<int>((sum[0] + population / 2) / population),
                          static_cast<int>((sum[1] + population / 2) / population),
                          static_cast<int>((sum[2] + population / 2) / population));
}

void SixelPalette::SnapBlackAndWhite() {
    if (m_colors.empty()) {
        return;
    }

    auto closestTo = [this](uint32_t target) {
        size_t best = 0;
        for (size_t i = 1; i < m_colors.size(); ++i) {
            if (DistanceSq(m_colors[i], target) < DistanceSq(m_colors[best], target)) {
                best = i;
            }
        }
        return best;
    };

    size_t black = closestTo(SIXEL_BLACK);
    if (DistanceSq(m_colors[black], SIXEL_BLACK) <= BLACK_WHITE_THRESHOLD_SQ) {
        m_colors[black] = SIXEL_BLACK;
    }
    size_t white = closestTo(SIXEL_WHITE);
    if (DistanceSq(m_colors[white], SIXEL_WHITE) <= BLACK_WHITE_THRESHOLD_SQ) {
        m_colors[white] = SIXEL_WHITE;
    }
}

void SixelPalette::FindPureEntries() {
    for (size_t i = 0; i < m_colors.size(); ++i) {
        if (m_blackIndex < 0 && m_colors[i] == SIXEL_BLACK) {
            m_blackIndex = static_cast<int>(i);
        }
        if (m_whiteIndex < 0 && m_colors[i] == SIXEL_WHITE) {
            m_whiteIndex = static_cast<int>(i);
        }
    }
}

// ============================================================================
// Matching
// ============================================================================

int SixelPalette::MapSourceIndex(int sourceIndex) const {
    if (sourceIndex < 0 || sourceIndex >= static_cast<int>(m_sourceIndexMap.size())) {
        return TRANSPARENT_INDEX;
    }
    return m_sourceIndexMap[sourceIndex];
}

int SixelPalette::MatchColor(uint32_t sixelColor) {
    auto exact = m_colorMap.find(sixelColor);
    if (exact != m_colorMap.end()) {
        return exact->second;
    }

    if (m_blackIndex >= 0 && DistanceSq(sixelColor, SIXEL_BLACK) <= BLACK_WHITE_THRESHOLD_SQ) {
        return m_blackIndex;
    }
    if (m_whiteIndex >= 0 && DistanceSq(sixelColor, SIXEL_WHITE) <= BLACK_WHITE_THRESHOLD_SQ) {
        return m_whiteIndex;
    }

    auto cached = m_cache.find(sixelColor);
    if (cached != m_cache.end()) {
        return cached->second;
    }

    int index = FindNearestColor(sixelColor);
    CacheStore(sixelColor, index);
    return index;
}

int SixelPalette::FindNearestColor(uint32_t sixelColor) const {
    if (!m_search.IsEmpty()) {
        return m_search.FindNearest(sixelColor);
    }

    int best = -1;
    int bestDist = 0;
    for (size_t i = 0; i < m_colors.size(); ++i) {
        int dist = DistanceSq(m_colors[i], sixelColor);
        if (best < 0 || dist < bestDist) {
            best = static_cast<int>(i);
            bestDist = dist;
        }
    }
    return best;
}

void SixelPalette::CacheStore(uint32_t color, int index) {
    if (m_options.colorCacheSize <= 0) {
        return;
    }
    if (static_cast<int>(m_cacheOrder.size()) >= m_options.colorCacheSize) {
        m_cache.erase(m_cacheOrder.front());
        m_cacheOrder.pop_front();
    }
    m_cache.emplace(color, index);
    m_cacheOrder.push_back(color);
}

// ============================================================================
// Color space
// ============================================================================

uint32_t SixelPalette::ToSixelColor(uint32_t argb) {
    return PackSixelColor(Bitmap::Red(argb) * 100 / 255,
                          Bitmap::Green(argb) * 100 / 255,
                          Bitmap::Blue(argb) * 100 / 255);
}

uint32_t SixelPalette::PackSixelColor(int r, int g, int b) {
    return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) |
           static_cast<uint32_t>(b);
}

int SixelPalette::DistanceSq(uint32_t a, uint32_t b) {
    int dr = SixelRed(a) - SixelRed(b);
    int dg = SixelGreen(a) - SixelGreen(b);
    int db = SixelBlue(a) - SixelBlue(b);
    return dr * dr + dg * dg + db * db;
}

} // namespace TermCanvas::Graphics
