#include "graphics/SixelEncoder.h"
#include <algorithm>
#include <map>
#include <spdlog/spdlog.h>

namespace TermCanvas::Graphics {

namespace {

constexpr int kSixelRows = 6;
constexpr char kSixelBase = 63;   // '?'

void AppendRun(std::string& out, uint8_t mask, int run) {
    char byte = static_cast<char>(kSixelBase + mask);
    if (run >= 2) {
        out += '!';
        out += std::to_string(run);
        out += byte;
    } else if (run == 1) {
        out += byte;
    }
}

} // namespace

SixelEncoder::SixelEncoder(const SixelOptions& options)
    : m_options()
    , m_lastTransparent(false)
{
    ReloadOptions(options);
}

void SixelEncoder::ReloadOptions(const SixelOptions& options) {
    int paletteSize = m_options.paletteSize;
    m_options = options;
    m_options.paletteSize = paletteSize;

    if (!SetPaletteSize(options.paletteSize)) {
        spdlog::warn("Keeping sixel palette size {}", m_options.paletteSize);
    }
    spdlog::debug("SixelEncoder options: palette {}, fast mode {}, dither {}",
                  m_options.paletteSize, m_options.fastMode, m_options.dither);
}

bool SixelEncoder::SetPaletteSize(int paletteSize) {
    if (!SixelOptions::IsValidPaletteSize(paletteSize)) {
        spdlog::warn("Invalid sixel palette size {}: must be a power of two from {} to {}",
                     paletteSize, SixelOptions::MIN_PALETTE_SIZE, SixelOptions::MAX_PALETTE_SIZE);
        return false;
    }
    m_options.paletteSize = paletteSize;
    return true;
}

SixelResult SixelEncoder::Encode(const Bitmap& bitmap) {
    SixelResult result;

    SixelPalette palette(bitmap, GetEffectivePaletteSize(), m_options);
    if (!palette.IsValid()) {
        result.status = palette.GetStatus();
        result.errorMessage = palette.GetErrorMessage();
        spdlog::error("Sixel encode failed: {}", result.errorMessage);
        return result;
    }

    // Exact palettes have no quantization error to spread
    bool dither = m_options.dither &&
                  palette.GetQuantizationType() == QuantizationType::MedianCut;
    std::vector<int> indices = dither ? DitherPixels(bitmap, palette)
                                      : MapPixels(bitmap, palette);

    result.data = Serialize(indices, bitmap.GetWidth(), bitmap.GetHeight(), palette);
    result.transparent = palette.IsTransparent();
    result.quantization = palette.GetQuantizationType();
    result.paletteColors = static_cast<int>(palette.GetColorCount());
    m_lastTransparent = result.transparent;

    spdlog::debug("Sixel encode {}x{}: {} colors ({}), {} bytes{}",
                  bitmap.GetWidth(), bitmap.GetHeight(), result.paletteColors,
                  ToString(result.quantization), result.data.size(),
                  result.transparent ? ", transparent" : "");
    return result;
}

std::vector<int> SixelEncoder::MapPixels(const Bitmap& bitmap, SixelPalette& palette) const {
    const int width = bitmap.GetWidth();
    const int height = bitmap.GetHeight();
    std::vector<int> indices(static_cast<size_t>(width) * height, SixelPalette::TRANSPARENT_INDEX);

    const bool directIndexed = palette.GetQuantizationType() == QuantizationType::DirectIndexed;
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            int& index = indices[static_cast<size_t>(y) * width + x];
            if (directIndexed) {
                index = palette.MapSourceIndex(bitmap.GetIndex(x, y));
                continue;
            }

            uint32_t argb = bitmap.GetPixel(x, y);
            if (!palette.IsTransparentPixel(argb)) {
                index = palette.MatchColor(SixelPalette::ToSixelColor(argb));
            }
        }
    }
    return indices;
}

std::vector<int> SixelEncoder::DitherPixels(const Bitmap& bitmap, SixelPalette& palette) const {
    const int width = bitmap.GetWidth();
    const int height = bitmap.GetHeight();
    const size_t count = static_cast<size_t>(width) * height;

    // Working copy in sixel space; error accumulates here
    std::vector<int> channels(count * 3);
    std::vector<uint8_t> opaque(count);
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            size_t i = static_cast<size_t>(y) * width + x;
            uint32_t argb = bitmap.GetPixel(x, y);
            uint32_t color = SixelPalette::ToSixelColor(argb);
            opaque[i] = palette.IsTransparentPixel(argb) ? 0 : 1;
            channels[i * 3 + 0] = SixelPalette::SixelRed(color);
            channels[i * 3 + 1] = SixelPalette::SixelGreen(color);
            channels[i * 3 + 2] = SixelPalette::SixelBlue(color);
        }
    }

    auto spread = [&](int x, int y, const int err[3], int weight) {
        if (x < 0 || x >= width || y >= height) {
            return;
        }
        size_t i = static_cast<size_t>(y) * width + x;
        if (!opaque[i]) {
            return;
        }
        for (int c = 0; c < 3; ++c) {
            channels[i * 3 + c] += err[c] * weight / 6;
        }
    };

    std::vector<int> indices(count, SixelPalette::TRANSPARENT_INDEX);
    const auto& colors = palette.GetColors();
    for (int y = 0; y < height; ++y) {
        for (int x = 0; x < width; ++x) {
            size_t i = static_cast<size_t>(y) * width + x;
            if (!opaque[i]) {
                continue;
            }

            int r = std::clamp(channels[i * 3 + 0], 0, 100);
            int g = std::clamp(channels[i * 3 + 1], 0, 100);
            int b = std::clamp(channels[i * 3 + 2], 0, 100);
            int index = palette.MatchColor(SixelPalette::PackSixelColor(r, g, b));
            indices[i] = index;

            uint32_t chosen = colors[index];
            int err[3] = {
                r - SixelPalette::SixelRed(chosen),
                g - SixelPalette::SixelGreen(chosen),
                b - SixelPalette::SixelBlue(chosen)
            };

            // Right and lower-right; the last column sends lower-left and down
            if (x < width - 1) {
                spread(x + 1, y, err, 3);
                spread(x + 1, y + 1, err, 1);
            } else {
                spread(x - 1, y + 1, err, 1);
                spread(x, y + 1, err, 2);
            }
        }
    }
    return indices;
}

std::string SixelEncoder::Serialize(const std::vector<int>& indices, int width, int height,
                                    const SixelPalette& palette) {
    const auto& colors = palette.GetColors();
    std::string out;
    out.reserve(static_cast<size_t>(width) * height / 2 + 64);

    // Raster attributes: 1:1 aspect, full image size
    out += "\"1;1;";
    out += std::to_string(width);
    out += ';';
    out += std::to_string(height);

    std::vector<bool> referenced(colors.size(), false);
    for (int index : indices) {
        if (index >= 0) {
            referenced[index] = true;
        }
    }
    for (size_t i = 0; i < colors.size(); ++i) {
        if (!referenced[i]) {
            continue;
        }
        out += '#';
        out += std::to_string(i);
        out += ";2;";
        out += std::to_string(SixelPalette::SixelRed(colors[i]));
        out += ';';
        out += std::to_string(SixelPalette::SixelGreen(colors[i]));
        out += ';';
        out += std::to_string(SixelPalette::SixelBlue(colors[i]));
    }

    for (int top = 0; top < height; top += kSixelRows) {
        if (top > 0) {
            out += '-';
        }

        // Row masks per color used in this band, in index order
        std::map<int, std::vector<uint8_t>> bandColors;
        const int rows = std::min(kSixelRows, height - top);
        for (int row = 0; row < rows; ++row) {
            const int* line = indices.data() + static_cast<size_t>(top + row) * width;
            for (int x = 0; x < width; ++x) {
                if (line[x] < 0) {
                    continue;
                }
                auto& masks = bandColors[line[x]];
                if (masks.empty()) {
                    masks.resize(width, 0);
                }
                masks[x] |= static_cast<uint8_t>(1 << row);
            }
        }

        for (const auto& [index, masks] : bandColors) {
            out += "$#";
            out += std::to_string(index);

            uint8_t current = masks[0];
            int run = 0;
            for (uint8_t mask : masks) {
                if (mask == current) {
                    ++run;
                } else {
                    AppendRun(out, current, run);
                    current = mask;
                    run = 1;
                }
            }
            AppendRun(out, current, run);
        }
    }

    return out;
}

std::string SixelEncoder::ToDcs(const SixelResult& result) {
    if (!result.IsOk() || result.data.empty()) {
        return std::string();
    }

    std::string dcs = result.transparent ? "\033P0;1;0q" : "\033Pq";
    dcs += result.data;
    dcs += "\033\\";
    return dcs;
}

} // namespace TermCanvas::Graphics
