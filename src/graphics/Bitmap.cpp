#include "graphics/Bitmap.h"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace TermCanvas::Graphics {

Bitmap::Bitmap()
    : m_width(0)
    , m_height(0)
    , m_indexed(false)
    , m_transparentIndex(-1)
    , m_storage(IndexStorage::Byte)
{
}

Bitmap::Bitmap(int width, int height, uint32_t fill)
    : m_width(std::max(width, 0))
    , m_height(std::max(height, 0))
    , m_indexed(false)
    , m_transparentIndex(-1)
    , m_storage(IndexStorage::Byte)
{
    m_pixels.assign(static_cast<size_t>(m_width) * m_height, fill);
}

Bitmap Bitmap::FromRgba(int width, int height, const uint8_t* data, int channels) {
    if (!data || width <= 0 || height <= 0) {
        spdlog::error("Bitmap::FromRgba: no pixel data ({}x{})", width, height);
        return Bitmap();
    }
    if (channels != 3 && channels != 4) {
        spdlog::error("Bitmap::FromRgba: unsupported channel count {}", channels);
        return Bitmap();
    }

    Bitmap bitmap(width, height);
    const uint8_t* p = data;
    for (uint32_t& pixel : bitmap.m_pixels) {
        uint8_t a = channels == 4 ? p[3] : 0xFF;
        pixel = Argb(a, p[0], p[1], p[2]);
        p += channels;
    }
    return bitmap;
}

Bitmap Bitmap::Indexed(int width, int height, std::vector<uint32_t> colorTable,
                       int transparentIndex, IndexStorage storage) {
    Bitmap bitmap;
    bitmap.m_width = std::max(width, 0);
    bitmap.m_height = std::max(height, 0);
    bitmap.m_indexed = true;
    bitmap.m_colorTable = std::move(colorTable);
    bitmap.m_transparentIndex = transparentIndex;
    bitmap.m_storage = storage;
    bitmap.m_indices.assign(static_cast<size_t>(bitmap.m_width) * bitmap.m_height, 0);
    return bitmap;
}

uint32_t Bitmap::GetPixel(int x, int y) const {
    if (!InBounds(x, y)) {
        return 0;
    }
    if (!m_indexed) {
        return m_pixels[PixelIndex(x, y)];
    }

    int index = m_indices[PixelIndex(x, y)];
    if (index == m_transparentIndex || index >= static_cast<int>(m_colorTable.size())) {
        return 0;
    }
    return m_colorTable[index];
}

void Bitmap::SetPixel(int x, int y, uint32_t argb) {
    if (m_indexed || !InBounds(x, y)) {
        return;
    }
    m_pixels[PixelIndex(x, y)] = argb;
}

void Bitmap::Fill(uint32_t argb) {
    if (m_indexed) {
        return;
    }
    std::fill(m_pixels.begin(), m_pixels.end(), argb);
}

int Bitmap::GetIndex(int x, int y) const {
    if (!m_indexed || !InBounds(x, y)) {
        return -1;
    }
    return m_indices[PixelIndex(x, y)];
}

void Bitmap::SetIndex(int x, int y, int index) {
    if (!m_indexed || !InBounds(x, y) || index < 0) {
        return;
    }
    uint32_t mask = m_storage == IndexStorage::Byte ? 0xFFu : 0xFFFFu;
    m_indices[PixelIndex(x, y)] = static_cast<uint16_t>(static_cast<uint32_t>(index) & mask);
}

} // namespace TermCanvas::Graphics
