#pragma once

#include <cstdint>
#include <vector>

namespace TermCanvas::Graphics {

/**
 * @brief In-memory image handed to the sixel encoder
 *
 * Direct-color bitmaps store one 0xAARRGGBB value per pixel. Indexed
 * bitmaps store one color table index per pixel, either as bytes or as
 * 16-bit values, and resolve pixels through the table.
 */
class Bitmap {
public:
    enum class IndexStorage {
        Byte,
        Short
    };

    Bitmap();
    Bitmap(int width, int height, uint32_t fill = 0);

    // Pack 3 (RGB) or 4 (RGBA) channel bytes, row-major; empty on bad input
    static Bitmap FromRgba(int width, int height, const uint8_t* data, int channels);

    // Indexed bitmap with every pixel set to index 0
    static Bitmap Indexed(int width, int height, std::vector<uint32_t> colorTable,
                          int transparentIndex = -1,
                          IndexStorage storage = IndexStorage::Byte);

    int GetWidth() const { return m_width; }
    int GetHeight() const { return m_height; }
    bool IsEmpty() const { return m_width <= 0 || m_height <= 0; }

    // ARGB value of a pixel, 0 outside the image
    uint32_t GetPixel(int x, int y) const;

    // Direct-color bitmaps only; indexed bitmaps are written with SetIndex
    void SetPixel(int x, int y, uint32_t argb);
    void Fill(uint32_t argb);

    bool IsIndexed() const { return m_indexed; }
    const std::vector<uint32_t>& GetColorTable() const { return m_colorTable; }
    int GetTransparentIndex() const { return m_transparentIndex; }
    IndexStorage GetIndexStorage() const { return m_storage; }
    int GetIndex(int x, int y) const;
    void SetIndex(int x, int y, int index);

    static uint8_t Alpha(uint32_t argb) { return static_cast<uint8_t>(argb >> 24); }
    static uint8_t Red(uint32_t argb) { return static_cast<uint8_t>(argb >> 16); }
    static uint8_t Green(uint32_t argb) { return static_cast<uint8_t>(argb >> 8); }
    static uint8_t Blue(uint32_t argb) { return static_cast<uint8_t>(argb); }
    static uint32_t Argb(uint8_t a, uint8_t r, uint8_t g, uint8_t b) {
        return (static_cast<uint32_t>(a) << 24) | (static_cast<uint32_t>(r) << 16) |
               (static_cast<uint32_t>(g) << 8) | b;
    }

private:
    bool InBounds(int x, int y) const { return x >= 0 && x < m_width && y >= 0 && y < m_height; }
    int PixelIndex(int x, int y) const { return y * m_width + x; }

    int m_width;
    int m_height;
    std::vector<uint32_t> m_pixels;

    bool m_indexed;
    std::vector<uint32_t> m_colorTable;
    int m_transparentIndex;
    IndexStorage m_storage;
    std::vector<uint16_t> m_indices;
};

} // namespace TermCanvas::Graphics
