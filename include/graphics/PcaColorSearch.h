#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace TermCanvas::Graphics {

/**
 * @brief Nearest-color lookup ordered along the palette's principal axis
 *
 * Palette entries are projected onto the eigenvector of the largest
 * eigenvalue of their covariance matrix and kept sorted by projection.
 * A query starts at the entry with the closest projection and walks
 * outward in both directions; a direction stops once the distance along
 * the axis alone exceeds the best squared distance found, since the axis
 * distance never exceeds the true distance.
 *
 * Colors are sixel colors packed as 0x00RRGGBB with channels 0-100.
 */
class PcaColorSearch {
public:
    PcaColorSearch() = default;
    explicit PcaColorSearch(const std::vector<uint32_t>& palette);

    // Palette index with the smallest Euclidean distance, -1 if empty.
    // Ties resolve to the lower index.
    int FindNearest(uint32_t color) const;

    bool IsEmpty() const { return m_entries.empty(); }
    const std::array<double, 3>& GetPrincipalAxis() const { return m_axis; }

private:
    struct Entry {
        double projection;
        int index;
        int r;
        int g;
        int b;
    };

    double Project(int r, int g, int b) const {
        return r * m_axis[0] + g * m_axis[1] + b * m_axis[2];
    }

    std::vector<Entry> m_entries;   // Sorted by projection
    std::array<double, 3> m_axis = {1.0, 0.0, 0.0};
};

} // namespace TermCanvas::Graphics
