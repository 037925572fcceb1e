// test_pca_search.cpp - Nearest-color search against brute force

#include <gtest/gtest.h>
#include "graphics/PcaColorSearch.h"
#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

namespace TermCanvas::Graphics {
namespace Tests {

namespace {

uint32_t Pack(int r, int g, int b) {
    return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8) |
           static_cast<uint32_t>(b);
}

int DistanceSq(uint32_t a, uint32_t b) {
    int dr = static_cast<int>((a >> 16) & 0xFF) - static_cast<int>((b >> 16) & 0xFF);
    int dg = static_cast<int>((a >> 8) & 0xFF) - static_cast<int>((b >> 8) & 0xFF);
    int db = static_cast<int>(a & 0xFF) - static_cast<int>(b & 0xFF);
    return dr * dr + dg * dg + db * db;
}

int BruteForceDistance(const std::vector<uint32_t>& palette, uint32_t color) {
    int best = DistanceSq(palette[0], color);
    for (uint32_t entry : palette) {
        best = std::min(best, DistanceSq(entry, color));
    }
    return best;
}

} // namespace

// ============================================================================
// Basic Lookups
// ============================================================================

TEST(PcaColorSearchTest, EmptyPaletteReturnsMinusOne) {
    PcaColorSearch search;
    EXPECT_TRUE(search.IsEmpty());
    EXPECT_EQ(search.FindNearest(Pack(10, 10, 10)), -1);
}

TEST(PcaColorSearchTest, SingleEntry) {
    PcaColorSearch search({Pack(50, 50, 50)});
    EXPECT_EQ(search.FindNearest(Pack(0, 0, 0)), 0);
    EXPECT_EQ(search.FindNearest(Pack(100, 100, 100)), 0);
}

TEST(PcaColorSearchTest, ExactMatchesReturnTheirIndex) {
    std::vector<uint32_t> palette = {
        Pack(0, 0, 0), Pack(100, 0, 0), Pack(0, 100, 0), Pack(0, 0, 100), Pack(100, 100, 100)
    };
    PcaColorSearch search(palette);
    for (size_t i = 0; i < palette.size(); ++i) {
        EXPECT_EQ(search.FindNearest(palette[i]), static_cast<int>(i));
    }
}

TEST(PcaColorSearchTest, GrayRampAxisFollowsDiagonal) {
    std::vector<uint32_t> palette;
    for (int v = 0; v <= 100; v += 10) {
        palette.push_back(Pack(v, v, v));
    }
    PcaColorSearch search(palette);

    const auto& axis = search.GetPrincipalAxis();
    double expected = 1.0 / std::sqrt(3.0);
    EXPECT_NEAR(std::fabs(axis[0]), expected, 1e-6);
    EXPECT_NEAR(std::fabs(axis[1]), expected, 1e-6);
    EXPECT_NEAR(std::fabs(axis[2]), expected, 1e-6);

    EXPECT_EQ(search.FindNearest(Pack(41, 42, 39)), 4);
}

TEST(PcaColorSearchTest, DegeneratePaletteFallsBackToRedAxis) {
    PcaColorSearch search({Pack(20, 30, 40), Pack(20, 30, 40)});
    const auto& axis = search.GetPrincipalAxis();
    EXPECT_DOUBLE_EQ(axis[0], 1.0);
    EXPECT_DOUBLE_EQ(axis[1], 0.0);
    EXPECT_DOUBLE_EQ(axis[2], 0.0);
    EXPECT_EQ(search.FindNearest(Pack(0, 0, 0)), 0);
}

TEST(PcaColorSearchTest, TiesResolveToLowerIndex) {
    PcaColorSearch search({Pack(40, 50, 50), Pack(60, 50, 50)});
    EXPECT_EQ(search.FindNearest(Pack(50, 50, 50)), 0);
}

// ============================================================================
// Brute-force Cross-check
// ============================================================================

TEST(PcaColorSearchTest, MatchesBruteForceOnRandomPalettes) {
    std::mt19937 rng(12345);
    std::uniform_int_distribution<int> channel(0, 100);
    std::uniform_int_distribution<int> size(2, 64);

    for (int round = 0; round < 50; ++round) {
        std::vector<uint32_t> palette(size(rng));
        for (auto& color : palette) {
            color = Pack(channel(rng), channel(rng), channel(rng));
        }
        PcaColorSearch search(palette);

        for (int q = 0; q < 200; ++q) {
            uint32_t query = Pack(channel(rng), channel(rng), channel(rng));
            int index = search.FindNearest(query);
            ASSERT_GE(index, 0);
            ASSERT_LT(index, static_cast<int>(palette.size()));
            EXPECT_EQ(DistanceSq(palette[index], query), BruteForceDistance(palette, query))
                << "round " << round << " query " << std::hex << query;
        }
    }
}

TEST(PcaColorSearchTest, MatchesBruteForceOnClusteredPalette) {
    // Colors spread along one direction with small noise
    std::mt19937 rng(777);
    std::uniform_int_distribution<int> noise(-3, 3);
    std::uniform_int_distribution<int> channel(0, 100);

    std::vector<uint32_t> palette;
    for (int t = 0; t < 90; t += 3) {
        int r = std::clamp(t + noise(rng), 0, 100);
        int g = std::clamp(t / 2 + 20 + noise(rng), 0, 100);
        int b = std::clamp(90 - t + noise(rng), 0, 100);
        palette.push_back(Pack(r, g, b));
    }
    PcaColorSearch search(palette);

    for (int q = 0; q < 500; ++q) {
        uint32_t query = Pack(channel(rng), channel(rng), channel(rng));
        int index = search.FindNearest(query);
        ASSERT_GE(index, 0);
        EXPECT_EQ(DistanceSq(palette[index], query), BruteForceDistance(palette, query));
    }
}

} // namespace Tests
} // namespace TermCanvas::Graphics
