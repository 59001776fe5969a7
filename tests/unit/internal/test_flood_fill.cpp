/**
 * @file test_flood_fill.cpp
 * @brief Unit tests for Internal/FloodFill
 */

#include <gtest/gtest.h>
#include <PathoMorph/Internal/FloodFill.h>

#include <numeric>
#include <vector>

using namespace Patho::Morph;
using namespace Patho::Morph::Internal;

namespace {

size_t CountVisited(const std::vector<uint8_t>& visited) {
    return static_cast<size_t>(std::accumulate(visited.begin(), visited.end(), 0));
}

std::vector<uint8_t> FreshMask(const ChannelImage& channel) {
    return std::vector<uint8_t>(channel.PixelCount(), 0);
}

} // anonymous namespace

TEST(FloodFillTest, FillsBlock) {
    ChannelImage img(20, 20, 0);
    img.FillRect(Rect2i(5, 5, 6, 4), 200);
    auto visited = FreshMask(img);

    FloodFillResult r = FloodFill(img, visited, Point2i(6, 6), 128, Connectivity::Eight, 1000);
    EXPECT_EQ(r.pixels.size(), 24u);
    EXPECT_FALSE(r.truncated);
    EXPECT_EQ(CountVisited(visited), 24u);
}

TEST(FloodFillTest, SeedAtOrBelowThresholdYieldsNothing) {
    ChannelImage img(10, 10, 128);
    auto visited = FreshMask(img);

    FloodFillResult r = FloodFill(img, visited, Point2i(3, 3), 128, Connectivity::Four, 100);
    EXPECT_TRUE(r.pixels.empty());
    EXPECT_EQ(CountVisited(visited), 0u);
}

TEST(FloodFillTest, VisitedSeedYieldsNothing) {
    ChannelImage img(10, 10, 255);
    auto visited = FreshMask(img);
    visited[0] = 1;

    FloodFillResult r = FloodFill(img, visited, Point2i(0, 0), 10, Connectivity::Four, 100);
    EXPECT_TRUE(r.pixels.empty());
}

TEST(FloodFillTest, OutOfBoundsSeedYieldsNothing) {
    ChannelImage img(10, 10, 255);
    auto visited = FreshMask(img);

    FloodFillResult r = FloodFill(img, visited, Point2i(10, 2), 10, Connectivity::Four, 100);
    EXPECT_TRUE(r.pixels.empty());
}

TEST(FloodFillTest, DiagonalNeighborsDependOnConnectivity) {
    ChannelImage img(5, 5, 0);
    img.SetAt(1, 1, 255);
    img.SetAt(2, 2, 255);
    img.SetAt(3, 3, 255);

    auto visited4 = FreshMask(img);
    EXPECT_EQ(FloodFill(img, visited4, Point2i(1, 1), 0, Connectivity::Four, 100).pixels.size(), 1u);

    auto visited8 = FreshMask(img);
    EXPECT_EQ(FloodFill(img, visited8, Point2i(1, 1), 0, Connectivity::Eight, 100).pixels.size(), 3u);
}

TEST(FloodFillTest, CapTruncatesAndReleasesFrontier) {
    ChannelImage img(10, 10, 255);
    auto visited = FreshMask(img);

    FloodFillResult r = FloodFill(img, visited, Point2i(0, 0), 128, Connectivity::Four, 30);
    EXPECT_EQ(r.pixels.size(), 30u);
    EXPECT_TRUE(r.truncated);
    // Only pixels that became members stay marked
    EXPECT_EQ(CountVisited(visited), 30u);
}

TEST(FloodFillTest, ExactCapIsNotTruncated) {
    ChannelImage img(10, 10, 0);
    img.FillRect(Rect2i(0, 0, 5, 2), 255);
    auto visited = FreshMask(img);

    FloodFillResult r = FloodFill(img, visited, Point2i(0, 0), 128, Connectivity::Eight, 10);
    EXPECT_EQ(r.pixels.size(), 10u);
    EXPECT_FALSE(r.truncated);
}

TEST(FloodFillTest, LargeRegionDoesNotRecurse) {
    // A full-frame component of one million pixels
    ChannelImage img(1000, 1000, 255);
    auto visited = FreshMask(img);

    FloodFillResult r = FloodFill(img, visited, Point2i(500, 500), 0, Connectivity::Eight,
                                  2000000);
    EXPECT_EQ(r.pixels.size(), 1000000u);
    EXPECT_FALSE(r.truncated);
}

TEST(FloodFillTest, MembersAreUnique) {
    ChannelImage img(30, 30, 0);
    img.FillRect(Rect2i(2, 2, 20, 20), 180);
    auto visited = FreshMask(img);

    FloodFillResult r = FloodFill(img, visited, Point2i(10, 10), 100, Connectivity::Eight, 10000);
    std::vector<uint8_t> seen(img.PixelCount(), 0);
    for (const auto& p : r.pixels) {
        size_t idx = static_cast<size_t>(p.y) * img.Width() + p.x;
        ASSERT_EQ(seen[idx], 0) << "duplicate pixel " << p.x << "," << p.y;
        seen[idx] = 1;
    }
    EXPECT_EQ(r.pixels.size(), 400u);
}
