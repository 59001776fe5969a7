/**
 * @file test_morphometry.cpp
 * @brief Unit tests for Measure/Morphometry
 */

#include <gtest/gtest.h>
#include <PathoMorph/Measure/Morphometry.h>
#include <PathoMorph/Core/Constants.h>
#include <PathoMorph/Core/Exception.h>

#include "TestImages.h"

#include <vector>

using namespace Patho::Morph;
using namespace Patho::Morph::Measure;

namespace {

Region MakeRegion(std::vector<Point2i> pixels, double meanIntensity = 0.0) {
    Region region;
    region.area = static_cast<int64_t>(pixels.size());
    region.pixels = std::move(pixels);
    region.meanIntensity = meanIntensity;
    return region;
}

} // anonymous namespace

class MorphometryTest : public ::testing::Test {
protected:
    MorphometricAnalyzer analyzer_;
};

// ============================================================================
// Shape
// ============================================================================

TEST_F(MorphometryTest, SquareRegion) {
    RegionMorphometry m = analyzer_.Analyze(MakeRegion(TestImages::RectPixels(0, 0, 20, 20)));
    EXPECT_EQ(m.area, 400);
    EXPECT_EQ(m.perimeter, 80);
    EXPECT_EQ(m.hull.size(), 4u);
    EXPECT_DOUBLE_EQ(m.hullArea, 361.0);
    EXPECT_DOUBLE_EQ(m.shapeComplexity, 0.0);
    EXPECT_NEAR(m.circularity, 0.785, 1e-3);
    EXPECT_DOUBLE_EQ(m.elongation, 1.0);
    EXPECT_DOUBLE_EQ(m.centroid.x, 9.5);
    EXPECT_EQ(m.boundingBox, Rect2i(0, 0, 20, 20));
}

TEST_F(MorphometryTest, ElongatedRegion) {
    RegionMorphometry m = analyzer_.Analyze(MakeRegion(TestImages::RectPixels(3, 3, 10, 40)));
    EXPECT_DOUBLE_EQ(m.elongation, 4.0);
    EXPECT_LT(m.circularity, 0.785);
}

TEST_F(MorphometryTest, StarIsIrregular) {
    RegionMorphometry m = analyzer_.Analyze(MakeRegion(TestImages::StarPixels(40, 40, 30, 12)));
    EXPECT_GT(m.shapeComplexity, 0.3);
    EXPECT_LE(m.shapeComplexity, 1.0);
    EXPECT_GE(m.hull.size(), 5u);
}

TEST_F(MorphometryTest, StarMoreIrregularThanConvexRegionOfSameArea) {
    std::vector<Point2i> star = TestImages::StarPixels(40, 40, 30, 12);
    const size_t area = star.size();

    // Convex block with the same pixel count: full rows plus one partial row
    int32_t side = 1;
    while (static_cast<size_t>(side) * side < area) ++side;
    std::vector<Point2i> block;
    for (int32_t y = 0; block.size() < area; ++y) {
        for (int32_t x = 0; x < side && block.size() < area; ++x) {
            block.emplace_back(x, y);
        }
    }

    RegionMorphometry starM = analyzer_.Analyze(MakeRegion(star));
    RegionMorphometry blockM = analyzer_.Analyze(MakeRegion(block));
    ASSERT_EQ(starM.area, blockM.area);
    EXPECT_GT(starM.shapeComplexity, blockM.shapeComplexity);
    EXPECT_LT(blockM.shapeComplexity, 0.05);
}

TEST_F(MorphometryTest, PerimeterFromDetectorIsReused) {
    Region region = MakeRegion(TestImages::RectPixels(0, 0, 5, 5));
    EXPECT_EQ(analyzer_.Analyze(region).perimeter, 20);

    region.perimeter = 20;
    EXPECT_EQ(analyzer_.Analyze(region).perimeter, 20);
}

TEST_F(MorphometryTest, SinglePixelHasNoHull) {
    RegionMorphometry m = analyzer_.Analyze(MakeRegion({Point2i(4, 4)}));
    EXPECT_EQ(m.area, 1);
    EXPECT_EQ(m.perimeter, 4);
    EXPECT_TRUE(m.hull.empty());
    EXPECT_DOUBLE_EQ(m.hullArea, 0.0);
    EXPECT_DOUBLE_EQ(m.shapeComplexity, 0.0);
    EXPECT_DOUBLE_EQ(m.circularity, PI / 4.0);
}

TEST_F(MorphometryTest, EmptyRegion) {
    RegionMorphometry m = analyzer_.Analyze(Region());
    EXPECT_EQ(m.area, 0);
    EXPECT_EQ(m.perimeter, 0);
    EXPECT_DOUBLE_EQ(m.elongation, 1.0);
}

TEST_F(MorphometryTest, TruncationCarriedThrough) {
    Region region = MakeRegion(TestImages::RectPixels(0, 0, 3, 3));
    region.truncated = true;
    EXPECT_TRUE(analyzer_.Analyze(region).truncated);
}

// ============================================================================
// Intensity
// ============================================================================

TEST_F(MorphometryTest, IntensityFromDetector) {
    RegionMorphometry m = analyzer_.Analyze(MakeRegion(TestImages::RectPixels(0, 0, 3, 3), 204.0));
    EXPECT_DOUBLE_EQ(m.meanIntensity, 0.8);
}

TEST_F(MorphometryTest, IntensityFromOtherChannel) {
    ChannelImage channel = TestImages::BlockChannel(10, 10, 0, 0, 0, 2, 3, 255);
    RegionMorphometry m = analyzer_.Analyze(MakeRegion(TestImages::RectPixels(0, 0, 4, 3)),
                                            channel);
    EXPECT_DOUBLE_EQ(m.meanIntensity, 0.5);
}

TEST_F(MorphometryTest, IntensityOutsideChannelThrows) {
    ChannelImage channel(5, 5, 10);
    EXPECT_THROW(MeanIntensity({Point2i(5, 0)}, channel), InvalidArgumentException);
    EXPECT_DOUBLE_EQ(MeanIntensity({}, channel), 0.0);
}

// ============================================================================
// Batch
// ============================================================================

TEST_F(MorphometryTest, AnalyzeAllPreservesOrder) {
    std::vector<Region> regions;
    for (int32_t i = 0; i < 500; ++i) {
        int32_t side = 1 + i % 7;
        regions.push_back(MakeRegion(TestImages::RectPixels(i, 0, side, side)));
    }

    auto results = analyzer_.AnalyzeAll(regions);
    ASSERT_EQ(results.size(), regions.size());
    for (size_t i = 0; i < results.size(); ++i) {
        int64_t side = 1 + static_cast<int64_t>(i) % 7;
        ASSERT_EQ(results[i].area, side * side) << "region " << i;
        ASSERT_EQ(results[i].boundingBox.x, static_cast<int32_t>(i));
    }
}

TEST_F(MorphometryTest, AnalyzeAllWithChannel) {
    ChannelImage channel(50, 50, 102);
    std::vector<Region> regions = {MakeRegion(TestImages::RectPixels(0, 0, 5, 5)),
                                   MakeRegion(TestImages::RectPixels(10, 10, 8, 3))};
    auto results = analyzer_.AnalyzeAll(regions, channel);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_DOUBLE_EQ(results[0].meanIntensity, 0.4);
    EXPECT_DOUBLE_EQ(results[1].meanIntensity, 0.4);
}
