/**
 * @file test_region_features.cpp
 * @brief Unit tests for Internal/RegionFeatures
 */

#include <gtest/gtest.h>
#include <PathoMorph/Internal/RegionFeatures.h>
#include <PathoMorph/Core/Constants.h>

#include "TestImages.h"

#include <cmath>
#include <vector>

using namespace Patho::Morph;
using namespace Patho::Morph::Internal;

// ============================================================================
// Basic Features
// ============================================================================

TEST(RegionFeaturesTest, CentroidOfRectangle) {
    auto pixels = TestImages::RectPixels(10, 20, 5, 3);
    Point2d c = ComputeCentroid(pixels);
    EXPECT_DOUBLE_EQ(c.x, 12.0);
    EXPECT_DOUBLE_EQ(c.y, 21.0);
}

TEST(RegionFeaturesTest, BoundingBoxOfRectangle) {
    auto pixels = TestImages::RectPixels(10, 20, 5, 3);
    EXPECT_EQ(ComputeBoundingBox(pixels), Rect2i(10, 20, 5, 3));
}

TEST(RegionFeaturesTest, EmptySetDefaults) {
    std::vector<Point2i> none;
    EXPECT_DOUBLE_EQ(ComputeCentroid(none).x, 0.0);
    EXPECT_TRUE(ComputeBoundingBox(none).Empty());
    EXPECT_EQ(ComputeEdgePerimeter(none), 0);
}

// ============================================================================
// Perimeter
// ============================================================================

TEST(RegionFeaturesTest, SinglePixelPerimeter) {
    EXPECT_EQ(ComputeEdgePerimeter({Point2i(0, 0)}), 4);
}

TEST(RegionFeaturesTest, SquarePerimeter) {
    EXPECT_EQ(ComputeEdgePerimeter(TestImages::RectPixels(0, 0, 20, 20)), 80);
}

TEST(RegionFeaturesTest, HoleContributesInnerEdges) {
    auto ring = TestImages::RectPixels(0, 0, 3, 3);
    ring.erase(ring.begin() + 4);   // center (1, 1)
    EXPECT_EQ(ComputeEdgePerimeter(ring), 16);
}

// ============================================================================
// Convex Hull
// ============================================================================

TEST(RegionFeaturesTest, HullOfSquareIsCorners) {
    auto hull = ComputeConvexHull(TestImages::RectPixels(0, 0, 20, 20));
    ASSERT_EQ(hull.size(), 4u);
    EXPECT_DOUBLE_EQ(ComputePolygonArea(hull), 361.0);
}

TEST(RegionFeaturesTest, HullOfCollinearIsEmpty) {
    std::vector<Point2i> line;
    for (int32_t x = 0; x < 10; ++x) line.emplace_back(x, 3);
    EXPECT_TRUE(ComputeConvexHull(line).empty());
}

TEST(RegionFeaturesTest, HullOfTwoPointsIsEmpty) {
    EXPECT_TRUE(ComputeConvexHull({Point2i(0, 0), Point2i(5, 5)}).empty());
}

TEST(RegionFeaturesTest, HullIsCounterClockwise) {
    auto hull = ComputeConvexHull({Point2i(0, 0), Point2i(4, 0), Point2i(4, 4),
                                   Point2i(0, 4), Point2i(2, 2)});
    ASSERT_EQ(hull.size(), 4u);
    double signedArea = 0.0;
    for (size_t i = 0; i < hull.size(); ++i) {
        const Point2i& a = hull[i];
        const Point2i& b = hull[(i + 1) % hull.size()];
        signedArea += static_cast<double>(a.x) * b.y - static_cast<double>(b.x) * a.y;
    }
    EXPECT_GT(signedArea, 0.0);
}

TEST(RegionFeaturesTest, PolygonAreaOfTriangle) {
    EXPECT_DOUBLE_EQ(ComputePolygonArea({Point2i(0, 0), Point2i(4, 0), Point2i(0, 3)}), 6.0);
    EXPECT_DOUBLE_EQ(ComputePolygonArea({Point2i(0, 0), Point2i(4, 0)}), 0.0);
}

// ============================================================================
// Shape Descriptors
// ============================================================================

TEST(RegionFeaturesTest, ComplexityClampedForConvexPixelSets) {
    // Pixel count exceeds the corner-hull area for filled rectangles
    EXPECT_DOUBLE_EQ(ComputeShapeComplexity(400.0, 361.0), 0.0);
}

TEST(RegionFeaturesTest, ComplexityOfStarIsHigh) {
    auto star = TestImages::StarPixels(50.0, 50.0, 30.0, 12.0);
    auto hull = ComputeConvexHull(star);
    double complexity = ComputeShapeComplexity(static_cast<double>(star.size()),
                                               ComputePolygonArea(hull));
    EXPECT_GT(complexity, 0.3);
    EXPECT_LE(complexity, 1.0);
}

TEST(RegionFeaturesTest, ComplexityZeroForDegenerateHull) {
    EXPECT_DOUBLE_EQ(ComputeShapeComplexity(10.0, 0.0), 0.0);
}

TEST(RegionFeaturesTest, CircularityOfSquare) {
    EXPECT_NEAR(ComputeCircularity(400.0, 80.0), PI / 4.0, 1e-12);
}

TEST(RegionFeaturesTest, CircularityBounded) {
    EXPECT_DOUBLE_EQ(ComputeCircularity(1.0, 4.0), PI / 4.0);
    EXPECT_DOUBLE_EQ(ComputeCircularity(100.0, 1.0), 1.0);
    EXPECT_DOUBLE_EQ(ComputeCircularity(100.0, 0.0), 0.0);
}
