/**
 * @file test_histogram.cpp
 * @brief Unit tests for Internal/Histogram
 */

#include <gtest/gtest.h>
#include <PathoMorph/Internal/Histogram.h>
#include <PathoMorph/Core/Exception.h>

#include <cstdint>
#include <vector>

using namespace Patho::Morph;
using namespace Patho::Morph::Internal;

// ============================================================================
// Test Fixtures
// ============================================================================

class HistogramTest : public ::testing::Test {
protected:
    void SetUp() override {
        uniformImg_ = ChannelImage(width_, height_, 128);

        // Gradient image (0 to 255)
        gradientImg_ = ChannelImage(width_, height_);
        for (int32_t y = 0; y < height_; ++y) {
            for (int32_t x = 0; x < width_; ++x) {
                gradientImg_.SetAt(x, y, static_cast<uint8_t>(x * 255 / (width_ - 1)));
            }
        }

        // Bimodal image (left half 50, right half 200)
        bimodalImg_ = ChannelImage(width_, height_, 50);
        bimodalImg_.FillRect(Rect2i(width_ / 2, 0, width_ / 2, height_), 200);

        // Low contrast image (100 to 155)
        lowContrastImg_ = ChannelImage(width_, height_);
        for (int32_t y = 0; y < height_; ++y) {
            for (int32_t x = 0; x < width_; ++x) {
                lowContrastImg_.SetAt(x, y, static_cast<uint8_t>(100 + x * 55 / (width_ - 1)));
            }
        }
    }

    const int32_t width_ = 100;
    const int32_t height_ = 100;
    ChannelImage uniformImg_;
    ChannelImage gradientImg_;
    ChannelImage bimodalImg_;
    ChannelImage lowContrastImg_;
};

// ============================================================================
// Histogram Computation
// ============================================================================

TEST_F(HistogramTest, UniformImageSingleBin) {
    Histogram hist = ComputeHistogram(uniformImg_);
    EXPECT_EQ(hist.totalCount, 10000u);
    EXPECT_EQ(hist.At(128), 10000u);
    EXPECT_EQ(hist.At(127), 0u);
    EXPECT_EQ(hist.At(-1), 0u);
    EXPECT_EQ(hist.At(256), 0u);
}

TEST_F(HistogramTest, EmptyImageEmptyHistogram) {
    Histogram hist = ComputeHistogram(ChannelImage());
    EXPECT_TRUE(hist.Empty());

    HistogramStats stats = ComputeHistogramStats(hist);
    EXPECT_EQ(stats.totalCount, 0u);
    EXPECT_DOUBLE_EQ(stats.mean, 0.0);
}

TEST_F(HistogramTest, StatsOfBimodal) {
    HistogramStats stats = ComputeHistogramStats(ComputeHistogram(bimodalImg_));
    EXPECT_EQ(stats.min, 50);
    EXPECT_EQ(stats.max, 200);
    EXPECT_DOUBLE_EQ(stats.mean, 125.0);
    EXPECT_DOUBLE_EQ(stats.variance, 75.0 * 75.0);
}

TEST_F(HistogramTest, CdfEndsAtTotal) {
    Histogram hist = ComputeHistogram(gradientImg_);
    std::vector<uint64_t> cdf = ComputeCDF(hist);
    ASSERT_EQ(cdf.size(), 256u);
    EXPECT_EQ(cdf[255], hist.totalCount);
    for (size_t i = 1; i < cdf.size(); ++i) {
        EXPECT_GE(cdf[i], cdf[i - 1]);
    }
}

// ============================================================================
// Otsu
// ============================================================================

TEST_F(HistogramTest, OtsuBimodalTakesPlateauMidpoint) {
    // Every t in [50, 199] separates the modes equally well
    EXPECT_EQ(ComputeOtsuThreshold(ComputeHistogram(bimodalImg_)), 124);
}

TEST_F(HistogramTest, OtsuSingleValued) {
    EXPECT_EQ(ComputeOtsuThreshold(ComputeHistogram(uniformImg_)), 128);
}

TEST_F(HistogramTest, OtsuEmpty) {
    EXPECT_EQ(ComputeOtsuThreshold(Histogram()), 0);
}

TEST_F(HistogramTest, OtsuUnbalancedModes) {
    ChannelImage img(100, 100, 30);
    img.FillRect(Rect2i(0, 0, 10, 100), 220);
    int32_t t = ComputeOtsuThreshold(ComputeHistogram(img));
    EXPECT_GE(t, 30);
    EXPECT_LT(t, 220);
}

// ============================================================================
// Lookup tables
// ============================================================================

TEST_F(HistogramTest, StretchLUTMapsRangeToFull) {
    auto lut = BuildStretchLUT(100, 155);
    ASSERT_EQ(lut.size(), 256u);
    EXPECT_EQ(lut[0], 0);
    EXPECT_EQ(lut[100], 0);
    EXPECT_EQ(lut[155], 255);
    EXPECT_EQ(lut[255], 255);
}

TEST_F(HistogramTest, StretchLUTIdentityForDegenerateRange) {
    auto lut = BuildStretchLUT(90, 90);
    for (int i = 0; i < 256; ++i) {
        EXPECT_EQ(lut[i], i);
    }
}

TEST_F(HistogramTest, EqualizationOfBimodal) {
    auto lut = BuildEqualizationLUT(ComputeHistogram(bimodalImg_));
    EXPECT_EQ(lut[50], 0);
    EXPECT_EQ(lut[200], 255);
}

TEST_F(HistogramTest, EqualizationIdentityForSingleValued) {
    auto lut = BuildEqualizationLUT(ComputeHistogram(uniformImg_));
    EXPECT_EQ(lut[128], 128);
}

TEST_F(HistogramTest, ApplyLUTStretchesLowContrast) {
    ChannelImage out = ApplyLUT(lowContrastImg_, BuildStretchLUT(100, 155));
    HistogramStats stats = ComputeHistogramStats(ComputeHistogram(out));
    EXPECT_EQ(stats.min, 0);
    EXPECT_EQ(stats.max, 255);
    EXPECT_EQ(out.Width(), width_);
    EXPECT_EQ(out.Height(), height_);
}

TEST_F(HistogramTest, ApplyLUTRejectsShortTable) {
    std::vector<uint8_t> lut(10, 0);
    EXPECT_THROW(ApplyLUT(uniformImg_, lut), InvalidArgumentException);
}
