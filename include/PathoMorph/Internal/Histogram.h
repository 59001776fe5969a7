#pragma once

/**
 * @file Histogram.h
 * @brief 8-bit channel histogram, statistics, Otsu threshold and LUT builders
 *
 * Used by:
 * - ImageEnhancer (min-max stretch, histogram equalization)
 * - RegionDetector (Otsu auto-threshold)
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Constants.h>

#include <array>
#include <cstdint>
#include <vector>

namespace Patho::Morph::Internal {

// ============================================================================
// Data Structures
// ============================================================================

/**
 * @brief 256-bin intensity histogram
 */
struct Histogram {
    std::array<uint64_t, INTENSITY_LEVELS> bins{};  ///< Bin counts
    uint64_t totalCount = 0;                        ///< Total pixel count

    uint64_t At(int32_t idx) const {
        if (idx < 0 || idx >= INTENSITY_LEVELS) return 0;
        return bins[idx];
    }

    bool Empty() const { return totalCount == 0; }
};

/**
 * @brief Histogram statistics
 */
struct HistogramStats {
    int32_t min = 0;            ///< Lowest value with non-zero count
    int32_t max = 0;            ///< Highest value with non-zero count
    double mean = 0;            ///< Mean value
    double variance = 0;        ///< Population variance
    uint64_t totalCount = 0;    ///< Total pixel count
};

// ============================================================================
// Computation
// ============================================================================

/// Histogram of every pixel in the channel
Histogram ComputeHistogram(const ChannelImage& channel);

/// Min/max/mean/variance of a histogram; all zero for an empty histogram
HistogramStats ComputeHistogramStats(const Histogram& hist);

/**
 * @brief Cumulative distribution (running count), same length as bins
 */
std::vector<uint64_t> ComputeCDF(const Histogram& hist);

/**
 * @brief Otsu threshold maximizing between-class variance w0*w1*(mu0-mu1)^2
 *
 * Class 0 is [0, t], class 1 is (t, 255]. When a range of thresholds share
 * the maximal variance (an empty gap between two modes), the midpoint of
 * that range is returned, so the result lies strictly between the modes.
 *
 * @return Threshold in [0, 255]; 0 for an empty histogram, the single value
 *         for a single-valued histogram
 */
int32_t ComputeOtsuThreshold(const Histogram& hist);

// ============================================================================
// Lookup tables
// ============================================================================

/**
 * @brief Linear stretch of [minVal, maxVal] onto [0, 255]
 *
 * Returns the identity table when maxVal <= minVal.
 */
std::vector<uint8_t> BuildStretchLUT(int32_t minVal, int32_t maxVal);

/**
 * @brief Equalization table (cdf[v] - cdfMin) / (N - cdfMin) * 255
 *
 * cdfMin is the first non-zero CDF value. Returns the identity table when
 * the histogram is empty or single-valued.
 */
std::vector<uint8_t> BuildEqualizationLUT(const Histogram& hist);

/**
 * @brief Map every pixel through a 256-entry table
 * @throws InvalidArgumentException if lut.size() != 256
 */
ChannelImage ApplyLUT(const ChannelImage& channel, const std::vector<uint8_t>& lut);

} // namespace Patho::Morph::Internal
