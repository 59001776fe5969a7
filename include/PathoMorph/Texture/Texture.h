#pragma once

/**
 * @file Texture.h
 * @brief First-order texture statistics and window sampling
 *
 * Provides:
 * - Mean / variance / standard deviation / homogeneity of scalar samples
 * - A fixed linear texture score combining contrast and homogeneity
 * - Samplers that reduce a channel to per-window or per-quadrant values
 *
 * Samplers tile the channel with non-overlapping windows; a partial window
 * at the right or bottom edge is dropped.
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Export.h>

#include <array>
#include <cstdint>
#include <vector>

namespace Patho::Morph::Texture {

// =============================================================================
// Statistics
// =============================================================================

struct PATHOMORPH_API TextureStats {
    double mean = 0;            ///< Arithmetic mean
    double variance = 0;        ///< Population variance
    double stddev = 0;          ///< sqrt(variance), the contrast term
    double homogeneity = 0;     ///< 1 / (1 + variance)
    double textureScore = 0;    ///< 0.5*min(stddev, 1) + 0.5*homogeneity, in [0, 1]
    size_t sampleCount = 0;
};

/**
 * @brief Statistics of a sample set
 * @return All-zero stats for an empty sample set
 */
PATHOMORPH_API TextureStats ComputeTextureStats(const std::vector<double>& samples);

// =============================================================================
// Samplers
// =============================================================================

/**
 * @brief Fraction of pixels above a threshold in each window
 * @param windowSize Window side in pixels (> 0)
 * @param intensityThreshold Pixels strictly above this count as dense
 * @throws InvalidArgumentException if windowSize <= 0
 */
PATHOMORPH_API std::vector<double> WindowDensitySamples(const ChannelImage& channel,
                                                        int32_t windowSize,
                                                        int32_t intensityThreshold);

/**
 * @brief Mean intensity / 255 of each window
 * @throws InvalidArgumentException if windowSize <= 0
 */
PATHOMORPH_API std::vector<double> WindowMeanSamples(const ChannelImage& channel,
                                                     int32_t windowSize);

/**
 * @brief Mean absolute forward difference / 255 of each window
 *
 * Horizontal and vertical differences are averaged; a flat window gives 0.
 * @throws InvalidArgumentException if windowSize <= 1
 */
PATHOMORPH_API std::vector<double> WindowGradientSamples(const ChannelImage& channel,
                                                         int32_t windowSize);

/**
 * @brief Mean intensity / 255 of the four quadrants (TL, TR, BL, BR)
 *
 * Odd dimensions give the extra row/column to the lower/right quadrants.
 * Quadrants with no pixels report 0.
 */
PATHOMORPH_API std::array<double, 4> QuadrantMeans(const ChannelImage& channel);

} // namespace Patho::Morph::Texture
