#pragma once

/**
 * @file Enhance.h
 * @brief Channel denoising and contrast enhancement
 *
 * Filters use clamp-to-border sampling and never change image dimensions.
 *
 * Usage:
 * @code
 * EnhanceParams params;
 * params.denoise = DenoiseMode::Median;
 * params.radius = 1;
 * params.contrast = ContrastMode::Equalize;
 * ChannelImage enhanced = ImageEnhancer(params).Enhance(hematoxylin);
 * @endcode
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Export.h>

#include <cstdint>
#include <string>

namespace Patho::Morph::Filter {

// =============================================================================
// Filters
// =============================================================================

/**
 * @brief Median over a (2r+1)x(2r+1) window
 * @param radius Window radius; 0 returns a copy
 * @throws InvalidArgumentException if radius < 0
 */
PATHOMORPH_API ChannelImage MedianFilter(const ChannelImage& channel, int32_t radius);

/**
 * @brief Mean over a (2r+1)x(2r+1) window, rounded to nearest
 * @param radius Window radius; 0 returns a copy
 * @throws InvalidArgumentException if radius < 0
 */
PATHOMORPH_API ChannelImage MeanFilter(const ChannelImage& channel, int32_t radius);

/**
 * @brief Linear min-max stretch onto [0, 255]
 *
 * A constant channel is returned unchanged.
 */
PATHOMORPH_API ChannelImage ContrastStretch(const ChannelImage& channel);

/**
 * @brief Global histogram equalization
 *
 * A constant channel is returned unchanged.
 */
PATHOMORPH_API ChannelImage HistogramEqualize(const ChannelImage& channel);

// =============================================================================
// ImageEnhancer
// =============================================================================

enum class DenoiseMode {
    None,
    Median,
    Mean
};

enum class ContrastMode {
    None,
    Stretch,    ///< Linear min-max
    Equalize    ///< Histogram equalization
};

PATHOMORPH_API const char* DenoiseModeName(DenoiseMode mode);
PATHOMORPH_API const char* ContrastModeName(ContrastMode mode);

/// @throws ConfigurationException on an unknown name
PATHOMORPH_API DenoiseMode ParseDenoiseMode(const std::string& name);
/// @throws ConfigurationException on an unknown name
PATHOMORPH_API ContrastMode ParseContrastMode(const std::string& name);

struct PATHOMORPH_API EnhanceParams {
    DenoiseMode denoise = DenoiseMode::Median;
    int32_t radius = 1;                         ///< Denoise window radius, 0 disables
    ContrastMode contrast = ContrastMode::Stretch;

    /// @throws ConfigurationException if radius is negative or above 15
    void Validate() const;
};

/**
 * @brief Denoise then contrast-enhance a channel
 */
class PATHOMORPH_API ImageEnhancer {
public:
    /// @throws ConfigurationException on invalid params
    explicit ImageEnhancer(const EnhanceParams& params = EnhanceParams());

    /**
     * @throws InvalidInputException if the channel is empty
     */
    ChannelImage Enhance(const ChannelImage& channel) const;

    const EnhanceParams& Params() const { return params_; }

private:
    EnhanceParams params_;
};

} // namespace Patho::Morph::Filter
