#pragma once

/**
 * @file StainDeconvolve.h
 * @brief Optical-density color deconvolution of H&E stained images
 *
 * Each RGB pixel is converted to optical density OD = -log10(I / 255),
 * capped at a maximum OD, and projected onto one stain vector per output
 * channel. The projection is rescaled so that maxOpticalDensity maps to 255.
 *
 * Usage:
 * @code
 * ColorDeconvolver deconvolver(StainMatrix::HematoxylinEosin());
 * std::vector<ChannelImage> channels = deconvolver.Deconvolve(buffer);
 * const ChannelImage& hematoxylin = channels[0];
 * @endcode
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Constants.h>
#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Core/PixelBuffer.h>

#include <array>
#include <string>
#include <vector>

namespace Patho::Morph::Color {

/**
 * @brief Stain vectors, one row per output channel, columns R/G/B optical density
 */
struct PATHOMORPH_API StainMatrix {
    std::vector<std::string> names;             ///< Channel name per row
    std::vector<std::array<double, 3>> rows;    ///< OD vector per row

    size_t Size() const { return rows.size(); }

    /// Hematoxylin, eosin and residual vectors, rows L2-normalized
    static StainMatrix HematoxylinEosin();

    /**
     * @brief Copy with every row scaled to unit length
     * @throws ConfigurationException if the matrix is invalid
     */
    StainMatrix Normalized() const;

    /**
     * @brief Check the matrix can be used for deconvolution
     * @throws ConfigurationException if there are no rows, a value is not
     *         finite, a row is all zero, or names and rows differ in count
     */
    void Validate() const;

    /// Row index of a named channel, or -1
    int32_t IndexOf(const std::string& name) const;
};

/**
 * @brief Pure per-pixel RGBA to stain-channel mapping
 *
 * Immutable after construction; Deconvolve may be called concurrently.
 */
class PATHOMORPH_API ColorDeconvolver {
public:
    /**
     * @param matrix Stain vectors (validated here)
     * @param maxOpticalDensity OD cap, also the value mapped to 255 (> 0)
     * @throws ConfigurationException on an invalid matrix or OD cap
     */
    explicit ColorDeconvolver(StainMatrix matrix,
                              double maxOpticalDensity = DEFAULT_MAX_OPTICAL_DENSITY);

    /**
     * @brief Separate a buffer into one channel per stain row
     * @return Channels in matrix row order, each the size of the buffer
     * @throws InvalidInputException if the buffer is null, empty or undersized
     */
    std::vector<ChannelImage> Deconvolve(const PixelBuffer& buffer) const;

    const StainMatrix& Matrix() const { return matrix_; }
    double MaxOpticalDensity() const { return maxOpticalDensity_; }

    /// Optical density of one 8-bit channel value, capped at maxOpticalDensity
    double OpticalDensity(uint8_t value) const { return odTable_[value]; }

private:
    StainMatrix matrix_;
    double maxOpticalDensity_;
    std::array<double, INTENSITY_LEVELS> odTable_{};
};

} // namespace Patho::Morph::Color
