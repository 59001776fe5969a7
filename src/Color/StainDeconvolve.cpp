/**
 * @file StainDeconvolve.cpp
 * @brief Optical-density color deconvolution
 */

#include <PathoMorph/Color/StainDeconvolve.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Core/Validate.h>
#include <PathoMorph/Platform/Log.h>
#include <PathoMorph/Platform/Thread.h>

#include <algorithm>
#include <cmath>

namespace Patho::Morph::Color {

// =============================================================================
// StainMatrix
// =============================================================================

StainMatrix StainMatrix::HematoxylinEosin() {
    StainMatrix matrix;
    matrix.names = {"hematoxylin", "eosin", "residual"};
    matrix.rows = {
        {0.65, 0.70, 0.29},
        {0.07, 0.99, 0.11},
        {0.27, 0.57, 0.78}
    };
    return matrix.Normalized();
}

void StainMatrix::Validate() const {
    if (rows.empty()) {
        throw ConfigurationException("StainMatrix: at least one stain row is required");
    }
    if (names.size() != rows.size()) {
        throw ConfigurationException("StainMatrix: " + std::to_string(names.size()) +
                                     " names for " + std::to_string(rows.size()) + " rows");
    }
    for (size_t i = 0; i < rows.size(); ++i) {
        double sq = 0.0;
        for (double v : rows[i]) {
            if (!std::isfinite(v)) {
                throw ConfigurationException("StainMatrix: row " + std::to_string(i) +
                                             " contains a non-finite value");
            }
            sq += v * v;
        }
        if (sq <= 0.0) {
            throw ConfigurationException("StainMatrix: row " + std::to_string(i) + " is all zero");
        }
    }
}

StainMatrix StainMatrix::Normalized() const {
    Validate();
    StainMatrix result = *this;
    for (auto& row : result.rows) {
        double norm = std::sqrt(row[0] * row[0] + row[1] * row[1] + row[2] * row[2]);
        for (double& v : row) {
            v /= norm;
        }
    }
    return result;
}

int32_t StainMatrix::IndexOf(const std::string& name) const {
    for (size_t i = 0; i < names.size(); ++i) {
        if (names[i] == name) return static_cast<int32_t>(i);
    }
    return -1;
}

// =============================================================================
// ColorDeconvolver
// =============================================================================

ColorDeconvolver::ColorDeconvolver(StainMatrix matrix, double maxOpticalDensity)
    : matrix_(std::move(matrix))
    , maxOpticalDensity_(maxOpticalDensity) {
    matrix_.Validate();
    Validate::RequireFiniteConfig(maxOpticalDensity_, "maxOpticalDensity", "ColorDeconvolver");
    if (maxOpticalDensity_ <= 0.0) {
        throw ConfigurationException("ColorDeconvolver: maxOpticalDensity must be > 0");
    }

    // Value 0 has no finite OD; it takes the cap like any value above it.
    for (int32_t v = 0; v < INTENSITY_LEVELS; ++v) {
        double od = maxOpticalDensity_;
        if (v > 0) {
            od = std::min(-std::log10(v / 255.0), maxOpticalDensity_);
        }
        odTable_[v] = std::max(od, 0.0);
    }
}

std::vector<ChannelImage> ColorDeconvolver::Deconvolve(const PixelBuffer& buffer) const {
    Validate::RequirePixelBuffer(buffer, "ColorDeconvolver::Deconvolve");

    const int32_t width = buffer.Width();
    const int32_t height = buffer.Height();
    const size_t numStains = matrix_.Size();
    const double scale = 255.0 / maxOpticalDensity_;

    std::vector<ChannelImage> channels;
    channels.reserve(numStains);
    for (size_t s = 0; s < numStains; ++s) {
        channels.emplace_back(width, height);
    }

    Platform::ParallelForRange(0, static_cast<size_t>(height),
        [&](size_t rowBegin, size_t rowEnd) {
            for (size_t y = rowBegin; y < rowEnd; ++y) {
                const int32_t row = static_cast<int32_t>(y);
                const uint8_t* src = buffer.PixelPtr(0, row);
                for (int32_t x = 0; x < width; ++x, src += PixelBuffer::BYTES_PER_PIXEL) {
                    const double odR = odTable_[src[0]];
                    const double odG = odTable_[src[1]];
                    const double odB = odTable_[src[2]];

                    for (size_t s = 0; s < numStains; ++s) {
                        const auto& stain = matrix_.rows[s];
                        double projected = (odR * stain[0] + odG * stain[1] + odB * stain[2]) * scale;
                        channels[s].RowPtr(row)[x] =
                            static_cast<uint8_t>(std::clamp(std::round(projected), 0.0, 255.0));
                    }
                }
            }
        });

    PATHOMORPH_LOG_DEBUG("ColorDeconvolver: %dx%d into %zu channels", width, height, numStains);
    return channels;
}

} // namespace Patho::Morph::Color
