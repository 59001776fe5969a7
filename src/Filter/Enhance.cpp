/**
 * @file Enhance.cpp
 * @brief Channel denoising and contrast enhancement
 */

#include <PathoMorph/Filter/Enhance.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Core/Validate.h>
#include <PathoMorph/Internal/Histogram.h>

#include <algorithm>
#include <vector>

namespace Patho::Morph::Filter {

namespace {

constexpr int32_t MAX_FILTER_RADIUS = 15;

} // anonymous namespace

// =============================================================================
// Filters
// =============================================================================

ChannelImage MedianFilter(const ChannelImage& channel, int32_t radius) {
    Validate::RequireNonNegative(radius, "radius", "MedianFilter");
    if (radius == 0 || channel.Empty()) {
        return channel;
    }

    const int32_t w = channel.Width();
    const int32_t h = channel.Height();
    const int32_t size = 2 * radius + 1;

    ChannelImage output(w, h);

    #pragma omp parallel for schedule(static)
    for (int32_t y = 0; y < h; ++y) {
        std::vector<uint8_t> neighborhood(static_cast<size_t>(size) * size);
        uint8_t* dstRow = output.RowPtr(y);

        for (int32_t x = 0; x < w; ++x) {
            int count = 0;
            for (int32_t ky = -radius; ky <= radius; ++ky) {
                int32_t sy = std::clamp(y + ky, 0, h - 1);
                const uint8_t* srcRow = channel.RowPtr(sy);
                for (int32_t kx = -radius; kx <= radius; ++kx) {
                    int32_t sx = std::clamp(x + kx, 0, w - 1);
                    neighborhood[count++] = srcRow[sx];
                }
            }

            std::nth_element(neighborhood.begin(), neighborhood.begin() + count / 2,
                             neighborhood.begin() + count);
            dstRow[x] = neighborhood[count / 2];
        }
    }

    return output;
}

ChannelImage MeanFilter(const ChannelImage& channel, int32_t radius) {
    Validate::RequireNonNegative(radius, "radius", "MeanFilter");
    if (radius == 0 || channel.Empty()) {
        return channel;
    }

    const int32_t w = channel.Width();
    const int32_t h = channel.Height();
    const int32_t size = 2 * radius + 1;
    const int32_t area = size * size;

    ChannelImage output(w, h);

    #pragma omp parallel for schedule(static)
    for (int32_t y = 0; y < h; ++y) {
        uint8_t* dstRow = output.RowPtr(y);
        for (int32_t x = 0; x < w; ++x) {
            int32_t sum = 0;
            for (int32_t ky = -radius; ky <= radius; ++ky) {
                const uint8_t* srcRow = channel.RowPtr(std::clamp(y + ky, 0, h - 1));
                for (int32_t kx = -radius; kx <= radius; ++kx) {
                    sum += srcRow[std::clamp(x + kx, 0, w - 1)];
                }
            }
            dstRow[x] = static_cast<uint8_t>((sum + area / 2) / area);
        }
    }

    return output;
}

ChannelImage ContrastStretch(const ChannelImage& channel) {
    if (channel.Empty()) return channel;

    Internal::HistogramStats stats = Internal::ComputeHistogramStats(Internal::ComputeHistogram(channel));
    if (stats.max <= stats.min) {
        return channel;
    }
    return Internal::ApplyLUT(channel, Internal::BuildStretchLUT(stats.min, stats.max));
}

ChannelImage HistogramEqualize(const ChannelImage& channel) {
    if (channel.Empty()) return channel;

    Internal::Histogram hist = Internal::ComputeHistogram(channel);
    return Internal::ApplyLUT(channel, Internal::BuildEqualizationLUT(hist));
}

// =============================================================================
// Mode names
// =============================================================================

const char* DenoiseModeName(DenoiseMode mode) {
    switch (mode) {
        case DenoiseMode::Median: return "median";
        case DenoiseMode::Mean:   return "mean";
        default:                  return "none";
    }
}

const char* ContrastModeName(ContrastMode mode) {
    switch (mode) {
        case ContrastMode::Stretch:  return "stretch";
        case ContrastMode::Equalize: return "equalize";
        default:                     return "none";
    }
}

DenoiseMode ParseDenoiseMode(const std::string& name) {
    if (name == "none") return DenoiseMode::None;
    if (name == "median") return DenoiseMode::Median;
    if (name == "mean") return DenoiseMode::Mean;
    throw ConfigurationException("unknown denoise mode '" + name + "'");
}

ContrastMode ParseContrastMode(const std::string& name) {
    if (name == "none") return ContrastMode::None;
    if (name == "stretch") return ContrastMode::Stretch;
    if (name == "equalize") return ContrastMode::Equalize;
    throw ConfigurationException("unknown contrast mode '" + name + "'");
}

// =============================================================================
// ImageEnhancer
// =============================================================================

void EnhanceParams::Validate() const {
    if (radius < 0 || radius > MAX_FILTER_RADIUS) {
        throw ConfigurationException("EnhanceParams: radius must be in [0, " +
                                     std::to_string(MAX_FILTER_RADIUS) + "], got " +
                                     std::to_string(radius));
    }
}

ImageEnhancer::ImageEnhancer(const EnhanceParams& params)
    : params_(params) {
    params_.Validate();
}

ChannelImage ImageEnhancer::Enhance(const ChannelImage& channel) const {
    Validate::RequireChannel(channel, "ImageEnhancer::Enhance");

    ChannelImage denoised;
    switch (params_.denoise) {
        case DenoiseMode::Median:
            denoised = MedianFilter(channel, params_.radius);
            break;
        case DenoiseMode::Mean:
            denoised = MeanFilter(channel, params_.radius);
            break;
        default:
            denoised = channel;
            break;
    }

    switch (params_.contrast) {
        case ContrastMode::Stretch:
            return ContrastStretch(denoised);
        case ContrastMode::Equalize:
            return HistogramEqualize(denoised);
        default:
            return denoised;
    }
}

} // namespace Patho::Morph::Filter
