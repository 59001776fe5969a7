/**
 * @file Histogram.cpp
 * @brief Histogram computation, Otsu threshold and LUT construction
 */

#include <PathoMorph/Internal/Histogram.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Platform/Thread.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace Patho::Morph::Internal {

// ============================================================================
// Computation
// ============================================================================

Histogram ComputeHistogram(const ChannelImage& channel) {
    Histogram hist;
    const uint8_t* data = channel.Data();
    size_t count = channel.PixelCount();
    for (size_t i = 0; i < count; ++i) {
        ++hist.bins[data[i]];
    }
    hist.totalCount = count;
    return hist;
}

HistogramStats ComputeHistogramStats(const Histogram& hist) {
    HistogramStats stats;
    if (hist.Empty()) {
        return stats;
    }

    stats.totalCount = hist.totalCount;

    stats.min = 0;
    while (stats.min < INTENSITY_LEVELS - 1 && hist.bins[stats.min] == 0) ++stats.min;
    stats.max = INTENSITY_LEVELS - 1;
    while (stats.max > 0 && hist.bins[stats.max] == 0) --stats.max;

    double sum = 0.0;
    for (int32_t i = 0; i < INTENSITY_LEVELS; ++i) {
        sum += static_cast<double>(i) * hist.bins[i];
    }
    stats.mean = sum / hist.totalCount;

    double sqSum = 0.0;
    for (int32_t i = 0; i < INTENSITY_LEVELS; ++i) {
        double d = i - stats.mean;
        sqSum += d * d * hist.bins[i];
    }
    stats.variance = sqSum / hist.totalCount;
    return stats;
}

std::vector<uint64_t> ComputeCDF(const Histogram& hist) {
    std::vector<uint64_t> cdf(INTENSITY_LEVELS, 0);
    std::partial_sum(hist.bins.begin(), hist.bins.end(), cdf.begin());
    return cdf;
}

int32_t ComputeOtsuThreshold(const Histogram& hist) {
    if (hist.Empty()) {
        return 0;
    }

    const double total = static_cast<double>(hist.totalCount);
    double totalSum = 0;
    for (int32_t i = 0; i < INTENSITY_LEVELS; ++i) {
        totalSum += static_cast<double>(i) * hist.bins[i];
    }

    double maxVariance = -1.0;
    int32_t firstBest = -1;
    int32_t lastBest = -1;

    double w0 = 0;
    double sum0 = 0;

    for (int32_t t = 0; t < INTENSITY_LEVELS - 1; ++t) {
        w0 += hist.bins[t];
        sum0 += static_cast<double>(t) * hist.bins[t];
        if (w0 == 0) continue;

        double w1 = total - w0;
        if (w1 == 0) break;

        double mean0 = sum0 / w0;
        double mean1 = (totalSum - sum0) / w1;
        double variance = w0 * w1 * (mean0 - mean1) * (mean0 - mean1);

        double tolerance = 1e-12 * std::max(1.0, maxVariance);
        if (variance > maxVariance + tolerance) {
            maxVariance = variance;
            firstBest = t;
            lastBest = t;
        } else if (std::abs(variance - maxVariance) <= tolerance) {
            lastBest = t;
        }
    }

    if (firstBest < 0) {
        // Single-valued: every pixel sits in one bin
        for (int32_t i = 0; i < INTENSITY_LEVELS; ++i) {
            if (hist.bins[i] != 0) return i;
        }
        return 0;
    }
    return (firstBest + lastBest) / 2;
}

// ============================================================================
// Lookup tables
// ============================================================================

std::vector<uint8_t> BuildStretchLUT(int32_t minVal, int32_t maxVal) {
    std::vector<uint8_t> lut(INTENSITY_LEVELS);
    std::iota(lut.begin(), lut.end(), uint8_t{0});
    if (maxVal <= minVal) {
        return lut;
    }

    double scale = 255.0 / (maxVal - minVal);
    for (int32_t i = 0; i < INTENSITY_LEVELS; ++i) {
        double v = (i - minVal) * scale;
        lut[i] = static_cast<uint8_t>(std::clamp(std::round(v), 0.0, 255.0));
    }
    return lut;
}

std::vector<uint8_t> BuildEqualizationLUT(const Histogram& hist) {
    std::vector<uint8_t> lut(INTENSITY_LEVELS);
    std::iota(lut.begin(), lut.end(), uint8_t{0});
    if (hist.Empty()) {
        return lut;
    }

    std::vector<uint64_t> cdf = ComputeCDF(hist);
    uint64_t cdfMin = 0;
    for (uint64_t c : cdf) {
        if (c != 0) {
            cdfMin = c;
            break;
        }
    }

    uint64_t denom = hist.totalCount - cdfMin;
    if (denom == 0) {
        return lut;
    }

    for (int32_t i = 0; i < INTENSITY_LEVELS; ++i) {
        double v = cdf[i] < cdfMin ? 0.0
                 : static_cast<double>(cdf[i] - cdfMin) / static_cast<double>(denom) * 255.0;
        lut[i] = static_cast<uint8_t>(std::clamp(std::round(v), 0.0, 255.0));
    }
    return lut;
}

ChannelImage ApplyLUT(const ChannelImage& channel, const std::vector<uint8_t>& lut) {
    if (lut.size() != static_cast<size_t>(INTENSITY_LEVELS)) {
        throw InvalidArgumentException("ApplyLUT: lut must have 256 entries, got " +
                                       std::to_string(lut.size()));
    }

    ChannelImage result(channel.Width(), channel.Height());
    if (channel.Empty()) return result;

    const int32_t width = channel.Width();
    Platform::ParallelForRange(0, static_cast<size_t>(channel.Height()),
        [&](size_t rowBegin, size_t rowEnd) {
            for (size_t y = rowBegin; y < rowEnd; ++y) {
                const uint8_t* src = channel.RowPtr(static_cast<int32_t>(y));
                uint8_t* dst = result.RowPtr(static_cast<int32_t>(y));
                for (int32_t x = 0; x < width; ++x) {
                    dst[x] = lut[src[x]];
                }
            }
        });
    return result;
}

} // namespace Patho::Morph::Internal
