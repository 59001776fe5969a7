/**
 * @file Texture.cpp
 * @brief First-order texture statistics and window sampling
 */

#include <PathoMorph/Texture/Texture.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Core/Validate.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>

namespace Patho::Morph::Texture {

namespace {

void RequireWindow(int32_t windowSize, int32_t minSize, const char* funcName) {
    if (windowSize < minSize) {
        throw InvalidArgumentException(std::string(funcName) + ": windowSize must be >= " +
                                       std::to_string(minSize) + ", got " +
                                       std::to_string(windowSize));
    }
}

// Visit every full window, calling func(x0, y0) with its top-left corner
template<typename Func>
void ForEachWindow(const ChannelImage& channel, int32_t windowSize, Func&& func) {
    for (int32_t y0 = 0; y0 + windowSize <= channel.Height(); y0 += windowSize) {
        for (int32_t x0 = 0; x0 + windowSize <= channel.Width(); x0 += windowSize) {
            func(x0, y0);
        }
    }
}

} // anonymous namespace

// =============================================================================
// Statistics
// =============================================================================

TextureStats ComputeTextureStats(const std::vector<double>& samples) {
    TextureStats stats;
    if (samples.empty()) {
        return stats;
    }

    double n = static_cast<double>(samples.size());
    double sum = 0.0;
    for (double v : samples) sum += v;
    stats.mean = sum / n;

    double sq = 0.0;
    for (double v : samples) {
        double d = v - stats.mean;
        sq += d * d;
    }
    stats.variance = sq / n;
    stats.stddev = std::sqrt(stats.variance);
    stats.homogeneity = 1.0 / (1.0 + stats.variance);
    stats.textureScore = std::clamp(0.5 * std::min(stats.stddev, 1.0) + 0.5 * stats.homogeneity,
                                    0.0, 1.0);
    stats.sampleCount = samples.size();
    return stats;
}

// =============================================================================
// Samplers
// =============================================================================

std::vector<double> WindowDensitySamples(const ChannelImage& channel, int32_t windowSize,
                                         int32_t intensityThreshold) {
    RequireWindow(windowSize, 1, "WindowDensitySamples");
    Validate::RequireRange(intensityThreshold, 0, 255, "intensityThreshold", "WindowDensitySamples");

    std::vector<double> samples;
    const double windowArea = static_cast<double>(windowSize) * windowSize;
    ForEachWindow(channel, windowSize, [&](int32_t x0, int32_t y0) {
        int64_t dense = 0;
        for (int32_t y = y0; y < y0 + windowSize; ++y) {
            const uint8_t* row = channel.RowPtr(y);
            for (int32_t x = x0; x < x0 + windowSize; ++x) {
                if (row[x] > intensityThreshold) ++dense;
            }
        }
        samples.push_back(static_cast<double>(dense) / windowArea);
    });
    return samples;
}

std::vector<double> WindowMeanSamples(const ChannelImage& channel, int32_t windowSize) {
    RequireWindow(windowSize, 1, "WindowMeanSamples");

    std::vector<double> samples;
    const double norm = 255.0 * windowSize * windowSize;
    ForEachWindow(channel, windowSize, [&](int32_t x0, int32_t y0) {
        uint64_t sum = 0;
        for (int32_t y = y0; y < y0 + windowSize; ++y) {
            const uint8_t* row = channel.RowPtr(y);
            for (int32_t x = x0; x < x0 + windowSize; ++x) {
                sum += row[x];
            }
        }
        samples.push_back(static_cast<double>(sum) / norm);
    });
    return samples;
}

std::vector<double> WindowGradientSamples(const ChannelImage& channel, int32_t windowSize) {
    RequireWindow(windowSize, 2, "WindowGradientSamples");

    std::vector<double> samples;
    // (windowSize - 1) differences per row plus as many per column
    const double count = 2.0 * windowSize * (windowSize - 1);
    ForEachWindow(channel, windowSize, [&](int32_t x0, int32_t y0) {
        uint64_t sum = 0;
        for (int32_t y = y0; y < y0 + windowSize; ++y) {
            const uint8_t* row = channel.RowPtr(y);
            for (int32_t x = x0; x < x0 + windowSize; ++x) {
                if (x + 1 < x0 + windowSize) {
                    sum += static_cast<uint64_t>(std::abs(row[x + 1] - row[x]));
                }
                if (y + 1 < y0 + windowSize) {
                    sum += static_cast<uint64_t>(std::abs(channel.RowPtr(y + 1)[x] - row[x]));
                }
            }
        }
        samples.push_back(static_cast<double>(sum) / (255.0 * count));
    });
    return samples;
}

std::array<double, 4> QuadrantMeans(const ChannelImage& channel) {
    std::array<double, 4> means{};
    if (channel.Empty()) return means;

    const int32_t midX = channel.Width() / 2;
    const int32_t midY = channel.Height() / 2;
    std::array<uint64_t, 4> sums{};
    std::array<uint64_t, 4> counts{};

    for (int32_t y = 0; y < channel.Height(); ++y) {
        const uint8_t* row = channel.RowPtr(y);
        for (int32_t x = 0; x < channel.Width(); ++x) {
            size_t q = (y >= midY ? 2 : 0) + (x >= midX ? 1 : 0);
            sums[q] += row[x];
            ++counts[q];
        }
    }

    for (size_t q = 0; q < 4; ++q) {
        means[q] = counts[q] > 0 ? static_cast<double>(sums[q]) / (255.0 * counts[q]) : 0.0;
    }
    return means;
}

} // namespace Patho::Morph::Texture
