/**
 * @file RegionDetector.cpp
 * @brief Threshold segmentation into connected regions
 */

#include <PathoMorph/Segment/RegionDetector.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Core/Validate.h>
#include <PathoMorph/Internal/FloodFill.h>
#include <PathoMorph/Internal/Histogram.h>
#include <PathoMorph/Internal/RegionFeatures.h>
#include <PathoMorph/Platform/Log.h>

#include <string>

namespace Patho::Morph::Segment {

// =============================================================================
// Parameters
// =============================================================================

void RegionDetectorParams::Validate() const {
    if (!useOtsu && (threshold < 0 || threshold > 255)) {
        throw ConfigurationException("RegionDetector: threshold must be in [0, 255], got " +
                                     std::to_string(threshold));
    }
    if (minRegionPx < 0) {
        throw ConfigurationException("RegionDetector: minRegionPx must be >= 0");
    }
    if (maxRegionPx < 1 || maxRegionPx < minRegionPx) {
        throw ConfigurationException("RegionDetector: maxRegionPx (" + std::to_string(maxRegionPx) +
                                     ") must be >= 1 and >= minRegionPx (" +
                                     std::to_string(minRegionPx) + ")");
    }
    if (maxRegionCount < 1) {
        throw ConfigurationException("RegionDetector: maxRegionCount must be >= 1");
    }
    if (connectivity != Connectivity::Four && connectivity != Connectivity::Eight) {
        throw ConfigurationException("RegionDetector: connectivity must be 4 or 8, got " +
                                     std::to_string(static_cast<int32_t>(connectivity)));
    }
}

// =============================================================================
// Thresholding
// =============================================================================

int32_t OtsuThreshold(const ChannelImage& channel) {
    return Internal::ComputeOtsuThreshold(Internal::ComputeHistogram(channel));
}

// =============================================================================
// RegionDetector
// =============================================================================

RegionDetector::RegionDetector(const RegionDetectorParams& params)
    : params_(params) {
    params_.Validate();
}

int32_t RegionDetector::ResolveThreshold(const ChannelImage& channel) const {
    return params_.useOtsu ? OtsuThreshold(channel) : params_.threshold;
}

DetectionResult RegionDetector::Detect(const ChannelImage& channel) const {
    Validate::RequireChannel(channel, "RegionDetector::Detect");

    DetectionResult result;
    result.thresholdUsed = ResolveThreshold(channel);

    const int32_t width = channel.Width();
    const int32_t height = channel.Height();
    const int32_t threshold = result.thresholdUsed;

    std::vector<uint8_t> visited(channel.PixelCount(), 0);

    for (int32_t y = 0; y < height && !result.regionLimitReached; ++y) {
        const uint8_t* row = channel.RowPtr(y);
        for (int32_t x = 0; x < width; ++x) {
            if (row[x] <= threshold || visited[static_cast<size_t>(y) * width + x]) {
                continue;
            }

            Internal::FloodFillResult fill = Internal::FloodFill(
                channel, visited, Point2i(x, y), threshold,
                params_.connectivity, params_.maxRegionPx);

            if (static_cast<int64_t>(fill.pixels.size()) < params_.minRegionPx) {
                ++result.discardedCount;
                continue;
            }

            Region region;
            region.pixels = std::move(fill.pixels);
            region.area = static_cast<int64_t>(region.pixels.size());
            region.perimeter = Internal::ComputeEdgePerimeter(region.pixels);
            region.centroid = Internal::ComputeCentroid(region.pixels);
            region.boundingBox = Internal::ComputeBoundingBox(region.pixels);
            region.truncated = fill.truncated;

            uint64_t sum = 0;
            for (const auto& p : region.pixels) {
                sum += channel.At(p.x, p.y);
            }
            region.meanIntensity = static_cast<double>(sum) / static_cast<double>(region.area);

            if (region.truncated) {
                ++result.truncatedCount;
            }
            result.regions.push_back(std::move(region));

            if (static_cast<int64_t>(result.regions.size()) >= params_.maxRegionCount) {
                result.regionLimitReached = true;
                break;
            }
        }
    }

    if (result.truncatedCount > 0) {
        PATHOMORPH_LOG_WARN("RegionDetector: %lld region(s) truncated at %lld px",
                            static_cast<long long>(result.truncatedCount),
                            static_cast<long long>(params_.maxRegionPx));
    }
    if (result.regionLimitReached) {
        PATHOMORPH_LOG_WARN("RegionDetector: stopped at region limit %lld",
                            static_cast<long long>(params_.maxRegionCount));
    }
    PATHOMORPH_LOG_DEBUG("RegionDetector: threshold %d, %zu regions, %lld discarded",
                         threshold, result.regions.size(),
                         static_cast<long long>(result.discardedCount));
    return result;
}

} // namespace Patho::Morph::Segment
