#pragma once

/**
 * @file RegionDetector.h
 * @brief Threshold segmentation into connected regions
 *
 * Pixels with value strictly above the threshold are foreground. Foreground
 * pixels are grouped into 4- or 8-connected components with an explicit-stack
 * flood fill; components below the minimum size are discarded.
 *
 * Two caps bound the work on adversarial input:
 * - maxRegionPx stops the growth of one region (the region is kept and
 *   flagged truncated)
 * - maxRegionCount stops detection after that many regions are kept
 *
 * The region set does not depend on scan order unless a region is truncated.
 * Callers must not rely on the order of the returned regions.
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Core/Region.h>
#include <PathoMorph/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Patho::Morph::Segment {

struct PATHOMORPH_API RegionDetectorParams {
    bool useOtsu = true;                            ///< Derive threshold from the channel
    int32_t threshold = 128;                        ///< Fixed threshold when useOtsu is false
    int64_t minRegionPx = 20;                       ///< Smaller components are discarded
    int64_t maxRegionPx = 100000;                   ///< Per-region growth cap
    int64_t maxRegionCount = 20000;                 ///< Total kept-region cap
    Connectivity connectivity = Connectivity::Eight;

    /// Fixed-threshold parameters
    static RegionDetectorParams Fixed(int32_t threshold, int64_t minRegionPx,
                                      Connectivity connectivity = Connectivity::Eight) {
        RegionDetectorParams p;
        p.useOtsu = false;
        p.threshold = threshold;
        p.minRegionPx = minRegionPx;
        p.connectivity = connectivity;
        return p;
    }

    /**
     * @throws ConfigurationException if the threshold is outside [0, 255],
     *         sizes are negative, maxRegionPx < max(minRegionPx, 1),
     *         maxRegionCount < 1, or connectivity is not 4 or 8
     */
    void Validate() const;
};

/**
 * @brief Regions plus diagnostics for one channel
 */
struct PATHOMORPH_API DetectionResult {
    std::vector<Region> regions;
    int32_t thresholdUsed = 0;
    int64_t truncatedCount = 0;         ///< Regions that hit maxRegionPx
    bool regionLimitReached = false;    ///< Detection stopped at maxRegionCount
    int64_t discardedCount = 0;         ///< Components below minRegionPx

    size_t Size() const { return regions.size(); }
};

class PATHOMORPH_API RegionDetector {
public:
    /// @throws ConfigurationException on invalid params
    explicit RegionDetector(const RegionDetectorParams& params = RegionDetectorParams());

    /**
     * @brief Segment a channel
     * @throws InvalidInputException if the channel is empty
     */
    DetectionResult Detect(const ChannelImage& channel) const;

    /// Threshold that Detect would use on this channel
    int32_t ResolveThreshold(const ChannelImage& channel) const;

    const RegionDetectorParams& Params() const { return params_; }

private:
    RegionDetectorParams params_;
};

/**
 * @brief Otsu threshold of a channel
 *
 * When several thresholds tie for maximal between-class variance, the
 * midpoint of the tie range is returned.
 */
PATHOMORPH_API int32_t OtsuThreshold(const ChannelImage& channel);

} // namespace Patho::Morph::Segment
