#pragma once

/**
 * @file Morphometry.h
 * @brief Per-region shape and intensity measurements
 *
 * Measurements:
 * - perimeter: edge-set boundary length (pixel edges)
 * - hull / hullArea: convex hull of pixel centers and its shoelace area
 * - shapeComplexity: 1 - area/hullArea clamped to [0, 1]
 * - circularity: 4*pi*area/perimeter^2 clamped to [0, 1]
 * - elongation: longer / shorter bounding-box side (>= 1)
 * - meanIntensity: mean source intensity scaled to [0, 1]
 *
 * Hull area is measured between pixel centers, so it is smaller than the
 * pixel count for convex shapes and complexity clamps to 0 for them.
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Core/Region.h>
#include <PathoMorph/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Patho::Morph::Measure {

struct PATHOMORPH_API RegionMorphometry {
    int64_t area = 0;
    int64_t perimeter = 0;
    Point2d centroid;
    Rect2i boundingBox;
    std::vector<Point2i> hull;      ///< Counter-clockwise, empty if degenerate
    double hullArea = 0.0;
    double shapeComplexity = 0.0;
    double circularity = 0.0;
    double elongation = 1.0;
    double meanIntensity = 0.0;
    bool truncated = false;
};

/**
 * @brief Stateless region measurement
 */
class PATHOMORPH_API MorphometricAnalyzer {
public:
    /// Measure using the intensity recorded by the detector
    RegionMorphometry Analyze(const Region& region) const;

    /**
     * @brief Measure, taking mean intensity from another channel
     * @throws InvalidArgumentException if a region pixel lies outside the channel
     */
    RegionMorphometry Analyze(const Region& region, const ChannelImage& intensity) const;

    /// Measure every region across the worker pool; output order matches input
    std::vector<RegionMorphometry> AnalyzeAll(const std::vector<Region>& regions) const;

    /// As above, with intensities from another channel
    std::vector<RegionMorphometry> AnalyzeAll(const std::vector<Region>& regions,
                                              const ChannelImage& intensity) const;
};

/// Mean intensity of a pixel set in a channel, scaled to [0, 1]
PATHOMORPH_API double MeanIntensity(const std::vector<Point2i>& pixels, const ChannelImage& channel);

} // namespace Patho::Morph::Measure
