#pragma once

/**
 * @file Region.h
 * @brief Connected component produced by RegionDetector
 */

#include <PathoMorph/Core/Export.h>
#include <PathoMorph/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Patho::Morph {

/**
 * @brief A 4- or 8-connected set of above-threshold pixels
 *
 * Area, perimeter, centroid, bounding box and mean intensity are filled by the
 * detector. Hull-derived measurements are computed on demand by
 * MorphometricAnalyzer.
 */
struct PATHOMORPH_API Region {
    std::vector<Point2i> pixels;    ///< Member pixels in discovery order
    int64_t area = 0;               ///< Number of member pixels
    int64_t perimeter = 0;          ///< Boundary pixel edges, 0 if not yet measured
    Point2d centroid;               ///< Mean of member pixel coordinates
    Rect2i boundingBox;             ///< Tight axis-aligned bounds
    double meanIntensity = 0.0;     ///< Mean source intensity in [0, 255]
    bool truncated = false;         ///< Growth stopped at the per-region pixel cap

    bool Empty() const { return pixels.empty(); }
};

} // namespace Patho::Morph
