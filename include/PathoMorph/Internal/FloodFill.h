#pragma once

/**
 * @file FloodFill.h
 * @brief Explicit-stack flood fill used for connected-component extraction
 *
 * Recursion is never used, so region size is bounded only by memory and by
 * the caller's pixel cap, not by call-stack depth.
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Patho::Morph::Internal {

/**
 * @brief Outcome of growing one component
 */
struct FloodFillResult {
    std::vector<Point2i> pixels;    ///< Member pixels in pop order
    bool truncated = false;         ///< Growth stopped at maxPixels with frontier left
};

/**
 * @brief Grow the component of pixels with value > threshold containing seed
 *
 * A pixel is marked in @p visited when it is pushed. When the component
 * reaches @p maxPixels members while the frontier is not empty, growth stops,
 * the frontier pixels are unmarked (so they may seed later components) and
 * the result is flagged truncated.
 *
 * @param channel Source channel
 * @param visited Grid of width*height flags indexed y*width+x, updated in place
 * @param seed Start pixel; must be in bounds, unvisited and above threshold
 * @param threshold Pixels strictly above this value are foreground
 * @param connectivity 4 or 8 neighborhood
 * @param maxPixels Per-component cap (>= 1)
 */
FloodFillResult FloodFill(const ChannelImage& channel,
                          std::vector<uint8_t>& visited,
                          const Point2i& seed,
                          int32_t threshold,
                          Connectivity connectivity,
                          int64_t maxPixels);

} // namespace Patho::Morph::Internal
