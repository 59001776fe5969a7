#pragma once

/**
 * @file RegionFeatures.h
 * @brief Geometric features of pixel sets
 *
 * Provides:
 * - Centroid and bounding box
 * - Edge-set perimeter (count of pixel edges not shared by two members)
 * - Convex hull (Andrew's monotone chain) and polygon area (shoelace)
 * - Shape complexity and circularity
 *
 * All functions expect each pixel at most once in the input.
 */

#include <PathoMorph/Core/Types.h>

#include <cstdint>
#include <vector>

namespace Patho::Morph::Internal {

// =============================================================================
// Basic Features
// =============================================================================

/// Mean of pixel coordinates; (0,0) for an empty set
Point2d ComputeCentroid(const std::vector<Point2i>& pixels);

/// Tight bounds; empty rectangle for an empty set
Rect2i ComputeBoundingBox(const std::vector<Point2i>& pixels);

/**
 * @brief Boundary length in pixel edges
 *
 * Each member pixel toggles its four unit edges in a set; edges shared by two
 * members cancel out. The result is the size of the remaining set, which also
 * counts the boundaries of interior holes.
 */
int64_t ComputeEdgePerimeter(const std::vector<Point2i>& pixels);

// =============================================================================
// Convex Hull
// =============================================================================

/**
 * @brief Convex hull of the pixel centers, counter-clockwise
 *
 * Collinear points are dropped. Returns an empty vector when fewer than 3
 * non-collinear distinct points exist.
 */
std::vector<Point2i> ComputeConvexHull(std::vector<Point2i> points);

/// Shoelace area of a closed polygon; 0 for fewer than 3 vertices
double ComputePolygonArea(const std::vector<Point2i>& polygon);

// =============================================================================
// Shape Descriptors
// =============================================================================

/**
 * @brief 1 - area / hullArea clamped to [0, 1]
 * @return 0 when hullArea is not positive
 */
double ComputeShapeComplexity(double area, double hullArea);

/**
 * @brief 4*pi*area / perimeter^2 clamped to [0, 1]
 * @return 0 when perimeter is not positive
 */
double ComputeCircularity(double area, double perimeter);

} // namespace Patho::Morph::Internal
