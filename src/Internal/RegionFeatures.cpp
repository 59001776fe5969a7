/**
 * @file RegionFeatures.cpp
 * @brief Geometric features of pixel sets
 */

#include <PathoMorph/Internal/RegionFeatures.h>
#include <PathoMorph/Core/Constants.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <unordered_set>

namespace Patho::Morph::Internal {

namespace {

// Edge keys: a unit edge is identified by its start corner (x, y) and its
// direction. Horizontal edge at (x, y) runs (x, y)-(x+1, y); vertical edge at
// (x, y) runs (x, y)-(x, y+1). Coordinates are offset by one so that edges on
// the image border never go negative.
inline uint64_t EdgeKey(int32_t x, int32_t y, bool vertical) {
    uint64_t ux = static_cast<uint32_t>(x + 1);
    uint64_t uy = static_cast<uint32_t>(y + 1);
    return (((ux << 31) | uy) << 1) | (vertical ? 1u : 0u);
}

inline void Toggle(std::unordered_set<uint64_t>& edges, uint64_t key) {
    auto inserted = edges.insert(key);
    if (!inserted.second) {
        edges.erase(inserted.first);
    }
}

inline int64_t Cross(const Point2i& o, const Point2i& a, const Point2i& b) {
    return static_cast<int64_t>(a.x - o.x) * (b.y - o.y) -
           static_cast<int64_t>(a.y - o.y) * (b.x - o.x);
}

} // anonymous namespace

// =============================================================================
// Basic Features
// =============================================================================

Point2d ComputeCentroid(const std::vector<Point2i>& pixels) {
    if (pixels.empty()) return {};

    double sumX = 0.0;
    double sumY = 0.0;
    for (const auto& p : pixels) {
        sumX += p.x;
        sumY += p.y;
    }
    double n = static_cast<double>(pixels.size());
    return {sumX / n, sumY / n};
}

Rect2i ComputeBoundingBox(const std::vector<Point2i>& pixels) {
    if (pixels.empty()) return {};

    int32_t minX = std::numeric_limits<int32_t>::max();
    int32_t minY = std::numeric_limits<int32_t>::max();
    int32_t maxX = std::numeric_limits<int32_t>::min();
    int32_t maxY = std::numeric_limits<int32_t>::min();

    for (const auto& p : pixels) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
    }

    return {minX, minY, maxX - minX + 1, maxY - minY + 1};
}

int64_t ComputeEdgePerimeter(const std::vector<Point2i>& pixels) {
    std::unordered_set<uint64_t> edges;
    edges.reserve(pixels.size() * 4);

    for (const auto& p : pixels) {
        Toggle(edges, EdgeKey(p.x, p.y, false));        // top
        Toggle(edges, EdgeKey(p.x, p.y + 1, false));    // bottom
        Toggle(edges, EdgeKey(p.x, p.y, true));         // left
        Toggle(edges, EdgeKey(p.x + 1, p.y, true));     // right
    }

    return static_cast<int64_t>(edges.size());
}

// =============================================================================
// Convex Hull
// =============================================================================

std::vector<Point2i> ComputeConvexHull(std::vector<Point2i> points) {
    std::sort(points.begin(), points.end());
    points.erase(std::unique(points.begin(), points.end()), points.end());

    if (points.size() < 3) {
        return {};
    }

    // Andrew's monotone chain
    std::vector<Point2i> hull;
    hull.reserve(points.size() * 2);
    int n = static_cast<int>(points.size());

    for (int i = 0; i < n; ++i) {
        while (hull.size() >= 2 && Cross(hull[hull.size()-2], hull[hull.size()-1], points[i]) <= 0) {
            hull.pop_back();
        }
        hull.push_back(points[i]);
    }

    size_t lowerSize = hull.size();
    for (int i = n - 2; i >= 0; --i) {
        while (hull.size() > lowerSize &&
               Cross(hull[hull.size()-2], hull[hull.size()-1], points[i]) <= 0) {
            hull.pop_back();
        }
        hull.push_back(points[i]);
    }

    // Last point repeats the first
    hull.pop_back();

    if (hull.size() < 3) {
        return {};
    }
    return hull;
}

double ComputePolygonArea(const std::vector<Point2i>& polygon) {
    if (polygon.size() < 3) return 0.0;

    double area = 0.0;
    size_t n = polygon.size();
    for (size_t i = 0; i < n; ++i) {
        size_t j = (i + 1) % n;
        area += static_cast<double>(polygon[i].x) * polygon[j].y;
        area -= static_cast<double>(polygon[j].x) * polygon[i].y;
    }
    return std::abs(area) / 2.0;
}

// =============================================================================
// Shape Descriptors
// =============================================================================

double ComputeShapeComplexity(double area, double hullArea) {
    if (!(hullArea > GEOM_EPSILON)) return 0.0;
    return std::clamp(1.0 - area / hullArea, 0.0, 1.0);
}

double ComputeCircularity(double area, double perimeter) {
    if (!(perimeter > GEOM_EPSILON)) return 0.0;
    return std::clamp(4.0 * PI * area / (perimeter * perimeter), 0.0, 1.0);
}

} // namespace Patho::Morph::Internal
