#pragma once

/**
 * @file Types.h
 * @brief Basic geometric types shared across PathoMorph modules
 */

#include <PathoMorph/Core/Export.h>

#include <cmath>
#include <cstdint>

namespace Patho::Morph {

// =============================================================================
// 2D Point Types
// =============================================================================

/**
 * @brief 2D point with integer (pixel) coordinates
 */
struct PATHOMORPH_API Point2i {
    int32_t x = 0;
    int32_t y = 0;

    Point2i() = default;
    Point2i(int32_t x_, int32_t y_) : x(x_), y(y_) {}

    bool operator==(const Point2i& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Point2i& other) const { return !(*this == other); }

    /// Lexicographic (x, then y) ordering
    bool operator<(const Point2i& other) const {
        return x < other.x || (x == other.x && y < other.y);
    }
};

/**
 * @brief 2D point with sub-pixel precision
 */
struct PATHOMORPH_API Point2d {
    double x = 0.0;
    double y = 0.0;

    Point2d() = default;
    Point2d(double x_, double y_) : x(x_), y(y_) {}

    bool IsValid() const { return std::isfinite(x) && std::isfinite(y); }

    Point2d operator-(const Point2d& other) const {
        return {x - other.x, y - other.y};
    }

    double Norm() const { return std::sqrt(x * x + y * y); }

    double DistanceTo(const Point2d& other) const { return (*this - other).Norm(); }
};

// =============================================================================
// Rectangle
// =============================================================================

/**
 * @brief Axis-aligned rectangle, inclusive of (x, y), exclusive of (x+width, y+height)
 */
struct PATHOMORPH_API Rect2i {
    int32_t x = 0;
    int32_t y = 0;
    int32_t width = 0;
    int32_t height = 0;

    Rect2i() = default;
    Rect2i(int32_t x_, int32_t y_, int32_t w_, int32_t h_)
        : x(x_), y(y_), width(w_), height(h_) {}

    int64_t Area() const { return static_cast<int64_t>(width) * height; }
    bool Empty() const { return width <= 0 || height <= 0; }

    bool Contains(int32_t px, int32_t py) const {
        return px >= x && px < x + width && py >= y && py < y + height;
    }

    bool operator==(const Rect2i& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

// =============================================================================
// Enumerations
// =============================================================================

/**
 * @brief Pixel neighborhood used for connected-component growth
 */
enum class Connectivity : int32_t {
    Four = 4,
    Eight = 8
};

} // namespace Patho::Morph
