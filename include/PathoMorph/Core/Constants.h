#pragma once

/**
 * @file Constants.h
 * @brief Numeric constants used by the measurement and scoring stages
 */

#include <cstdint>

namespace Patho::Morph {

constexpr double PI = 3.14159265358979323846;

/// Number of intensity levels in an 8-bit channel
constexpr int32_t INTENSITY_LEVELS = 256;

/// Optical density ceiling applied during stain deconvolution
constexpr double DEFAULT_MAX_OPTICAL_DENSITY = 2.0;

/// Tolerance accepted on the sum of aggregation weights
constexpr double WEIGHT_SUM_EPSILON = 1e-3;

/// Bonus added to the weighted mean confidence, and the confidence ceiling
constexpr double CONFIDENCE_BONUS = 0.1;
constexpr double CONFIDENCE_CEILING = 0.95;

/// Geometry comparison tolerance
constexpr double GEOM_EPSILON = 1e-9;

} // namespace Patho::Morph
