#pragma once

/**
 * @file Validate.h
 * @brief Argument and input validation helpers
 *
 * Input problems (bad buffers) raise InvalidInputException, misuse of a
 * routine raises InvalidArgumentException, and bad configuration raises
 * ConfigurationException. Messages are prefixed with the calling function.
 */

#include <PathoMorph/Core/ChannelImage.h>
#include <PathoMorph/Core/Exception.h>
#include <PathoMorph/Core/PixelBuffer.h>

#include <cmath>
#include <cstdio>
#include <string>

namespace Patho::Morph::Validate {

namespace Detail {

inline std::string FormatValue(double val) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.4g", val);
    return buf;
}

inline std::string FormatValue(int val) { return std::to_string(val); }
inline std::string FormatValue(int64_t val) { return std::to_string(val); }
inline std::string FormatValue(size_t val) { return std::to_string(val); }

} // namespace Detail

// =============================================================================
// Input validation
// =============================================================================

/**
 * @brief Require a usable RGBA buffer
 * @throws InvalidInputException on null data, zero dimensions or a byte count
 *         that does not match width*height*4
 */
inline void RequirePixelBuffer(const PixelBuffer& buffer, const char* funcName) {
    if (buffer.Data() == nullptr) {
        throw InvalidInputException(std::string(funcName) + ": pixel data is null");
    }
    if (buffer.Width() <= 0 || buffer.Height() <= 0) {
        throw InvalidInputException(
            std::string(funcName) + ": dimensions must be positive, got " +
            Detail::FormatValue(buffer.Width()) + "x" + Detail::FormatValue(buffer.Height()));
    }
    size_t expected = buffer.PixelCount() * PixelBuffer::BYTES_PER_PIXEL;
    if (buffer.ByteCount() != expected) {
        throw InvalidInputException(
            std::string(funcName) + ": buffer holds " + Detail::FormatValue(buffer.ByteCount()) +
            " bytes, expected " + Detail::FormatValue(expected));
    }
}

/**
 * @brief Require a non-empty channel
 * @throws InvalidInputException if the channel is empty
 */
inline void RequireChannel(const ChannelImage& channel, const char* funcName) {
    if (channel.Empty()) {
        throw InvalidInputException(std::string(funcName) + ": channel is empty");
    }
}

/**
 * @brief Require two channels with identical dimensions
 */
inline void RequireSameSize(const ChannelImage& a, const ChannelImage& b, const char* funcName) {
    if (a.Width() != b.Width() || a.Height() != b.Height()) {
        throw InvalidInputException(
            std::string(funcName) + ": channel size mismatch (" +
            Detail::FormatValue(a.Width()) + "x" + Detail::FormatValue(a.Height()) + " vs " +
            Detail::FormatValue(b.Width()) + "x" + Detail::FormatValue(b.Height()) + ")");
    }
}

// =============================================================================
// Value validation
// =============================================================================

/**
 * @brief Validate value is in range [min, max]
 */
template<typename T>
inline void RequireRange(T value, T minVal, T maxVal,
                         const char* paramName, const char* funcName) {
    if (value < minVal || value > maxVal) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be in [" +
            Detail::FormatValue(minVal) + ", " + Detail::FormatValue(maxVal) +
            "], got " + Detail::FormatValue(value));
    }
}

/**
 * @brief Validate value is non-negative (>= 0)
 */
template<typename T>
inline void RequireNonNegative(T value, const char* paramName, const char* funcName) {
    if (value < T(0)) {
        throw InvalidArgumentException(
            std::string(funcName) + ": " + paramName + " must be >= 0, got " +
            Detail::FormatValue(value));
    }
}

/**
 * @brief Validate a configuration value is finite
 */
inline void RequireFiniteConfig(double value, const char* paramName, const char* funcName) {
    if (!std::isfinite(value)) {
        throw ConfigurationException(
            std::string(funcName) + ": " + paramName + " must be finite");
    }
}

} // namespace Patho::Morph::Validate
