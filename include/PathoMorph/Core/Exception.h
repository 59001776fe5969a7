#pragma once

#include <PathoMorph/Core/Export.h>

/**
 * @file Exception.h
 * @brief Exception classes for PathoMorph
 *
 * Fatal conditions are reported by exception. Recoverable conditions
 * (too few samples for a scorer, a region or region count hitting its cap)
 * are reported through flags on the result types instead.
 */

#include <stdexcept>
#include <string>

namespace Patho::Morph {

/**
 * @brief Base exception class for PathoMorph
 */
class PATHOMORPH_API Exception : public std::runtime_error {
public:
    explicit Exception(const std::string& message)
        : std::runtime_error(message) {}

    explicit Exception(const char* message)
        : std::runtime_error(message) {}
};

/**
 * @brief Malformed pixel buffer or channel (null data, size mismatch, zero dimensions)
 */
class PATHOMORPH_API InvalidInputException : public Exception {
public:
    explicit InvalidInputException(const std::string& message)
        : Exception("Invalid input: " + message) {}
};

/**
 * @brief Invalid configuration (weights, stain matrix, bands, detector limits)
 *
 * Raised when a component is constructed, before any image is processed.
 */
class PATHOMORPH_API ConfigurationException : public Exception {
public:
    explicit ConfigurationException(const std::string& message)
        : Exception("Configuration error: " + message) {}
};

/**
 * @brief Invalid argument passed to a lower-level routine
 */
class PATHOMORPH_API InvalidArgumentException : public Exception {
public:
    explicit InvalidArgumentException(const std::string& message)
        : Exception("Invalid argument: " + message) {}
};

/**
 * @brief File I/O exception
 */
class PATHOMORPH_API IOException : public Exception {
public:
    explicit IOException(const std::string& message)
        : Exception("I/O error: " + message) {}
};

} // namespace Patho::Morph
