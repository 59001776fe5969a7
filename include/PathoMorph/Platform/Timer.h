#pragma once

/**
 * @file Timer.h
 * @brief Stage timing for the analysis pipeline
 *
 * Usage:
 * @code
 * Timer stage;
 * // ... deconvolve ...
 * timings.deconvolveMs = stage.Lap();
 * // ... enhance ...
 * timings.enhanceMs = stage.Lap();
 * @endcode
 */

#include <PathoMorph/Core/Export.h>

#include <chrono>

namespace Patho::Morph::Platform {

/**
 * @brief Monotonic stopwatch, running from construction
 */
class PATHOMORPH_API Timer {
public:
    Timer();

    /// Milliseconds since construction or the last Lap()
    double ElapsedMs() const;

    /// Return ElapsedMs() and restart from now
    double Lap();

private:
    std::chrono::steady_clock::time_point start_;
};

} // namespace Patho::Morph::Platform
