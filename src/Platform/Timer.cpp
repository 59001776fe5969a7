/**
 * @file Timer.cpp
 * @brief Stage timer implementation
 */

#include <PathoMorph/Platform/Timer.h>

namespace Patho::Morph::Platform {

Timer::Timer()
    : start_(std::chrono::steady_clock::now()) {
}

double Timer::ElapsedMs() const {
    std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start_;
    return elapsed.count();
}

double Timer::Lap() {
    auto now = std::chrono::steady_clock::now();
    std::chrono::duration<double, std::milli> elapsed = now - start_;
    start_ = now;
    return elapsed.count();
}

} // namespace Patho::Morph::Platform
