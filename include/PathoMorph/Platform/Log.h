#pragma once

/**
 * @file Log.h
 * @brief Minimal leveled logging to stderr
 *
 * Usage:
 * @code
 * PATHOMORPH_LOG_WARN("%s: %d regions truncated", "RegionDetector", count);
 * Platform::SetLogLevel(Platform::LogLevel::Debug);
 * @endcode
 *
 * The initial level is Warn, or the value of the PATHOMORPH_LOG_LEVEL
 * environment variable (debug, info, warn, error, off) when set.
 */

#include <PathoMorph/Core/Export.h>

namespace Patho::Morph::Platform {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4
};

/// Set the minimum level that is written
PATHOMORPH_API void SetLogLevel(LogLevel level);

/// Get the current minimum level
PATHOMORPH_API LogLevel GetLogLevel();

/// Parse "debug", "info", "warn", "error" or "off" (case-insensitive); fallback on anything else
PATHOMORPH_API LogLevel ParseLogLevel(const char* text, LogLevel fallback);

/// Name of a level as printed in the line prefix
PATHOMORPH_API const char* LogLevelName(LogLevel level);

/// True if a message at this level would be written
inline bool IsLogEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(GetLogLevel()) && level != LogLevel::Off;
}

/**
 * @brief Write one formatted line to stderr if the level is enabled
 */
#if defined(__GNUC__) || defined(__clang__)
PATHOMORPH_API void LogMessage(LogLevel level, const char* format, ...)
    __attribute__((format(printf, 2, 3)));
#else
PATHOMORPH_API void LogMessage(LogLevel level, const char* format, ...);
#endif

} // namespace Patho::Morph::Platform

#define PATHOMORPH_LOG(level, ...)                                              \
    do {                                                                        \
        if (::Patho::Morph::Platform::IsLogEnabled(level)) {                    \
            ::Patho::Morph::Platform::LogMessage(level, __VA_ARGS__);           \
        }                                                                       \
    } while (0)

#define PATHOMORPH_LOG_DEBUG(...) PATHOMORPH_LOG(::Patho::Morph::Platform::LogLevel::Debug, __VA_ARGS__)
#define PATHOMORPH_LOG_INFO(...)  PATHOMORPH_LOG(::Patho::Morph::Platform::LogLevel::Info, __VA_ARGS__)
#define PATHOMORPH_LOG_WARN(...)  PATHOMORPH_LOG(::Patho::Morph::Platform::LogLevel::Warn, __VA_ARGS__)
#define PATHOMORPH_LOG_ERROR(...) PATHOMORPH_LOG(::Patho::Morph::Platform::LogLevel::Error, __VA_ARGS__)
