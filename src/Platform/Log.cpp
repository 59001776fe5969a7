/**
 * @file Log.cpp
 * @brief Leveled stderr logging
 */

#include <PathoMorph/Platform/Log.h>

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <mutex>
#include <string>

namespace Patho::Morph::Platform {

namespace {

LogLevel InitialLevel() {
    const char* env = std::getenv("PATHOMORPH_LOG_LEVEL");
    return env ? ParseLogLevel(env, LogLevel::Warn) : LogLevel::Warn;
}

std::atomic<int>& LevelStorage() {
    static std::atomic<int> level{static_cast<int>(InitialLevel())};
    return level;
}

std::mutex& OutputMutex() {
    static std::mutex mutex;
    return mutex;
}

} // anonymous namespace

void SetLogLevel(LogLevel level) {
    LevelStorage().store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel GetLogLevel() {
    return static_cast<LogLevel>(LevelStorage().load(std::memory_order_relaxed));
}

LogLevel ParseLogLevel(const char* text, LogLevel fallback) {
    if (text == nullptr) return fallback;

    std::string lower;
    for (const char* p = text; *p; ++p) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(*p))));
    }

    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return fallback;
}

const char* LogLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        default:              return "OFF";
    }
}

void LogMessage(LogLevel level, const char* format, ...) {
    if (!IsLogEnabled(level)) return;

    char message[1024];
    va_list args;
    va_start(args, format);
    std::vsnprintf(message, sizeof(message), format, args);
    va_end(args);

    std::lock_guard<std::mutex> lock(OutputMutex());
    std::fprintf(stderr, "[PathoMorph][%s] %s\n", LogLevelName(level), message);
}

} // namespace Patho::Morph::Platform
