#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - PATHOMORPH_BUILD_SHARED: when building PathoMorph as shared library
 *   - PATHOMORPH_USE_SHARED: when linking against the shared library
 *   - nothing: static build (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(PATHOMORPH_BUILD_SHARED)
        #define PATHOMORPH_API __declspec(dllexport)
    #elif defined(PATHOMORPH_USE_SHARED)
        #define PATHOMORPH_API __declspec(dllimport)
    #else
        #define PATHOMORPH_API
    #endif
#else
    #if defined(PATHOMORPH_BUILD_SHARED)
        #define PATHOMORPH_API __attribute__((visibility("default")))
    #else
        #define PATHOMORPH_API
    #endif
#endif
