#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - HYPDISK_BUILD_SHARED: when building HypDisk as shared library
 *   - HYPDISK_USE_SHARED: when using HypDisk as shared library
 *   - neither: static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(HYPDISK_BUILD_SHARED)
        #define HYPDISK_API __declspec(dllexport)
    #elif defined(HYPDISK_USE_SHARED)
        #define HYPDISK_API __declspec(dllimport)
    #else
        #define HYPDISK_API
    #endif
#else
    #if defined(HYPDISK_BUILD_SHARED)
        #define HYPDISK_API __attribute__((visibility("default")))
    #else
        #define HYPDISK_API
    #endif
#endif
