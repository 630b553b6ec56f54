#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - CELLDECLUMP_BUILD_SHARED: when building CellDeclump as shared library
 *   - CELLDECLUMP_USE_SHARED: when using CellDeclump as shared library
 *   - CELLDECLUMP_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(CELLDECLUMP_BUILD_SHARED)
        #define CELLDECLUMP_API __declspec(dllexport)
    #elif defined(CELLDECLUMP_USE_SHARED)
        #define CELLDECLUMP_API __declspec(dllimport)
    #else
        #define CELLDECLUMP_API
    #endif
#else
    #if defined(CELLDECLUMP_BUILD_SHARED)
        #define CELLDECLUMP_API __attribute__((visibility("default")))
    #else
        #define CELLDECLUMP_API
    #endif
#endif
