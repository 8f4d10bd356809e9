#pragma once

/**
 * @file Export.h
 * @brief Export/import macros for shared library support
 *
 * Build system should define one of:
 *   - QILANDSCAPE_BUILD_SHARED: when building QiLandscape as shared library
 *   - QILANDSCAPE_USE_SHARED: when using QiLandscape as shared library
 *   - QILANDSCAPE_STATIC: when building/using as static library (default)
 */

#if defined(_WIN32) || defined(_WIN64)
    #if defined(QILANDSCAPE_BUILD_SHARED)
        #define QILANDSCAPE_API __declspec(dllexport)
    #elif defined(QILANDSCAPE_USE_SHARED)
        #define QILANDSCAPE_API __declspec(dllimport)
    #else
        #define QILANDSCAPE_API
    #endif
#else
    #if defined(QILANDSCAPE_BUILD_SHARED)
        #define QILANDSCAPE_API __attribute__((visibility("default")))
    #else
        #define QILANDSCAPE_API
    #endif
#endif
