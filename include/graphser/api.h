// api.h - DLL export/import macros for graphser

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for graphser library.
///
/// Usage:
/// - When building graphser as a SHARED library:
///   - CMake automatically defines GRAPHSER_EXPORTS (private) and GRAPHSER_SHARED (public)
///   - Functions/classes marked with GRAPHSER_API will be exported
///
/// - When using graphser as a SHARED library:
///   - Link against graphser target (CMake propagates GRAPHSER_SHARED)
///   - Functions/classes marked with GRAPHSER_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, GRAPHSER_API expands to nothing

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef GRAPHSER_SHARED
        #ifdef GRAPHSER_EXPORTS
            #define GRAPHSER_API __declspec(dllexport)
        #else
            #define GRAPHSER_API __declspec(dllimport)
        #endif
    #else
        #define GRAPHSER_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(GRAPHSER_SHARED) && defined(GRAPHSER_EXPORTS)
        #define GRAPHSER_API __attribute__((visibility("default")))
    #else
        #define GRAPHSER_API
    #endif
#else
    #define GRAPHSER_API
#endif

// ============================================================
// Deprecation Warnings
// ============================================================

#if defined(__GNUC__) || defined(__clang__)
    #define GRAPHSER_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define GRAPHSER_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define GRAPHSER_DEPRECATED(msg)
#endif
