// api.h - DLL export/import macros for draftcow

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for the draftcow library.
///
/// - Building draftcow as a SHARED library:
///   CMake defines DRAFTCOW_EXPORTS (private) and DRAFTCOW_SHARED (public),
///   so everything marked DRAFTCOW_API is exported.
/// - Using draftcow as a SHARED library:
///   DRAFTCOW_SHARED is propagated by the target and symbols are imported.
/// - STATIC builds: DRAFTCOW_API expands to nothing.
///
/// @code
/// class DRAFTCOW_API DraftScope { ... };
/// DRAFTCOW_API Value apply_patches(...);
/// @endcode

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef DRAFTCOW_SHARED
        #ifdef DRAFTCOW_EXPORTS
            #define DRAFTCOW_API __declspec(dllexport)
        #else
            #define DRAFTCOW_API __declspec(dllimport)
        #endif
    #else
        #define DRAFTCOW_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(DRAFTCOW_SHARED) && defined(DRAFTCOW_EXPORTS)
        #define DRAFTCOW_API __attribute__((visibility("default")))
    #else
        #define DRAFTCOW_API
    #endif
#else
    #define DRAFTCOW_API
#endif

// ============================================================
// Deprecation Warnings
// ============================================================

#if defined(__GNUC__) || defined(__clang__)
    #define DRAFTCOW_DEPRECATED(msg) __attribute__((deprecated(msg)))
#elif defined(_MSC_VER)
    #define DRAFTCOW_DEPRECATED(msg) __declspec(deprecated(msg))
#else
    #define DRAFTCOW_DEPRECATED(msg)
#endif
