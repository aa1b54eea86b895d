// api.h - DLL export/import macros for keydiff

#pragma once

/// @file api.h
/// @brief Cross-platform DLL export/import macros for keydiff library.
///
/// Usage:
/// - When building keydiff as a SHARED library:
///   - CMake defines KEYDIFF_EXPORTS (private) and KEYDIFF_SHARED (public)
///   - Functions/classes marked with KEYDIFF_API will be exported
///
/// - When using keydiff as a SHARED library:
///   - Link against the keydiff target (CMake propagates KEYDIFF_SHARED)
///   - Functions/classes marked with KEYDIFF_API will be imported
///
/// - When building/using as a STATIC library:
///   - No macros defined, KEYDIFF_API expands to nothing
///
/// The diff engine itself is header-only (templates); only the Value
/// utilities, the JSON codec, the document loader and the report helpers
/// carry KEYDIFF_API.

// ============================================================
// Platform Detection and Export Macro Definition
// ============================================================

#if defined(_WIN32) || defined(_WIN64)
    #ifdef KEYDIFF_SHARED
        #ifdef KEYDIFF_EXPORTS
            #define KEYDIFF_API __declspec(dllexport)
        #else
            #define KEYDIFF_API __declspec(dllimport)
        #endif
    #else
        #define KEYDIFF_API
    #endif
#elif defined(__GNUC__) || defined(__clang__)
    #if defined(KEYDIFF_SHARED) && defined(KEYDIFF_EXPORTS)
        #define KEYDIFF_API __attribute__((visibility("default")))
    #else
        #define KEYDIFF_API
    #endif
#else
    #define KEYDIFF_API
#endif
