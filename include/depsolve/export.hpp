#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   DEPSOLVE_BUILDING  — defined when compiling the depsolve library itself
///   DEPSOLVE_STATIC    — define when building/linking depsolve as a static lib

#if defined(DEPSOLVE_STATIC)
  #define DEPSOLVE_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef DEPSOLVE_BUILDING
    #define DEPSOLVE_EXPORT __declspec(dllexport)
  #else
    #define DEPSOLVE_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define DEPSOLVE_EXPORT __attribute__((visibility("default")))
#else
  #define DEPSOLVE_EXPORT
#endif
