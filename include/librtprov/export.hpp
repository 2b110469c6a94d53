#pragma once

/// @file export.hpp
/// Cross-platform shared-library symbol visibility macro.
///
/// Build-system defines (set automatically by CMake):
///   LIBRTPROV_BUILDING : defined when compiling the librtprov library itself
///   LIBRTPROV_STATIC   : define when building/linking librtprov as a static lib

#if defined(LIBRTPROV_STATIC)
  #define LIBRTPROV_EXPORT
#elif defined(_WIN32) || defined(__CYGWIN__)
  #ifdef LIBRTPROV_BUILDING
    #define LIBRTPROV_EXPORT __declspec(dllexport)
  #else
    #define LIBRTPROV_EXPORT __declspec(dllimport)
  #endif
#elif defined(__GNUC__) || defined(__clang__)
  #define LIBRTPROV_EXPORT __attribute__((visibility("default")))
#else
  #define LIBRTPROV_EXPORT
#endif
