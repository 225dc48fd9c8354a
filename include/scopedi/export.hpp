#pragma once

/// @file export.hpp
/// Symbol visibility for the scopedi shared library.
///
/// CMake sets SCOPEDI_BUILDING while compiling scopedi and adds
/// SCOPEDI_STATIC to every consumer of a static build.  The library is
/// compiled with hidden visibility; only SCOPEDI_EXPORT types are public.

#if defined(_WIN32) || defined(__CYGWIN__)
  #define SCOPEDI_DLL_EXPORT __declspec(dllexport)
  #define SCOPEDI_DLL_IMPORT __declspec(dllimport)
#elif defined(__GNUC__) || defined(__clang__)
  #define SCOPEDI_DLL_EXPORT __attribute__((visibility("default")))
  #define SCOPEDI_DLL_IMPORT __attribute__((visibility("default")))
#else
  #define SCOPEDI_DLL_EXPORT
  #define SCOPEDI_DLL_IMPORT
#endif

#if defined(SCOPEDI_STATIC)
  #define SCOPEDI_EXPORT
#elif defined(SCOPEDI_BUILDING)
  #define SCOPEDI_EXPORT SCOPEDI_DLL_EXPORT
#else
  #define SCOPEDI_EXPORT SCOPEDI_DLL_IMPORT
#endif
