#pragma once

/// @file export.hpp
/// Symbol visibility for the wheatgrass library.
///
/// wheatgrass builds as a static library unless CMake is configured with
/// WHEATGRASS_BUILD_SHARED, which defines WHEATGRASS_SHARED for the library
/// and its consumers.  WHEATGRASS_BUILDING is defined only while compiling
/// the library itself.

#ifndef WHEATGRASS_SHARED
  #define WHEATGRASS_EXPORT
#elif defined(_WIN32)
  #ifdef WHEATGRASS_BUILDING
    #define WHEATGRASS_EXPORT __declspec(dllexport)
  #else
    #define WHEATGRASS_EXPORT __declspec(dllimport)
  #endif
#else
  #define WHEATGRASS_EXPORT __attribute__((visibility("default")))
#endif
