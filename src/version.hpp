#pragma once

// Build/version info.
//
// CMake defines PETSPRITES_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".
//
// PETSPRITES_PROJECT_ROOT comes from the cache variable of the same name,
// which defaults to the source directory. Without it the output directory is
// resolved from the executable location at runtime.

#ifndef PETSPRITES_VERSION
#define PETSPRITES_VERSION "dev"
#endif

#ifndef PETSPRITES_APPNAME
#define PETSPRITES_APPNAME "petsprites"
#endif
