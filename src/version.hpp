#pragma once

// Build/version info.
//
// CMake defines DELVEGEN_VERSION to the project version string.
// If you build without CMake, it falls back to "dev".

#ifndef DELVEGEN_VERSION
#define DELVEGEN_VERSION "dev"
#endif

#ifndef DELVEGEN_APPNAME
#define DELVEGEN_APPNAME "DelveGen"
#endif
