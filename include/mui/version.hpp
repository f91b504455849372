#pragma once

/// @file version.hpp
/// @brief Library version information.

#define MUI_VERSION_MAJOR 0
#define MUI_VERSION_MINOR 1
#define MUI_VERSION_PATCH 0

namespace mui {

/// @brief Return the library version string (e.g. "0.1.0").
inline const char* version() {
    return "0.1.0";
}

inline int versionMajor() { return MUI_VERSION_MAJOR; }
inline int versionMinor() { return MUI_VERSION_MINOR; }
inline int versionPatch() { return MUI_VERSION_PATCH; }

} // namespace mui
