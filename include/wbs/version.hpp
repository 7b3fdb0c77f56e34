#pragma once

/// @file version.hpp
/// @brief Project version information and root namespace definition.

#define WBS_VERSION_MAJOR 1
#define WBS_VERSION_MINOR 0
#define WBS_VERSION_PATCH 0
#define WBS_VERSION_STRING "1.0.0"

namespace wbs {

/// Simulator version at compile time.
struct Version {
    static constexpr int major = WBS_VERSION_MAJOR;
    static constexpr int minor = WBS_VERSION_MINOR;
    static constexpr int patch = WBS_VERSION_PATCH;
    static constexpr const char* string = WBS_VERSION_STRING;
};

} // namespace wbs
