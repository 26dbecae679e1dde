#pragma once
/**
 * @file version.hpp
 * @brief Library version as stamped by the build (CMake `project(... VERSION ...)`).
 */

#ifndef WBR_VERSION_MAJOR
#define WBR_VERSION_MAJOR 0
#define WBR_VERSION_MINOR 1
#define WBR_VERSION_PATCH 0
#define WBR_VERSION_STRING "0.1.0"
#endif

namespace wbr {

    struct Version {
        int major;
        int minor;
        int patch;
    };

    inline constexpr Version version{WBR_VERSION_MAJOR, WBR_VERSION_MINOR, WBR_VERSION_PATCH};

    /// "major.minor.patch"
    inline constexpr const char* version_string = WBR_VERSION_STRING;

    /// Emitted in tool banners and log headers.
    inline constexpr const char* project_name = "weighted_branch_router";

} // namespace wbr
