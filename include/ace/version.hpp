#pragma once

/// @file version.hpp
/// @brief Project version information and core namespace definition.

#define ACE_VERSION_MAJOR 0
#define ACE_VERSION_MINOR 3
#define ACE_VERSION_PATCH 0
#define ACE_VERSION_STRING "0.3.0"

namespace ace {

/// Engine version information at compile time.
struct Version {
    static constexpr int major = ACE_VERSION_MAJOR;
    static constexpr int minor = ACE_VERSION_MINOR;
    static constexpr int patch = ACE_VERSION_PATCH;
    static constexpr const char* string = ACE_VERSION_STRING;
};

} // namespace ace
