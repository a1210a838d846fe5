#pragma once

/// @file version.hpp
/// @brief Library version information and root namespace definition.

#define ARANK_VERSION_MAJOR 0
#define ARANK_VERSION_MINOR 3
#define ARANK_VERSION_PATCH 0
#define ARANK_VERSION_STRING "0.3.0"

namespace arank {

/// Library version information at compile time.
struct Version {
    static constexpr int major = ARANK_VERSION_MAJOR;
    static constexpr int minor = ARANK_VERSION_MINOR;
    static constexpr int patch = ARANK_VERSION_PATCH;
    static constexpr const char* string = ARANK_VERSION_STRING;
};

} // namespace arank
