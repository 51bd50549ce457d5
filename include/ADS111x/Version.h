/// @file Version.h
/// @brief Library version information
#pragma once

namespace ADS111x {

/// Library version string
static constexpr const char* VERSION = "1.1.0";

/// Version components
static constexpr int VERSION_MAJOR = 1;
static constexpr int VERSION_MINOR = 1;
static constexpr int VERSION_PATCH = 0;

/// Version as single integer (major * 10000 + minor * 100 + patch)
static constexpr int VERSION_INT = 10100;

} // namespace ADS111x
