#pragma once

/**
 * @file version.hpp
 * @brief fieldlens version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace fieldlens {

/// fieldlens version string
constexpr const char* kVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

/// Version written into every call analysis document
constexpr const char* kResultVersion = "1.0";

/// Schema identifiers
constexpr const char* kProgramSchemaVersion = "program.v1";
constexpr const char* kConfigSchemaVersion = "config.v1";

}  // namespace fieldlens
