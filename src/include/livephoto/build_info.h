#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how livephoto was built.
 */

namespace livephoto {

/**
 * \brief livephoto build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// livephoto version string (e.g. "0.4.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform (e.g. "Linux", "Darwin").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// Expat version found at configure time.
    std::string_view expat_version;
};

/// Returns build information for the linked livephoto library.
const BuildInfo&
build_info() noexcept;

/// Version reported by the Expat library linked at run time.
std::string_view
expat_runtime_version() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `livephoto vX.Y.Z <build_type> [expat <version>]`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked livephoto library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace livephoto
