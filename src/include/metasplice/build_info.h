#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how metasplice was built.
 */

namespace metasplice {

/**
 * \brief metasplice build information.
 *
 * Toolchain values are compiled in at build time; library versions are
 * queried from the linked zlib and expat at runtime.
 */
struct BuildInfo final {
    /// metasplice version string (e.g. "0.1.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// CMake generator used to configure the build (e.g. "Ninja").
    std::string_view cmake_generator;

    /// Target platform (e.g. "Linux", "Darwin", "Windows").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU", "MSVC").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// Compiler executable path, if available.
    std::string_view cxx_compiler;

    /// True if this binary was built from the static library target.
    bool linkage_static = false;
    /// True if this binary was built from the shared library target.
    bool linkage_shared = false;

    /// Version reported by the linked zlib.
    std::string_view zlib_runtime_version;
    /// Version reported by the linked expat (e.g. "expat_2.6.2").
    std::string_view expat_runtime_version;
};

/// Returns build information for the linked metasplice library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `metasplice vX.Y.Z <build_type> [zlib-<ver>,<expat ver>] <linkage>`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked metasplice library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace metasplice
