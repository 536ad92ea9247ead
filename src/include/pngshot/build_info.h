#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how pngshot was built.
 */

namespace pngshot {

/**
 * \brief pngshot build information.
 *
 * Values are compiled into the binary at configure time.
 */
struct BuildInfo final {
    /// pngshot version string (e.g. "1.0.0").
    std::string_view version;

    /// Build timestamp in UTC (ISO-8601), or empty if not recorded.
    std::string_view build_timestamp_utc;

    /// Build type string (e.g. "Release", "Debug", "multi-config").
    std::string_view build_type;

    /// Target platform (e.g. "Linux", "Darwin").
    std::string_view system_name;

    /// Target CPU architecture (e.g. "x86_64", "arm64").
    std::string_view system_processor;

    /// Compiler ID (e.g. "Clang", "GNU").
    std::string_view cxx_compiler_id;

    /// Compiler version string.
    std::string_view cxx_compiler_version;

    /// Linked zlib version (CRC-32).
    std::string_view zlib_version;
    /// Linked libjpeg version (JPEG decode).
    std::string_view jpeg_version;
    /// Linked libpng version (PNG encode).
    std::string_view png_version;
};

/// Returns build information for the linked pngshot library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `pngshot vX.Y.Z <build_type> [zlib A,libjpeg B,libpng C]`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked pngshot library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

}  // namespace pngshot
