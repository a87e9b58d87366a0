#pragma once

#include <string>
#include <string_view>

/**
 * \file build_info.h
 * \brief Runtime information about how PhotoClean was built.
 */

namespace photoclean {

/**
 * \brief PhotoClean build information.
 *
 * Values are compiled into the binary at build time.
 */
struct BuildInfo final {
    /// PhotoClean version string (e.g. "0.2.0").
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

    /// libjpeg API version the JPEG backend was compiled against (e.g. 62).
    int jpeg_lib_version = 0;
    /// libpng version the PNG backend was compiled against.
    std::string_view png_version;

    /// Whether libwebp support was requested at configure time.
    bool option_with_webp = false;
    /// Whether libtiff support was requested at configure time.
    bool option_with_tiff = false;
    /// Whether giflib support was requested at configure time.
    bool option_with_gif = false;

    /// Whether zlib support is compiled in (linked).
    bool has_zlib = false;
    /// Whether the libwebp backend is compiled in (linked).
    bool has_webp = false;
    /// Whether the libtiff backend is compiled in (linked).
    bool has_tiff = false;
    /// Whether the giflib backend is compiled in (linked).
    bool has_gif = false;
};

/// Returns build information for the linked PhotoClean library.
const BuildInfo&
build_info() noexcept;

/**
 * \brief Formats a stable, human-readable build info header (2 lines).
 *
 * Output format:
 * - `PhotoClean vX.Y.Z <build_type> [features]`
 * - `built with <compiler> for <system>/<arch> (<timestamp>)`
 */
void
format_build_info_lines(const BuildInfo& info, std::string* line1,
                        std::string* line2) noexcept;

/// Convenience overload for the linked PhotoClean library build.
void
format_build_info_lines(std::string* line1, std::string* line2) noexcept;

/**
 * \brief Lists the formats \p info can clean, e.g. "JPEG, PNG, GIF".
 *
 * Formats whose backend is not compiled in are left out; files in those
 * formats are skipped.
 */
void
format_supported_formats(const BuildInfo& info, std::string* out);

}  // namespace photoclean
