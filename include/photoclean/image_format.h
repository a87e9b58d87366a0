#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file image_format.h
 * \brief Image format tags, extension lookup and magic-byte detection.
 */

namespace photoclean {

/// Image container formats known to PhotoClean.
enum class ImageFormat : uint8_t {
    Unknown,
    Jpeg,
    Png,
    Gif,
    Webp,
    Tiff,
};

/// Returns a stable lowercase name (e.g. "jpeg"), or "unknown".
const char*
image_format_name(ImageFormat format) noexcept;

/**
 * \brief Maps a file extension to a format.
 *
 * Accepts the extension with or without the leading dot and in any ASCII
 * case (".JPG", "jpeg", ".Tiff"). Unrecognized extensions map to
 * \ref ImageFormat::Unknown.
 */
ImageFormat
format_from_extension(std::string_view extension) noexcept;

/**
 * \brief Returns the extension of the last path component, including the dot.
 *
 * Dot files (".profile") and names ending in a dot have no extension and
 * return an empty view. The result points into \p path.
 */
std::string_view
path_extension(std::string_view path) noexcept;

/// True when \p path has one of the extensions PhotoClean processes.
bool
is_candidate_path(std::string_view path) noexcept;

/**
 * \brief Output format chosen from a file extension when the codec did not
 * report one. Unrecognized extensions fall back to PNG.
 */
ImageFormat
fallback_output_format(std::string_view extension) noexcept;

/// Detects the container format from its leading magic bytes.
ImageFormat
detect_image_format(std::span<const std::byte> bytes) noexcept;

}  // namespace photoclean
