#pragma once

#include "photoclean/image_format.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file format_trim.h
 * \brief Removal of bytes appended after a format's end-of-data marker.
 */

namespace photoclean {

/// Outcome of a trim operation.
enum class TrimStatus : uint8_t {
    /// The terminator was found and trailing bytes were removed.
    Trimmed,
    /// The terminator was found at the very end; nothing to remove.
    Unchanged,
    /// No terminator could be located (or the structure is malformed); the
    /// input is returned unchanged.
    NoTerminator,
    /// The format has no trimming rule (TIFF, unknown extensions).
    NotApplicable,
};

/**
 * \brief Result of trimming a byte buffer.
 *
 * \ref bytes is always a prefix of the input buffer (same data pointer,
 * `bytes.size() <= input.size()`).
 */
struct TrimResult final {
    std::span<const std::byte> bytes;
    TrimStatus status = TrimStatus::NotApplicable;
    /// Number of trailing bytes dropped (`input.size() - bytes.size()`).
    uint64_t removed = 0;
};

/// Returns a stable lowercase name for \p status.
const char*
trim_status_name(TrimStatus status) noexcept;

/**
 * \brief Trims trailing data according to \p format.
 *
 * \ref ImageFormat::Tiff and \ref ImageFormat::Unknown pass through
 * unchanged with \ref TrimStatus::NotApplicable.
 */
TrimResult
trim_trailing_data(std::span<const std::byte> bytes,
                   ImageFormat format) noexcept;

/// Extension-driven overload (e.g. ".JPG", "png").
TrimResult
trim_trailing_data(std::span<const std::byte> bytes,
                   std::string_view extension) noexcept;

/**
 * \brief JPEG: keeps everything up to and including the last `FF D9`.
 *
 * \note This is a heuristic. JPEG has no authoritative length field, and
 * layouts that legitimately follow the primary image (e.g. multi-picture
 * containers) end at their own last EOI, which is where this cut lands.
 */
TrimResult
trim_jpeg(std::span<const std::byte> bytes) noexcept;

/// PNG: walks the chunk list and keeps everything through the IEND CRC.
TrimResult
trim_png(std::span<const std::byte> bytes) noexcept;

/// GIF: keeps everything up to and including the last trailer byte (0x3B).
TrimResult
trim_gif(std::span<const std::byte> bytes) noexcept;

/// WebP: truncates to the RIFF size declared in the header plus 8.
TrimResult
trim_webp(std::span<const std::byte> bytes) noexcept;

}  // namespace photoclean
