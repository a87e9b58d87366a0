#pragma once

#include "photoclean/image_format.h"

#include <cstddef>
#include <cstdint>
#include <span>

/**
 * \file metadata_scan.h
 * \brief Locates metadata blocks inside JPEG, PNG, WebP and GIF streams.
 */

namespace photoclean {

/// Scanner result status.
enum class ScanStatus : uint8_t {
    Ok,
    /// Output buffer was too small; \ref ScanResult::needed reports required size.
    OutputTruncated,
    /// The bytes are not a container handled by the scanner.
    Unsupported,
    /// The container structure is malformed; blocks found so far are reported.
    Malformed,
};

/// Logical kind of a discovered metadata block.
enum class MetadataKind : uint8_t {
    Unknown,
    Exif,
    Xmp,
    XmpExtended,
    Icc,
    PhotoshopIrb,
    Mpf,
    Comment,
    Text,
};

/**
 * \brief One metadata block. Offsets are relative to the scanned buffer and
 * cover the whole container unit (JPEG segment, PNG/RIFF chunk, GIF
 * extension including its sub-blocks).
 */
struct MetadataBlock final {
    ImageFormat format = ImageFormat::Unknown;
    MetadataKind kind  = MetadataKind::Unknown;
    uint64_t offset    = 0;
    uint64_t size      = 0;

    // - JPEG: marker (0xFFEx / 0xFFFE)
    // - PNG, RIFF/WebP: chunk type (FourCC)
    // - GIF: 0x21 << 8 | extension label
    uint32_t id = 0;
};

struct ScanResult final {
    ScanStatus status = ScanStatus::Ok;
    uint32_t written  = 0;
    uint32_t needed   = 0;
    /// PNG only: chunks whose stored CRC does not match their contents.
    uint32_t crc_mismatches = 0;
};

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

const char*
metadata_kind_name(MetadataKind kind) noexcept;

const char*
scan_status_name(ScanStatus status) noexcept;

/// Detects the container and dispatches to the matching scanner.
ScanResult
scan_metadata(std::span<const std::byte> bytes,
              std::span<MetadataBlock> out) noexcept;

/// Scans JPEG marker segments up to SOS/EOI.
ScanResult
scan_jpeg_metadata(std::span<const std::byte> bytes,
                   std::span<MetadataBlock> out) noexcept;
/// Scans PNG chunks up to IEND and validates chunk CRCs.
ScanResult
scan_png_metadata(std::span<const std::byte> bytes,
                  std::span<MetadataBlock> out) noexcept;
/// Scans RIFF/WebP chunks within the declared RIFF size.
ScanResult
scan_webp_metadata(std::span<const std::byte> bytes,
                   std::span<MetadataBlock> out) noexcept;
/// Scans GIF extension blocks up to the trailer.
ScanResult
scan_gif_metadata(std::span<const std::byte> bytes,
                  std::span<MetadataBlock> out) noexcept;

}  // namespace photoclean
