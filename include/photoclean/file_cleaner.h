#pragma once

#include "photoclean/format_trim.h"
#include "photoclean/image_codec.h"
#include "photoclean/image_format.h"

#include <cstdint>
#include <string>

/**
 * \file file_cleaner.h
 * \brief Per-file sanitization: read, trim, decode, re-encode, replace.
 */

namespace photoclean {

enum class CleanStatus : uint8_t {
    /// The file was rewritten without metadata or trailing data.
    Cleaned,
    /// The file is not an image PhotoClean can process; it was not touched.
    Skipped,
    /// Processing failed; the file was not touched.
    Failed,
};

/// Reason attached to a \ref CleanOutcome.
enum class CleanError : uint8_t {
    None,
    Read,
    Unidentifiable,
    Unsupported,
    Decode,
    Encode,
    Replace,
};

const char*
clean_status_name(CleanStatus status) noexcept;

const char*
clean_error_name(CleanError error) noexcept;

struct CleanOptions final {
    /// Refuse files larger than this (0 = unlimited).
    uint64_t max_file_bytes = 512ULL * 1024ULL * 1024ULL;
    DecodeLimits limits;
    EncodeOptions encode;
};

/// Result of cleaning one file.
struct CleanOutcome final {
    CleanStatus status = CleanStatus::Failed;
    CleanError error   = CleanError::None;
    /// Human-readable diagnostic (empty on success).
    std::string detail;

    uint64_t input_size      = 0;
    TrimStatus trim_status   = TrimStatus::NotApplicable;
    uint64_t trimmed_bytes   = 0;
    /// Metadata blocks found in the original bytes.
    uint32_t metadata_blocks = 0;
    ImageFormat input_format  = ImageFormat::Unknown;
    ImageFormat output_format = ImageFormat::Unknown;
    uint64_t output_size      = 0;
};

/**
 * \brief Cleans \p path in place.
 *
 * The re-encoded image is written to a temporary file beside \p path and
 * renamed over it. On every non-\ref CleanStatus::Cleaned outcome the file on
 * disk is left byte-identical and no temporary file remains.
 */
CleanOutcome
clean_image_file(const char* path, const ImageCodec& codec,
                 const CleanOptions& options);

}  // namespace photoclean
