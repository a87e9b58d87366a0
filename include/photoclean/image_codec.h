#pragma once

#include "photoclean/image_format.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file image_codec.h
 * \brief Decode/encode boundary between PhotoClean and image codec libraries.
 */

namespace photoclean {

/// Channel layout of a decoded image. All channels are 8-bit.
enum class ColorModel : uint8_t {
    Gray,
    GrayAlpha,
    Rgb,
    Rgba,
    Cmyk,
};

/// Number of interleaved channels for \p color.
uint32_t
channel_count(ColorModel color) noexcept;

const char*
color_model_name(ColorModel color) noexcept;

/**
 * \brief A decoded pixel grid.
 *
 * Rows are stored top to bottom, tightly packed
 * (`width * channel_count(color)` bytes per row).
 */
struct PixelImage final {
    uint32_t width     = 0;
    uint32_t height    = 0;
    ColorModel color   = ColorModel::Rgb;
    /// Format the decoder identified, or \ref ImageFormat::Unknown.
    ImageFormat format = ImageFormat::Unknown;
    std::vector<std::byte> pixels;
};

enum class DecodeStatus : uint8_t {
    Ok,
    /// The bytes are not an image format the codec recognizes.
    Unidentifiable,
    /// The format was recognized but no decoder for it is built in.
    Unsupported,
    /// Corrupt or truncated image data.
    Malformed,
    /// The image exceeds \ref DecodeLimits.
    LimitExceeded,
};

enum class EncodeStatus : uint8_t {
    Ok,
    /// No encoder for the target format, or the color model cannot be stored
    /// in it (e.g. RGBA as JPEG).
    Unsupported,
    Failed,
};

/// Resource limits applied while decoding untrusted input.
struct DecodeLimits final {
    /// Max `width * height` (0 = unlimited).
    uint64_t max_pixels = 178956970ULL;
};

/// Encoder settings. No metadata is ever written.
struct EncodeOptions final {
    /// JPEG quality (1..100).
    int jpeg_quality = 95;
    /// JPEG: compute optimal Huffman tables.
    bool jpeg_optimize = true;
    /// PNG: use maximum zlib compression.
    bool png_optimize = true;
    /// WebP lossy quality (0..100).
    float webp_quality = 80.0f;
    /// TIFF: Deflate compression with horizontal predictor when libtiff has
    /// it, uncompressed strips otherwise.
    bool tiff_deflate = true;
};

struct DecodeResult final {
    DecodeStatus status = DecodeStatus::Ok;
    ImageFormat format  = ImageFormat::Unknown;
    /// Library diagnostic for failures (may be empty).
    std::string message;
};

struct EncodeResult final {
    EncodeStatus status = EncodeStatus::Ok;
    std::string message;
};

const char*
decode_status_name(DecodeStatus status) noexcept;

const char*
encode_status_name(EncodeStatus status) noexcept;

/**
 * \brief Image codec interface.
 *
 * Implementations must leave \p out in a valid (possibly empty) state on
 * failure and must never write metadata when encoding.
 */
class ImageCodec {
public:
    virtual ~ImageCodec() = default;

    /// Decodes \p bytes fully (every scanline is read) into \p out.
    virtual DecodeResult decode(std::span<const std::byte> bytes,
                                const DecodeLimits& limits,
                                PixelImage* out) const
        = 0;

    /// Encodes \p image as \p format into \p out (replacing its contents).
    virtual EncodeResult encode(const PixelImage& image, ImageFormat format,
                                const EncodeOptions& options,
                                std::vector<std::byte>* out) const
        = 0;
};

/**
 * \brief Returns the library-backed codec.
 *
 * JPEG uses libjpeg and PNG uses libpng. GIF (giflib), TIFF (libtiff) and
 * WebP (libwebp) are decoded when PhotoClean was built with the library and
 * report \ref DecodeStatus::Unsupported otherwise. Animated GIF and WebP and
 * multi-page TIFF are Unsupported as well.
 */
const ImageCodec&
default_image_codec() noexcept;

}  // namespace photoclean
