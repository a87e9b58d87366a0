#pragma once

#include "photoclean/image_codec.h"

// Internal-only backends behind default_image_codec(). Each backend lives in
// its own translation unit so optional libraries stay out of the others.

namespace photoclean::codec_internal {

DecodeResult
decode_jpeg(std::span<const std::byte> bytes, const DecodeLimits& limits,
            PixelImage* out);
EncodeResult
encode_jpeg(const PixelImage& image, const EncodeOptions& options,
            std::vector<std::byte>* out);

DecodeResult
decode_png(std::span<const std::byte> bytes, const DecodeLimits& limits,
           PixelImage* out);
EncodeResult
encode_png(const PixelImage& image, const EncodeOptions& options,
           std::vector<std::byte>* out);

// The WebP, GIF and TIFF backends are optional. When their library is not
// linked they report Unsupported.
DecodeResult
decode_webp(std::span<const std::byte> bytes, const DecodeLimits& limits,
            PixelImage* out);
EncodeResult
encode_webp(const PixelImage& image, const EncodeOptions& options,
            std::vector<std::byte>* out);

DecodeResult
decode_gif(std::span<const std::byte> bytes, const DecodeLimits& limits,
           PixelImage* out);
EncodeResult
encode_gif(const PixelImage& image, const EncodeOptions& options,
           std::vector<std::byte>* out);

DecodeResult
decode_tiff(std::span<const std::byte> bytes, const DecodeLimits& limits,
            PixelImage* out);
EncodeResult
encode_tiff(const PixelImage& image, const EncodeOptions& options,
            std::vector<std::byte>* out);

/// Checks dimensions against limits and the pixel buffer size against size_t.
bool
pixel_budget_ok(uint64_t width, uint64_t height, uint32_t channels,
                const DecodeLimits& limits) noexcept;

/// True when `image.pixels` matches its declared geometry.
bool
pixel_buffer_consistent(const PixelImage& image) noexcept;

}  // namespace photoclean::codec_internal
