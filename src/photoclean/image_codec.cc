#include "photoclean/image_codec.h"

#include "image_codec_internal.h"

#include <limits>

namespace photoclean {
namespace {

    class LibraryImageCodec final : public ImageCodec {
    public:
        DecodeResult decode(std::span<const std::byte> bytes,
                            const DecodeLimits& limits,
                            PixelImage* out) const override
        {
            *out = PixelImage();

            DecodeResult res;
            res.format = detect_image_format(bytes);
            switch (res.format) {
            case ImageFormat::Jpeg:
                return codec_internal::decode_jpeg(bytes, limits, out);
            case ImageFormat::Png:
                return codec_internal::decode_png(bytes, limits, out);
            case ImageFormat::Webp:
                return codec_internal::decode_webp(bytes, limits, out);
            case ImageFormat::Gif:
                return codec_internal::decode_gif(bytes, limits, out);
            case ImageFormat::Tiff:
                return codec_internal::decode_tiff(bytes, limits, out);
            case ImageFormat::Unknown: break;
            }
            res.status = DecodeStatus::Unidentifiable;
            return res;
        }

        EncodeResult encode(const PixelImage& image, ImageFormat format,
                            const EncodeOptions& options,
                            std::vector<std::byte>* out) const override
        {
            out->clear();

            EncodeResult res;
            if (!codec_internal::pixel_buffer_consistent(image)) {
                res.status  = EncodeStatus::Failed;
                res.message = "pixel buffer does not match image geometry";
                return res;
            }
            switch (format) {
            case ImageFormat::Jpeg:
                return codec_internal::encode_jpeg(image, options, out);
            case ImageFormat::Png:
                return codec_internal::encode_png(image, options, out);
            case ImageFormat::Webp:
                return codec_internal::encode_webp(image, options, out);
            case ImageFormat::Gif:
                return codec_internal::encode_gif(image, options, out);
            case ImageFormat::Tiff:
                return codec_internal::encode_tiff(image, options, out);
            case ImageFormat::Unknown: break;
            }
            res.status  = EncodeStatus::Unsupported;
            res.message = "no encoder for ";
            res.message.append(image_format_name(format));
            return res;
        }
    };

}  // namespace

uint32_t
channel_count(ColorModel color) noexcept
{
    switch (color) {
    case ColorModel::Gray: return 1U;
    case ColorModel::GrayAlpha: return 2U;
    case ColorModel::Rgb: return 3U;
    case ColorModel::Rgba: return 4U;
    case ColorModel::Cmyk: return 4U;
    }
    return 0U;
}


const char*
color_model_name(ColorModel color) noexcept
{
    switch (color) {
    case ColorModel::Gray: return "gray";
    case ColorModel::GrayAlpha: return "gray_alpha";
    case ColorModel::Rgb: return "rgb";
    case ColorModel::Rgba: return "rgba";
    case ColorModel::Cmyk: return "cmyk";
    }
    return "unknown";
}


const char*
decode_status_name(DecodeStatus status) noexcept
{
    switch (status) {
    case DecodeStatus::Ok: return "ok";
    case DecodeStatus::Unidentifiable: return "unidentifiable";
    case DecodeStatus::Unsupported: return "unsupported";
    case DecodeStatus::Malformed: return "malformed";
    case DecodeStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}


const char*
encode_status_name(EncodeStatus status) noexcept
{
    switch (status) {
    case EncodeStatus::Ok: return "ok";
    case EncodeStatus::Unsupported: return "unsupported";
    case EncodeStatus::Failed: return "failed";
    }
    return "unknown";
}


const ImageCodec&
default_image_codec() noexcept
{
    static const LibraryImageCodec codec;
    return codec;
}

namespace codec_internal {

    bool pixel_budget_ok(uint64_t width, uint64_t height, uint32_t channels,
                         const DecodeLimits& limits) noexcept
    {
        if (width > std::numeric_limits<uint32_t>::max()
            || height > std::numeric_limits<uint32_t>::max()) {
            return false;
        }
        const uint64_t pixels = width * height;
        if (limits.max_pixels != 0U && pixels > limits.max_pixels) {
            return false;
        }
        const uint64_t max_bytes = static_cast<uint64_t>(
            std::numeric_limits<size_t>::max());
        return pixels <= max_bytes / (channels ? channels : 1U);
    }


    bool pixel_buffer_consistent(const PixelImage& image) noexcept
    {
        if (image.width == 0U || image.height == 0U) {
            return false;
        }
        const uint64_t expected = static_cast<uint64_t>(image.width)
                                  * image.height * channel_count(image.color);
        return expected == static_cast<uint64_t>(image.pixels.size());
    }

}  // namespace codec_internal

}  // namespace photoclean
