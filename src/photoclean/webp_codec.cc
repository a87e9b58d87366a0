#include "image_codec_internal.h"

#if defined(PHOTOCLEAN_HAS_WEBP) && PHOTOCLEAN_HAS_WEBP
#    include <webp/decode.h>
#    include <webp/encode.h>
#endif

namespace photoclean::codec_internal {

#if defined(PHOTOCLEAN_HAS_WEBP) && PHOTOCLEAN_HAS_WEBP

namespace {

    // WebP has no gray layouts; gray images are widened before encoding.
    static void widen_gray(const PixelImage& image,
                           std::vector<std::byte>* out)
    {
        const bool alpha = (image.color == ColorModel::GrayAlpha);
        const size_t n   = static_cast<size_t>(image.width) * image.height;
        out->resize(n * (alpha ? 4U : 3U));
        size_t o = 0;
        for (size_t i = 0; i < n; ++i) {
            const std::byte g = image.pixels[alpha ? i * 2U : i];
            (*out)[o++]       = g;
            (*out)[o++]       = g;
            (*out)[o++]       = g;
            if (alpha) {
                (*out)[o++] = image.pixels[i * 2U + 1U];
            }
        }
    }

}  // namespace

DecodeResult
decode_webp(std::span<const std::byte> bytes, const DecodeLimits& limits,
            PixelImage* out)
{
    DecodeResult res;
    res.format = ImageFormat::Webp;

    const uint8_t* data = reinterpret_cast<const uint8_t*>(bytes.data());
    WebPBitstreamFeatures features;
    if (WebPGetFeatures(data, bytes.size(), &features) != VP8_STATUS_OK) {
        res.status  = DecodeStatus::Malformed;
        res.message = "invalid WebP bitstream header";
        return res;
    }
    if (features.has_animation) {
        res.status  = DecodeStatus::Unsupported;
        res.message = "animated WebP";
        return res;
    }

    const ColorModel color  = features.has_alpha ? ColorModel::Rgba
                                                 : ColorModel::Rgb;
    const uint32_t channels = channel_count(color);
    if (features.width <= 0 || features.height <= 0
        || !pixel_budget_ok(static_cast<uint64_t>(features.width),
                            static_cast<uint64_t>(features.height), channels,
                            limits)) {
        res.status  = DecodeStatus::LimitExceeded;
        res.message = "image dimensions exceed the pixel limit";
        return res;
    }

    const size_t stride = static_cast<size_t>(features.width) * channels;
    out->pixels.resize(stride * static_cast<size_t>(features.height));
    uint8_t* dst      = reinterpret_cast<uint8_t*>(out->pixels.data());
    const uint8_t* ok = features.has_alpha
                            ? WebPDecodeRGBAInto(data, bytes.size(), dst,
                                                 out->pixels.size(),
                                                 static_cast<int>(stride))
                            : WebPDecodeRGBInto(data, bytes.size(), dst,
                                                out->pixels.size(),
                                                static_cast<int>(stride));
    if (!ok) {
        out->pixels.clear();
        res.status  = DecodeStatus::Malformed;
        res.message = "WebP decode failed";
        return res;
    }

    out->width  = static_cast<uint32_t>(features.width);
    out->height = static_cast<uint32_t>(features.height);
    out->color  = color;
    out->format = ImageFormat::Webp;
    return res;
}


EncodeResult
encode_webp(const PixelImage& image, const EncodeOptions& options,
            std::vector<std::byte>* out)
{
    EncodeResult res;
    if (image.color == ColorModel::Cmyk) {
        res.status  = EncodeStatus::Unsupported;
        res.message = "WebP cannot store CMYK";
        return res;
    }

    std::vector<std::byte> widened;
    const std::byte* pixels = image.pixels.data();
    bool alpha = (image.color == ColorModel::Rgba);
    if (image.color == ColorModel::Gray
        || image.color == ColorModel::GrayAlpha) {
        widen_gray(image, &widened);
        pixels = widened.data();
        alpha  = (image.color == ColorModel::GrayAlpha);
    }

    const int w      = static_cast<int>(image.width);
    const int h      = static_cast<int>(image.height);
    const int stride = w * (alpha ? 4 : 3);
    const uint8_t* src = reinterpret_cast<const uint8_t*>(pixels);

    uint8_t* encoded = nullptr;
    const size_t size
        = alpha ? WebPEncodeRGBA(src, w, h, stride, options.webp_quality,
                                 &encoded)
                : WebPEncodeRGB(src, w, h, stride, options.webp_quality,
                                &encoded);
    if (size == 0 || !encoded) {
        WebPFree(encoded);
        res.status  = EncodeStatus::Failed;
        res.message = "WebP encode failed";
        return res;
    }
    const std::byte* p = reinterpret_cast<const std::byte*>(encoded);
    out->assign(p, p + size);
    WebPFree(encoded);
    return res;
}

#else

DecodeResult
decode_webp(std::span<const std::byte>, const DecodeLimits&, PixelImage*)
{
    DecodeResult res;
    res.status  = DecodeStatus::Unsupported;
    res.format  = ImageFormat::Webp;
    res.message = "built without libwebp";
    return res;
}


EncodeResult
encode_webp(const PixelImage&, const EncodeOptions&, std::vector<std::byte>*)
{
    EncodeResult res;
    res.status  = EncodeStatus::Unsupported;
    res.message = "built without libwebp";
    return res;
}

#endif

}  // namespace photoclean::codec_internal
