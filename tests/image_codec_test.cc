#include "photoclean/image_codec.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <cstdlib>
#include <initializer_list>
#include <string_view>
#include <vector>

#include <zlib.h>

namespace photoclean {
namespace {

    using test::append_bytes;
    using test::append_fill;
    using test::append_u32be;
    using test::append_u32le;
    using test::encode_fixture;
    using test::make_gradient;

    static std::span<const std::byte> as_span(const std::vector<std::byte>& v)
    {
        return std::span<const std::byte>(v.data(), v.size());
    }


    TEST(ImageCodec, JpegRoundTrip)
    {
        const std::vector<std::byte> jpeg = encode_fixture(ImageFormat::Jpeg);
        ASSERT_FALSE(jpeg.empty());
        EXPECT_EQ(detect_image_format(as_span(jpeg)), ImageFormat::Jpeg);

        PixelImage img;
        const DecodeResult r = default_image_codec().decode(
            as_span(jpeg), DecodeLimits(), &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        EXPECT_EQ(r.format, ImageFormat::Jpeg);
        EXPECT_EQ(img.format, ImageFormat::Jpeg);
        EXPECT_EQ(img.width, 32U);
        EXPECT_EQ(img.height, 24U);
        EXPECT_EQ(img.color, ColorModel::Rgb);
        EXPECT_EQ(img.pixels.size(), 32U * 24U * 3U);

        // Lossy, but a smooth gradient stays close.
        const PixelImage src = make_gradient(32, 24, ColorModel::Rgb);
        uint64_t total_diff  = 0;
        for (size_t i = 0; i < img.pixels.size(); ++i) {
            total_diff += static_cast<uint64_t>(std::abs(
                static_cast<int>(img.pixels[i]) - static_cast<int>(src.pixels[i])));
        }
        EXPECT_LT(total_diff / img.pixels.size(), 24U);
    }


    TEST(ImageCodec, JpegGrayscale)
    {
        const std::vector<std::byte> jpeg = encode_fixture(ImageFormat::Jpeg,
                                                           ColorModel::Gray);
        PixelImage img;
        const DecodeResult r = default_image_codec().decode(
            as_span(jpeg), DecodeLimits(), &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        EXPECT_EQ(img.color, ColorModel::Gray);
        EXPECT_EQ(img.pixels.size(), 32U * 24U);
    }


    TEST(ImageCodec, PngRoundTripIsLossless)
    {
        for (ColorModel color : { ColorModel::Gray, ColorModel::GrayAlpha,
                                  ColorModel::Rgb, ColorModel::Rgba }) {
            const PixelImage src = make_gradient(17, 9, color);
            std::vector<std::byte> png;
            const EncodeResult e = default_image_codec().encode(
                src, ImageFormat::Png, EncodeOptions(), &png);
            ASSERT_EQ(e.status, EncodeStatus::Ok) << e.message;

            PixelImage img;
            const DecodeResult r = default_image_codec().decode(
                as_span(png), DecodeLimits(), &img);
            ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
            EXPECT_EQ(img.color, color) << color_model_name(color);
            EXPECT_EQ(img.width, 17U);
            EXPECT_EQ(img.height, 9U);
            EXPECT_EQ(img.pixels, src.pixels) << color_model_name(color);
        }
    }


    TEST(ImageCodec, UnknownBytesAreUnidentifiable)
    {
        std::vector<std::byte> bytes;
        append_bytes(&bytes, "this is not an image");
        PixelImage img;
        const DecodeResult r = default_image_codec().decode(
            as_span(bytes), DecodeLimits(), &img);
        EXPECT_EQ(r.status, DecodeStatus::Unidentifiable);
        EXPECT_EQ(r.format, ImageFormat::Unknown);

        const DecodeResult empty = default_image_codec().decode(
            {}, DecodeLimits(), &img);
        EXPECT_EQ(empty.status, DecodeStatus::Unidentifiable);
        EXPECT_TRUE(img.pixels.empty());
    }


    TEST(ImageCodec, TruncatedJpegIsMalformed)
    {
        std::vector<std::byte> jpeg = encode_fixture(ImageFormat::Jpeg,
                                                     ColorModel::Rgb, 64, 64);
        ASSERT_GT(jpeg.size(), 400U);
        jpeg.resize(jpeg.size() / 2);

        PixelImage img;
        const DecodeResult r = default_image_codec().decode(
            as_span(jpeg), DecodeLimits(), &img);
        EXPECT_EQ(r.status, DecodeStatus::Malformed);
        EXPECT_EQ(r.format, ImageFormat::Jpeg);
        EXPECT_TRUE(img.pixels.empty());
    }


    TEST(ImageCodec, TruncatedPngIsMalformed)
    {
        std::vector<std::byte> png = encode_fixture(ImageFormat::Png,
                                                    ColorModel::Rgb, 64, 64);
        png.resize(png.size() - 20);  // drops IEND and part of IDAT

        PixelImage img;
        const DecodeResult r = default_image_codec().decode(
            as_span(png), DecodeLimits(), &img);
        EXPECT_EQ(r.status, DecodeStatus::Malformed);
        EXPECT_FALSE(r.message.empty());
    }


    TEST(ImageCodec, PixelLimitIsEnforced)
    {
        const std::vector<std::byte> png = encode_fixture(ImageFormat::Png);
        DecodeLimits limits;
        limits.max_pixels = 100;

        PixelImage img;
        const DecodeResult r = default_image_codec().decode(as_span(png),
                                                            limits, &img);
        EXPECT_EQ(r.status, DecodeStatus::LimitExceeded);
        EXPECT_TRUE(img.pixels.empty());
    }


    static uint64_t mean_abs_diff(const PixelImage& a, const PixelImage& b)
    {
        uint64_t total = 0;
        for (size_t i = 0; i < a.pixels.size(); ++i) {
            total += static_cast<uint64_t>(
                std::abs(static_cast<int>(a.pixels[i])
                         - static_cast<int>(b.pixels[i])));
        }
        return a.pixels.empty() ? 0 : total / a.pixels.size();
    }


    static DecodeResult decode_bytes(const std::vector<std::byte>& bytes,
                                     PixelImage* img)
    {
        return default_image_codec().decode(as_span(bytes), DecodeLimits(),
                                            img);
    }


    static void append_png_chunk(std::vector<std::byte>* out,
                                 std::string_view type,
                                 const std::vector<std::byte>& data)
    {
        append_u32be(out, static_cast<uint32_t>(data.size()));
        const size_t crc_start = out->size();
        append_bytes(out, type);
        out->insert(out->end(), data.begin(), data.end());
        uLong crc = crc32(0L, Z_NULL, 0);
        crc       = crc32(crc,
                          reinterpret_cast<const Bytef*>(out->data() + crc_start),
                          static_cast<uInt>(out->size() - crc_start));
        append_u32be(out, static_cast<uint32_t>(crc));
    }


    // Assembles a PNG from unfiltered rows (each row already starts with
    // its filter byte).
    static std::vector<std::byte> make_png(uint32_t width, uint32_t height,
                                           uint8_t bit_depth,
                                           uint8_t color_type,
                                           const std::vector<std::byte>& plte,
                                           const std::vector<std::byte>& raw)
    {
        std::vector<std::byte> png;
        append_bytes(&png, std::string_view("\x89PNG\r\n\x1A\n", 8));

        std::vector<std::byte> ihdr;
        append_u32be(&ihdr, width);
        append_u32be(&ihdr, height);
        ihdr.push_back(std::byte { bit_depth });
        ihdr.push_back(std::byte { color_type });
        append_fill(&ihdr, 3, 0x00);
        append_png_chunk(&png, "IHDR", ihdr);
        if (!plte.empty()) {
            append_png_chunk(&png, "PLTE", plte);
        }

        uLongf packed_size = compressBound(static_cast<uLong>(raw.size()));
        std::vector<std::byte> idat(packed_size);
        EXPECT_EQ(compress(reinterpret_cast<Bytef*>(idat.data()), &packed_size,
                           reinterpret_cast<const Bytef*>(raw.data()),
                           static_cast<uLong>(raw.size())),
                  Z_OK);
        idat.resize(packed_size);
        append_png_chunk(&png, "IDAT", idat);
        append_png_chunk(&png, "IEND", {});
        return png;
    }


    static std::vector<std::byte> bytes_of(std::initializer_list<uint8_t> v)
    {
        std::vector<std::byte> out;
        for (uint8_t b : v) {
            out.push_back(std::byte { b });
        }
        return out;
    }


    TEST(ImageCodec, PalettePngDecodesToTruecolor)
    {
        const std::vector<std::byte> plte = bytes_of(
            { 0xFF, 0x00, 0x00, 0x00, 0xFF, 0x00, 0x00, 0x00, 0xFF });
        const std::vector<std::byte> raw = bytes_of({ 0, 0, 1, 0, 2, 0 });
        const std::vector<std::byte> png = make_png(2, 2, 8, 3, plte, raw);

        PixelImage img;
        const DecodeResult r = decode_bytes(png, &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        EXPECT_EQ(img.color, ColorModel::Rgb);
        EXPECT_EQ(img.pixels, bytes_of({ 0xFF, 0x00, 0x00, 0x00, 0xFF, 0x00,
                                         0x00, 0x00, 0xFF, 0xFF, 0x00,
                                         0x00 }));

        // Written back as 8-bit truecolor.
        std::vector<std::byte> out;
        ASSERT_EQ(default_image_codec()
                      .encode(img, ImageFormat::Png, EncodeOptions(), &out)
                      .status,
                  EncodeStatus::Ok);
        ASSERT_GT(out.size(), 26U);
        EXPECT_EQ(static_cast<uint8_t>(out[24]), 8U);  // bit depth
        EXPECT_EQ(static_cast<uint8_t>(out[25]), 2U);  // color type RGB
    }


    TEST(ImageCodec, SixteenBitPngKeepsHighByte)
    {
        const std::vector<std::byte> raw = bytes_of({ 0, 0x12, 0x34, 0xAB,
                                                      0xCD });
        const std::vector<std::byte> png = make_png(2, 1, 16, 0, {}, raw);

        PixelImage img;
        const DecodeResult r = decode_bytes(png, &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        EXPECT_EQ(img.color, ColorModel::Gray);
        EXPECT_EQ(img.pixels, bytes_of({ 0x12, 0xAB }));
    }


#if defined(PHOTOCLEAN_HAS_GIF) && PHOTOCLEAN_HAS_GIF
    TEST(ImageCodec, GifDecodesSingleFrame)
    {
        PixelImage img;
        const DecodeResult r = decode_bytes(test::make_tiny_gif("hello"), &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        EXPECT_EQ(r.format, ImageFormat::Gif);
        EXPECT_EQ(img.width, 1U);
        EXPECT_EQ(img.height, 1U);
        EXPECT_EQ(img.color, ColorModel::Rgb);
        EXPECT_EQ(img.pixels, bytes_of({ 0x10, 0x20, 0x30 }));
    }


    TEST(ImageCodec, GifRoundTripKeepsSmallPalettesExact)
    {
        const PixelImage src = make_gradient(16, 8, ColorModel::Rgb);
        std::vector<std::byte> gif;
        const EncodeResult e = default_image_codec().encode(
            src, ImageFormat::Gif, EncodeOptions(), &gif);
        ASSERT_EQ(e.status, EncodeStatus::Ok) << e.message;
        EXPECT_EQ(detect_image_format(as_span(gif)), ImageFormat::Gif);
        EXPECT_EQ(static_cast<uint8_t>(gif.back()), 0x3BU);

        PixelImage img;
        const DecodeResult r = decode_bytes(gif, &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        EXPECT_EQ(img.color, ColorModel::Rgb);
        EXPECT_EQ(img.width, 16U);
        EXPECT_EQ(img.height, 8U);
        EXPECT_EQ(img.pixels, src.pixels);
    }


    TEST(ImageCodec, GifTransparencySurvives)
    {
        const PixelImage src = make_gradient(8, 4, ColorModel::Rgba);
        std::vector<std::byte> gif;
        ASSERT_EQ(default_image_codec()
                      .encode(src, ImageFormat::Gif, EncodeOptions(), &gif)
                      .status,
                  EncodeStatus::Ok);

        PixelImage img;
        const DecodeResult r = decode_bytes(gif, &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        ASSERT_EQ(img.color, ColorModel::Rgba);
        ASSERT_EQ(img.pixels.size(), src.pixels.size());
        uint32_t transparent = 0;
        for (size_t i = 0; i < src.pixels.size(); i += 4) {
            const bool opaque = static_cast<uint8_t>(src.pixels[i + 3]) >= 0x80U;
            if (!opaque) {
                transparent += 1;
                EXPECT_EQ(static_cast<uint8_t>(img.pixels[i + 3]), 0x00U);
                continue;
            }
            EXPECT_EQ(static_cast<uint8_t>(img.pixels[i + 3]), 0xFFU);
            EXPECT_EQ(img.pixels[i], src.pixels[i]);
            EXPECT_EQ(img.pixels[i + 1], src.pixels[i + 1]);
            EXPECT_EQ(img.pixels[i + 2], src.pixels[i + 2]);
        }
        EXPECT_GT(transparent, 0U);
    }


    TEST(ImageCodec, GifQuantizesManyColors)
    {
        const PixelImage src = make_gradient(64, 64, ColorModel::Rgb);
        std::vector<std::byte> gif;
        ASSERT_EQ(default_image_codec()
                      .encode(src, ImageFormat::Gif, EncodeOptions(), &gif)
                      .status,
                  EncodeStatus::Ok);

        PixelImage img;
        ASSERT_EQ(decode_bytes(gif, &img).status, DecodeStatus::Ok);
        ASSERT_EQ(img.pixels.size(), src.pixels.size());
        EXPECT_LT(mean_abs_diff(img, src), 32U);
    }


    TEST(ImageCodec, AnimatedGifIsUnsupported)
    {
        PixelImage img;
        const DecodeResult r = decode_bytes(test::make_tiny_gif({}, 2), &img);
        EXPECT_EQ(r.status, DecodeStatus::Unsupported);
        EXPECT_EQ(r.format, ImageFormat::Gif);
        EXPECT_TRUE(img.pixels.empty());

        std::vector<std::byte> out;
        EXPECT_EQ(default_image_codec()
                      .encode(make_gradient(4, 4, ColorModel::Cmyk),
                              ImageFormat::Gif, EncodeOptions(), &out)
                      .status,
                  EncodeStatus::Unsupported);
    }
#else
    TEST(ImageCodec, GifWithoutGiflibIsUnsupported)
    {
        PixelImage img;
        const DecodeResult r = decode_bytes(test::make_tiny_gif(), &img);
        EXPECT_EQ(r.status, DecodeStatus::Unsupported);
        EXPECT_EQ(r.format, ImageFormat::Gif);

        std::vector<std::byte> out;
        const EncodeResult e = default_image_codec().encode(
            make_gradient(4, 4, ColorModel::Rgb), ImageFormat::Gif,
            EncodeOptions(), &out);
        EXPECT_EQ(e.status, EncodeStatus::Unsupported);
        EXPECT_TRUE(out.empty());
    }
#endif


#if defined(PHOTOCLEAN_HAS_TIFF) && PHOTOCLEAN_HAS_TIFF
    TEST(ImageCodec, TiffRoundTripIsLossless)
    {
        for (bool deflate : { true, false }) {
            for (ColorModel color :
                 { ColorModel::Gray, ColorModel::GrayAlpha, ColorModel::Rgb,
                   ColorModel::Rgba, ColorModel::Cmyk }) {
                const PixelImage src = make_gradient(17, 9, color);
                EncodeOptions options;
                options.tiff_deflate = deflate;
                std::vector<std::byte> tiff;
                const EncodeResult e = default_image_codec().encode(
                    src, ImageFormat::Tiff, options, &tiff);
                ASSERT_EQ(e.status, EncodeStatus::Ok) << e.message;
                EXPECT_EQ(detect_image_format(as_span(tiff)),
                          ImageFormat::Tiff);

                PixelImage img;
                const DecodeResult r = decode_bytes(tiff, &img);
                ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
                EXPECT_EQ(img.color, color) << color_model_name(color);
                EXPECT_EQ(img.width, 17U);
                EXPECT_EQ(img.height, 9U);
                EXPECT_EQ(img.pixels, src.pixels)
                    << color_model_name(color) << " deflate=" << deflate;
            }
        }
    }


    TEST(ImageCodec, TiffDecodesHandBuiltGray)
    {
        PixelImage img;
        const DecodeResult r = decode_bytes(
            test::make_gray_tiff("owner: someone", 0x5A), &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        EXPECT_EQ(r.format, ImageFormat::Tiff);
        EXPECT_EQ(img.color, ColorModel::Gray);
        EXPECT_EQ(img.pixels, bytes_of({ 0x5A }));
    }


    TEST(ImageCodec, MultiPageAndBrokenTiffAreRejected)
    {
        PixelImage img;
        DecodeResult r = decode_bytes(test::make_gray_tiff("page", 1, 2),
                                      &img);
        EXPECT_EQ(r.status, DecodeStatus::Unsupported);
        EXPECT_EQ(r.format, ImageFormat::Tiff);

        std::vector<std::byte> tiff = test::make_gray_tiff("page", 1);
        tiff.resize(12);
        r = decode_bytes(tiff, &img);
        EXPECT_EQ(r.status, DecodeStatus::Malformed);
        EXPECT_FALSE(r.message.empty());
        EXPECT_TRUE(img.pixels.empty());
    }
#else
    TEST(ImageCodec, TiffWithoutLibtiffIsUnsupported)
    {
        PixelImage img;
        const DecodeResult r = decode_bytes(test::make_gray_tiff("page", 1),
                                            &img);
        EXPECT_EQ(r.status, DecodeStatus::Unsupported);
        EXPECT_EQ(r.format, ImageFormat::Tiff);
    }
#endif


#if defined(PHOTOCLEAN_HAS_WEBP) && PHOTOCLEAN_HAS_WEBP
    TEST(ImageCodec, WebpRoundTrip)
    {
        for (ColorModel color : { ColorModel::Rgb, ColorModel::Rgba }) {
            const PixelImage src = make_gradient(32, 24, color);
            std::vector<std::byte> webp;
            const EncodeResult e = default_image_codec().encode(
                src, ImageFormat::Webp, EncodeOptions(), &webp);
            ASSERT_EQ(e.status, EncodeStatus::Ok) << e.message;
            EXPECT_EQ(detect_image_format(as_span(webp)), ImageFormat::Webp);

            PixelImage img;
            const DecodeResult r = decode_bytes(webp, &img);
            ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
            EXPECT_EQ(img.color, color) << color_model_name(color);
            EXPECT_EQ(img.width, 32U);
            EXPECT_EQ(img.height, 24U);
            if (color == ColorModel::Rgb) {
                EXPECT_LT(mean_abs_diff(img, src), 24U);
            }
        }
    }


    TEST(ImageCodec, WebpWidensGray)
    {
        const PixelImage src = make_gradient(16, 16, ColorModel::Gray);
        std::vector<std::byte> webp;
        ASSERT_EQ(default_image_codec()
                      .encode(src, ImageFormat::Webp, EncodeOptions(), &webp)
                      .status,
                  EncodeStatus::Ok);

        PixelImage img;
        ASSERT_EQ(decode_bytes(webp, &img).status, DecodeStatus::Ok);
        EXPECT_EQ(img.color, ColorModel::Rgb);
        EXPECT_EQ(img.pixels.size(), 16U * 16U * 3U);
    }


    TEST(ImageCodec, AnimatedWebpIsUnsupported)
    {
        // RIFF header plus a VP8X chunk with the animation flag, 1x1 canvas.
        std::vector<std::byte> webp;
        append_bytes(&webp, "RIFF");
        append_u32le(&webp, 22);
        append_bytes(&webp, "WEBPVP8X");
        append_u32le(&webp, 10);
        webp.push_back(std::byte { 0x02 });
        append_fill(&webp, 9, 0x00);

        PixelImage img;
        const DecodeResult r = decode_bytes(webp, &img);
        EXPECT_EQ(r.status, DecodeStatus::Unsupported);
        EXPECT_EQ(r.format, ImageFormat::Webp);
        EXPECT_TRUE(img.pixels.empty());
    }
#else
    TEST(ImageCodec, WebpWithoutLibwebpIsUnsupported)
    {
        std::vector<std::byte> out;
        const EncodeResult e = default_image_codec().encode(
            make_gradient(4, 4, ColorModel::Rgb), ImageFormat::Webp,
            EncodeOptions(), &out);
        EXPECT_EQ(e.status, EncodeStatus::Unsupported);
        EXPECT_TRUE(out.empty());
    }
#endif


    TEST(ImageCodec, EncoderRejectsUnstorableLayouts)
    {
        std::vector<std::byte> out;
        EncodeResult e = default_image_codec().encode(
            make_gradient(4, 4, ColorModel::Rgba), ImageFormat::Jpeg,
            EncodeOptions(), &out);
        EXPECT_EQ(e.status, EncodeStatus::Unsupported);

        e = default_image_codec().encode(make_gradient(4, 4, ColorModel::Cmyk),
                                         ImageFormat::Png, EncodeOptions(),
                                         &out);
        EXPECT_EQ(e.status, EncodeStatus::Unsupported);

        PixelImage bad = make_gradient(4, 4, ColorModel::Rgb);
        bad.pixels.pop_back();
        e = default_image_codec().encode(bad, ImageFormat::Png,
                                         EncodeOptions(), &out);
        EXPECT_EQ(e.status, EncodeStatus::Failed);
        EXPECT_TRUE(out.empty());
    }


    TEST(ImageCodec, CmykJpegRoundTrip)
    {
        const std::vector<std::byte> jpeg = encode_fixture(ImageFormat::Jpeg,
                                                           ColorModel::Cmyk);
        PixelImage img;
        const DecodeResult r = default_image_codec().decode(
            as_span(jpeg), DecodeLimits(), &img);
        ASSERT_EQ(r.status, DecodeStatus::Ok) << r.message;
        EXPECT_EQ(img.color, ColorModel::Cmyk);
        EXPECT_EQ(img.pixels.size(), 32U * 24U * 4U);
    }


    TEST(ImageCodec, StatusNames)
    {
        EXPECT_STREQ(decode_status_name(DecodeStatus::LimitExceeded),
                     "limit_exceeded");
        EXPECT_STREQ(encode_status_name(EncodeStatus::Unsupported),
                     "unsupported");
        EXPECT_EQ(channel_count(ColorModel::GrayAlpha), 2U);
    }

}  // namespace
}  // namespace photoclean
