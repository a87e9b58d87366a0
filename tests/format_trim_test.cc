#include "photoclean/format_trim.h"

#include "test_support.h"

#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

namespace photoclean {
namespace {

    using test::append_bytes;
    using test::append_fill;
    using test::append_u32be;
    using test::append_u32le;

    static std::span<const std::byte> as_span(const std::vector<std::byte>& v)
    {
        return std::span<const std::byte>(v.data(), v.size());
    }


    static void append_png_chunk(std::vector<std::byte>* out,
                                 std::string_view type, uint32_t len)
    {
        append_u32be(out, len);
        append_bytes(out, type);
        append_fill(out, len, 0x11);
        append_u32be(out, 0xDEADBEEF);  // CRC is not checked by the trimmer
    }


    static std::vector<std::byte> make_png_chunks()
    {
        std::vector<std::byte> png;
        append_bytes(&png, "\x89PNG\r\n\x1a\n");
        append_png_chunk(&png, "IHDR", 13);
        append_png_chunk(&png, "IDAT", 40);
        append_png_chunk(&png, "IEND", 0);
        return png;
    }


    static std::vector<std::byte> make_riff(uint32_t payload_size)
    {
        std::vector<std::byte> webp;
        append_bytes(&webp, "RIFF");
        append_u32le(&webp, payload_size);
        append_bytes(&webp, "WEBP");
        append_fill(&webp, payload_size - 4U, 0x22);
        return webp;
    }


    static void expect_prefix(std::span<const std::byte> input,
                              const TrimResult& r)
    {
        ASSERT_LE(r.bytes.size(), input.size());
        if (!r.bytes.empty()) {
            EXPECT_EQ(r.bytes.data(), input.data());
        }
        EXPECT_EQ(r.removed, input.size() - r.bytes.size());
    }


    TEST(FormatTrim, JpegDropsBytesAfterLastEoi)
    {
        std::vector<std::byte> jpeg;
        append_bytes(&jpeg, "\xFF\xD8\xFF\xE0");
        append_fill(&jpeg, 20, 0x42);
        append_bytes(&jpeg, "\xFF\xD9");
        const size_t body = jpeg.size();
        append_bytes(&jpeg, "garbage-after-eoi");

        const TrimResult r = trim_jpeg(as_span(jpeg));
        EXPECT_EQ(r.status, TrimStatus::Trimmed);
        ASSERT_EQ(r.bytes.size(), body);
        EXPECT_EQ(r.removed, 17U);
        EXPECT_EQ(static_cast<uint8_t>(r.bytes[body - 2]), 0xFF);
        EXPECT_EQ(static_cast<uint8_t>(r.bytes[body - 1]), 0xD9);
        expect_prefix(as_span(jpeg), r);
    }


    TEST(FormatTrim, JpegWithoutEoiIsUnchanged)
    {
        std::vector<std::byte> jpeg;
        append_bytes(&jpeg, "\xFF\xD8\xFF\xE0");
        append_fill(&jpeg, 64, 0x10);

        const TrimResult r = trim_jpeg(as_span(jpeg));
        EXPECT_EQ(r.status, TrimStatus::NoTerminator);
        EXPECT_EQ(r.bytes.size(), jpeg.size());
        EXPECT_EQ(r.removed, 0U);
    }


    TEST(FormatTrim, JpegEndingAtEoiIsUnchanged)
    {
        std::vector<std::byte> jpeg;
        append_bytes(&jpeg, "\xFF\xD8\xFF\xD9");
        const TrimResult r = trim_jpeg(as_span(jpeg));
        EXPECT_EQ(r.status, TrimStatus::Unchanged);
        EXPECT_EQ(r.bytes.size(), jpeg.size());
    }


    TEST(FormatTrim, JpegUsesLastEoiWhenSeveralExist)
    {
        std::vector<std::byte> jpeg;
        append_bytes(&jpeg, "\xFF\xD8");
        append_bytes(&jpeg, "\xFF\xD9");  // embedded thumbnail end
        append_fill(&jpeg, 8, 0x30);
        append_bytes(&jpeg, "\xFF\xD9");
        const size_t body = jpeg.size();
        append_bytes(&jpeg, "tail");

        const TrimResult r = trim_jpeg(as_span(jpeg));
        EXPECT_EQ(r.status, TrimStatus::Trimmed);
        EXPECT_EQ(r.bytes.size(), body);
    }


    TEST(FormatTrim, PngRemovesExactlyTrailingBytes)
    {
        std::vector<std::byte> png = make_png_chunks();
        const size_t body          = png.size();
        append_fill(&png, 37, 0x99);

        const TrimResult r = trim_png(as_span(png));
        EXPECT_EQ(r.status, TrimStatus::Trimmed);
        EXPECT_EQ(r.bytes.size(), body);
        EXPECT_EQ(r.removed, 37U);
        expect_prefix(as_span(png), r);
    }


    TEST(FormatTrim, PngWithoutReachableIendIsUnchanged)
    {
        std::vector<std::byte> png;
        append_bytes(&png, "\x89PNG\r\n\x1a\n");
        append_png_chunk(&png, "IHDR", 13);
        append_u32be(&png, 1000);  // IDAT claims more data than exists
        append_bytes(&png, "IDAT");
        append_fill(&png, 10, 0x00);

        const TrimResult r = trim_png(as_span(png));
        EXPECT_EQ(r.status, TrimStatus::NoTerminator);
        EXPECT_EQ(r.bytes.size(), png.size());
    }


    TEST(FormatTrim, PngIendBeyondBufferIsUnchanged)
    {
        std::vector<std::byte> png = make_png_chunks();
        png.resize(png.size() - 2);  // cut into the IEND CRC

        const TrimResult r = trim_png(as_span(png));
        EXPECT_EQ(r.status, TrimStatus::NoTerminator);
        EXPECT_EQ(r.bytes.size(), png.size());
    }


    TEST(FormatTrim, PngWithoutSignatureIsUnchanged)
    {
        std::vector<std::byte> bytes;
        append_bytes(&bytes, "not a png at all, IEND");
        const TrimResult r = trim_png(as_span(bytes));
        EXPECT_EQ(r.status, TrimStatus::NoTerminator);
        EXPECT_EQ(r.bytes.size(), bytes.size());
    }


    TEST(FormatTrim, GifTrimsAfterLastTrailer)
    {
        std::vector<std::byte> gif;
        append_bytes(&gif, "GIF89a");
        append_fill(&gif, 20, 0x01);
        gif.push_back(std::byte { 0x3B });
        const size_t body = gif.size();
        append_fill(&gif, 5, 0x00);

        const TrimResult r = trim_gif(as_span(gif));
        EXPECT_EQ(r.status, TrimStatus::Trimmed);
        EXPECT_EQ(r.bytes.size(), body);
        EXPECT_EQ(static_cast<uint8_t>(r.bytes.back()), 0x3B);
    }


    TEST(FormatTrim, GifWithoutTrailerIsUnchanged)
    {
        std::vector<std::byte> gif;
        append_bytes(&gif, "GIF89a");
        append_fill(&gif, 20, 0x01);
        const TrimResult r = trim_gif(as_span(gif));
        EXPECT_EQ(r.status, TrimStatus::NoTerminator);
        EXPECT_EQ(r.bytes.size(), gif.size());
    }


    TEST(FormatTrim, WebpTruncatesToDeclaredRiffSize)
    {
        std::vector<std::byte> webp = make_riff(100);
        ASSERT_EQ(webp.size(), 108U);
        append_fill(&webp, 13, 0xEE);

        const TrimResult r = trim_webp(as_span(webp));
        EXPECT_EQ(r.status, TrimStatus::Trimmed);
        EXPECT_EQ(r.bytes.size(), 108U);
        EXPECT_EQ(r.removed, 13U);
    }


    TEST(FormatTrim, WebpNeverPads)
    {
        std::vector<std::byte> webp = make_riff(100);
        webp.resize(60);  // shorter than declared

        const TrimResult r = trim_webp(as_span(webp));
        EXPECT_EQ(r.status, TrimStatus::Unchanged);
        EXPECT_EQ(r.bytes.size(), 60U);

        const std::vector<std::byte> exact = make_riff(100);
        EXPECT_EQ(trim_webp(as_span(exact)).bytes.size(), exact.size());
    }


    TEST(FormatTrim, WebpWithoutRiffIsUnchanged)
    {
        std::vector<std::byte> bytes;
        append_bytes(&bytes,
                     std::string_view("RIFX\x04\x00\x00\x00WEBPxxxx", 16));
        const TrimResult r = trim_webp(as_span(bytes));
        EXPECT_EQ(r.status, TrimStatus::NoTerminator);
        EXPECT_EQ(r.bytes.size(), bytes.size());
    }


    TEST(FormatTrim, DispatchByExtension)
    {
        std::vector<std::byte> jpeg;
        append_bytes(&jpeg, "\xFF\xD8\xFF\xD9trailing");

        EXPECT_EQ(trim_trailing_data(as_span(jpeg), ".JPG").status,
                  TrimStatus::Trimmed);
        EXPECT_EQ(trim_trailing_data(as_span(jpeg), "jpeg").status,
                  TrimStatus::Trimmed);

        // TIFF and unknown extensions pass through untouched.
        const TrimResult tiff = trim_trailing_data(as_span(jpeg), ".tiff");
        EXPECT_EQ(tiff.status, TrimStatus::NotApplicable);
        EXPECT_EQ(tiff.bytes.size(), jpeg.size());
        const TrimResult bmp = trim_trailing_data(as_span(jpeg), ".bmp");
        EXPECT_EQ(bmp.status, TrimStatus::NotApplicable);
        EXPECT_EQ(bmp.bytes.size(), jpeg.size());
    }


    TEST(FormatTrim, EmptyInputIsSafe)
    {
        const std::span<const std::byte> empty;
        for (ImageFormat f : { ImageFormat::Jpeg, ImageFormat::Png,
                               ImageFormat::Gif, ImageFormat::Webp,
                               ImageFormat::Tiff, ImageFormat::Unknown }) {
            const TrimResult r = trim_trailing_data(empty, f);
            EXPECT_TRUE(r.bytes.empty()) << image_format_name(f);
            EXPECT_EQ(r.removed, 0U);
        }
    }


    TEST(FormatTrim, PrefixAndIdempotentAcrossFormats)
    {
        std::vector<std::vector<std::byte>> inputs;
        {
            std::vector<std::byte> png = make_png_chunks();
            append_bytes(&png, "tail\x3B\xFF\xD9");
            inputs.push_back(png);
        }
        {
            std::vector<std::byte> webp = make_riff(32);
            append_bytes(&webp, "\xFF\xD9 then more \x3B!");
            inputs.push_back(webp);
        }
        {
            std::vector<std::byte> mixed;
            append_bytes(&mixed, "\x3B\xFF\xD9\x3B\xFF");
            inputs.push_back(mixed);
        }
        inputs.push_back(std::vector<std::byte>(3, std::byte { 0x3B }));

        for (const std::vector<std::byte>& in : inputs) {
            for (ImageFormat f : { ImageFormat::Jpeg, ImageFormat::Png,
                                   ImageFormat::Gif, ImageFormat::Webp }) {
                const TrimResult once = trim_trailing_data(as_span(in), f);
                expect_prefix(as_span(in), once);
                const TrimResult twice = trim_trailing_data(once.bytes, f);
                EXPECT_EQ(twice.bytes.size(), once.bytes.size())
                    << image_format_name(f);
                EXPECT_EQ(twice.removed, 0U) << image_format_name(f);
            }
        }
    }


    TEST(FormatTrim, StatusNames)
    {
        EXPECT_STREQ(trim_status_name(TrimStatus::Trimmed), "trimmed");
        EXPECT_STREQ(trim_status_name(TrimStatus::NotApplicable),
                     "not_applicable");
    }

}  // namespace
}  // namespace photoclean
