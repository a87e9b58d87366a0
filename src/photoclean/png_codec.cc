#include "image_codec_internal.h"

#include <csetjmp>
#include <cstdio>
#include <cstring>
#include <new>

#include <png.h>
#include <zlib.h>

namespace photoclean::codec_internal {
namespace {

    struct PngMessage final {
        char text[200];
    };

    struct PngReadContext final {
        png_structp png = nullptr;
        png_infop info  = nullptr;
        std::span<const std::byte> bytes;
        size_t offset = 0;
        // Sized after setjmp, so it must not be a local of decode_png.
        std::vector<png_bytep> rows;

        ~PngReadContext()
        {
            if (png) {
                png_destroy_read_struct(&png, info ? &info : nullptr, nullptr);
            }
        }
    };

    struct PngWriteContext final {
        png_structp png = nullptr;
        png_infop info  = nullptr;
        std::vector<std::byte>* out = nullptr;

        ~PngWriteContext()
        {
            if (png) {
                png_destroy_write_struct(&png, info ? &info : nullptr);
            }
        }
    };


    static void png_error_fn(png_structp png, png_const_charp msg)
    {
        PngMessage* m = static_cast<PngMessage*>(png_get_error_ptr(png));
        if (m) {
            std::snprintf(m->text, sizeof(m->text), "%s",
                          msg ? msg : "libpng error");
        }
        png_longjmp(png, 1);
    }


    static void png_warning_fn(png_structp, png_const_charp) { }


    static void png_read_fn(png_structp png, png_bytep data, size_t length)
    {
        PngReadContext* ctx = static_cast<PngReadContext*>(
            png_get_io_ptr(png));
        if (length > ctx->bytes.size() - ctx->offset) {
            png_error(png, "unexpected end of PNG data");
        }
        std::memcpy(data, ctx->bytes.data() + ctx->offset, length);
        ctx->offset += length;
    }


    static void png_write_fn(png_structp png, png_bytep data, size_t length)
    {
        PngWriteContext* ctx = static_cast<PngWriteContext*>(
            png_get_io_ptr(png));
        bool ok = true;
        try {
            const std::byte* p = reinterpret_cast<const std::byte*>(data);
            ctx->out->insert(ctx->out->end(), p, p + length);
        } catch (const std::bad_alloc&) {
            ok = false;
        }
        if (!ok) {
            png_error(png, "out of memory");
        }
    }


    static void png_flush_fn(png_structp) { }

}  // namespace

DecodeResult
decode_png(std::span<const std::byte> bytes, const DecodeLimits& limits,
           PixelImage* out)
{
    DecodeResult res;
    res.format = ImageFormat::Png;

    PngMessage msg {};
    PngReadContext ctx;
    ctx.bytes = bytes;

    ctx.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, &msg,
                                     png_error_fn, png_warning_fn);
    if (!ctx.png) {
        res.status  = DecodeStatus::Malformed;
        res.message = "png_create_read_struct failed";
        return res;
    }
    ctx.info = png_create_info_struct(ctx.png);
    if (!ctx.info) {
        res.status  = DecodeStatus::Malformed;
        res.message = "png_create_info_struct failed";
        return res;
    }

    if (setjmp(png_jmpbuf(ctx.png))) {
        out->pixels.clear();
        res.status  = DecodeStatus::Malformed;
        res.message = msg.text;
        return res;
    }

    png_set_read_fn(ctx.png, &ctx, png_read_fn);
    png_read_info(ctx.png, ctx.info);

    // Normalize to 8-bit samples: palette -> RGB, low-depth gray -> 8-bit,
    // tRNS -> alpha channel, 16-bit -> 8-bit.
    png_set_expand(ctx.png);
    png_set_strip_16(ctx.png);
    (void)png_set_interlace_handling(ctx.png);
    png_read_update_info(ctx.png, ctx.info);

    const png_uint_32 width  = png_get_image_width(ctx.png, ctx.info);
    const png_uint_32 height = png_get_image_height(ctx.png, ctx.info);

    ColorModel color = ColorModel::Rgb;
    switch (png_get_color_type(ctx.png, ctx.info)) {
    case PNG_COLOR_TYPE_GRAY: color = ColorModel::Gray; break;
    case PNG_COLOR_TYPE_GRAY_ALPHA: color = ColorModel::GrayAlpha; break;
    case PNG_COLOR_TYPE_RGB: color = ColorModel::Rgb; break;
    case PNG_COLOR_TYPE_RGB_ALPHA: color = ColorModel::Rgba; break;
    default:
        res.status  = DecodeStatus::Malformed;
        res.message = "unexpected PNG color type after expansion";
        return res;
    }

    const uint32_t channels = channel_count(color);
    if (!pixel_budget_ok(width, height, channels, limits)) {
        res.status  = DecodeStatus::LimitExceeded;
        res.message = "image dimensions exceed the pixel limit";
        return res;
    }
    const size_t row_bytes = static_cast<size_t>(width) * channels;
    if (png_get_rowbytes(ctx.png, ctx.info) != row_bytes) {
        res.status  = DecodeStatus::Malformed;
        res.message = "unexpected PNG row size";
        return res;
    }

    out->pixels.resize(row_bytes * height);
    ctx.rows.resize(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        ctx.rows[y] = reinterpret_cast<png_bytep>(out->pixels.data()
                                                  + row_bytes * y);
    }
    png_read_image(ctx.png, ctx.rows.data());
    // Reads the remaining chunks through IEND; a truncated stream fails here.
    png_read_end(ctx.png, nullptr);

    out->width  = width;
    out->height = height;
    out->color  = color;
    out->format = ImageFormat::Png;
    return res;
}


EncodeResult
encode_png(const PixelImage& image, const EncodeOptions& options,
           std::vector<std::byte>* out)
{
    EncodeResult res;

    int color_type = 0;
    switch (image.color) {
    case ColorModel::Gray: color_type = PNG_COLOR_TYPE_GRAY; break;
    case ColorModel::GrayAlpha: color_type = PNG_COLOR_TYPE_GRAY_ALPHA; break;
    case ColorModel::Rgb: color_type = PNG_COLOR_TYPE_RGB; break;
    case ColorModel::Rgba: color_type = PNG_COLOR_TYPE_RGB_ALPHA; break;
    case ColorModel::Cmyk:
        res.status  = EncodeStatus::Unsupported;
        res.message = "PNG cannot store CMYK";
        return res;
    }

    const size_t row_bytes = static_cast<size_t>(image.width)
                             * channel_count(image.color);
    std::vector<png_bytep> rows(image.height);
    for (uint32_t y = 0; y < image.height; ++y) {
        rows[y] = reinterpret_cast<png_bytep>(
            const_cast<std::byte*>(image.pixels.data() + row_bytes * y));
    }

    PngMessage msg {};
    PngWriteContext ctx;
    ctx.out = out;

    ctx.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, &msg,
                                      png_error_fn, png_warning_fn);
    if (!ctx.png) {
        res.status  = EncodeStatus::Failed;
        res.message = "png_create_write_struct failed";
        return res;
    }
    ctx.info = png_create_info_struct(ctx.png);
    if (!ctx.info) {
        res.status  = EncodeStatus::Failed;
        res.message = "png_create_info_struct failed";
        return res;
    }

    if (setjmp(png_jmpbuf(ctx.png))) {
        out->clear();
        res.status  = EncodeStatus::Failed;
        res.message = msg.text;
        return res;
    }

    png_set_write_fn(ctx.png, &ctx, png_write_fn, png_flush_fn);
    png_set_IHDR(ctx.png, ctx.info, image.width, image.height, 8, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);
    png_set_compression_level(ctx.png, options.png_optimize
                                           ? Z_BEST_COMPRESSION
                                           : Z_DEFAULT_COMPRESSION);

    // IHDR and IDAT only: no text, time, ICC or eXIf chunks are set.
    png_write_info(ctx.png, ctx.info);
    png_write_image(ctx.png, rows.data());
    png_write_end(ctx.png, nullptr);
    return res;
}

}  // namespace photoclean::codec_internal
