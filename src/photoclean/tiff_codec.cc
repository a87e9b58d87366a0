#include "image_codec_internal.h"

#if defined(PHOTOCLEAN_HAS_TIFF) && PHOTOCLEAN_HAS_TIFF
#    include <algorithm>
#    include <cstdarg>
#    include <cstdio>
#    include <cstring>
#    include <new>

#    include <tiffio.h>
#endif

namespace photoclean::codec_internal {

#if defined(PHOTOCLEAN_HAS_TIFF) && PHOTOCLEAN_HAS_TIFF

namespace {

    // Client handle for TIFFClientOpen. Reads come from `in`; writes grow
    // `out`. libtiff's error handler writes into `message`.
    struct TiffMemory final {
        std::span<const std::byte> in;
        std::vector<std::byte>* out = nullptr;
        uint64_t pos                = 0;
        char message[256]           = {};
    };

    struct TiffGuard final {
        TIFF* tif = nullptr;
        ~TiffGuard()
        {
            if (tif) {
                TIFFClose(tif);
            }
        }
    };


    static uint64_t memory_size(const TiffMemory* m) noexcept
    {
        return m->out ? static_cast<uint64_t>(m->out->size())
                      : static_cast<uint64_t>(m->in.size());
    }


    static tmsize_t tiff_read_fn(thandle_t h, void* buf, tmsize_t size)
    {
        TiffMemory* m = static_cast<TiffMemory*>(h);
        if (size <= 0) {
            return 0;
        }
        const uint64_t total = memory_size(m);
        if (m->pos >= total) {
            return 0;
        }
        const uint64_t n = std::min(static_cast<uint64_t>(size),
                                    total - m->pos);
        const std::byte* src = m->out ? m->out->data() : m->in.data();
        std::memcpy(buf, src + m->pos, static_cast<size_t>(n));
        m->pos += n;
        return static_cast<tmsize_t>(n);
    }


    static tmsize_t tiff_write_fn(thandle_t h, void* buf, tmsize_t size)
    {
        TiffMemory* m = static_cast<TiffMemory*>(h);
        if (!m->out || size < 0) {
            return -1;
        }
        const uint64_t end = m->pos + static_cast<uint64_t>(size);
        try {
            if (end > m->out->size()) {
                m->out->resize(static_cast<size_t>(end));
            }
        } catch (const std::bad_alloc&) {
            return -1;
        }
        std::memcpy(m->out->data() + m->pos, buf, static_cast<size_t>(size));
        m->pos = end;
        return size;
    }


    static toff_t tiff_seek_fn(thandle_t h, toff_t off, int whence)
    {
        TiffMemory* m      = static_cast<TiffMemory*>(h);
        const int64_t delta = static_cast<int64_t>(off);
        int64_t base        = 0;
        switch (whence) {
        case SEEK_SET: base = 0; break;
        case SEEK_CUR: base = static_cast<int64_t>(m->pos); break;
        case SEEK_END: base = static_cast<int64_t>(memory_size(m)); break;
        default: return static_cast<toff_t>(-1);
        }
        const int64_t target = (whence == SEEK_SET) ? static_cast<int64_t>(off)
                                                    : base + delta;
        if (target < 0) {
            return static_cast<toff_t>(-1);
        }
        // Writers may seek past the end; the gap is filled on write.
        m->pos = static_cast<uint64_t>(target);
        return static_cast<toff_t>(m->pos);
    }


    static int tiff_close_fn(thandle_t) { return 0; }


    static toff_t tiff_size_fn(thandle_t h)
    {
        return static_cast<toff_t>(memory_size(static_cast<TiffMemory*>(h)));
    }


    static int tiff_map_fn(thandle_t, void**, toff_t*) { return 0; }


    static void tiff_unmap_fn(thandle_t, void*, toff_t) { }


    static void tiff_error_fn(thandle_t h, const char* module, const char* fmt,
                              va_list ap)
    {
        TiffMemory* m = static_cast<TiffMemory*>(h);
        if (!m || m->message[0] != '\0') {
            return;
        }
        char text[200];
        std::vsnprintf(text, sizeof(text), fmt, ap);
        std::snprintf(m->message, sizeof(m->message), "%s: %s",
                      module ? module : "libtiff", text);
    }


    // libtiff's handlers are process-wide. The default ones print to stderr.
    static void install_tiff_handlers() noexcept
    {
        static const bool installed = [] {
            TIFFSetErrorHandler(nullptr);
            TIFFSetWarningHandler(nullptr);
            TIFFSetErrorHandlerExt(tiff_error_fn);
            TIFFSetWarningHandlerExt(nullptr);
            return true;
        }();
        (void)installed;
    }


    static TIFF* open_memory(TiffMemory* m, const char* mode)
    {
        install_tiff_handlers();
        return TIFFClientOpen("photoclean", mode, static_cast<thandle_t>(m),
                              tiff_read_fn, tiff_write_fn, tiff_seek_fn,
                              tiff_close_fn, tiff_size_fn, tiff_map_fn,
                              tiff_unmap_fn);
    }


    static const char* tiff_message(const TiffMemory& m, const char* fallback)
    {
        return m.message[0] != '\0' ? m.message : fallback;
    }


    /**
     * \brief Picks a layout that can be read scanline by scanline.
     *
     * Returns false for anything else (palette, YCbCr, tiles, planar data,
     * bit depths other than 8, associated alpha); those go through the RGBA
     * interface.
     */
    static bool direct_layout(TIFF* tif, ColorModel* color)
    {
        uint16_t bps = 1, spp = 1, photometric = 0, planar = PLANARCONFIG_CONTIG;
        uint16_t extra_count   = 0;
        uint16_t* extra_types  = nullptr;
        uint16_t inkset        = INKSET_CMYK;
        (void)TIFFGetFieldDefaulted(tif, TIFFTAG_BITSPERSAMPLE, &bps);
        (void)TIFFGetFieldDefaulted(tif, TIFFTAG_SAMPLESPERPIXEL, &spp);
        (void)TIFFGetFieldDefaulted(tif, TIFFTAG_PLANARCONFIG, &planar);
        (void)TIFFGetFieldDefaulted(tif, TIFFTAG_EXTRASAMPLES, &extra_count,
                                    &extra_types);
        (void)TIFFGetFieldDefaulted(tif, TIFFTAG_INKSET, &inkset);
        if (TIFFGetField(tif, TIFFTAG_PHOTOMETRIC, &photometric) != 1) {
            return false;
        }
        if (bps != 8 || planar != PLANARCONFIG_CONTIG || TIFFIsTiled(tif)) {
            return false;
        }
        const bool unassoc_alpha = extra_count == 1 && extra_types
                                   && extra_types[0] == EXTRASAMPLE_UNASSALPHA;

        if (photometric == PHOTOMETRIC_MINISBLACK) {
            if (spp == 1 && extra_count == 0) {
                *color = ColorModel::Gray;
                return true;
            }
            if (spp == 2 && unassoc_alpha) {
                *color = ColorModel::GrayAlpha;
                return true;
            }
        } else if (photometric == PHOTOMETRIC_RGB) {
            if (spp == 3 && extra_count == 0) {
                *color = ColorModel::Rgb;
                return true;
            }
            if (spp == 4 && unassoc_alpha) {
                *color = ColorModel::Rgba;
                return true;
            }
        } else if (photometric == PHOTOMETRIC_SEPARATED) {
            if (spp == 4 && extra_count == 0 && inkset == INKSET_CMYK) {
                *color = ColorModel::Cmyk;
                return true;
            }
        }
        return false;
    }


    static DecodeStatus read_direct(TIFF* tif, uint32_t width,
                                    uint32_t height, ColorModel color,
                                    PixelImage* out)
    {
        const size_t row_bytes = static_cast<size_t>(width)
                                 * channel_count(color);
        if (TIFFScanlineSize64(tif) != static_cast<uint64_t>(row_bytes)) {
            return DecodeStatus::Malformed;
        }
        out->pixels.resize(row_bytes * height);
        for (uint32_t y = 0; y < height; ++y) {
            if (TIFFReadScanline(tif, out->pixels.data() + row_bytes * y, y,
                                 0)
                < 0) {
                return DecodeStatus::Malformed;
            }
        }
        out->color = color;
        return DecodeStatus::Ok;
    }


    static DecodeStatus read_rgba(TIFF* tif, uint32_t width, uint32_t height,
                                  PixelImage* out)
    {
        uint16_t photometric = PHOTOMETRIC_RGB;
        uint16_t extra_count = 0;
        uint16_t* extra_types = nullptr;
        (void)TIFFGetField(tif, TIFFTAG_PHOTOMETRIC, &photometric);
        (void)TIFFGetFieldDefaulted(tif, TIFFTAG_EXTRASAMPLES, &extra_count,
                                    &extra_types);
        const bool gray  = photometric == PHOTOMETRIC_MINISBLACK
                          || photometric == PHOTOMETRIC_MINISWHITE;
        const bool alpha = extra_count > 0;
        ColorModel color = ColorModel::Rgb;
        if (gray) {
            color = alpha ? ColorModel::GrayAlpha : ColorModel::Gray;
        } else if (alpha) {
            color = ColorModel::Rgba;
        }

        const size_t n = static_cast<size_t>(width) * height;
        std::vector<uint32_t> raster(n);
        if (!TIFFReadRGBAImageOriented(tif, width, height, raster.data(),
                                       ORIENTATION_TOPLEFT, 0)) {
            return DecodeStatus::Malformed;
        }

        const uint32_t channels = channel_count(color);
        out->pixels.resize(n * channels);
        for (size_t i = 0; i < n; ++i) {
            const uint32_t p = raster[i];
            std::byte* dst   = out->pixels.data() + i * channels;
            if (gray) {
                dst[0] = std::byte { static_cast<uint8_t>(TIFFGetR(p)) };
                if (alpha) {
                    dst[1] = std::byte { static_cast<uint8_t>(TIFFGetA(p)) };
                }
                continue;
            }
            dst[0] = std::byte { static_cast<uint8_t>(TIFFGetR(p)) };
            dst[1] = std::byte { static_cast<uint8_t>(TIFFGetG(p)) };
            dst[2] = std::byte { static_cast<uint8_t>(TIFFGetB(p)) };
            if (alpha) {
                dst[3] = std::byte { static_cast<uint8_t>(TIFFGetA(p)) };
            }
        }
        out->color = color;
        return DecodeStatus::Ok;
    }

}  // namespace

DecodeResult
decode_tiff(std::span<const std::byte> bytes, const DecodeLimits& limits,
            PixelImage* out)
{
    DecodeResult res;
    res.format = ImageFormat::Tiff;

    TiffMemory mem;
    mem.in = bytes;
    TiffGuard guard;
    guard.tif = open_memory(&mem, "rm");
    if (!guard.tif) {
        res.status  = DecodeStatus::Malformed;
        res.message = tiff_message(mem, "cannot open TIFF");
        return res;
    }
    TIFF* tif = guard.tif;

    if (TIFFNumberOfDirectories(tif) > 1) {
        res.status  = DecodeStatus::Unsupported;
        res.message = "multi-page TIFF";
        return res;
    }

    uint32_t width  = 0;
    uint32_t height = 0;
    if (TIFFGetField(tif, TIFFTAG_IMAGEWIDTH, &width) != 1
        || TIFFGetField(tif, TIFFTAG_IMAGELENGTH, &height) != 1 || width == 0
        || height == 0) {
        res.status  = DecodeStatus::Malformed;
        res.message = tiff_message(mem, "missing TIFF image dimensions");
        return res;
    }
    if (!pixel_budget_ok(width, height, 4U, limits)) {
        res.status  = DecodeStatus::LimitExceeded;
        res.message = "image dimensions exceed the pixel limit";
        return res;
    }

    ColorModel color = ColorModel::Rgb;
    const DecodeStatus st = direct_layout(tif, &color)
                                ? read_direct(tif, width, height, color, out)
                                : read_rgba(tif, width, height, out);
    if (st != DecodeStatus::Ok) {
        out->pixels.clear();
        res.status  = st;
        res.message = tiff_message(mem, "TIFF decode failed");
        return res;
    }

    out->width  = width;
    out->height = height;
    out->format = ImageFormat::Tiff;
    return res;
}


EncodeResult
encode_tiff(const PixelImage& image, const EncodeOptions& options,
            std::vector<std::byte>* out)
{
    EncodeResult res;

    uint16_t photometric = PHOTOMETRIC_RGB;
    bool alpha           = false;
    switch (image.color) {
    case ColorModel::Gray: photometric = PHOTOMETRIC_MINISBLACK; break;
    case ColorModel::GrayAlpha:
        photometric = PHOTOMETRIC_MINISBLACK;
        alpha       = true;
        break;
    case ColorModel::Rgb: photometric = PHOTOMETRIC_RGB; break;
    case ColorModel::Rgba:
        photometric = PHOTOMETRIC_RGB;
        alpha       = true;
        break;
    case ColorModel::Cmyk: photometric = PHOTOMETRIC_SEPARATED; break;
    }
    const uint16_t spp = static_cast<uint16_t>(channel_count(image.color));

    TiffMemory mem;
    mem.out = out;
    TiffGuard guard;
    guard.tif = open_memory(&mem, "w");
    if (!guard.tif) {
        res.status  = EncodeStatus::Failed;
        res.message = tiff_message(mem, "cannot create TIFF");
        return res;
    }
    TIFF* tif = guard.tif;

    uint16_t compression = COMPRESSION_NONE;
    if (options.tiff_deflate
        && TIFFIsCODECConfigured(COMPRESSION_ADOBE_DEFLATE)) {
        compression = COMPRESSION_ADOBE_DEFLATE;
    }

    // Only the tags needed to describe the pixels are written.
    bool ok = TIFFSetField(tif, TIFFTAG_IMAGEWIDTH, image.width) == 1
              && TIFFSetField(tif, TIFFTAG_IMAGELENGTH, image.height) == 1
              && TIFFSetField(tif, TIFFTAG_BITSPERSAMPLE, 8) == 1
              && TIFFSetField(tif, TIFFTAG_SAMPLESPERPIXEL, spp) == 1
              && TIFFSetField(tif, TIFFTAG_PHOTOMETRIC, photometric) == 1
              && TIFFSetField(tif, TIFFTAG_PLANARCONFIG, PLANARCONFIG_CONTIG)
                     == 1
              && TIFFSetField(tif, TIFFTAG_COMPRESSION, compression) == 1;
    if (ok && compression == COMPRESSION_ADOBE_DEFLATE) {
        ok = TIFFSetField(tif, TIFFTAG_PREDICTOR, PREDICTOR_HORIZONTAL) == 1;
    }
    if (ok && alpha) {
        uint16_t extra[1] = { EXTRASAMPLE_UNASSALPHA };
        ok = TIFFSetField(tif, TIFFTAG_EXTRASAMPLES, 1, extra) == 1;
    }
    if (ok && image.color == ColorModel::Cmyk) {
        ok = TIFFSetField(tif, TIFFTAG_INKSET, INKSET_CMYK) == 1;
    }
    if (ok) {
        ok = TIFFSetField(tif, TIFFTAG_ROWSPERSTRIP,
                          TIFFDefaultStripSize(tif, 0))
             == 1;
    }

    // The predictor works in place, so each row is copied first.
    const size_t row_bytes = static_cast<size_t>(image.width) * spp;
    std::vector<std::byte> row(row_bytes);
    for (uint32_t y = 0; ok && y < image.height; ++y) {
        std::memcpy(row.data(), image.pixels.data() + row_bytes * y,
                    row_bytes);
        ok = TIFFWriteScanline(tif, row.data(), y, 0) == 1;
    }
    if (ok) {
        ok = TIFFFlush(tif) == 1;
    }
    if (!ok) {
        out->clear();
        res.status  = EncodeStatus::Failed;
        res.message = tiff_message(mem, "TIFF encode failed");
        return res;
    }
    guard.tif = nullptr;
    TIFFClose(tif);
    return res;
}

#else

DecodeResult
decode_tiff(std::span<const std::byte>, const DecodeLimits&, PixelImage*)
{
    DecodeResult res;
    res.status  = DecodeStatus::Unsupported;
    res.format  = ImageFormat::Tiff;
    res.message = "built without libtiff";
    return res;
}


EncodeResult
encode_tiff(const PixelImage&, const EncodeOptions&, std::vector<std::byte>*)
{
    EncodeResult res;
    res.status  = EncodeStatus::Unsupported;
    res.message = "built without libtiff";
    return res;
}

#endif

}  // namespace photoclean::codec_internal
