#include "image_codec_internal.h"

#if defined(PHOTOCLEAN_HAS_GIF) && PHOTOCLEAN_HAS_GIF
#    include <algorithm>
#    include <cstring>
#    include <new>
#    include <unordered_map>

#    include <gif_lib.h>
#endif

namespace photoclean::codec_internal {

#if defined(PHOTOCLEAN_HAS_GIF) && PHOTOCLEAN_HAS_GIF

namespace {

    // Up to 255 opaque colors plus one transparent slot.
    static constexpr uint32_t kMaxPaletteColors = 256;

    struct GifReadContext final {
        std::span<const std::byte> bytes;
        size_t offset = 0;
    };

    struct GifWriteContext final {
        std::vector<std::byte>* out = nullptr;
    };

    struct DecoderGuard final {
        GifFileType* gif = nullptr;
        ~DecoderGuard()
        {
            if (gif) {
                int err = 0;
                (void)DGifCloseFile(gif, &err);
            }
        }
    };

    struct EncoderGuard final {
        GifFileType* gif = nullptr;
        ~EncoderGuard()
        {
            if (gif) {
                int err = 0;
                (void)EGifCloseFile(gif, &err);
            }
        }
    };

    struct ColorMapGuard final {
        ColorMapObject* map = nullptr;
        ~ColorMapGuard()
        {
            if (map) {
                GifFreeMapObject(map);
            }
        }
    };


    static int gif_read_fn(GifFileType* gif, GifByteType* buf, int len)
    {
        GifReadContext* ctx = static_cast<GifReadContext*>(gif->UserData);
        if (len <= 0) {
            return 0;
        }
        const size_t avail = ctx->bytes.size() - ctx->offset;
        const size_t n     = std::min(static_cast<size_t>(len), avail);
        std::memcpy(buf, ctx->bytes.data() + ctx->offset, n);
        ctx->offset += n;
        return static_cast<int>(n);
    }


    static int gif_write_fn(GifFileType* gif, const GifByteType* buf, int len)
    {
        GifWriteContext* ctx = static_cast<GifWriteContext*>(gif->UserData);
        if (len <= 0) {
            return 0;
        }
        try {
            const std::byte* p = reinterpret_cast<const std::byte*>(buf);
            ctx->out->insert(ctx->out->end(), p, p + len);
        } catch (const std::bad_alloc&) {
            return 0;
        }
        return len;
    }


    static const char* gif_error_text(int code)
    {
        const char* s = GifErrorString(code);
        return s ? s : "giflib error";
    }


    static uint32_t pack_rgb(uint8_t r, uint8_t g, uint8_t b) noexcept
    {
        return (static_cast<uint32_t>(r) << 16) | (static_cast<uint32_t>(g) << 8)
               | static_cast<uint32_t>(b);
    }


    // Reads pixel i as RGBA regardless of the source layout.
    static void read_rgba(const PixelImage& image, size_t i, uint8_t rgba[4])
    {
        const std::byte* p = image.pixels.data();
        switch (image.color) {
        case ColorModel::Gray:
            rgba[0] = rgba[1] = rgba[2] = static_cast<uint8_t>(p[i]);
            rgba[3] = 0xFF;
            return;
        case ColorModel::GrayAlpha:
            rgba[0] = rgba[1] = rgba[2] = static_cast<uint8_t>(p[i * 2U]);
            rgba[3] = static_cast<uint8_t>(p[i * 2U + 1U]);
            return;
        case ColorModel::Rgb:
            rgba[0] = static_cast<uint8_t>(p[i * 3U]);
            rgba[1] = static_cast<uint8_t>(p[i * 3U + 1U]);
            rgba[2] = static_cast<uint8_t>(p[i * 3U + 2U]);
            rgba[3] = 0xFF;
            return;
        case ColorModel::Rgba:
        case ColorModel::Cmyk:
            rgba[0] = static_cast<uint8_t>(p[i * 4U]);
            rgba[1] = static_cast<uint8_t>(p[i * 4U + 1U]);
            rgba[2] = static_cast<uint8_t>(p[i * 4U + 2U]);
            rgba[3] = static_cast<uint8_t>(p[i * 4U + 3U]);
            return;
        }
    }


    /**
     * \brief Maps every pixel to a palette index.
     *
     * Images with at most 255 distinct opaque colors keep them exactly.
     * Anything else falls back to a fixed 6x7x6 color cube. Pixels with
     * alpha below 128 map to a dedicated transparent index.
     */
    static void build_indexed(const PixelImage& image,
                              std::vector<GifColorType>* palette,
                              std::vector<GifPixelType>* indices,
                              int* transparent_index)
    {
        const size_t n = static_cast<size_t>(image.width) * image.height;
        indices->resize(n);
        palette->clear();
        *transparent_index = -1;

        std::unordered_map<uint32_t, uint8_t> exact;
        bool has_transparent = false;
        bool exact_ok        = true;
        uint8_t px[4];
        for (size_t i = 0; i < n && exact_ok; ++i) {
            read_rgba(image, i, px);
            if (px[3] < 0x80U) {
                has_transparent = true;
                continue;
            }
            const uint32_t key = pack_rgb(px[0], px[1], px[2]);
            if (exact.find(key) != exact.end()) {
                continue;
            }
            if (exact.size() + 1U >= kMaxPaletteColors) {
                exact_ok = false;
                break;
            }
            const uint8_t idx = static_cast<uint8_t>(palette->size());
            exact.emplace(key, idx);
            palette->push_back(GifColorType { px[0], px[1], px[2] });
        }

        if (!exact_ok) {
            palette->clear();
            for (int r = 0; r < 6; ++r) {
                for (int g = 0; g < 7; ++g) {
                    for (int b = 0; b < 6; ++b) {
                        palette->push_back(GifColorType {
                            static_cast<GifByteType>(r * 255 / 5),
                            static_cast<GifByteType>(g * 255 / 6),
                            static_cast<GifByteType>(b * 255 / 5) });
                    }
                }
            }
        }
        if (has_transparent) {
            *transparent_index = static_cast<int>(palette->size());
            palette->push_back(GifColorType { 0, 0, 0 });
        }
        if (palette->empty()) {
            palette->push_back(GifColorType { 0, 0, 0 });
        }

        for (size_t i = 0; i < n; ++i) {
            read_rgba(image, i, px);
            if (px[3] < 0x80U) {
                (*indices)[i] = static_cast<GifPixelType>(*transparent_index);
            } else if (exact_ok) {
                (*indices)[i] = exact[pack_rgb(px[0], px[1], px[2])];
            } else {
                const int r     = (px[0] * 5 + 127) / 255;
                const int g     = (px[1] * 6 + 127) / 255;
                const int b     = (px[2] * 5 + 127) / 255;
                (*indices)[i]   = static_cast<GifPixelType>((r * 7 + g) * 6
                                                            + b);
            }
        }
    }

}  // namespace

DecodeResult
decode_gif(std::span<const std::byte> bytes, const DecodeLimits& limits,
           PixelImage* out)
{
    DecodeResult res;
    res.format = ImageFormat::Gif;

    GifReadContext ctx;
    ctx.bytes = bytes;
    int err   = 0;
    DecoderGuard guard;
    guard.gif = DGifOpen(&ctx, gif_read_fn, &err);
    if (!guard.gif) {
        res.status  = DecodeStatus::Malformed;
        res.message = gif_error_text(err);
        return res;
    }
    GifFileType* gif = guard.gif;

    if (gif->SWidth <= 0 || gif->SHeight <= 0
        || !pixel_budget_ok(static_cast<uint64_t>(gif->SWidth),
                            static_cast<uint64_t>(gif->SHeight), 4U,
                            limits)) {
        res.status  = DecodeStatus::LimitExceeded;
        res.message = "image dimensions exceed the pixel limit";
        return res;
    }
    if (DGifSlurp(gif) != GIF_OK) {
        res.status  = DecodeStatus::Malformed;
        res.message = gif_error_text(gif->Error);
        return res;
    }
    if (gif->ImageCount < 1) {
        res.status  = DecodeStatus::Malformed;
        res.message = "GIF contains no image";
        return res;
    }
    if (gif->ImageCount > 1) {
        res.status  = DecodeStatus::Unsupported;
        res.message = "animated GIF";
        return res;
    }

    const SavedImage& frame     = gif->SavedImages[0];
    const ColorMapObject* cmap  = frame.ImageDesc.ColorMap
                                      ? frame.ImageDesc.ColorMap
                                      : gif->SColorMap;
    if (!cmap || !frame.RasterBits) {
        res.status  = DecodeStatus::Malformed;
        res.message = "GIF image has no color map";
        return res;
    }

    GraphicsControlBlock gcb;
    gcb.TransparentColor = NO_TRANSPARENT_COLOR;
    (void)DGifSavedExtensionToGCB(gif, 0, &gcb);
    const int transparent = gcb.TransparentColor;

    const ColorModel color  = (transparent >= 0) ? ColorModel::Rgba
                                                 : ColorModel::Rgb;
    const uint32_t channels = channel_count(color);
    const uint32_t width    = static_cast<uint32_t>(gif->SWidth);
    const uint32_t height   = static_cast<uint32_t>(gif->SHeight);
    out->pixels.assign(static_cast<size_t>(width) * height * channels,
                       std::byte { 0 });

    // Uncovered canvas is the background color, or transparent.
    if (transparent < 0 && gif->SColorMap
        && gif->SBackGroundColor < gif->SColorMap->ColorCount) {
        const GifColorType bg = gif->SColorMap->Colors[gif->SBackGroundColor];
        for (size_t i = 0; i < out->pixels.size(); i += channels) {
            out->pixels[i]      = std::byte { bg.Red };
            out->pixels[i + 1U] = std::byte { bg.Green };
            out->pixels[i + 2U] = std::byte { bg.Blue };
        }
    }

    const GifImageDesc& desc = frame.ImageDesc;
    for (int fy = 0; fy < desc.Height; ++fy) {
        const int y = desc.Top + fy;
        if (y < 0 || static_cast<uint32_t>(y) >= height) {
            continue;
        }
        for (int fx = 0; fx < desc.Width; ++fx) {
            const int x = desc.Left + fx;
            if (x < 0 || static_cast<uint32_t>(x) >= width) {
                continue;
            }
            const int idx = frame.RasterBits[static_cast<size_t>(fy)
                                                 * desc.Width
                                             + fx];
            if (idx == transparent) {
                continue;
            }
            const size_t o = (static_cast<size_t>(y) * width
                              + static_cast<size_t>(x))
                             * channels;
            GifColorType c { 0, 0, 0 };
            if (idx < cmap->ColorCount) {
                c = cmap->Colors[idx];
            }
            out->pixels[o]      = std::byte { c.Red };
            out->pixels[o + 1U] = std::byte { c.Green };
            out->pixels[o + 2U] = std::byte { c.Blue };
            if (channels == 4U) {
                out->pixels[o + 3U] = std::byte { 0xFF };
            }
        }
    }

    out->width  = width;
    out->height = height;
    out->color  = color;
    out->format = ImageFormat::Gif;
    return res;
}


EncodeResult
encode_gif(const PixelImage& image, const EncodeOptions&,
           std::vector<std::byte>* out)
{
    EncodeResult res;
    if (image.color == ColorModel::Cmyk) {
        res.status  = EncodeStatus::Unsupported;
        res.message = "GIF cannot store CMYK";
        return res;
    }
    if (image.width > 0xFFFFU || image.height > 0xFFFFU) {
        res.status  = EncodeStatus::Unsupported;
        res.message = "GIF dimensions are limited to 65535";
        return res;
    }

    std::vector<GifColorType> palette;
    std::vector<GifPixelType> indices;
    int transparent = -1;
    build_indexed(image, &palette, &indices, &transparent);

    // giflib color maps must have a power-of-two size.
    int map_size = 2;
    while (map_size < static_cast<int>(palette.size())) {
        map_size *= 2;
    }
    palette.resize(static_cast<size_t>(map_size), GifColorType { 0, 0, 0 });
    ColorMapGuard cmap;
    cmap.map = GifMakeMapObject(map_size, palette.data());
    if (!cmap.map) {
        res.status  = EncodeStatus::Failed;
        res.message = "cannot allocate GIF color map";
        return res;
    }

    GifWriteContext ctx;
    ctx.out = out;
    int err = 0;
    EncoderGuard guard;
    guard.gif = EGifOpen(&ctx, gif_write_fn, &err);
    if (!guard.gif) {
        res.status  = EncodeStatus::Failed;
        res.message = gif_error_text(err);
        return res;
    }
    GifFileType* gif = guard.gif;

    const int w = static_cast<int>(image.width);
    const int h = static_cast<int>(image.height);
    EGifSetGifVersion(gif, transparent >= 0);
    bool ok = EGifPutScreenDesc(gif, w, h, cmap.map->BitsPerPixel, 0,
                                cmap.map)
              == GIF_OK;

    // The only extension written is the graphic control block that carries
    // transparency.
    if (ok && transparent >= 0) {
        GraphicsControlBlock gcb;
        gcb.DisposalMode     = DISPOSAL_UNSPECIFIED;
        gcb.UserInputFlag    = false;
        gcb.DelayTime        = 0;
        gcb.TransparentColor = transparent;
        GifByteType ext[4];
        const size_t len = EGifGCBToExtension(&gcb, ext);
        ok = EGifPutExtension(gif, GRAPHICS_EXT_FUNC_CODE,
                              static_cast<int>(len), ext)
             == GIF_OK;
    }
    if (ok) {
        ok = EGifPutImageDesc(gif, 0, 0, w, h, false, nullptr) == GIF_OK;
    }
    for (int y = 0; ok && y < h; ++y) {
        ok = EGifPutLine(gif, indices.data() + static_cast<size_t>(y) * w, w)
             == GIF_OK;
    }
    if (!ok) {
        res.status  = EncodeStatus::Failed;
        res.message = gif_error_text(gif->Error);
        out->clear();
        return res;
    }

    // Writes the trailer and frees the handle on every path.
    guard.gif = nullptr;
    if (EGifCloseFile(gif, &err) != GIF_OK) {
        out->clear();
        res.status  = EncodeStatus::Failed;
        res.message = gif_error_text(err);
        return res;
    }
    return res;
}

#else

DecodeResult
decode_gif(std::span<const std::byte>, const DecodeLimits&, PixelImage*)
{
    DecodeResult res;
    res.status  = DecodeStatus::Unsupported;
    res.format  = ImageFormat::Gif;
    res.message = "built without giflib";
    return res;
}


EncodeResult
encode_gif(const PixelImage&, const EncodeOptions&, std::vector<std::byte>*)
{
    EncodeResult res;
    res.status  = EncodeStatus::Unsupported;
    res.message = "built without giflib";
    return res;
}

#endif

}  // namespace photoclean::codec_internal
