#include "image_codec_internal.h"

#include <csetjmp>
#include <cstdio>
#include <new>

#include <jpeglib.h>
#include <jerror.h>

namespace photoclean::codec_internal {
namespace {

    static constexpr size_t kDestinationBufferSize = 16384;

    struct JpegErrorManager final {
        jpeg_error_mgr pub;
        std::jmp_buf jump;
        char message[JMSG_LENGTH_MAX];
    };

    struct VectorDestination final {
        jpeg_destination_mgr pub;
        std::vector<std::byte>* out = nullptr;
        JOCTET buffer[kDestinationBufferSize];
    };

    struct DecompressGuard final {
        jpeg_decompress_struct* cinfo = nullptr;
        ~DecompressGuard()
        {
            if (cinfo) {
                jpeg_destroy_decompress(cinfo);
            }
        }
    };

    struct CompressGuard final {
        jpeg_compress_struct* cinfo = nullptr;
        ~CompressGuard()
        {
            if (cinfo) {
                jpeg_destroy_compress(cinfo);
            }
        }
    };


    static void jpeg_error_exit(j_common_ptr cinfo)
    {
        JpegErrorManager* err = reinterpret_cast<JpegErrorManager*>(
            cinfo->err);
        (*cinfo->err->format_message)(cinfo, err->message);
        std::longjmp(err->jump, 1);
    }


    // libjpeg only warns when the stream ends early and then synthesizes the
    // missing scanlines. A full decode must reject that, so the warning is
    // escalated; every other message is dropped.
    static void jpeg_emit_message(j_common_ptr cinfo, int msg_level)
    {
        if (msg_level >= 0) {
            return;
        }
        if (cinfo->err->msg_code == JWRN_JPEG_EOF) {
            jpeg_error_exit(cinfo);
        }
        cinfo->err->num_warnings += 1;
    }


    static void install_error_manager(JpegErrorManager* jerr,
                                      jpeg_error_mgr** slot)
    {
        *slot                 = jpeg_std_error(&jerr->pub);
        jerr->pub.error_exit  = jpeg_error_exit;
        jerr->pub.emit_message = jpeg_emit_message;
        jerr->message[0]      = '\0';
    }


    static bool flush_destination(VectorDestination* dest, size_t count)
    {
        try {
            const std::byte* p = reinterpret_cast<const std::byte*>(
                dest->buffer);
            dest->out->insert(dest->out->end(), p, p + count);
        } catch (const std::bad_alloc&) {
            return false;
        }
        return true;
    }


    static void init_destination(j_compress_ptr cinfo)
    {
        VectorDestination* dest = reinterpret_cast<VectorDestination*>(
            cinfo->dest);
        dest->pub.next_output_byte = dest->buffer;
        dest->pub.free_in_buffer   = kDestinationBufferSize;
    }


    static boolean empty_output_buffer(j_compress_ptr cinfo)
    {
        VectorDestination* dest = reinterpret_cast<VectorDestination*>(
            cinfo->dest);
        if (!flush_destination(dest, kDestinationBufferSize)) {
            ERREXIT1(cinfo, JERR_OUT_OF_MEMORY, 0);
        }
        dest->pub.next_output_byte = dest->buffer;
        dest->pub.free_in_buffer   = kDestinationBufferSize;
        return TRUE;
    }


    static void term_destination(j_compress_ptr cinfo)
    {
        VectorDestination* dest = reinterpret_cast<VectorDestination*>(
            cinfo->dest);
        const size_t used = kDestinationBufferSize - dest->pub.free_in_buffer;
        if (used != 0 && !flush_destination(dest, used)) {
            ERREXIT1(cinfo, JERR_OUT_OF_MEMORY, 0);
        }
    }

}  // namespace

DecodeResult
decode_jpeg(std::span<const std::byte> bytes, const DecodeLimits& limits,
            PixelImage* out)
{
    DecodeResult res;
    res.format = ImageFormat::Jpeg;

    jpeg_decompress_struct cinfo {};
    JpegErrorManager jerr {};
    DecompressGuard guard;
    guard.cinfo = &cinfo;
    install_error_manager(&jerr, &cinfo.err);

    if (setjmp(jerr.jump)) {
        out->pixels.clear();
        res.status  = DecodeStatus::Malformed;
        res.message = jerr.message;
        return res;
    }

    jpeg_create_decompress(&cinfo);
    jpeg_mem_src(&cinfo, reinterpret_cast<const unsigned char*>(bytes.data()),
                 static_cast<unsigned long>(bytes.size()));
    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        res.status  = DecodeStatus::Malformed;
        res.message = "no image in JPEG stream";
        return res;
    }

    ColorModel color = ColorModel::Rgb;
    switch (cinfo.jpeg_color_space) {
    case JCS_GRAYSCALE:
        cinfo.out_color_space = JCS_GRAYSCALE;
        color                 = ColorModel::Gray;
        break;
    case JCS_CMYK:
    case JCS_YCCK:
        cinfo.out_color_space = JCS_CMYK;
        color                 = ColorModel::Cmyk;
        break;
    default:
        cinfo.out_color_space = JCS_RGB;
        color                 = ColorModel::Rgb;
        break;
    }

    const uint32_t channels = channel_count(color);
    if (!pixel_budget_ok(cinfo.image_width, cinfo.image_height, channels,
                         limits)) {
        res.status  = DecodeStatus::LimitExceeded;
        res.message = "image dimensions exceed the pixel limit";
        return res;
    }

    jpeg_start_decompress(&cinfo);
    if (static_cast<uint32_t>(cinfo.output_components) != channels) {
        res.status  = DecodeStatus::Malformed;
        res.message = "unexpected JPEG component count";
        return res;
    }

    const size_t row_bytes = static_cast<size_t>(cinfo.output_width)
                             * channels;
    out->pixels.resize(row_bytes * cinfo.output_height);
    while (cinfo.output_scanline < cinfo.output_height) {
        JSAMPROW row = reinterpret_cast<JSAMPROW>(
            out->pixels.data() + row_bytes * cinfo.output_scanline);
        if (jpeg_read_scanlines(&cinfo, &row, 1) != 1) {
            out->pixels.clear();
            res.status  = DecodeStatus::Malformed;
            res.message = "JPEG scanline read stalled";
            return res;
        }
    }
    (void)jpeg_finish_decompress(&cinfo);

    out->width  = cinfo.output_width;
    out->height = cinfo.output_height;
    out->color  = color;
    out->format = ImageFormat::Jpeg;
    return res;
}


EncodeResult
encode_jpeg(const PixelImage& image, const EncodeOptions& options,
            std::vector<std::byte>* out)
{
    EncodeResult res;

    J_COLOR_SPACE in_space = JCS_UNKNOWN;
    switch (image.color) {
    case ColorModel::Gray: in_space = JCS_GRAYSCALE; break;
    case ColorModel::Rgb: in_space = JCS_RGB; break;
    case ColorModel::Cmyk: in_space = JCS_CMYK; break;
    case ColorModel::GrayAlpha:
    case ColorModel::Rgba:
        res.status  = EncodeStatus::Unsupported;
        res.message = "JPEG cannot store an alpha channel";
        return res;
    }

    const int quality = (options.jpeg_quality < 1)     ? 1
                        : (options.jpeg_quality > 100) ? 100
                                                       : options.jpeg_quality;

    jpeg_compress_struct cinfo {};
    JpegErrorManager jerr {};
    VectorDestination dest {};
    CompressGuard guard;
    guard.cinfo = &cinfo;
    install_error_manager(&jerr, &cinfo.err);

    if (setjmp(jerr.jump)) {
        out->clear();
        res.status  = EncodeStatus::Failed;
        res.message = jerr.message;
        return res;
    }

    jpeg_create_compress(&cinfo);
    dest.out                     = out;
    dest.pub.init_destination    = init_destination;
    dest.pub.empty_output_buffer = empty_output_buffer;
    dest.pub.term_destination    = term_destination;
    cinfo.dest                   = &dest.pub;

    cinfo.image_width      = image.width;
    cinfo.image_height     = image.height;
    cinfo.input_components = static_cast<int>(channel_count(image.color));
    cinfo.in_color_space   = in_space;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    cinfo.optimize_coding = options.jpeg_optimize ? TRUE : FALSE;

    // Only the JFIF header is written (Adobe marker for CMYK); no APPn
    // metadata segments.
    jpeg_start_compress(&cinfo, TRUE);
    const size_t row_bytes = static_cast<size_t>(image.width)
                             * channel_count(image.color);
    while (cinfo.next_scanline < cinfo.image_height) {
        JSAMPROW row = const_cast<JSAMPROW>(reinterpret_cast<const JSAMPLE*>(
            image.pixels.data() + row_bytes * cinfo.next_scanline));
        (void)jpeg_write_scanlines(&cinfo, &row, 1);
    }
    jpeg_finish_compress(&cinfo);
    return res;
}

}  // namespace photoclean::codec_internal
