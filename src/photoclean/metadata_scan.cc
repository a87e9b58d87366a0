#include "photoclean/metadata_scan.h"

#include <cstring>

#include <zlib.h>

namespace photoclean {
namespace {

    static constexpr uint32_t kPngSignatureSize = 8;

    struct BlockSink final {
        MetadataBlock* out = nullptr;
        uint32_t cap       = 0;
        ScanResult result;
    };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool match(std::span<const std::byte> bytes, uint64_t offset,
                      const char* s, uint32_t s_len) noexcept
    {
        const uint64_t size = static_cast<uint64_t>(bytes.size());
        if (offset + s_len > size) {
            return false;
        }
        return std::memcmp(bytes.data() + static_cast<size_t>(offset), s,
                           static_cast<size_t>(s_len))
               == 0;
    }


    static void sink_init(BlockSink* sink,
                          std::span<MetadataBlock> out) noexcept
    {
        sink->out = out.data();
        sink->cap = static_cast<uint32_t>(out.size());
    }


    static void sink_emit(BlockSink* sink, ImageFormat format,
                          MetadataKind kind, uint64_t offset, uint64_t size,
                          uint32_t id) noexcept
    {
        sink->result.needed += 1;
        if (sink->result.written < sink->cap) {
            MetadataBlock& block = sink->out[sink->result.written];
            block.format         = format;
            block.kind           = kind;
            block.offset         = offset;
            block.size           = size;
            block.id             = id;
            sink->result.written += 1;
        } else if (sink->result.status == ScanStatus::Ok) {
            sink->result.status = ScanStatus::OutputTruncated;
        }
    }


    static ScanResult sink_fail(BlockSink* sink, ScanStatus status) noexcept
    {
        sink->result.status = status;
        return sink->result;
    }


    static bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        if (offset + 2 > bytes.size()) {
            return false;
        }
        *out = static_cast<uint16_t>(u8(bytes[offset + 0]) << 8)
               | static_cast<uint16_t>(u8(bytes[offset + 1]) << 0);
        return true;
    }


    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 24)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 0);
        return true;
    }


    static bool read_u32le(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        if (offset + 4 > bytes.size()) {
            return false;
        }
        *out = (static_cast<uint32_t>(u8(bytes[offset + 0])) << 0)
               | (static_cast<uint32_t>(u8(bytes[offset + 1])) << 8)
               | (static_cast<uint32_t>(u8(bytes[offset + 2])) << 16)
               | (static_cast<uint32_t>(u8(bytes[offset + 3])) << 24);
        return true;
    }


    // Skips a chain of GIF data sub-blocks starting at `offset`. Returns the
    // offset after the zero-length terminator, or 0 when the chain runs off
    // the buffer.
    static uint64_t skip_gif_sub_blocks(std::span<const std::byte> bytes,
                                        uint64_t offset) noexcept
    {
        uint64_t p = offset;
        while (p < bytes.size()) {
            const uint8_t sub = u8(bytes[p]);
            p += 1;
            if (sub == 0) {
                return p;
            }
            if (p + sub > bytes.size()) {
                return 0;
            }
            p += sub;
        }
        return 0;
    }


    static bool png_chunk_crc_ok(std::span<const std::byte> bytes,
                                 uint64_t chunk_off, uint32_t len) noexcept
    {
        uint32_t stored = 0;
        if (!read_u32be(bytes, chunk_off + 8 + len, &stored)) {
            return false;
        }
        // The CRC covers the chunk type and data, not the length field.
        uLong crc = crc32(0L, Z_NULL, 0);
        crc       = crc32(crc,
                          reinterpret_cast<const Bytef*>(bytes.data()
                                                         + chunk_off + 4),
                          static_cast<uInt>(4 + len));
        return static_cast<uint32_t>(crc) == stored;
    }

}  // namespace

const char*
metadata_kind_name(MetadataKind kind) noexcept
{
    switch (kind) {
    case MetadataKind::Unknown: return "unknown";
    case MetadataKind::Exif: return "exif";
    case MetadataKind::Xmp: return "xmp";
    case MetadataKind::XmpExtended: return "xmp_extended";
    case MetadataKind::Icc: return "icc";
    case MetadataKind::PhotoshopIrb: return "photoshop_irb";
    case MetadataKind::Mpf: return "mpf";
    case MetadataKind::Comment: return "comment";
    case MetadataKind::Text: return "text";
    }
    return "unknown";
}


const char*
scan_status_name(ScanStatus status) noexcept
{
    switch (status) {
    case ScanStatus::Ok: return "ok";
    case ScanStatus::OutputTruncated: return "output_truncated";
    case ScanStatus::Unsupported: return "unsupported";
    case ScanStatus::Malformed: return "malformed";
    }
    return "unknown";
}


ScanResult
scan_jpeg_metadata(std::span<const std::byte> bytes,
                   std::span<MetadataBlock> out) noexcept
{
    BlockSink sink;
    sink_init(&sink, out);

    if (bytes.size() < 2) {
        return sink_fail(&sink, ScanStatus::Malformed);
    }
    if (u8(bytes[0]) != 0xFF || u8(bytes[1]) != 0xD8) {
        return sink_fail(&sink, ScanStatus::Unsupported);
    }

    uint64_t offset = 2;
    while (offset + 2 <= bytes.size()) {
        if (u8(bytes[offset]) != 0xFF) {
            return sink_fail(&sink, ScanStatus::Malformed);
        }
        // Fill bytes: any number of 0xFF may precede the marker code.
        while (offset < bytes.size() && u8(bytes[offset]) == 0xFF) {
            offset += 1;
        }
        if (offset >= bytes.size()) {
            break;
        }
        const uint64_t marker_off = offset - 1;
        const uint16_t marker     = static_cast<uint16_t>(
            0xFF00U | static_cast<uint16_t>(u8(bytes[offset])));
        offset += 1;

        if (marker == 0xFFD9 || marker == 0xFFDA) {
            break;
        }
        if ((marker >= 0xFFD0 && marker <= 0xFFD7) || marker == 0xFF01) {
            continue;
        }

        uint16_t seg_len = 0;
        if (!read_u16be(bytes, offset, &seg_len) || seg_len < 2) {
            return sink_fail(&sink, ScanStatus::Malformed);
        }
        const uint64_t payload_off  = offset + 2;
        const uint64_t payload_size = static_cast<uint64_t>(seg_len - 2);
        const uint64_t seg_size     = 2 + static_cast<uint64_t>(seg_len);
        if (payload_off + payload_size > bytes.size()) {
            return sink_fail(&sink, ScanStatus::Malformed);
        }

        MetadataKind kind = MetadataKind::Unknown;
        if (marker == 0xFFE1) {
            if (match(bytes, payload_off, "Exif\0", 5)) {
                kind = MetadataKind::Exif;
            } else if (match(bytes, payload_off,
                             "http://ns.adobe.com/xap/1.0/\0", 29)) {
                kind = MetadataKind::Xmp;
            } else if (match(bytes, payload_off,
                             "http://ns.adobe.com/xmp/extension/\0", 35)) {
                kind = MetadataKind::XmpExtended;
            }
        } else if (marker == 0xFFE2) {
            if (match(bytes, payload_off, "ICC_PROFILE\0", 12)) {
                kind = MetadataKind::Icc;
            } else if (match(bytes, payload_off, "MPF\0", 4)) {
                kind = MetadataKind::Mpf;
            }
        } else if (marker == 0xFFED) {
            if (match(bytes, payload_off, "Photoshop 3.0\0", 14)) {
                kind = MetadataKind::PhotoshopIrb;
            }
        } else if (marker == 0xFFFE) {
            kind = MetadataKind::Comment;
        }

        if (kind != MetadataKind::Unknown) {
            sink_emit(&sink, ImageFormat::Jpeg, kind, marker_off, seg_size,
                      marker);
        }
        offset = payload_off + payload_size;
    }

    return sink.result;
}


ScanResult
scan_png_metadata(std::span<const std::byte> bytes,
                  std::span<MetadataBlock> out) noexcept
{
    BlockSink sink;
    sink_init(&sink, out);

    if (bytes.size() < kPngSignatureSize) {
        return sink_fail(&sink, ScanStatus::Malformed);
    }
    if (detect_image_format(bytes) != ImageFormat::Png) {
        return sink_fail(&sink, ScanStatus::Unsupported);
    }

    uint64_t offset = kPngSignatureSize;
    while (offset + 12 <= bytes.size()) {
        const uint64_t chunk_off = offset;
        uint32_t len             = 0;
        uint32_t type            = 0;
        if (!read_u32be(bytes, offset, &len)
            || !read_u32be(bytes, offset + 4, &type)) {
            return sink_fail(&sink, ScanStatus::Malformed);
        }
        const uint64_t data_off   = offset + 8;
        const uint64_t chunk_size = 12 + static_cast<uint64_t>(len);
        if (data_off + len + 4 > bytes.size()) {
            return sink_fail(&sink, ScanStatus::Malformed);
        }
        if (!png_chunk_crc_ok(bytes, chunk_off, len)) {
            sink.result.crc_mismatches += 1;
        }

        MetadataKind kind = MetadataKind::Unknown;
        if (type == fourcc('e', 'X', 'I', 'f')) {
            kind = MetadataKind::Exif;
        } else if (type == fourcc('i', 'C', 'C', 'P')) {
            kind = MetadataKind::Icc;
        } else if (type == fourcc('i', 'T', 'X', 't')) {
            const uint32_t kXmpKeywordLen = 17;
            const bool is_xmp
                = len > kXmpKeywordLen
                  && match(bytes, data_off, "XML:com.adobe.xmp", kXmpKeywordLen)
                  && u8(bytes[data_off + kXmpKeywordLen]) == 0;
            kind = is_xmp ? MetadataKind::Xmp : MetadataKind::Text;
        } else if (type == fourcc('t', 'E', 'X', 't')
                   || type == fourcc('z', 'T', 'X', 't')) {
            kind = MetadataKind::Text;
        }

        if (kind != MetadataKind::Unknown) {
            sink_emit(&sink, ImageFormat::Png, kind, chunk_off, chunk_size,
                      type);
        }

        offset += chunk_size;
        if (type == fourcc('I', 'E', 'N', 'D')) {
            break;
        }
    }

    return sink.result;
}


ScanResult
scan_webp_metadata(std::span<const std::byte> bytes,
                   std::span<MetadataBlock> out) noexcept
{
    BlockSink sink;
    sink_init(&sink, out);

    if (bytes.size() < 12) {
        return sink_fail(&sink, ScanStatus::Malformed);
    }
    if (!match(bytes, 0, "RIFF", 4) || !match(bytes, 8, "WEBP", 4)) {
        return sink_fail(&sink, ScanStatus::Unsupported);
    }

    uint32_t riff_size = 0;
    if (!read_u32le(bytes, 4, &riff_size)) {
        return sink_fail(&sink, ScanStatus::Malformed);
    }
    const uint64_t file_end = (riff_size + 8ULL < bytes.size())
                                  ? (riff_size + 8ULL)
                                  : static_cast<uint64_t>(bytes.size());

    uint64_t offset = 12;
    while (offset + 8 <= file_end) {
        const uint64_t chunk_off = offset;
        uint32_t type            = 0;
        uint32_t size_le         = 0;
        if (!read_u32be(bytes, offset, &type)
            || !read_u32le(bytes, offset + 4, &size_le)) {
            return sink_fail(&sink, ScanStatus::Malformed);
        }
        uint64_t next = offset + 8 + static_cast<uint64_t>(size_le);
        if (next > file_end) {
            return sink_fail(&sink, ScanStatus::Malformed);
        }
        // RIFF chunks are padded to even sizes.
        if ((size_le & 1U) != 0U) {
            next += 1;
        }

        MetadataKind kind = MetadataKind::Unknown;
        if (type == fourcc('E', 'X', 'I', 'F')) {
            kind = MetadataKind::Exif;
        } else if (type == fourcc('X', 'M', 'P', ' ')) {
            kind = MetadataKind::Xmp;
        } else if (type == fourcc('I', 'C', 'C', 'P')) {
            kind = MetadataKind::Icc;
        }
        if (kind != MetadataKind::Unknown) {
            const uint64_t end = (next < file_end) ? next : file_end;
            sink_emit(&sink, ImageFormat::Webp, kind, chunk_off,
                      end - chunk_off, type);
        }
        offset = next;
    }

    return sink.result;
}


ScanResult
scan_gif_metadata(std::span<const std::byte> bytes,
                  std::span<MetadataBlock> out) noexcept
{
    BlockSink sink;
    sink_init(&sink, out);

    if (bytes.size() < 13) {
        return sink_fail(&sink, ScanStatus::Malformed);
    }
    if (!match(bytes, 0, "GIF87a", 6) && !match(bytes, 0, "GIF89a", 6)) {
        return sink_fail(&sink, ScanStatus::Unsupported);
    }

    // Header (6) + Logical Screen Descriptor (7).
    const uint8_t packed = u8(bytes[10]);
    uint64_t offset      = 13;
    if ((packed & 0x80U) != 0U) {
        const uint64_t gct_bytes = 3ULL << ((packed & 0x07U) + 1U);
        if (offset + gct_bytes > bytes.size()) {
            return sink_fail(&sink, ScanStatus::Malformed);
        }
        offset += gct_bytes;
    }

    while (offset < bytes.size()) {
        const uint8_t introducer = u8(bytes[offset]);
        if (introducer == 0x3B) {  // trailer
            break;
        }
        if (introducer == 0x21) {  // extension
            if (offset + 2 > bytes.size()) {
                return sink_fail(&sink, ScanStatus::Malformed);
            }
            const uint8_t label = u8(bytes[offset + 1]);
            const uint32_t id = (0x21U << 8) | label;

            MetadataKind kind = MetadataKind::Unknown;
            uint64_t data_off = offset + 2;
            if (label == 0xFF && offset + 3 <= bytes.size()) {
                const uint8_t app_block_size = u8(bytes[offset + 2]);
                if (app_block_size == 11) {
                    const uint64_t app_id_off = offset + 3;
                    if (match(bytes, app_id_off, "XMP DataXMP", 11)) {
                        kind = MetadataKind::Xmp;
                    } else if (match(bytes, app_id_off, "ICCRGBG1012", 11)) {
                        kind = MetadataKind::Icc;
                    }
                }
                data_off = offset + 3 + app_block_size;
            } else if (label == 0xFE) {
                kind = MetadataKind::Comment;
            }

            const uint64_t ext_end = skip_gif_sub_blocks(bytes, data_off);
            if (ext_end == 0) {
                return sink_fail(&sink, ScanStatus::Malformed);
            }
            if (kind != MetadataKind::Unknown) {
                sink_emit(&sink, ImageFormat::Gif, kind, offset,
                          ext_end - offset, id);
            }
            offset = ext_end;
            continue;
        }

        if (introducer == 0x2C) {  // image descriptor
            if (offset + 10 > bytes.size()) {
                return sink_fail(&sink, ScanStatus::Malformed);
            }
            const uint8_t img_packed = u8(bytes[offset + 9]);
            offset += 10;
            if ((img_packed & 0x80U) != 0U) {
                const uint64_t lct_bytes = 3ULL << ((img_packed & 0x07U) + 1U);
                if (offset + lct_bytes > bytes.size()) {
                    return sink_fail(&sink, ScanStatus::Malformed);
                }
                offset += lct_bytes;
            }
            // LZW minimum code size, then image data sub-blocks.
            const uint64_t data_end = skip_gif_sub_blocks(bytes, offset + 1);
            if (data_end == 0) {
                return sink_fail(&sink, ScanStatus::Malformed);
            }
            offset = data_end;
            continue;
        }

        return sink_fail(&sink, ScanStatus::Malformed);
    }

    return sink.result;
}


ScanResult
scan_metadata(std::span<const std::byte> bytes,
              std::span<MetadataBlock> out) noexcept
{
    if (bytes.size() >= 2 && u8(bytes[0]) == 0xFF && u8(bytes[1]) == 0xD8) {
        return scan_jpeg_metadata(bytes, out);
    }
    switch (detect_image_format(bytes)) {
    case ImageFormat::Png: return scan_png_metadata(bytes, out);
    case ImageFormat::Webp: return scan_webp_metadata(bytes, out);
    case ImageFormat::Gif: return scan_gif_metadata(bytes, out);
    case ImageFormat::Jpeg: return scan_jpeg_metadata(bytes, out);
    case ImageFormat::Tiff:
    case ImageFormat::Unknown: break;
    }
    ScanResult res;
    res.status = ScanStatus::Unsupported;
    return res;
}

}  // namespace photoclean
