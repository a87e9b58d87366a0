#include "photoclean/format_trim.h"

#include <cstring>

namespace photoclean {
namespace {

    static constexpr uint32_t kPngSignatureSize = 8;
    static constexpr unsigned char kPngSignature[kPngSignatureSize] = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
    };

    // Locator outcome: either an end offset (exclusive) or nothing.
    struct DataEnd final {
        bool found   = false;
        uint64_t end = 0;
    };

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static bool match(std::span<const std::byte> bytes, uint64_t offset,
                      const void* s, uint32_t s_len) noexcept
    {
        const uint64_t size = static_cast<uint64_t>(bytes.size());
        if (offset + s_len > size) {
            return false;
        }
        return std::memcmp(bytes.data() + static_cast<size_t>(offset), s,
                           static_cast<size_t>(s_len))
               == 0;
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


    static DataEnd locate_jpeg_end(std::span<const std::byte> bytes) noexcept
    {
        DataEnd res;
        if (bytes.size() < 2) {
            return res;
        }
        for (size_t i = bytes.size() - 1; i >= 1; --i) {
            if (u8(bytes[i]) == 0xD9 && u8(bytes[i - 1]) == 0xFF) {
                res.found = true;
                res.end   = static_cast<uint64_t>(i) + 1;
                return res;
            }
        }
        return res;
    }


    static DataEnd locate_png_end(std::span<const std::byte> bytes) noexcept
    {
        DataEnd res;
        if (!match(bytes, 0, kPngSignature, kPngSignatureSize)) {
            return res;
        }

        const uint64_t size = static_cast<uint64_t>(bytes.size());
        uint64_t offset     = kPngSignatureSize;
        while (offset + 8 <= size) {
            uint32_t len  = 0;
            uint32_t type = 0;
            if (!read_u32be(bytes, offset, &len)
                || !read_u32be(bytes, offset + 4, &type)) {
                return res;
            }
            // length + type + data + crc
            const uint64_t next = offset + 8 + static_cast<uint64_t>(len) + 4;
            if (match(bytes, offset + 4, "IEND", 4)) {
                res.found = true;
                res.end   = next;
                return res;
            }
            offset = next;
        }
        return res;
    }


    static DataEnd locate_gif_end(std::span<const std::byte> bytes) noexcept
    {
        DataEnd res;
        for (size_t i = bytes.size(); i > 0; --i) {
            if (u8(bytes[i - 1]) == 0x3B) {
                res.found = true;
                res.end   = static_cast<uint64_t>(i);
                return res;
            }
        }
        return res;
    }


    static DataEnd locate_webp_end(std::span<const std::byte> bytes) noexcept
    {
        DataEnd res;
        if (!match(bytes, 0, "RIFF", 4)) {
            return res;
        }
        uint32_t riff_size = 0;
        if (!read_u32le(bytes, 4, &riff_size)) {
            return res;
        }
        res.found = true;
        res.end   = static_cast<uint64_t>(riff_size) + 8;
        return res;
    }


    // The single place where locator output becomes a TrimResult. Any path
    // that does not yield an end inside (0, size] returns the input as is.
    static TrimResult apply_data_end(std::span<const std::byte> bytes,
                                     const DataEnd& end) noexcept
    {
        TrimResult res;
        res.bytes = bytes;
        const uint64_t size = static_cast<uint64_t>(bytes.size());
        if (!end.found || end.end == 0) {
            res.status = TrimStatus::NoTerminator;
            return res;
        }
        if (end.end >= size) {
            res.status = (end.end == size) ? TrimStatus::Unchanged
                                           : TrimStatus::NoTerminator;
            return res;
        }
        res.bytes   = bytes.first(static_cast<size_t>(end.end));
        res.status  = TrimStatus::Trimmed;
        res.removed = size - end.end;
        return res;
    }

}  // namespace

const char*
trim_status_name(TrimStatus status) noexcept
{
    switch (status) {
    case TrimStatus::Trimmed: return "trimmed";
    case TrimStatus::Unchanged: return "unchanged";
    case TrimStatus::NoTerminator: return "no_terminator";
    case TrimStatus::NotApplicable: return "not_applicable";
    }
    return "unknown";
}


TrimResult
trim_jpeg(std::span<const std::byte> bytes) noexcept
{
    return apply_data_end(bytes, locate_jpeg_end(bytes));
}


TrimResult
trim_png(std::span<const std::byte> bytes) noexcept
{
    return apply_data_end(bytes, locate_png_end(bytes));
}


TrimResult
trim_gif(std::span<const std::byte> bytes) noexcept
{
    return apply_data_end(bytes, locate_gif_end(bytes));
}


TrimResult
trim_webp(std::span<const std::byte> bytes) noexcept
{
    const DataEnd end = locate_webp_end(bytes);
    TrimResult res    = apply_data_end(bytes, end);
    // A declared size larger than the buffer is a short file, not a missing
    // terminator: the header was found, there is just nothing to drop.
    if (end.found && res.status == TrimStatus::NoTerminator
        && end.end > bytes.size()) {
        res.status = TrimStatus::Unchanged;
    }
    return res;
}


TrimResult
trim_trailing_data(std::span<const std::byte> bytes,
                   ImageFormat format) noexcept
{
    switch (format) {
    case ImageFormat::Jpeg: return trim_jpeg(bytes);
    case ImageFormat::Png: return trim_png(bytes);
    case ImageFormat::Gif: return trim_gif(bytes);
    case ImageFormat::Webp: return trim_webp(bytes);
    case ImageFormat::Tiff:
    case ImageFormat::Unknown: break;
    }
    TrimResult res;
    res.bytes  = bytes;
    res.status = TrimStatus::NotApplicable;
    return res;
}


TrimResult
trim_trailing_data(std::span<const std::byte> bytes,
                   std::string_view extension) noexcept
{
    return trim_trailing_data(bytes, format_from_extension(extension));
}

}  // namespace photoclean
