#include "photoclean/image_format.h"

#include <cstring>

namespace photoclean {
namespace {

    static constexpr uint32_t kPngSignatureSize = 8;
    static constexpr unsigned char kPngSignature[kPngSignatureSize] = {
        0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A,
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


    static char ascii_lower(char c) noexcept
    {
        if (c >= 'A' && c <= 'Z') {
            return static_cast<char>(c - 'A' + 'a');
        }
        return c;
    }


    static bool equals_ascii_nocase(std::string_view a,
                                    std::string_view b) noexcept
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            if (ascii_lower(a[i]) != ascii_lower(b[i])) {
                return false;
            }
        }
        return true;
    }

    struct ExtensionEntry final {
        std::string_view extension;
        ImageFormat format;
    };

    static constexpr ExtensionEntry kExtensions[] = {
        { "jpg", ImageFormat::Jpeg },  { "jpeg", ImageFormat::Jpeg },
        { "png", ImageFormat::Png },   { "gif", ImageFormat::Gif },
        { "tif", ImageFormat::Tiff },  { "tiff", ImageFormat::Tiff },
        { "webp", ImageFormat::Webp },
    };

}  // namespace

const char*
image_format_name(ImageFormat format) noexcept
{
    switch (format) {
    case ImageFormat::Unknown: return "unknown";
    case ImageFormat::Jpeg: return "jpeg";
    case ImageFormat::Png: return "png";
    case ImageFormat::Gif: return "gif";
    case ImageFormat::Webp: return "webp";
    case ImageFormat::Tiff: return "tiff";
    }
    return "unknown";
}


ImageFormat
format_from_extension(std::string_view extension) noexcept
{
    if (!extension.empty() && extension.front() == '.') {
        extension.remove_prefix(1);
    }
    for (const ExtensionEntry& e : kExtensions) {
        if (equals_ascii_nocase(extension, e.extension)) {
            return e.format;
        }
    }
    return ImageFormat::Unknown;
}


std::string_view
path_extension(std::string_view path) noexcept
{
    const size_t sep = path.find_last_of("/\\");
    const std::string_view name = (sep == std::string_view::npos)
                                      ? path
                                      : path.substr(sep + 1);
    const size_t dot = name.find_last_of('.');
    if (dot == std::string_view::npos || dot == 0
        || dot + 1 == name.size()) {
        return {};
    }
    return name.substr(dot);
}


bool
is_candidate_path(std::string_view path) noexcept
{
    return format_from_extension(path_extension(path)) != ImageFormat::Unknown;
}


ImageFormat
fallback_output_format(std::string_view extension) noexcept
{
    const ImageFormat format = format_from_extension(extension);
    if (format == ImageFormat::Unknown) {
        return ImageFormat::Png;
    }
    return format;
}


ImageFormat
detect_image_format(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() >= 3 && u8(bytes[0]) == 0xFF && u8(bytes[1]) == 0xD8
        && u8(bytes[2]) == 0xFF) {
        return ImageFormat::Jpeg;
    }
    if (match(bytes, 0, kPngSignature, kPngSignatureSize)) {
        return ImageFormat::Png;
    }
    if (match(bytes, 0, "GIF87a", 6) || match(bytes, 0, "GIF89a", 6)) {
        return ImageFormat::Gif;
    }
    if (match(bytes, 0, "RIFF", 4) && match(bytes, 8, "WEBP", 4)) {
        return ImageFormat::Webp;
    }
    if (bytes.size() >= 4) {
        const uint8_t b0 = u8(bytes[0]);
        const uint8_t b1 = u8(bytes[1]);
        // Classic TIFF (42) and BigTIFF (43).
        if (b0 == 0x49 && b1 == 0x49 && u8(bytes[3]) == 0x00
            && (u8(bytes[2]) == 42 || u8(bytes[2]) == 43)) {
            return ImageFormat::Tiff;
        }
        if (b0 == 0x4D && b1 == 0x4D && u8(bytes[2]) == 0x00
            && (u8(bytes[3]) == 42 || u8(bytes[3]) == 43)) {
            return ImageFormat::Tiff;
        }
    }
    return ImageFormat::Unknown;
}

}  // namespace photoclean
