#include "photoclean/build_info.h"

#include "photoclean/build_info_generated.h"

#include <cstdio>
#include <string>

#include <jpeglib.h>
#include <png.h>

namespace photoclean {
namespace {

    static constexpr bool has_zlib() noexcept
    {
#if defined(PHOTOCLEAN_HAS_ZLIB) && PHOTOCLEAN_HAS_ZLIB
        return true;
#else
        return false;
#endif
    }

    static constexpr bool has_webp() noexcept
    {
#if defined(PHOTOCLEAN_HAS_WEBP) && PHOTOCLEAN_HAS_WEBP
        return true;
#else
        return false;
#endif
    }

    static constexpr bool has_tiff() noexcept
    {
#if defined(PHOTOCLEAN_HAS_TIFF) && PHOTOCLEAN_HAS_TIFF
        return true;
#else
        return false;
#endif
    }

    static constexpr bool has_gif() noexcept
    {
#if defined(PHOTOCLEAN_HAS_GIF) && PHOTOCLEAN_HAS_GIF
        return true;
#else
        return false;
#endif
    }

    static constexpr BuildInfo kBuildInfo = {
        /*version=*/PHOTOCLEAN_BUILDINFO_VERSION,
        /*build_timestamp_utc=*/PHOTOCLEAN_BUILDINFO_BUILD_TIMESTAMP_UTC,
        /*build_type=*/PHOTOCLEAN_BUILDINFO_BUILD_TYPE,
        /*system_name=*/PHOTOCLEAN_BUILDINFO_SYSTEM_NAME,
        /*system_processor=*/PHOTOCLEAN_BUILDINFO_SYSTEM_PROCESSOR,
        /*cxx_compiler_id=*/PHOTOCLEAN_BUILDINFO_CXX_COMPILER_ID,
        /*cxx_compiler_version=*/PHOTOCLEAN_BUILDINFO_CXX_COMPILER_VERSION,
        /*jpeg_lib_version=*/JPEG_LIB_VERSION,
        /*png_version=*/PNG_LIBPNG_VER_STRING,
        /*option_with_webp=*/static_cast<bool>(PHOTOCLEAN_BUILDINFO_WITH_WEBP),
        /*option_with_tiff=*/static_cast<bool>(PHOTOCLEAN_BUILDINFO_WITH_TIFF),
        /*option_with_gif=*/static_cast<bool>(PHOTOCLEAN_BUILDINFO_WITH_GIF),
        /*has_zlib=*/has_zlib(),
        /*has_webp=*/has_webp(),
        /*has_tiff=*/has_tiff(),
        /*has_gif=*/has_gif(),
    };

    static void append_sv(std::string* out, std::string_view s) noexcept
    {
        if (!out) {
            return;
        }
        out->append(s.data(), s.size());
    }

}  // namespace

const BuildInfo&
build_info() noexcept
{
    return kBuildInfo;
}


void
format_build_info_lines(const BuildInfo& bi, std::string* line1,
                        std::string* line2) noexcept
{
    if (line1) {
        line1->clear();
        line1->reserve(128);
        line1->append("PhotoClean v");
        append_sv(line1, bi.version);
        line1->append(" ");
        append_sv(line1, bi.build_type);

        char jpeg[32];
        std::snprintf(jpeg, sizeof(jpeg), "jpeg%d", bi.jpeg_lib_version);
        line1->append(" [");
        line1->append(jpeg);
        line1->append(",png");
        if (!bi.png_version.empty()) {
            line1->append("-");
            append_sv(line1, bi.png_version);
        }
        if (bi.has_zlib) {
            line1->append(",zlib");
        }
        if (bi.has_gif) {
            line1->append(",gif");
        }
        if (bi.has_tiff) {
            line1->append(",tiff");
        }
        if (bi.has_webp) {
            line1->append(",webp");
        }
        line1->append("]");
    }

    if (line2) {
        line2->clear();
        line2->reserve(160);
        line2->append("built with ");
        append_sv(line2, bi.cxx_compiler_id);
        line2->append("-");
        append_sv(line2, bi.cxx_compiler_version);
        line2->append(" for ");
        append_sv(line2, bi.system_name);
        line2->append("/");
        append_sv(line2, bi.system_processor);

        if (!bi.build_timestamp_utc.empty()) {
            line2->append(" (");
            append_sv(line2, bi.build_timestamp_utc);
            line2->append(")");
        }
    }
}


void
format_build_info_lines(std::string* line1, std::string* line2) noexcept
{
    format_build_info_lines(build_info(), line1, line2);
}


void
format_supported_formats(const BuildInfo& bi, std::string* out)
{
    if (!out) {
        return;
    }
    out->clear();
    out->append("JPEG, PNG");
    if (bi.has_gif) {
        out->append(", GIF");
    }
    if (bi.has_tiff) {
        out->append(", TIFF");
    }
    if (bi.has_webp) {
        out->append(", WebP");
    }
}

}  // namespace photoclean
