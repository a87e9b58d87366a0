#include "photoclean/format_trim.h"

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace photoclean {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}


static void
verify_trim(std::span<const std::byte> bytes, ImageFormat format) noexcept
{
    const TrimResult first = trim_trailing_data(bytes, format);
    if (first.bytes.data() != bytes.data()
        || first.bytes.size() > bytes.size()) {
        fuzz_trap();
    }
    if (first.removed != bytes.size() - first.bytes.size()) {
        fuzz_trap();
    }
    if (first.status != TrimStatus::Trimmed && first.removed != 0U) {
        fuzz_trap();
    }

    // Trimming is a fixed point.
    const TrimResult second = trim_trailing_data(first.bytes, format);
    if (second.bytes.size() != first.bytes.size()) {
        fuzz_trap();
    }
}

}  // namespace photoclean

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace photoclean;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    verify_trim(bytes, ImageFormat::Jpeg);
    verify_trim(bytes, ImageFormat::Png);
    verify_trim(bytes, ImageFormat::Gif);
    verify_trim(bytes, ImageFormat::Webp);
    verify_trim(bytes, ImageFormat::Tiff);
    return 0;
}
