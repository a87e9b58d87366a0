#include "photoclean/console_format.h"

#include <cstdio>

namespace photoclean {

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool escaped     = false;
    const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                           ? static_cast<uint32_t>(s.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        switch (c) {
        case '\n': out->append("\\n"); escaped = true; continue;
        case '\r': out->append("\\r"); escaped = true; continue;
        case '\t': out->append("\\t"); escaped = true; continue;
        case '\\':
            out->append("\\\\");
            continue;
        default: break;
        }
        // File names are arbitrary bytes; UTF-8 is escaped too so a name can
        // never carry terminal control sequences.
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_byte_size(uint64_t bytes, std::string* out) noexcept
{
    static constexpr const char* kUnits[] = { "KiB", "MiB", "GiB", "TiB" };

    char buf[48];
    if (bytes < 1024U) {
        std::snprintf(buf, sizeof(buf), "%llu B",
                      static_cast<unsigned long long>(bytes));
        out->append(buf);
        return;
    }
    double v      = static_cast<double>(bytes) / 1024.0;
    size_t unit   = 0;
    while (v >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
        v /= 1024.0;
        unit += 1;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %s", v, kUnits[unit]);
    out->append(buf);
}

}  // namespace photoclean
