#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace photoclean {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Appends a byte count with a binary unit ("512 B", "1.5 KiB", "12.0 MiB").
void
append_byte_size(uint64_t bytes, std::string* out) noexcept;

}  // namespace photoclean
