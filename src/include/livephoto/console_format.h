#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace livephoto {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`
// - Escapes `\\` and `"` with a backslash
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Returns `s` escaped as by append_console_escaped_ascii.
std::string
console_escaped(std::string_view s, uint32_t max_bytes = 0);

// Appends a byte count as "<n> B", "<x.y> KiB", "<x.y> MiB" or "<x.y> GiB".
void
append_byte_size(uint64_t bytes, std::string* out) noexcept;

}  // namespace livephoto
