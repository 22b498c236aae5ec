#include "livephoto/console_format.h"

#include <cstdio>

namespace livephoto {

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool dangerous   = false;
    const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                           ? static_cast<uint32_t>(s.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned char c = static_cast<unsigned char>(s[i]);
        if (c == '\\' || c == '"') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            continue;
        }
        if (c == '\n') {
            out->append("\\n");
            dangerous = true;
            continue;
        }
        if (c == '\r') {
            out->append("\\r");
            dangerous = true;
            continue;
        }
        if (c == '\t') {
            out->append("\\t");
            dangerous = true;
            continue;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            dangerous = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < s.size()) {
        out->append("...");
        dangerous = true;
    }
    return dangerous;
}


std::string
console_escaped(std::string_view s, uint32_t max_bytes)
{
    std::string out;
    (void)append_console_escaped_ascii(s, max_bytes, &out);
    return out;
}


void
append_byte_size(uint64_t bytes, std::string* out) noexcept
{
    static constexpr const char* kUnits[] = { "KiB", "MiB", "GiB" };

    char buf[48];
    if (bytes < 1024U) {
        std::snprintf(buf, sizeof(buf), "%llu B",
                      static_cast<unsigned long long>(bytes));
        out->append(buf);
        return;
    }
    double v      = static_cast<double>(bytes) / 1024.0;
    uint32_t unit = 0;
    while (v >= 1024.0 && unit + 1U < 3U) {
        v /= 1024.0;
        unit += 1;
    }
    std::snprintf(buf, sizeof(buf), "%.1f %s", v, kUnits[unit]);
    out->append(buf);
}

}  // namespace livephoto
