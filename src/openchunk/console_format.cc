#include "openchunk/console_format.h"

#include <cstdio>

namespace openchunk {
namespace {

    static constexpr uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }


    static void append_replacement(std::string* out)
    {
        out->append("\xEF\xBF\xBD");
    }


    static uint32_t clamp_count(size_t size, uint32_t max_bytes) noexcept
    {
        if (max_bytes == 0U || size < max_bytes) {
            return static_cast<uint32_t>(size);
        }
        return max_bytes;
    }

}  // namespace

bool
append_utf8_lossy(std::span<const std::byte> bytes, std::string* out)
{
    bool replaced  = false;
    const size_t n = bytes.size();
    out->reserve(out->size() + n);

    size_t i = 0;
    while (i < n) {
        const uint8_t lead = u8(bytes[i]);
        if (lead < 0x80U) {
            out->push_back(static_cast<char>(lead));
            i += 1;
            continue;
        }

        // Continuation count and the allowed range of the second byte.
        uint32_t tail = 0;
        uint8_t lo    = 0x80U;
        uint8_t hi    = 0xBFU;
        if (lead >= 0xC2U && lead <= 0xDFU) {
            tail = 1;
        } else if (lead == 0xE0U) {
            tail = 2;
            lo   = 0xA0U;
        } else if (lead == 0xEDU) {
            tail = 2;
            hi   = 0x9FU;
        } else if (lead >= 0xE1U && lead <= 0xEFU) {
            tail = 2;
        } else if (lead == 0xF0U) {
            tail = 3;
            lo   = 0x90U;
        } else if (lead == 0xF4U) {
            tail = 3;
            hi   = 0x8FU;
        } else if (lead >= 0xF1U && lead <= 0xF3U) {
            tail = 3;
        } else {
            append_replacement(out);
            replaced = true;
            i += 1;
            continue;
        }

        size_t j = i + 1;
        bool ok  = true;
        for (uint32_t k = 0; k < tail; ++k, ++j) {
            const uint8_t lower = (k == 0) ? lo : 0x80U;
            const uint8_t upper = (k == 0) ? hi : 0xBFU;
            if (j >= n || u8(bytes[j]) < lower || u8(bytes[j]) > upper) {
                ok = false;
                break;
            }
        }

        if (!ok) {
            // The maximal valid prefix [i, j) collapses into one U+FFFD; the
            // offending byte is examined again as a potential lead.
            append_replacement(out);
            replaced = true;
            i        = j;
            continue;
        }

        out->append(reinterpret_cast<const char*>(bytes.data() + i), j - i);
        i = j;
    }
    return replaced;
}


bool
append_console_escaped(std::span<const std::byte> bytes, uint32_t max_bytes,
                       std::string* out)
{
    bool escaped     = false;
    const uint32_t n = clamp_count(bytes.size(), max_bytes);

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        const uint8_t c = u8(bytes[i]);
        switch (c) {
        case '\\': out->append("\\\\"); continue;
        case '"': out->append("\\\""); continue;
        case '\n': out->append("\\n"); escaped = true; continue;
        case '\r': out->append("\\r"); escaped = true; continue;
        case '\t': out->append("\\t"); escaped = true; continue;
        default: break;
        }
        if (c < 0x20U || c >= 0x7FU) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            escaped = true;
            continue;
        }
        out->push_back(static_cast<char>(c));
    }
    if (n < bytes.size()) {
        out->append("...");
        escaped = true;
    }
    return escaped;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out)
{
    static constexpr char kDigits[] = "0123456789ABCDEF";

    const uint32_t n = clamp_count(bytes.size(), max_bytes);
    out->reserve(out->size() + static_cast<size_t>(n) * 3U);
    for (uint32_t i = 0; i < n; ++i) {
        if (i != 0) {
            out->push_back(' ');
        }
        const uint8_t v = u8(bytes[i]);
        out->push_back(kDigits[(v >> 4) & 0x0FU]);
        out->push_back(kDigits[v & 0x0FU]);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}

}  // namespace openchunk
