#include "text/utf8.hpp"

namespace pchunk {

namespace {
inline bool is_cont(uint8_t b) { return (b & 0xC0) == 0x80; }

// Number of bytes in the sequence led by b0, or 0 if b0 cannot start one.
inline size_t sequence_length(uint8_t b0) {
    if (b0 < 0x80) return 1;
    if (b0 >= 0xC2 && b0 <= 0xDF) return 2;
    if (b0 >= 0xE0 && b0 <= 0xEF) return 3;
    if (b0 >= 0xF0 && b0 <= 0xF4) return 4;
    return 0;  // stray continuation, overlong lead (C0/C1) or > U+10FFFF
}
} // namespace

bool validate_utf8_strict(const uint8_t* data, size_t n, uint32_t& bad_off) {
    size_t i = 0;
    while (i < n) {
        const uint8_t b0 = data[i];
        const size_t len = sequence_length(b0);
        if (len == 0 || n - i < len) {
            bad_off = static_cast<uint32_t>(i);
            return false;
        }
        bool ok = true;
        for (size_t k = 1; k < len; ++k) ok = ok && is_cont(data[i + k]);
        if (ok && len >= 3) {
            const uint8_t b1 = data[i + 1];
            if (b0 == 0xE0 && b1 < 0xA0) ok = false;   // overlong 3-byte
            if (b0 == 0xED && b1 >= 0xA0) ok = false;  // UTF-16 surrogate
            if (b0 == 0xF0 && b1 < 0x90) ok = false;   // overlong 4-byte
            if (b0 == 0xF4 && b1 > 0x8F) ok = false;   // > U+10FFFF
        }
        if (!ok) {
            bad_off = static_cast<uint32_t>(i);
            return false;
        }
        i += len;
    }
    return true;
}

} // namespace pchunk
