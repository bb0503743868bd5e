#pragma once

/// @file utf8.hpp
/// @brief UTF-8 helpers for the input normalizer and the string decoder.
///
///   - Encoding a code point to UTF-8 (1-4 bytes), for \uXXXX escapes
///   - Locating the first ill-formed sequence of a buffer

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace mjson::detail::utf8 {

// ─── Code point encoding → UTF-8 ─────────────────────────────────────

/// @brief Encode a code point into a fixed buffer.
/// @return Number of bytes written (1-4), or 0 for an invalid code point.
inline unsigned encode(uint32_t cp, char* buf) noexcept {
    if (cp < 0x80) {
        buf[0] = static_cast<char>(cp);
        return 1;
    } else if (cp < 0x800) {
        buf[0] = static_cast<char>(0xC0 | (cp >> 6));
        buf[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    } else if (cp < 0x10000) {
        buf[0] = static_cast<char>(0xE0 | (cp >> 12));
        buf[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    } else if (cp <= 0x10FFFF) {
        buf[0] = static_cast<char>(0xF0 | (cp >> 18));
        buf[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buf[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buf[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

/// @brief UTF-8 sequence length from the leading byte.
/// @return 1-4 for a valid lead byte, 0 otherwise.
inline unsigned sequence_length(unsigned char lead) noexcept {
    if (lead < 0x80) return 1;
    if ((lead & 0xE0) == 0xC0) return 2;
    if ((lead & 0xF0) == 0xE0) return 3;
    if ((lead & 0xF8) == 0xF0) return 4;
    return 0;
}

// ─── Validation ──────────────────────────────────────────────────────────────

/// @brief Find the first byte that does not start a well-formed sequence.
///
/// Rejects truncated sequences, stray continuation bytes, overlong forms,
/// encoded surrogates and code points above U+10FFFF.
///
/// @return Pointer to the offending lead byte, or end when the whole range
///         is valid.
inline const char* find_invalid(const char* ptr, const char* end) noexcept {
    while (ptr < end) {
        // ASCII run: 8 bytes at a time while the high bits stay clear
        while (end - ptr >= 8) {
            uint64_t word;
            std::memcpy(&word, ptr, 8);
            if (word & 0x8080808080808080ULL) break;
            ptr += 8;
        }
        if (ptr >= end) break;

        const auto lead = static_cast<unsigned char>(*ptr);
        if (lead < 0x80) {
            ++ptr;
            continue;
        }

        const unsigned len = sequence_length(lead);
        if (len == 0 || static_cast<size_t>(end - ptr) < len) return ptr;

        uint32_t cp;
        switch (len) {
            case 2: cp = lead & 0x1F; break;
            case 3: cp = lead & 0x0F; break;
            default: cp = lead & 0x07; break;
        }
        for (unsigned i = 1; i < len; ++i) {
            const auto byte = static_cast<unsigned char>(ptr[i]);
            if ((byte & 0xC0) != 0x80) return ptr;
            cp = (cp << 6) | (byte & 0x3F);
        }

        if ((len == 2 && cp < 0x80) ||
            (len == 3 && cp < 0x800) ||
            (len == 4 && cp < 0x10000)) {
            return ptr;  // overlong
        }
        if (cp >= 0xD800 && cp <= 0xDFFF) return ptr;
        if (cp > 0x10FFFF) return ptr;

        ptr += len;
    }
    return end;
}

/// @brief True when [ptr, end) is well-formed UTF-8.
inline bool validate(const char* ptr, const char* end) noexcept {
    return find_invalid(ptr, end) == end;
}

} // namespace mjson::detail::utf8
