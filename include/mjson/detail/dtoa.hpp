#pragma once

/// @file detail/dtoa.hpp
/// @brief Number-to-text conversion for the encoder.
///
///   1. Integers up to 128 bits: two-digit pair table, digit count via
///      __builtin_clzll, written left to right without reversal.
///   2. Finite doubles: exact integers below 2^53 use the integer writer
///      plus ".0"; everything else goes through std::to_chars, which
///      produces the shortest text that reads back to the same bits.

#include "../config.hpp"
#include "../fwd.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace mjson::detail {

// ─── Tables ──────────────────────────────────────────────────────────────────

/// Two-digit pair table "00".."99".
inline constexpr char kDigitPairs[201] =
    "00010203040506070809"
    "10111213141516171819"
    "20212223242526272829"
    "30313233343536373839"
    "40414243444546474849"
    "50515253545556575859"
    "60616263646566676869"
    "70717273747576777879"
    "80818283848586878889"
    "90919293949596979899";

/// kPow10U64[0] = 0 (sentinel); kPow10U64[i] = 10^i for i = 1..19.
inline constexpr uint64_t kPow10U64[] = {
    0ULL,
    10ULL,
    100ULL,
    1000ULL,
    10000ULL,
    100000ULL,
    1000000ULL,
    10000000ULL,
    100000000ULL,
    1000000000ULL,
    10000000000ULL,
    100000000000ULL,
    1000000000000ULL,
    10000000000000ULL,
    100000000000000ULL,
    1000000000000000ULL,
    10000000000000000ULL,
    100000000000000000ULL,
    1000000000000000000ULL,
    10000000000000000000ULL
};

/// 2^53: every integer up to here is exactly representable as a double.
inline constexpr double kMaxSafeInteger = 9007199254740992.0;

/// Buffer sizes callers must provide.
inline constexpr size_t kIntegerBufferSize = 48;  // "-" + 39 digits
inline constexpr size_t kDoubleBufferSize  = 32;

// ─── Integer formatting ─────────────────────────────────────────────────────────

/// @brief Decimal digit count of val (1..20).
MJSON_ALWAYS_INLINE int count_digits(uint64_t val) noexcept {
    // floor(log10) ~ bits * 1233 / 4096, corrected against the power table.
    const int bits = 64 - __builtin_clzll(val | 1);
    const int approx = (bits * 1233) >> 12;
    return approx - (val < kPow10U64[approx]) + 1;
}

/// @brief Write val in decimal.
/// @return Pointer past the last written character.
MJSON_ALWAYS_INLINE char* write_u64(char* buf, uint64_t val) noexcept {
    if (val == 0) {
        *buf = '0';
        return buf + 1;
    }

    const int len = count_digits(val);
    char* p = buf + len;

    while (val >= 100) {
        const auto idx = static_cast<unsigned>((val % 100) * 2);
        val /= 100;
        p -= 2;
        std::memcpy(p, kDigitPairs + idx, 2);
    }
    if (val >= 10) {
        std::memcpy(buf, kDigitPairs + val * 2, 2);
    } else {
        *buf = static_cast<char>('0' + val);
    }
    return buf + len;
}

/// @brief Write val zero-padded to exactly 19 digits.
inline char* write_u64_padded19(char* buf, uint64_t val) noexcept {
    char* p = buf + 19;
    for (int i = 0; i < 9; ++i) {
        const auto idx = static_cast<unsigned>((val % 100) * 2);
        val /= 100;
        p -= 2;
        std::memcpy(p, kDigitPairs + idx, 2);
    }
    *--p = static_cast<char>('0' + val);
    return buf + 19;
}

inline char* write_i64(char* buf, int64_t val) noexcept {
    if (val < 0) {
        *buf++ = '-';
        return write_u64(buf, uint64_t(0) - static_cast<uint64_t>(val));
    }
    return write_u64(buf, static_cast<uint64_t>(val));
}

/// @brief Write a 128-bit unsigned value in decimal.
///
/// Splits into base-10^19 limbs so that every step is a 64-bit division
/// except the (at most two) 128-bit ones producing the limbs.
inline char* write_u128(char* buf, uint128_t val) noexcept {
    constexpr uint64_t kLimb = 10000000000000000000ULL;  // 10^19
    if (val <= UINT64_MAX) return write_u64(buf, static_cast<uint64_t>(val));

    const auto low = static_cast<uint64_t>(val % kLimb);
    val /= kLimb;
    if (val <= UINT64_MAX) {
        buf = write_u64(buf, static_cast<uint64_t>(val));
        return write_u64_padded19(buf, low);
    }
    const auto mid = static_cast<uint64_t>(val % kLimb);
    const auto high = static_cast<uint64_t>(val / kLimb);
    buf = write_u64(buf, high);
    buf = write_u64_padded19(buf, mid);
    return write_u64_padded19(buf, low);
}

inline char* write_i128(char* buf, int128_t val) noexcept {
    if (val < 0) {
        *buf++ = '-';
        return write_u128(buf, uint128_t(0) - static_cast<uint128_t>(val));
    }
    return write_u128(buf, static_cast<uint128_t>(val));
}

// ─── Double to string conversion ───────────────────────────────────────────

/// @brief Shortest round-trip decimal text of a finite double.
///
///   - parse(text) reproduces val bit for bit, sign of zero included
///   - the text always holds '.' or 'e' so it reads back as a float
///
/// @param buf Output buffer (>= kDoubleBufferSize bytes).
/// @param val Finite value; NaN and infinities are the caller's business.
/// @return Number of characters written.
inline size_t dtoa(char* buf, double val) noexcept {
    char* const start = buf;

    if (std::signbit(val)) {
        *buf++ = '-';
        val = -val;
    }

    // Exact integers (counters, ids, timestamps) skip the general algorithm.
    if (val <= kMaxSafeInteger && val == std::floor(val)) {
        buf = write_u64(buf, static_cast<uint64_t>(val));
        *buf++ = '.';
        *buf++ = '0';
        return static_cast<size_t>(buf - start);
    }

    auto [ptr, ec] = std::to_chars(buf, start + kDoubleBufferSize, val);
    (void)ec;  // 32 bytes always fit the shortest form of a double
    bool has_dot = false;
    for (const char* p = buf; p < ptr; ++p) {
        if (*p == '.' || *p == 'e' || *p == 'E') {
            has_dot = true;
            break;
        }
    }
    buf = ptr;
    if (!has_dot) {
        *buf++ = '.';
        *buf++ = '0';
    }
    return static_cast<size_t>(buf - start);
}

} // namespace mjson::detail
