#pragma once

/// @file hash.hpp
/// @brief Content hashing for object keys.
///
/// One function serves both the key cache (slot selection and hit check)
/// and the object index, so a key's hash is computed once, at
/// materialization, and reused everywhere afterwards.
///
/// The mixer is wyhash-inspired: one multiply per 8 bytes, sub-word loads
/// for short input. Typical member names are 2-20 bytes, which makes this
/// 1-2 multiply rounds plus the final avalanche.

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string_view>

namespace mjson::detail {

/// @brief Hash a byte string. Deterministic for the lifetime of the process.
inline uint64_t hash_bytes(const char* data, size_t len) noexcept {
    // Constants from wyhash v4 (public domain, Wang Yi).
    constexpr uint64_t kSeed  = 0xa0761d6478bd642fULL;
    constexpr uint64_t kSeed2 = 0xe7037ed1a0b428dbULL;

    uint64_t h = kSeed ^ (static_cast<uint64_t>(len) * kSeed2);

    auto mix = [&h](uint64_t a, uint64_t b) noexcept {
        h ^= a;
        h *= kSeed2;
        h ^= b;
        h *= kSeed;
    };

    if (len <= 8) {
        uint64_t a = 0, b = 0;
        if (len >= 4) {
            // 4..8 bytes: first 4 and last 4, overlapping when len < 8
            uint32_t lo, hi;
            std::memcpy(&lo, data, 4);
            std::memcpy(&hi, data + len - 4, 4);
            a = lo;
            b = hi;
        } else if (len > 0) {
            a = static_cast<uint64_t>(static_cast<unsigned char>(data[0])) << 16
              | static_cast<uint64_t>(static_cast<unsigned char>(data[len >> 1])) << 8
              | static_cast<uint64_t>(static_cast<unsigned char>(data[len - 1]));
        }
        mix(a, b);
    } else if (len <= 16) {
        uint64_t a, b;
        std::memcpy(&a, data, 8);
        std::memcpy(&b, data + len - 8, 8);
        mix(a, b);
    } else {
        const char* p = data;
        const char* const stop = data + len - 16;
        while (p <= stop) {
            uint64_t a, b;
            std::memcpy(&a, p, 8);
            std::memcpy(&b, p + 8, 8);
            mix(a, b);
            p += 16;
        }
        // Tail: last 16 bytes, overlapping the final block
        uint64_t a, b;
        std::memcpy(&a, data + len - 16, 8);
        std::memcpy(&b, data + len - 8, 8);
        mix(a, b);
    }

    h ^= h >> 32;
    h *= kSeed;
    h ^= h >> 29;
    return h;
}

inline uint64_t hash_bytes(std::string_view sv) noexcept {
    return hash_bytes(sv.data(), sv.size());
}

/// @brief Transparent hasher for string_view-keyed indexes.
struct StringHash {
    using is_transparent = void;

    size_t operator()(std::string_view sv) const noexcept {
        return static_cast<size_t>(hash_bytes(sv));
    }
};

} // namespace mjson::detail
