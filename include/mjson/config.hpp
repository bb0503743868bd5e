#pragma once

/// @file config.hpp
/// @brief Configuration macros for the mjson marshalling core.
///
/// Controls:
///   - Non-finite float token support (NaN / Infinity)
///   - Key cache geometry
///   - Recursion depth limit
///   - Branch prediction hints
///   - 128-bit integer availability

// =====================================================================
// Non-finite float tokens
// =====================================================================
// When enabled, the output format accepts NaN, Infinity and -Infinity as
// numeric tokens (a documented deviation from RFC 8259): the encoder emits
// them when no suppression option is set, and the decoder reads them back.
// Disable for a strict-conformance build.

#if !defined(MJSON_ALLOW_INF_AND_NAN)
    #define MJSON_ALLOW_INF_AND_NAN 1
#endif

// =====================================================================
// Key cache geometry
// =====================================================================

/// Number of slots in the key cache. Fixed for the lifetime of the cache.
#if !defined(MJSON_KEY_CACHE_CAPACITY)
    #define MJSON_KEY_CACHE_CAPACITY 2048
#endif

/// Keys longer than this are never cached.
#if !defined(MJSON_KEY_CACHE_MAX_KEY_LEN)
    #define MJSON_KEY_CACHE_MAX_KEY_LEN 64
#endif

/// Number of mutexes striped over the cache slots. Power of two.
#if !defined(MJSON_KEY_CACHE_LOCK_STRIPES)
    #define MJSON_KEY_CACHE_LOCK_STRIPES 64
#endif

static_assert((MJSON_KEY_CACHE_LOCK_STRIPES & (MJSON_KEY_CACHE_LOCK_STRIPES - 1)) == 0,
              "MJSON_KEY_CACHE_LOCK_STRIPES must be a power of two");

// =====================================================================
// Recursion depth limit (stack overflow protection)
// =====================================================================

#if !defined(MJSON_MAX_DEPTH)
    #define MJSON_MAX_DEPTH 1024
#endif

// =====================================================================
// Branch prediction hints
// =====================================================================

#if defined(__GNUC__) || defined(__clang__)
    #define MJSON_LIKELY(x)   __builtin_expect(!!(x), 1)
    #define MJSON_UNLIKELY(x) __builtin_expect(!!(x), 0)
    #define MJSON_NOINLINE    __attribute__((noinline))
    #define MJSON_ALWAYS_INLINE __attribute__((always_inline)) inline
#else
    #define MJSON_LIKELY(x)   (x)
    #define MJSON_UNLIKELY(x) (x)
    #define MJSON_NOINLINE
    #define MJSON_ALWAYS_INLINE inline
#endif

// =====================================================================
// 128-bit integers
// =====================================================================
// The numeric materializer keeps integers up to 128 bits exact. That needs
// the __int128 extension (GCC, Clang).

#if !defined(__SIZEOF_INT128__)
    #error "mjson requires a compiler with __int128 support"
#endif
