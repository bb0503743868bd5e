#pragma once

/// @file options.hpp
/// @brief Encode option flags and decode options.
///
/// Encode options are a plain bitset: combine with |, test with &.
/// Every bit is an independent switch; unknown bits are ignored.
///
/// @code
///   auto text = mjson::encode(v, mjson::OPT_INDENT_2 | mjson::OPT_SANITIZE_NAN);
/// @endcode

#include "config.hpp"
#include "value.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>

namespace mjson {

class KeyCache;

// =====================================================================
// Encode flags
// =====================================================================

using OptionFlags = uint32_t;

/// Pretty-print with two-space indentation.
inline constexpr OptionFlags OPT_INDENT_2       = 1u << 0;
/// Emit object members ordered by key bytes.
inline constexpr OptionFlags OPT_SORT_KEYS      = 1u << 1;
/// Terminate the output with '\n'.
inline constexpr OptionFlags OPT_APPEND_NEWLINE = 1u << 2;
/// Non-finite floats are written as null.
inline constexpr OptionFlags OPT_DISALLOW_NAN   = 1u << 3;
/// NaN and +/-Infinity are written as null. Same net effect as
/// OPT_DISALLOW_NAN; the two bits are kept apart for compatibility.
inline constexpr OptionFlags OPT_SANITIZE_NAN   = 1u << 4;

/// Either non-finite policy bit.
inline constexpr OptionFlags OPT_NONFINITE_AS_NULL = OPT_DISALLOW_NAN | OPT_SANITIZE_NAN;

// =====================================================================
// Decode options
// =====================================================================

/// @brief Builds a value for an integer lexeme wider than 128 bits.
/// Receives the lexeme as written, sign included (e.g. "-1234...").
using BigIntegerFn = std::function<JsonValue(std::string_view lexeme)>;

/// @brief Runtime decode configuration.
struct DecodeOptions {
    /// Cache used for object keys. nullptr selects KeyCache::global().
    KeyCache* key_cache = nullptr;

    /// When false, keys are materialized fresh and no cache is touched.
    bool use_key_cache = true;

    /// Maximum nesting depth of arrays and objects (0 = MJSON_MAX_DEPTH).
    size_t max_depth = MJSON_MAX_DEPTH;

    /// Reject input that is not well-formed UTF-8 before parsing.
    bool validate_utf8 = true;

    /// Constructor for integers beyond the 128-bit range. When empty they
    /// are approximated as Float64.
    BigIntegerFn big_integer;
};

} // namespace mjson
