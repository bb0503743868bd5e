#pragma once

/// @file numeric.hpp
/// @brief Numeric materializer: numeral text -> narrowest adequate value.
///
/// Integral numerals become, in order of preference:
///   Integer (int64) -> UInteger (uint64) -> Integer128 / UInteger128
///   -> big integer hook -> Float64 approximation.
/// Numerals with a fraction or an exponent always become Float64.
///
/// The parser keeps its own inline accumulation for the common 64-bit
/// integer and short float cases and calls in here for everything else.

#include "config.hpp"
#include "error.hpp"
#include "options.hpp"
#include "value.hpp"

#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <string>
#include <string_view>
#include <system_error>

namespace mjson {
namespace detail {

/// @brief Accumulate a run of decimal digits into 128 bits.
/// @return false on overflow (out is then unspecified).
inline bool parse_u128(std::string_view digits, uint128_t& out) noexcept {
    constexpr uint128_t kMax = ~uint128_t(0);
    constexpr uint128_t kThreshold = kMax / 10;
    constexpr unsigned kLastDigit = static_cast<unsigned>(kMax % 10);

    uint128_t val = 0;
    for (char c : digits) {
        const auto digit = static_cast<unsigned>(c - '0');
        if (MJSON_UNLIKELY(val > kThreshold ||
                           (val == kThreshold && digit > kLastDigit))) {
            return false;
        }
        val = val * 10 + digit;
    }
    out = val;
    return true;
}

/// @brief Integer wider than 64 bits, within 128 bits, as a value.
/// @param digits  Magnitude digits, no sign.
/// @return false when the magnitude does not fit the signed or unsigned
///         128-bit range for the given sign.
inline bool materialize_int128(std::string_view digits, bool negative,
                               JsonValue& out) noexcept {
    uint128_t mag = 0;
    if (!parse_u128(digits, mag)) return false;

    constexpr uint128_t kMaxPos = ~uint128_t(0) >> 1;  // 2^127 - 1
    if (negative) {
        if (mag > kMaxPos + 1) return false;
        out = JsonValue(static_cast<int128_t>(uint128_t(0) - mag));
        return true;
    }
    if (mag <= kMaxPos) {
        out = JsonValue(static_cast<int128_t>(mag));
    } else {
        out = JsonValue(mag);
    }
    return true;
}

/// @brief Full-precision double from numeral text.
///
/// Underflow rounds toward zero (or the nearest subnormal); only a
/// magnitude beyond the largest finite double is an error.
inline std::errc parse_double(std::string_view text, double& out) {
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [p, ec] = std::from_chars(first, last, out);
    if (ec == std::errc::result_out_of_range) {
        // from_chars leaves out untouched here; strtod tells overflow
        // (HUGE_VAL) from underflow.
        const std::string copy(text);
        char* end_ptr = nullptr;
        const double d = std::strtod(copy.c_str(), &end_ptr);
        if (std::isinf(d)) return std::errc::result_out_of_range;
        out = d;
        return std::errc{};
    }
    if (ec != std::errc{}) return ec;
    if (p != last) return std::errc::invalid_argument;
    return std::errc{};
}

/// Shape of a numeral as scanned: sign, integer digits, float markers.
struct NumeralShape {
    bool negative = false;
    bool integral = true;
    std::string_view int_digits;  ///< magnitude digits before '.', 'e' or 'E'
};

/// @brief Check JSON numeral grammar and describe the numeral.
/// @return false when text is not a JSON numeral.
inline bool scan_numeral(std::string_view text, NumeralShape& shape) noexcept {
    size_t i = 0;
    const size_t n = text.size();
    auto is_digit = [&](size_t k) {
        return k < n && static_cast<unsigned>(text[k] - '0') <= 9u;
    };

    if (i < n && text[i] == '-') {
        shape.negative = true;
        ++i;
    }
    const size_t int_start = i;
    if (!is_digit(i)) return false;
    if (text[i] == '0') {
        ++i;
    } else {
        while (is_digit(i)) ++i;
    }
    shape.int_digits = text.substr(int_start, i - int_start);

    if (i < n && text[i] == '.') {
        shape.integral = false;
        ++i;
        if (!is_digit(i)) return false;
        while (is_digit(i)) ++i;
    }
    if (i < n && (text[i] == 'e' || text[i] == 'E')) {
        shape.integral = false;
        ++i;
        if (i < n && (text[i] == '+' || text[i] == '-')) ++i;
        if (!is_digit(i)) return false;
        while (is_digit(i)) ++i;
    }
    return i == n;
}

} // namespace detail

/// @brief Materialize a JSON numeral.
///
/// @param lexeme  Complete numeral text, e.g. "-12", "3.5e10",
///                "340282366920938463463374607431768211455".
/// @param big_integer  Constructor for integers beyond 128 bits; when
///                empty such integers are approximated as Float64.
/// @return The value, or errc::invalid_number when the text is not a
///         numeral or its magnitude overflows a double.
[[nodiscard]] inline result<JsonValue> materialize_number(
        std::string_view lexeme, const BigIntegerFn& big_integer = {}) {
    detail::NumeralShape shape;
    if (MJSON_UNLIKELY(!detail::scan_numeral(lexeme, shape))) {
        return {JsonValue{}, make_error_code(errc::invalid_number)};
    }

    if (shape.integral) {
        const std::string_view digits = shape.int_digits;
        // 19 digits always fit in uint64.
        if (digits.size() <= 19) {
            uint64_t mag = 0;
            for (char c : digits) mag = mag * 10 + static_cast<uint64_t>(c - '0');
            if (shape.negative) {
                constexpr uint64_t kMaxNeg =
                    static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
                if (mag <= kMaxNeg) {
                    return {JsonValue(static_cast<int64_t>(uint64_t(0) - mag)), {}};
                }
            } else if (mag <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return {JsonValue(static_cast<int64_t>(mag)), {}};
            } else {
                return {JsonValue(mag), {}};
            }
        } else if (digits.size() == 20 && !shape.negative) {
            uint128_t mag = 0;
            (void)detail::parse_u128(digits, mag);  // 20 digits never overflow
            if (mag <= UINT64_MAX) return {JsonValue(static_cast<uint64_t>(mag)), {}};
        }

        JsonValue wide;
        if (detail::materialize_int128(digits, shape.negative, wide)) {
            return {std::move(wide), {}};
        }
        if (big_integer) return {big_integer(lexeme), {}};
    }

    double d = 0.0;
    if (MJSON_UNLIKELY(detail::parse_double(lexeme, d) != std::errc{})) {
        return {JsonValue{}, make_error_code(errc::invalid_number)};
    }
    return {JsonValue(d), {}};
}

} // namespace mjson
