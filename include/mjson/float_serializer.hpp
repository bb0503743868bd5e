#pragma once

/// @file float_serializer.hpp
/// @brief Float64 -> JSON numeral under the non-finite value policy.
///
/// Decision order for a value v with option flags opts:
///   1. v finite                       -> shortest round-trip numeral
///   2. OPT_DISALLOW_NAN or
///      OPT_SANITIZE_NAN set           -> null
///   3. MJSON_ALLOW_INF_AND_NAN build  -> NaN, Infinity or -Infinity
///   4. strict build                   -> EncodeError(non_finite_float)
///
/// The two policy bits have the same effect and may be combined freely.

#include "config.hpp"
#include "detail/dtoa.hpp"
#include "error.hpp"
#include "options.hpp"

#include <cmath>
#include <cstddef>
#include <cstring>
#include <string>

namespace mjson {

class FloatSerializer {
public:
    /// Minimum size of the buffer passed to write().
    static constexpr size_t kBufferSize = detail::kDoubleBufferSize;

    /// @brief True when the flags turn non-finite values into null.
    [[nodiscard]] static constexpr bool nonfinite_as_null(OptionFlags opts) noexcept {
        return (opts & OPT_NONFINITE_AS_NULL) != 0;
    }

    /// @brief Format val into buf (>= kBufferSize bytes).
    /// @return Number of characters written.
    /// @throws EncodeError in a strict build for a non-finite value with no
    ///         policy bit set.
    static size_t write(char* buf, double val, OptionFlags opts) {
        if (MJSON_LIKELY(std::isfinite(val))) return detail::dtoa(buf, val);

        if (nonfinite_as_null(opts)) return copy(buf, "null", 4);

#if MJSON_ALLOW_INF_AND_NAN
        if (std::isnan(val)) return copy(buf, "NaN", 3);
        if (val < 0) return copy(buf, "-Infinity", 9);
        return copy(buf, "Infinity", 8);
#else
        throw EncodeError(std::isnan(val)
                              ? "cannot serialize NaN in strict JSON"
                              : "cannot serialize Infinity in strict JSON",
                          errc::non_finite_float);
#endif
    }

    /// @brief Convenience form of write().
    [[nodiscard]] static std::string to_string(double val, OptionFlags opts = 0) {
        char buf[kBufferSize];
        return std::string(buf, write(buf, val, opts));
    }

private:
    static size_t copy(char* buf, const char* token, size_t len) noexcept {
        std::memcpy(buf, token, len);
        return len;
    }
};

} // namespace mjson
