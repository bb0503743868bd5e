#pragma once

/// @file error.hpp
/// @brief Error types for mjson: exceptions + std::error_code system.
///
/// Dual error reporting:
///   - Via exceptions: DecodeError, EncodeError, TypeError, OutOfRangeError
///   - Via error_code: mjson::errc enum + json_category() (exception-free)
///
/// Use try_decode_one() / try_decode_next() / try_encode() for
/// exception-free operation.

#include <cstddef>
#include <stdexcept>
#include <string>
#include <system_error>

namespace mjson {

// =====================================================================
// Source position for decode errors
// =====================================================================

/// @brief Position in the source JSON text.
struct SourceLocation {
    size_t line   = 1;  ///< Line number (1-based)
    size_t column = 1;  ///< Column number (1-based)
    size_t offset = 0;  ///< Byte offset from the beginning
};

// =====================================================================
// Error code enumeration
// =====================================================================

/// @brief mjson error codes for std::error_code integration.
enum class errc : int {
    ok = 0,

    // Decode errors (1-49)
    invalid_utf8        = 1,
    unexpected_token    = 2,
    trailing_data       = 3,
    unterminated_value  = 4,
    invalid_number      = 5,
    invalid_escape      = 6,
    max_depth_exceeded  = 7,
    invalid_input       = 8,

    // Value access errors (50-79)
    type_mismatch       = 50,
    out_of_range        = 51,

    // Encode errors (80-99)
    non_finite_float    = 80,
};

// =====================================================================
// Error category
// =====================================================================

namespace detail {

class json_error_category_impl : public std::error_category {
public:
    const char* name() const noexcept override {
        return "mjson";
    }

    std::string message(int ev) const override {
        switch (static_cast<errc>(ev)) {
            case errc::ok:                 return "success";
            case errc::invalid_utf8:       return "invalid UTF-8 encoding";
            case errc::unexpected_token:   return "unexpected token";
            case errc::trailing_data:      return "trailing data after JSON value";
            case errc::unterminated_value: return "unterminated value";
            case errc::invalid_number:     return "invalid number";
            case errc::invalid_escape:     return "invalid escape sequence";
            case errc::max_depth_exceeded: return "maximum nesting depth exceeded";
            case errc::invalid_input:      return "invalid input buffer";
            case errc::type_mismatch:      return "type mismatch";
            case errc::out_of_range:       return "index out of range";
            case errc::non_finite_float:   return "NaN or Infinity not permitted";
            default:                       return "unknown mjson error";
        }
    }
};

} // namespace detail

/// @brief Get the mjson error category singleton.
inline const std::error_category& json_category() noexcept {
    static const detail::json_error_category_impl instance;
    return instance;
}

/// @brief Create an error_code from mjson::errc.
inline std::error_code make_error_code(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

/// @brief Create an error_condition from mjson::errc.
inline std::error_condition make_error_condition(errc e) noexcept {
    return {static_cast<int>(e), json_category()};
}

namespace detail {

/// @brief Line / column / offset of position at within [begin, at].
inline SourceLocation locate(const char* begin, const char* at) noexcept {
    SourceLocation loc;
    loc.offset = static_cast<size_t>(at - begin);
    for (const char* p = begin; p < at; ++p) {
        if (*p == '\n') { ++loc.line; loc.column = 1; }
        else { ++loc.column; }
    }
    return loc;
}

} // namespace detail

// =====================================================================
// Exception types
// =====================================================================

/// @brief Decode error with source position information.
class DecodeError : public std::system_error {
public:
    DecodeError(const std::string& message, SourceLocation loc,
                errc code = errc::unexpected_token)
        : std::system_error(make_error_code(code), format_message(message, loc))
        , location_(loc) {}

    /// @brief Error position in the source text.
    [[nodiscard]] const SourceLocation& location() const noexcept {
        return location_;
    }

    /// @brief Byte offset of the error from the start of the input.
    [[nodiscard]] size_t offset() const noexcept { return location_.offset; }

private:
    static std::string format_message(const std::string& msg,
                                      const SourceLocation& loc) {
        return "JSON decode error at line " + std::to_string(loc.line) +
               ", column " + std::to_string(loc.column) +
               " (byte " + std::to_string(loc.offset) + "): " + msg;
    }

    SourceLocation location_;
};

/// @brief Encode error. Value-local, so it carries no position.
class EncodeError : public std::system_error {
public:
    explicit EncodeError(const std::string& msg,
                         errc code = errc::non_finite_float)
        : std::system_error(make_error_code(code), msg) {}
};

/// @brief Type mismatch error when accessing a value.
class TypeError : public std::system_error {
public:
    explicit TypeError(const std::string& msg)
        : std::system_error(make_error_code(errc::type_mismatch), msg) {}
};

/// @brief Out-of-range error (array index or missing key).
class OutOfRangeError : public std::system_error {
public:
    explicit OutOfRangeError(const std::string& msg)
        : std::system_error(make_error_code(errc::out_of_range), msg) {}
};

// =====================================================================
// Result type for exception-free operations
// =====================================================================

/// @brief Simple result type: value + error_code.
/// Usage: auto [val, ec] = mjson::try_decode_one(input);
template <typename T>
struct result {
    T value;
    std::error_code ec;

    explicit operator bool() const noexcept { return !ec; }
    bool has_value() const noexcept { return !ec; }
};

} // namespace mjson

// Register mjson::errc as an error_code enum
namespace std {
template <>
struct is_error_code_enum<mjson::errc> : true_type {};
} // namespace std
