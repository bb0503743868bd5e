#pragma once

/// @file decoder.hpp
/// @brief Decode entry points: input normalization, literal fast path,
/// decode-one and decode-next.
///
///   decode_one   whole buffer -> value; trailing non-whitespace is an error
///   decode_next  first value of the buffer -> (value, bytes consumed);
///                the caller continues from buffer + bytes_consumed
///   decode_each  decode_next in a loop over concatenated / NDJSON input
///
/// decode_one short-circuits the three 2-byte inputs [] {} "" without
/// touching the parser. decode_next never does: a 2-byte literal at the
/// start of a longer buffer still has to go through the parser to find
/// where it ends.
///
/// @code
///   auto v = mjson::decode_one(R"({"a": [1, 2.5, "x"]})");
///
///   std::string_view buf = "1 [2] {\"k\": 3}";
///   size_t pos = 0;
///   while (pos < buf.size()) {
///       auto [value, used] = mjson::decode_next(buf.substr(pos));
///       pos += used;
///       ...
///   }
/// @endcode

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "options.hpp"
#include "parser.hpp"
#include "singletons.hpp"
#include "value.hpp"

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <utility>
#include <vector>

namespace mjson {

/// @brief Result of decode_next.
struct DecodeResult {
    JsonValue value;
    size_t bytes_consumed = 0;
};

// ─── Input normalizer ───────────────────────────────────────────────────────

/// @brief Turns a decode source into the borrowed byte slice the parser reads.
///
/// No copy is made: the caller keeps the source alive for the duration of
/// the decode call.
class InputNormalizer {
public:
    /// @throws DecodeError(invalid_utf8) at the first ill-formed byte when
    ///         opts.validate_utf8 is set.
    [[nodiscard]] static std::string_view normalize(std::string_view input,
                                                    const DecodeOptions& opts) {
        if (opts.validate_utf8) {
            const char* begin = input.data();
            const char* end = begin + input.size();
            const char* bad = detail::utf8::find_invalid(begin, end);
            if (MJSON_UNLIKELY(bad != end)) {
                throw DecodeError("invalid UTF-8 sequence",
                                  detail::locate(begin, bad), errc::invalid_utf8);
            }
        }
        return input;
    }

    /// @throws DecodeError(invalid_input) for a null pointer with a
    ///         non-zero size.
    [[nodiscard]] static std::string_view normalize(const void* data, size_t size,
                                                    const DecodeOptions& opts) {
        if (size == 0) return std::string_view();
        if (MJSON_UNLIKELY(data == nullptr)) {
            throw DecodeError("null input buffer with non-zero size",
                              SourceLocation{}, errc::invalid_input);
        }
        return normalize(std::string_view(static_cast<const char*>(data), size), opts);
    }
};

namespace detail {

/// @brief Decode-one fast path for the inputs [] {} "".
/// @return false when input is anything else.
inline bool decode_literal_fast_path(std::string_view input, JsonValue& out) {
    if (input.size() != 2) return false;
    const char a = input[0], b = input[1];
    if (a == '[' && b == ']') {
        out = JsonValue::array();
        return true;
    }
    if (a == '{' && b == '}') {
        out = JsonValue::object();
        return true;
    }
    if (a == '"' && b == '"') {
        out = *Singletons::empty_string();
        return true;
    }
    return false;
}

} // namespace detail

// ─── Decode-one ─────────────────────────────────────────────────────────────

/// @brief Decode a complete JSON document.
/// @throws DecodeError with the byte offset of the problem.
[[nodiscard]] inline JsonValue decode_one(std::string_view input,
                                          const DecodeOptions& opts = {}) {
    const std::string_view in = InputNormalizer::normalize(input, opts);
    JsonValue fast;
    if (detail::decode_literal_fast_path(in, fast)) return fast;
    return detail::Parser::parse_document(in, opts);
}

[[nodiscard]] inline JsonValue decode_one(const void* data, size_t size,
                                          const DecodeOptions& opts = {}) {
    const std::string_view in = InputNormalizer::normalize(data, size, opts);
    JsonValue fast;
    if (detail::decode_literal_fast_path(in, fast)) return fast;
    return detail::Parser::parse_document(in, opts);
}

[[nodiscard]] inline JsonValue decode_one(const std::vector<uint8_t>& bytes,
                                          const DecodeOptions& opts = {}) {
    return decode_one(bytes.data(), bytes.size(), opts);
}

// ─── Decode-next ────────────────────────────────────────────────────────────

/// @brief Decode the first JSON value of input.
///
/// bytes_consumed counts leading whitespace and the value itself; whatever
/// follows the value is left alone. Empty or whitespace-only input is
/// errc::unterminated_value.
[[nodiscard]] inline DecodeResult decode_next(std::string_view input,
                                              const DecodeOptions& opts = {}) {
    const std::string_view in = InputNormalizer::normalize(input, opts);
    auto out = detail::Parser::parse_prefix(in, opts);
    return {std::move(out.value), out.consumed};
}

[[nodiscard]] inline DecodeResult decode_next(const void* data, size_t size,
                                              const DecodeOptions& opts = {}) {
    const std::string_view in = InputNormalizer::normalize(data, size, opts);
    auto out = detail::Parser::parse_prefix(in, opts);
    return {std::move(out.value), out.consumed};
}

[[nodiscard]] inline DecodeResult decode_next(const std::vector<uint8_t>& bytes,
                                              const DecodeOptions& opts = {}) {
    return decode_next(bytes.data(), bytes.size(), opts);
}

// ─── Chained decode ─────────────────────────────────────────────────────────

/// @brief Decode every value of a buffer of concatenated JSON values
/// (newline-delimited or not) and hand each one to fn.
///
/// Whitespace between values is skipped. Error offsets are relative to the
/// start of input.
/// @return Number of values decoded.
template <typename Fn>
size_t decode_each(std::string_view input, Fn&& fn,
                   const DecodeOptions& opts = {}) {
    const std::string_view in = InputNormalizer::normalize(input, opts);
    size_t pos = 0;
    size_t count = 0;
    for (;;) {
        while (pos < in.size() &&
               (in[pos] == ' ' || in[pos] == '\n' || in[pos] == '\r' || in[pos] == '\t')) {
            ++pos;
        }
        if (pos >= in.size()) break;
        auto out = detail::Parser::parse_prefix(in, opts, pos);
        pos += out.consumed;
        ++count;
        fn(std::move(out.value));
    }
    return count;
}

// ─── Exception-free variants ────────────────────────────────────────────────

[[nodiscard]] inline result<JsonValue> try_decode_one(std::string_view input,
                                                      const DecodeOptions& opts = {}) {
    try {
        return {decode_one(input, opts), {}};
    } catch (const DecodeError& e) {
        return {JsonValue{}, e.code()};
    }
}

[[nodiscard]] inline result<DecodeResult> try_decode_next(std::string_view input,
                                                          const DecodeOptions& opts = {}) {
    try {
        return {decode_next(input, opts), {}};
    } catch (const DecodeError& e) {
        return {DecodeResult{}, e.code()};
    }
}

} // namespace mjson
