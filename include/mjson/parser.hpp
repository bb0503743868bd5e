#pragma once

/// @file parser.hpp
/// @brief Recursive JSON parser backend of the decoder.
///
/// Features:
///   - Two stop modes: whole document (trailing content is an error) and
///     prefix (stop after one complete value and report the bytes used)
///   - Object keys interned through the key cache
///   - true / false / null taken from the singleton registry
///   - Inline integer accumulation, numeric materializer for everything
///     wider than 64 bits or not exactly reconstructible
///   - NaN / Infinity / -Infinity literals when MJSON_ALLOW_INF_AND_NAN
///   - Recursion depth limiting to protect against stack overflow
///
/// Grammar checks happen here; UTF-8 well-formedness is checked once over
/// the whole input by the decoder before the parser runs.

#include "config.hpp"
#include "detail/utf8.hpp"
#include "error.hpp"
#include "key_cache.hpp"
#include "numeric.hpp"
#include "options.hpp"
#include "singletons.hpp"
#include "value.hpp"

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory_resource>
#include <string>
#include <string_view>

namespace mjson {
namespace detail {

class Parser {
public:
    /// @brief Value plus the number of input bytes it spans (leading
    /// whitespace included, anything after the value excluded).
    struct Outcome {
        JsonValue value;
        size_t consumed = 0;
    };

    /// @brief Parse exactly one document; only whitespace may follow it.
    [[nodiscard]] static JsonValue parse_document(std::string_view input,
                                                  const DecodeOptions& opts) {
        alignas(16) char temp_buf[1024];
        std::pmr::monotonic_buffer_resource local_mbr(
            temp_buf, sizeof(temp_buf), std::pmr::new_delete_resource());

        Parser p(input, opts, &local_mbr);
        JsonValue result = p.parse_value();
        p.skip_whitespace();
        if (MJSON_UNLIKELY(p.ptr_ < p.end_)) {
            p.error("unexpected trailing content", errc::trailing_data);
        }
        return result;
    }

    /// @brief Parse the first value at or after offset and stop right after
    /// it. Error positions stay relative to the start of input.
    [[nodiscard]] static Outcome parse_prefix(std::string_view input,
                                              const DecodeOptions& opts,
                                              size_t offset = 0) {
        alignas(16) char temp_buf[1024];
        std::pmr::monotonic_buffer_resource local_mbr(
            temp_buf, sizeof(temp_buf), std::pmr::new_delete_resource());

        Parser p(input, opts, &local_mbr);
        p.prefix_ = true;
        p.ptr_ += offset;
        const char* const start = p.ptr_;
        Outcome out;
        out.value = p.parse_value();
        out.consumed = static_cast<size_t>(p.ptr_ - start);
        return out;
    }

private:
    const char* ptr_;
    const char* end_;
    const char* begin_;
    const DecodeOptions& opts_;
    size_t depth_ = 0;
    size_t max_depth_;
    bool prefix_ = false;  ///< bytes after the value belong to the caller
    std::pmr::memory_resource* temp_mr_;  ///< scratch for escaped strings
    KeyCache* cache_;                     ///< nullptr: keys bypass the cache

    // Held for the duration of the parse; literal values are copied out.
    SingletonRef true_;
    SingletonRef false_;
    SingletonRef null_;

    Parser(std::string_view input, const DecodeOptions& opts,
           std::pmr::memory_resource* temp_mr)
        : ptr_(input.data()), end_(input.data() + input.size())
        , begin_(input.data()), opts_(opts)
        , max_depth_(opts.max_depth > 0 ? opts.max_depth : MJSON_MAX_DEPTH)
        , temp_mr_(temp_mr)
        , cache_(!opts.use_key_cache ? nullptr
                 : opts.key_cache   ? opts.key_cache
                                    : &KeyCache::global())
        , true_(Singletons::true_value())
        , false_(Singletons::false_value())
        , null_(Singletons::null_value()) {}

    // ─── Error reporting ──────────────────────────────────────────────────

    [[nodiscard]] SourceLocation location_at(const char* at) const noexcept {
        return locate(begin_, at);
    }

    [[noreturn]] MJSON_NOINLINE void error(const std::string& msg,
                                            errc code = errc::unexpected_token) const {
        throw DecodeError(msg, location_at(ptr_), code);
    }

    [[noreturn]] MJSON_NOINLINE void error_at(const char* at, const std::string& msg,
                                               errc code) const {
        throw DecodeError(msg, location_at(at), code);
    }

    [[noreturn]] MJSON_NOINLINE void error_unexpected_end() const {
        throw DecodeError("unexpected end of input", location_at(ptr_),
                          errc::unterminated_value);
    }

    [[noreturn]] MJSON_NOINLINE void error_unexpected_char() const {
        if (ptr_ >= end_) error_unexpected_end();
        const auto c = static_cast<unsigned char>(*ptr_);
        if (c < 0x20 || c >= 0x7F) {
            static constexpr char kHex[] = "0123456789abcdef";
            const char byte[] = {'0', 'x', kHex[c >> 4], kHex[c & 0xF], '\0'};
            error(std::string("unexpected byte ") + byte);
        }
        error(std::string("unexpected character '") + *ptr_ + "'");
    }

    // ─── Depth tracking ──────────────────────────────────────────────────────

    void push_depth() {
        if (MJSON_UNLIKELY(++depth_ > max_depth_)) {
            error("maximum nesting depth exceeded", errc::max_depth_exceeded);
        }
    }

    void pop_depth() noexcept { --depth_; }

    // ─── Whitespace ────────────────────────────────────────────────────

    static bool is_ws(char c) noexcept {
        return c == ' ' || c == '\n' || c == '\r' || c == '\t';
    }

    void skip_whitespace() noexcept {
        // Most tokens are not preceded by whitespace at all.
        if (MJSON_LIKELY(ptr_ < end_ && static_cast<unsigned char>(*ptr_) > ' ')) {
            return;
        }
        while (ptr_ < end_ && is_ws(*ptr_)) ++ptr_;
    }

    // ─── Character reading ────────────────────────────────────────────

    void expect(char c) {
        if (MJSON_LIKELY(ptr_ < end_ && *ptr_ == c)) {
            ++ptr_;
            return;
        }
        if (ptr_ >= end_) error_unexpected_end();
        error(std::string("expected '") + c + "', got '" + *ptr_ + "'");
    }

    template <size_t N>
    void expect_literal(const char (&literal)[N]) {
        constexpr size_t len = N - 1;
        const auto avail = static_cast<size_t>(end_ - ptr_);
        if (MJSON_UNLIKELY(avail < len || std::memcmp(ptr_, literal, len) != 0)) {
            // A clean prefix of the literal that runs into the end of input
            // is a truncated value, anything else a bad token.
            if (avail < len && std::memcmp(ptr_, literal, avail) == 0) {
                ptr_ = end_;
                error_unexpected_end();
            }
            error(std::string("expected '") + literal + "'");
        }
        ptr_ += len;
    }

    // ─── Value parsing ───────────────────────────────────────────────────────

    JsonValue parse_value() {
        skip_whitespace();
        if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();

        switch (*ptr_) {
            case '"': return parse_string_value();
            case '{': return parse_object();
            case '[': return parse_array();
            case 't': expect_literal("true");  return *true_;
            case 'f': expect_literal("false"); return *false_;
            case 'n': expect_literal("null");  return *null_;
            case '-':
            case '0': case '1': case '2': case '3': case '4':
            case '5': case '6': case '7': case '8': case '9':
                return parse_number();
#if MJSON_ALLOW_INF_AND_NAN
            case 'N':
                expect_literal("NaN");
                return JsonValue(std::numeric_limits<double>::quiet_NaN());
            case 'I':
                return parse_infinity(false);
#endif
            default:
                error_unexpected_char();
        }
    }

#if MJSON_ALLOW_INF_AND_NAN
    JsonValue parse_infinity(bool negative) {
        expect_literal("Infinity");
        const double inf = std::numeric_limits<double>::infinity();
        return JsonValue(negative ? -inf : inf);
    }
#endif

    // ─── Strings ──────────────────────────────────────────────────────────────

    /// Next '"' or '\\' at or after p. Raw control characters stop the scan
    /// as well so the caller can reject them.
    const char* find_string_delimiter(const char* p) const noexcept {
        while (p < end_) {
            const auto c = static_cast<unsigned char>(*p);
            if (c == '"' || c == '\\' || c < 0x20) return p;
            ++p;
        }
        return p;
    }

    /// @brief Scan a string body starting after the opening quote.
    ///
    /// Strings without escapes are returned as a view into the input;
    /// otherwise the decoded text is built in buf and a view of buf is
    /// returned.
    std::string_view scan_string(std::pmr::string& buf) {
        const char* delim = find_string_delimiter(ptr_);
        if (MJSON_LIKELY(delim < end_ && *delim == '"')) {
            std::string_view sv(ptr_, static_cast<size_t>(delim - ptr_));
            ptr_ = delim + 1;
            return sv;
        }

        for (;;) {
            if (delim > ptr_) {
                buf.append(ptr_, static_cast<size_t>(delim - ptr_));
                ptr_ = delim;
            }
            if (MJSON_UNLIKELY(ptr_ >= end_)) {
                error("unterminated string", errc::unterminated_value);
            }
            const char c = *ptr_;
            if (c == '"') {
                ++ptr_;
                return std::string_view(buf.data(), buf.size());
            }
            if (c == '\\') {
                ++ptr_;
                parse_escape(buf);
            } else {
                error("control character in string");
            }
            delim = find_string_delimiter(ptr_);
        }
    }

    void parse_escape(std::pmr::string& out) {
        if (MJSON_UNLIKELY(ptr_ >= end_)) {
            error("unterminated escape sequence", errc::unterminated_value);
        }
        const char c = *ptr_++;
        switch (c) {
            case '"':  out.push_back('"');  return;
            case '\\': out.push_back('\\'); return;
            case '/':  out.push_back('/');  return;
            case 'b':  out.push_back('\b'); return;
            case 'f':  out.push_back('\f'); return;
            case 'n':  out.push_back('\n'); return;
            case 'r':  out.push_back('\r'); return;
            case 't':  out.push_back('\t'); return;
            case 'u':  parse_unicode_escape(out); return;
            default:
                --ptr_;
                error(std::string("invalid escape '\\") + c + "'", errc::invalid_escape);
        }
    }

    static int hex_value(char c) noexcept {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    }

    uint32_t parse_hex4() {
        if (MJSON_UNLIKELY(end_ - ptr_ < 4)) {
            error("incomplete unicode escape", errc::invalid_escape);
        }
        uint32_t val = 0;
        for (int i = 0; i < 4; ++i) {
            const int nib = hex_value(ptr_[i]);
            if (MJSON_UNLIKELY(nib < 0)) {
                error("invalid hex digit in unicode escape", errc::invalid_escape);
            }
            val = (val << 4) | static_cast<uint32_t>(nib);
        }
        ptr_ += 4;
        return val;
    }

    void parse_unicode_escape(std::pmr::string& out) {
        uint32_t cp = parse_hex4();

        if (cp >= 0xD800 && cp <= 0xDBFF) {
            if (MJSON_UNLIKELY(end_ - ptr_ < 2 || ptr_[0] != '\\' || ptr_[1] != 'u')) {
                error("missing low surrogate", errc::invalid_escape);
            }
            ptr_ += 2;
            const uint32_t low = parse_hex4();
            if (MJSON_UNLIKELY(low < 0xDC00 || low > 0xDFFF)) {
                error("invalid low surrogate", errc::invalid_escape);
            }
            cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
        } else if (MJSON_UNLIKELY(cp >= 0xDC00 && cp <= 0xDFFF)) {
            error("unexpected low surrogate", errc::invalid_escape);
        }

        char buf[4];
        const unsigned n = utf8::encode(cp, buf);
        out.append(buf, n);
    }

    JsonValue parse_string_value() {
        ++ptr_;
        std::pmr::string buf(temp_mr_);
        return JsonValue(String::make(scan_string(buf)));
    }

    Key parse_key() {
        ++ptr_;
        std::pmr::string buf(temp_mr_);
        const std::string_view text = scan_string(buf);
        if (MJSON_LIKELY(cache_ != nullptr)) return cache_->intern(text);
        return String::make_key(text);
    }

    // ─── Numbers ──────────────────────────────────────────────────────────────

    /// ptr_ is on 'e' / 'E'. In prefix mode the exponent is taken only when
    /// a digit (optionally signed) or the end of input follows, so "42extra"
    /// stops after "42". Whole documents always take it and report the
    /// malformed exponent.
    [[nodiscard]] bool exponent_follows() const noexcept {
        if (!prefix_) return true;
        const char* p = ptr_ + 1;
        if (p < end_ && (*p == '+' || *p == '-')) ++p;
        return p >= end_ || static_cast<unsigned>(*p - '0') <= 9u;
    }

    JsonValue parse_number() {
        const char* start = ptr_;
        bool negative = false;

        if (*ptr_ == '-') {
            negative = true;
            ++ptr_;
            if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();
#if MJSON_ALLOW_INF_AND_NAN
            if (*ptr_ == 'I') return parse_infinity(true);
#endif
        }

        if (MJSON_UNLIKELY(static_cast<unsigned>(*ptr_ - '0') > 9u)) {
            error("invalid number", errc::invalid_number);
        }

        // Integer part, accumulated while it fits in 64 bits.
        uint64_t int_val = 0;
        bool int_overflow = false;
        int int_digits = 0;

        if (*ptr_ == '0') {
            ++ptr_;
        } else {
            constexpr uint64_t kOverflowThreshold = UINT64_MAX / 10;
            constexpr uint64_t kOverflowLastDigit = UINT64_MAX % 10;
            while (ptr_ < end_ && static_cast<unsigned>(*ptr_ - '0') <= 9u) {
                const auto digit = static_cast<uint64_t>(*ptr_ - '0');
                if (MJSON_UNLIKELY(int_val > kOverflowThreshold ||
                                   (int_val == kOverflowThreshold && digit > kOverflowLastDigit))) {
                    int_overflow = true;
                    while (ptr_ < end_ && static_cast<unsigned>(*ptr_ - '0') <= 9u) ++ptr_;
                    break;
                }
                int_val = int_val * 10 + digit;
                ++ptr_;
                ++int_digits;
            }
        }

        bool is_float = false;
        uint64_t mantissa = int_val;
        int32_t frac_digits = 0;
        int32_t explicit_exp = 0;
        bool mantissa_overflow = int_overflow;
        constexpr int kMaxMantissaDigits = 19;
        int total_digits = int_digits;

        if (ptr_ < end_ && *ptr_ == '.') {
            is_float = true;
            ++ptr_;
            if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();
            if (MJSON_UNLIKELY(static_cast<unsigned>(*ptr_ - '0') > 9u)) {
                error("expected digit after decimal point", errc::invalid_number);
            }
            while (ptr_ < end_ && static_cast<unsigned>(*ptr_ - '0') <= 9u) {
                if (total_digits < kMaxMantissaDigits) {
                    mantissa = mantissa * 10 + static_cast<uint64_t>(*ptr_ - '0');
                    ++frac_digits;
                    ++total_digits;
                } else {
                    mantissa_overflow = true;
                }
                ++ptr_;
            }
        }

        if (ptr_ < end_ && (*ptr_ == 'e' || *ptr_ == 'E') && exponent_follows()) {
            is_float = true;
            ++ptr_;
            bool neg_exp = false;
            if (ptr_ < end_ && (*ptr_ == '+' || *ptr_ == '-')) {
                neg_exp = (*ptr_ == '-');
                ++ptr_;
            }
            if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();
            if (MJSON_UNLIKELY(static_cast<unsigned>(*ptr_ - '0') > 9u)) {
                error("expected digit in exponent", errc::invalid_number);
            }
            while (ptr_ < end_ && static_cast<unsigned>(*ptr_ - '0') <= 9u) {
                explicit_exp = explicit_exp * 10 + (*ptr_ - '0');
                if (explicit_exp > 400) explicit_exp = 400;
                ++ptr_;
            }
            if (neg_exp) explicit_exp = -explicit_exp;
        }

        if (MJSON_LIKELY(!is_float && !int_overflow)) {
            if (negative) {
                constexpr uint64_t kMaxNeg =
                    static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1;
                if (MJSON_LIKELY(int_val <= kMaxNeg)) {
                    return JsonValue(static_cast<int64_t>(uint64_t(0) - int_val));
                }
            } else {
                if (MJSON_LIKELY(int_val <= static_cast<uint64_t>(
                                     std::numeric_limits<int64_t>::max()))) {
                    return JsonValue(static_cast<int64_t>(int_val));
                }
                return JsonValue(int_val);
            }
        }

        // Exact reconstruction: mantissa and 10^|exp10| are both exact doubles,
        // so a single multiply or divide rounds correctly.
        if (is_float && MJSON_LIKELY(!mantissa_overflow) &&
            mantissa <= (uint64_t(1) << 53)) {
            const int32_t exp10 = explicit_exp - frac_digits;
            if (exp10 >= -22 && exp10 <= 22) {
                static constexpr double kPow10[] = {
                    1e0,  1e1,  1e2,  1e3,  1e4,  1e5,  1e6,  1e7,  1e8,  1e9,
                    1e10, 1e11, 1e12, 1e13, 1e14, 1e15, 1e16, 1e17, 1e18, 1e19,
                    1e20, 1e21, 1e22
                };
                double d = static_cast<double>(mantissa);
                d = exp10 >= 0 ? d * kPow10[exp10] : d / kPow10[-exp10];
                return JsonValue(negative ? -d : d);
            }
        }

        return parse_number_slow(start);
    }

    /// Integers beyond 64 bits and floats outside the exact fast path.
    MJSON_NOINLINE JsonValue parse_number_slow(const char* start) {
        const std::string_view lexeme(start, static_cast<size_t>(ptr_ - start));
        auto r = materialize_number(lexeme, opts_.big_integer);
        if (MJSON_UNLIKELY(r.ec)) {
            error_at(start, "number out of range", errc::invalid_number);
        }
        return std::move(r.value);
    }

    // ─── Arrays ────────────────────────────────────────────────────

    JsonValue parse_array() {
        ++ptr_;
        push_depth();
        skip_whitespace();

        if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();

        if (*ptr_ == ']') {
            ++ptr_;
            pop_depth();
            return JsonValue(Array());
        }

        Array arr;
        arr.reserve(8);

        for (;;) {
            arr.push_back(parse_value());
            skip_whitespace();

            if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();

            if (*ptr_ == ',') {
                ++ptr_;
                continue;
            }
            if (MJSON_LIKELY(*ptr_ == ']')) {
                ++ptr_;
                pop_depth();
                return JsonValue(std::move(arr));
            }
            error("expected ',' or ']' in array");
        }
    }

    // ─── Objects ──────────────────────────────────────────────────

    JsonValue parse_object() {
        ++ptr_;
        push_depth();
        skip_whitespace();

        if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();

        if (*ptr_ == '}') {
            ++ptr_;
            pop_depth();
            return JsonValue(Object());
        }

        Object obj;
        obj.reserve(8);

        for (;;) {
            skip_whitespace();
            if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();
            if (MJSON_UNLIKELY(*ptr_ != '"')) error("expected string key in object");

            Key key = parse_key();

            skip_whitespace();
            expect(':');

            JsonValue value = parse_value();
            // Append now, resolve duplicates once the object is closed.
            obj.entries.emplace_back(std::move(key), std::move(value));

            skip_whitespace();
            if (MJSON_UNLIKELY(ptr_ >= end_)) error_unexpected_end();

            if (*ptr_ == ',') {
                ++ptr_;
                continue;
            }
            if (MJSON_LIKELY(*ptr_ == '}')) {
                ++ptr_;
                pop_depth();
                obj.dedup_last_wins();
                return JsonValue(std::move(obj));
            }
            error("expected ',' or '}' in object");
        }
    }
};

} // namespace detail
} // namespace mjson
