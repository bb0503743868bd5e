#pragma once

/// @file serializer.hpp
/// @brief Value-tree serializer: JsonValue -> JSON text.
///
/// Features:
///   - Buffered string output, constexpr escape tables
///   - Compact or two-space indented output (OPT_INDENT_2), selected at
///     compile time per call
///   - Optional key ordering (OPT_SORT_KEYS) and trailing newline
///     (OPT_APPEND_NEWLINE)
///   - Integers up to 128 bits written exactly
///   - Floats through FloatSerializer, non-finite policy included

#include "config.hpp"
#include "detail/dtoa.hpp"
#include "error.hpp"
#include "float_serializer.hpp"
#include "options.hpp"
#include "value.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

namespace mjson {
namespace detail {

/// Hex digit table.
inline constexpr char kHexDigits[16] = {
    '0','1','2','3','4','5','6','7','8','9','a','b','c','d','e','f'
};

/// Precomputed escape strings for control characters 0x00..0x1F.
struct EscapeEntry {
    char str[7];
    uint8_t len;
};

inline constexpr auto make_control_escape_table() {
    struct Table { EscapeEntry entries[32] = {}; } t;

    for (int i = 0; i < 32; ++i) {
        t.entries[i].str[0] = '\\';
        t.entries[i].str[1] = 'u';
        t.entries[i].str[2] = '0';
        t.entries[i].str[3] = '0';
        t.entries[i].str[4] = kHexDigits[(i >> 4) & 0xF];
        t.entries[i].str[5] = kHexDigits[i & 0xF];
        t.entries[i].str[6] = '\0';
        t.entries[i].len = 6;
    }

    auto set = [&](int idx, char c) {
        t.entries[idx].str[0] = '\\';
        t.entries[idx].str[1] = c;
        t.entries[idx].str[2] = '\0';
        t.entries[idx].len = 2;
    };
    set(0x08, 'b');
    set(0x09, 't');
    set(0x0A, 'n');
    set(0x0C, 'f');
    set(0x0D, 'r');

    return t;
}

inline constexpr auto kControlEscapes = make_control_escape_table();

/// @brief Output adapter: writes through a 4 KiB stack buffer into a string.
class StringOutput {
public:
    StringOutput() = default;
    StringOutput(const StringOutput&) = delete;
    StringOutput& operator=(const StringOutput&) = delete;

    void write(char c) {
        if (MJSON_UNLIKELY(pos_ >= kBufSize)) flush();
        buf_[pos_++] = c;
    }

    void write(const char* s, size_t n) {
        if (MJSON_LIKELY(pos_ + n <= kBufSize)) {
            std::memcpy(buf_ + pos_, s, n);
            pos_ += n;
        } else {
            write_slow(s, n);
        }
    }

    void reserve(size_t n) { result_.reserve(n); }

    std::string take() {
        flush();
        return std::move(result_);
    }

private:
    static constexpr size_t kBufSize = 4096;

    char buf_[kBufSize];
    size_t pos_ = 0;
    std::string result_;

    void flush() {
        if (pos_ > 0) {
            result_.append(buf_, pos_);
            pos_ = 0;
        }
    }

    MJSON_NOINLINE void write_slow(const char* s, size_t n) {
        flush();
        if (n >= kBufSize) {
            result_.append(s, n);
        } else {
            std::memcpy(buf_, s, n);
            pos_ = n;
        }
    }
};

/// @brief Tree walker. Pretty is a compile-time switch so compact output
/// carries no indentation branches.
template <bool Pretty>
class SerializerCore {
public:
    SerializerCore(StringOutput& out, OptionFlags opts) noexcept
        : out_(out), opts_(opts) {}

    void serialize(const JsonValue& value) { write_value(value); }

private:
    static constexpr int kIndentStep = 2;

    StringOutput& out_;
    OptionFlags opts_;
    int indent_ = 0;

    void write_newline_indent() {
        if constexpr (Pretty) {
            static constexpr char kSpaces[] =
                "                                                                ";
            constexpr int kChunk = static_cast<int>(sizeof(kSpaces) - 1);
            out_.write('\n');
            int n = indent_;
            while (n > 0) {
                const int chunk = n < kChunk ? n : kChunk;
                out_.write(kSpaces, static_cast<size_t>(chunk));
                n -= chunk;
            }
        }
    }

    void write_value(const JsonValue& v) {
        switch (v.type()) {
            case Type::Null:
                out_.write("null", 4);
                break;
            case Type::Bool:
                if (v.as_bool()) out_.write("true", 4);
                else out_.write("false", 5);
                break;
            case Type::Integer: {
                char buf[kIntegerBufferSize];
                out_.write(buf, static_cast<size_t>(write_i64(buf, v.as_integer()) - buf));
                break;
            }
            case Type::UInteger: {
                char buf[kIntegerBufferSize];
                out_.write(buf, static_cast<size_t>(write_u64(buf, v.as_uinteger()) - buf));
                break;
            }
            case Type::Integer128: {
                char buf[kIntegerBufferSize];
                out_.write(buf, static_cast<size_t>(write_i128(buf, v.as_integer128()) - buf));
                break;
            }
            case Type::UInteger128: {
                char buf[kIntegerBufferSize];
                out_.write(buf, static_cast<size_t>(write_u128(buf, v.as_uinteger128()) - buf));
                break;
            }
            case Type::Float: {
                char buf[FloatSerializer::kBufferSize];
                out_.write(buf, FloatSerializer::write(buf, v.as_float(), opts_));
                break;
            }
            case Type::String:
                write_string(v.as_string_view());
                break;
            case Type::Array:
                write_array(v.as_array());
                break;
            case Type::Object:
                write_object(v.as_object());
                break;
        }
    }

    void write_string(std::string_view s) {
        out_.write('"');
        const char* ptr = s.data();
        const char* const str_end = ptr + s.size();

        while (ptr < str_end) {
            const char* run = ptr;
            while (ptr < str_end) {
                const auto c = static_cast<unsigned char>(*ptr);
                if (c < 0x20 || c == '"' || c == '\\') break;
                ++ptr;
            }
            if (ptr > run) out_.write(run, static_cast<size_t>(ptr - run));
            if (ptr >= str_end) break;

            const auto c = static_cast<unsigned char>(*ptr);
            if (c < 0x20) {
                const auto& esc = kControlEscapes.entries[c];
                out_.write(esc.str, esc.len);
            } else if (c == '"') {
                out_.write("\\\"", 2);
            } else {
                out_.write("\\\\", 2);
            }
            ++ptr;
        }
        out_.write('"');
    }

    void write_array(const Array& arr) {
        if (arr.empty()) { out_.write("[]", 2); return; }
        out_.write('[');
        if constexpr (Pretty) indent_ += kIndentStep;
        for (size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) out_.write(',');
            write_newline_indent();
            write_value(arr[i]);
        }
        if constexpr (Pretty) indent_ -= kIndentStep;
        write_newline_indent();
        out_.write(']');
    }

    void write_member(const Object::value_type& member, bool first) {
        if (!first) out_.write(',');
        write_newline_indent();
        write_string(member.first.view());
        out_.write(':');
        if constexpr (Pretty) out_.write(' ');
        write_value(member.second);
    }

    void write_object(const Object& obj) {
        if (obj.empty()) { out_.write("{}", 2); return; }
        out_.write('{');
        if constexpr (Pretty) indent_ += kIndentStep;

        const auto& storage = obj.storage();
        if (opts_ & OPT_SORT_KEYS) {
            const size_t n = storage.size();
            // Objects up to 64 members sort an index array on the stack.
            constexpr size_t kSmallBuf = 64;
            size_t stack_indices[kSmallBuf];
            std::vector<size_t> heap_indices;
            size_t* indices = stack_indices;
            if (MJSON_UNLIKELY(n > kSmallBuf)) {
                heap_indices.resize(n);
                indices = heap_indices.data();
            }
            for (size_t i = 0; i < n; ++i) indices[i] = i;
            std::sort(indices, indices + n, [&storage](size_t a, size_t b) {
                return storage[a].first < storage[b].first;
            });
            for (size_t k = 0; k < n; ++k) write_member(storage[indices[k]], k == 0);
        } else {
            bool first = true;
            for (const auto& member : storage) {
                write_member(member, first);
                first = false;
            }
        }

        if constexpr (Pretty) indent_ -= kIndentStep;
        write_newline_indent();
        out_.write('}');
    }
};

/// @brief O(1) size hint from the root value only.
inline size_t serialization_size_hint(const JsonValue& value) noexcept {
    switch (value.type()) {
        case Type::Array:  return value.as_array().size() * 64 + 2;
        case Type::Object: return value.as_object().size() * 80 + 2;
        case Type::String: return value.as_string_view().size() + 2;
        default:           return 16;
    }
}

} // namespace detail

// ─── Encode entry points ─────────────────────────────────────────────────────

/// @brief Serialize a value.
/// @throws EncodeError for a non-finite float in a strict build when no
///         non-finite policy flag is set.
[[nodiscard]] inline std::string encode(const JsonValue& value, OptionFlags opts = 0) {
    detail::StringOutput out;
    const size_t hint = detail::serialization_size_hint(value);
    if (hint > 4096) out.reserve(hint);

    if (opts & OPT_INDENT_2) {
        detail::SerializerCore<true>(out, opts).serialize(value);
    } else {
        detail::SerializerCore<false>(out, opts).serialize(value);
    }
    if (opts & OPT_APPEND_NEWLINE) out.write('\n');
    return out.take();
}

/// @brief Serialize without exceptions.
[[nodiscard]] inline result<std::string> try_encode(const JsonValue& value,
                                                    OptionFlags opts = 0) {
    try {
        return {encode(value, opts), {}};
    } catch (const EncodeError& e) {
        return {std::string(), e.code()};
    }
}

inline std::string JsonValue::dump(uint32_t opts) const {
    return encode(*this, opts);
}

} // namespace mjson
