/// @file test_decoder.cpp
/// @brief Unit tests for decode_one / decode_next / decode_each and the
/// literal fast path.

#include <mjson/mjson.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

using namespace mjson;

namespace {

errc decode_error_code(std::string_view input, const DecodeOptions& opts = {}) {
    try {
        (void)decode_one(input, opts);
    } catch (const DecodeError& e) {
        return static_cast<errc>(e.code().value());
    }
    return errc::ok;
}

size_t decode_error_offset(std::string_view input) {
    try {
        (void)decode_one(input);
    } catch (const DecodeError& e) {
        return e.offset();
    }
    return static_cast<size_t>(-1);
}

std::string nested_arrays(size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// decode_one
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DecodeOne, Scalars) {
    EXPECT_TRUE(decode_one("null").is_null());
    EXPECT_TRUE(decode_one("true").as_bool());
    EXPECT_FALSE(decode_one("false").as_bool());
    EXPECT_EQ(decode_one("42").as_integer(), 42);
    EXPECT_DOUBLE_EQ(decode_one("-1.25").as_float(), -1.25);
    EXPECT_EQ(decode_one(R"("hi")").as_string(), "hi");
}

TEST(DecodeOne, Containers) {
    auto doc = decode_one(R"({"a": [1, 2, {"b": null}], "c": "d"})");
    ASSERT_TRUE(doc.is_object());
    EXPECT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc["a"].size(), 3u);
    EXPECT_TRUE(doc["a"][2]["b"].is_null());
    EXPECT_EQ(doc["c"].as_string(), "d");
}

TEST(DecodeOne, SurroundingWhitespace) {
    EXPECT_EQ(decode_one(" \t\r\n[1] \n").size(), 1u);
}

TEST(DecodeOne, DuplicateKeysLastWins) {
    auto doc = decode_one(R"({"a": 1, "b": 2, "a": 3})");
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc["a"].as_integer(), 3);
    const auto& storage = doc.as_object().storage();
    EXPECT_EQ(storage[0].first.view(), "b");
    EXPECT_EQ(storage[1].first.view(), "a");
}

TEST(DecodeOne, DuplicateKeysLastWinsLargeObject) {
    std::string text = "{";
    for (int i = 0; i < 20; ++i) {
        text += "\"k" + std::to_string(i) + "\": " + std::to_string(i) + ", ";
    }
    text += "\"k3\": 100, \"k17\": 200}";
    auto doc = decode_one(text);
    EXPECT_EQ(doc.size(), 20u);
    EXPECT_EQ(doc["k3"].as_integer(), 100);
    EXPECT_EQ(doc["k17"].as_integer(), 200);
    EXPECT_EQ(doc["k0"].as_integer(), 0);
    EXPECT_EQ(doc.as_object().storage().back().first.view(), "k17");
}

TEST(DecodeOne, EscapesAndSurrogates) {
    auto doc = decode_one(R"(["a\"b\\c\/d", "\b\f\n\r\t", "\u00e9", "\ud83d\ude00"])");
    EXPECT_EQ(doc[0].as_string(), "a\"b\\c/d");
    EXPECT_EQ(doc[1].as_string(), "\b\f\n\r\t");
    EXPECT_EQ(doc[2].as_string(), "\xC3\xA9");
    EXPECT_EQ(doc[3].as_string(), "\xF0\x9F\x98\x80");
}

#if MJSON_ALLOW_INF_AND_NAN
TEST(DecodeOne, NonFiniteTokens) {
    auto doc = decode_one("[NaN, Infinity, -Infinity]");
    EXPECT_TRUE(std::isnan(doc[0].as_float()));
    EXPECT_EQ(doc[1].as_float(), HUGE_VAL);
    EXPECT_EQ(doc[2].as_float(), -HUGE_VAL);
}
#else
TEST(DecodeOne, NonFiniteTokensRejected) {
    for (std::string_view in : {"NaN", "Infinity", "[1, NaN]"}) {
        EXPECT_EQ(try_decode_one(in).ec, make_error_code(errc::unexpected_token)) << in;
    }
    EXPECT_EQ(try_decode_one("-Infinity").ec, make_error_code(errc::invalid_number));
    EXPECT_EQ(try_decode_next("NaN").ec, make_error_code(errc::unexpected_token));
}
#endif

TEST(DecodeOne, ByteOverloads) {
    const std::string text = R"({"x": 1})";
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(decode_one(bytes)["x"].as_integer(), 1);
    EXPECT_EQ(decode_one(text.data(), text.size())["x"].as_integer(), 1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Literal fast path
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FastPath, MatchesParserResult) {
    DecodeOptions opts;
    for (std::string_view lit : {"[]", "{}", "\"\""}) {
        JsonValue fast;
        ASSERT_TRUE(detail::decode_literal_fast_path(lit, fast)) << lit;
        EXPECT_EQ(fast, detail::Parser::parse_document(lit, opts)) << lit;
        EXPECT_EQ(decode_one(lit), decode_next(lit).value) << lit;
    }
}

TEST(FastPath, Types) {
    EXPECT_TRUE(decode_one("[]").is_array());
    EXPECT_TRUE(decode_one("[]").empty());
    EXPECT_TRUE(decode_one("{}").is_object());
    EXPECT_TRUE(decode_one("{}").empty());
    EXPECT_EQ(decode_one("\"\"").as_string_view(), "");
}

TEST(FastPath, OnlyExactTwoByteInputs) {
    JsonValue out;
    EXPECT_FALSE(detail::decode_literal_fast_path("[] ", out));
    EXPECT_FALSE(detail::decode_literal_fast_path(" []", out));
    EXPECT_FALSE(detail::decode_literal_fast_path("[1]", out));
    EXPECT_FALSE(detail::decode_literal_fast_path("[}", out));
    EXPECT_FALSE(detail::decode_literal_fast_path("12", out));

    // Longer inputs holding the literals still decode through the parser.
    EXPECT_TRUE(decode_one(" [] ").is_array());
    EXPECT_TRUE(decode_one("{ }").is_object());
}

TEST(FastPath, InvalidTwoByteInputs) {
    EXPECT_EQ(decode_error_code("[}"), errc::unexpected_token);
    EXPECT_EQ(decode_error_code("{]"), errc::unexpected_token);
    EXPECT_EQ(decode_error_code("\"a"), errc::unterminated_value);
}

TEST(FastPath, DecodeNextReportsTwoBytes) {
    auto r = decode_next("[]");
    EXPECT_TRUE(r.value.is_array());
    EXPECT_EQ(r.bytes_consumed, 2u);

    r = decode_next("{}[]");
    EXPECT_TRUE(r.value.is_object());
    EXPECT_EQ(r.bytes_consumed, 2u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// decode_next
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DecodeNext, StopsAfterFirstValue) {
    auto r = decode_next("123 456");
    EXPECT_EQ(r.value.as_integer(), 123);
    EXPECT_EQ(r.bytes_consumed, 3u);
}

TEST(DecodeNext, LeadingWhitespaceCounts) {
    auto r = decode_next(" 456");
    EXPECT_EQ(r.value.as_integer(), 456);
    EXPECT_EQ(r.bytes_consumed, 4u);

    r = decode_next("456");
    EXPECT_EQ(r.bytes_consumed, 3u);
}

TEST(DecodeNext, TrailingBytesNotConsumed) {
    auto r = decode_next("42extra");
    EXPECT_EQ(r.value.as_integer(), 42);
    EXPECT_EQ(r.bytes_consumed, 2u);

    r = decode_next("3.14extra");
    EXPECT_DOUBLE_EQ(r.value.as_float(), 3.14);
    EXPECT_EQ(r.bytes_consumed, 4u);

    r = decode_next("true\n");
    EXPECT_TRUE(r.value.as_bool());
    EXPECT_EQ(r.bytes_consumed, 4u);
}

TEST(DecodeNext, ExponentNeedsDigits) {
    auto r = decode_next("7ex");
    EXPECT_EQ(r.value.as_integer(), 7);
    EXPECT_EQ(r.bytes_consumed, 1u);

    r = decode_next("2e-x");
    EXPECT_EQ(r.value.as_integer(), 2);
    EXPECT_EQ(r.bytes_consumed, 1u);

    r = decode_next("1E5x");
    EXPECT_DOUBLE_EQ(r.value.as_float(), 100000.0);
    EXPECT_EQ(r.bytes_consumed, 3u);

    // Input ending inside the exponent is still truncated.
    EXPECT_EQ(try_decode_next("7e").ec, make_error_code(errc::unterminated_value));
    EXPECT_EQ(try_decode_next("7e+").ec, make_error_code(errc::unterminated_value));

    // A whole document still rejects the malformed exponent.
    EXPECT_EQ(try_decode_one("42extra").ec, make_error_code(errc::invalid_number));
}

TEST(DecodeNext, WalkConcatenatedValues) {
    const std::string buf = R"({"a": [1, 2]} "s" 3.5 null)";
    std::vector<JsonValue> values;
    size_t pos = 0;
    while (pos < buf.size()) {
        auto r = decode_next(std::string_view(buf).substr(pos));
        ASSERT_GT(r.bytes_consumed, 0u);
        pos += r.bytes_consumed;
        values.push_back(std::move(r.value));
    }
    ASSERT_EQ(values.size(), 4u);
    EXPECT_EQ(values[0]["a"][1].as_integer(), 2);
    EXPECT_EQ(values[1].as_string(), "s");
    EXPECT_DOUBLE_EQ(values[2].as_float(), 3.5);
    EXPECT_TRUE(values[3].is_null());
}

TEST(DecodeNext, ConsumedMatchesNestedValueLength) {
    const std::string value = R"({"a": {"b": [1, 2, {"c": 3}]}})";
    auto r = decode_next(value + "\n{}");
    EXPECT_EQ(r.bytes_consumed, value.size());
}

TEST(DecodeNext, DeeplyNestedThenMore) {
    const std::string value = R"({"a": {"b": {"c": [1, 2, 3]}}})";
    auto r = decode_next(value + "more");
    EXPECT_EQ(r.bytes_consumed, 30u);
    EXPECT_EQ(r.bytes_consumed, value.size());
    EXPECT_EQ(r.value["a"]["b"]["c"][2].as_integer(), 3);
}

TEST(DecodeNext, MultiByteUtf8CountsBytes) {
    const std::string value = "{\"emoji\": \"\xF0\x9F\x8E\x89\"}";
    auto r = decode_next(value);
    EXPECT_EQ(r.bytes_consumed, 17u);
    EXPECT_EQ(r.value["emoji"].as_string(), "\xF0\x9F\x8E\x89");

    r = decode_next(value + "\n[]");
    EXPECT_EQ(r.bytes_consumed, value.size());
}

TEST(DecodeNext, EmptyOrWhitespaceOnly) {
    for (std::string_view in : {"", " ", " \n\t "}) {
        try {
            (void)decode_next(in);
            FAIL() << "expected DecodeError for \"" << in << "\"";
        } catch (const DecodeError& e) {
            EXPECT_EQ(e.code(), make_error_code(errc::unterminated_value));
        }
    }
}

TEST(DecodeNext, TruncatedValue) {
    auto r = try_decode_next(R"({"a": [1, 2)");
    EXPECT_EQ(r.ec, make_error_code(errc::unterminated_value));
    r = try_decode_next("tru");
    EXPECT_EQ(r.ec, make_error_code(errc::unterminated_value));
}

TEST(DecodeNext, ByteOverloads) {
    const std::string text = "[1] [2]";
    auto r = decode_next(text.data(), text.size());
    EXPECT_EQ(r.bytes_consumed, 3u);
    std::vector<uint8_t> bytes(text.begin(), text.end());
    EXPECT_EQ(decode_next(bytes).value[0].as_integer(), 1);
}

// ═══════════════════════════════════════════════════════════════════════════════
// decode_each
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DecodeEach, NewlineDelimited) {
    const std::string ndjson = "{\"id\": 1}\n{\"id\": 2}\n\n{\"id\": 3}\n";
    std::vector<int64_t> ids;
    const size_t n = decode_each(ndjson, [&ids](JsonValue&& row) {
        ids.push_back(row["id"].as_integer());
    });
    EXPECT_EQ(n, 3u);
    EXPECT_EQ(ids, (std::vector<int64_t>{1, 2, 3}));
}

TEST(DecodeEach, EmptyInputDecodesNothing) {
    int calls = 0;
    EXPECT_EQ(decode_each("", [&calls](JsonValue&&) { ++calls; }), 0u);
    EXPECT_EQ(decode_each(" \n ", [&calls](JsonValue&&) { ++calls; }), 0u);
    EXPECT_EQ(calls, 0);
}

TEST(DecodeEach, ErrorOffsetIsRelativeToBuffer) {
    const std::string buf = "[1]\n[2,]\n";
    int calls = 0;
    try {
        (void)decode_each(buf, [&calls](JsonValue&&) { ++calls; });
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(calls, 1);
        EXPECT_EQ(e.offset(), 7u);
        EXPECT_EQ(e.location().line, 2u);
    }
}

// ═══════════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(DecodeErrors, Codes) {
    EXPECT_EQ(decode_error_code(""), errc::unterminated_value);
    EXPECT_EQ(decode_error_code("[1, 2"), errc::unterminated_value);
    EXPECT_EQ(decode_error_code("\"abc"), errc::unterminated_value);
    EXPECT_EQ(decode_error_code("[1,]"), errc::unexpected_token);
    EXPECT_EQ(decode_error_code("{\"a\" 1}"), errc::unexpected_token);
    EXPECT_EQ(decode_error_code("nul!"), errc::unexpected_token);
    EXPECT_EQ(decode_error_code("1 2"), errc::trailing_data);
    EXPECT_EQ(decode_error_code("{} x"), errc::trailing_data);
    EXPECT_EQ(decode_error_code("01"), errc::trailing_data);
    EXPECT_EQ(decode_error_code("1."), errc::unterminated_value);
    EXPECT_EQ(decode_error_code("1.x"), errc::invalid_number);
    EXPECT_EQ(decode_error_code("-x"), errc::invalid_number);
    EXPECT_EQ(decode_error_code("1e+]"), errc::invalid_number);
    EXPECT_EQ(decode_error_code(R"("\x")"), errc::invalid_escape);
    EXPECT_EQ(decode_error_code(R"("\u12G4")"), errc::invalid_escape);
    EXPECT_EQ(decode_error_code("\"a\nb\""), errc::unexpected_token);
}

TEST(DecodeErrors, Offsets) {
    EXPECT_EQ(decode_error_offset("[1,]"), 3u);
    EXPECT_EQ(decode_error_offset("1 2"), 2u);
    EXPECT_EQ(decode_error_offset("{\"a\" 1}"), 5u);
}

TEST(DecodeErrors, LineAndColumn) {
    try {
        (void)decode_one("{\n  \"a\": 1,\n  \"b\": ?\n}");
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.location().line, 3u);
        EXPECT_EQ(e.location().column, 8u);
        EXPECT_NE(std::string(e.what()).find("line 3"), std::string::npos);
    }
}

TEST(DecodeErrors, InvalidUtf8ReportsOffset) {
    const std::string bad = std::string("[\"ok\", \"") + "\xC3\x28" + "\"]";
    try {
        (void)decode_one(bad);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::invalid_utf8));
        EXPECT_EQ(e.offset(), 8u);
    }
}

TEST(DecodeErrors, Utf8CheckCanBeDisabled) {
    DecodeOptions opts;
    opts.validate_utf8 = false;
    const std::string raw = std::string("\"") + "\xFF" + "\"";
    EXPECT_EQ(decode_one(raw, opts).as_string_view().size(), 1u);
    EXPECT_EQ(decode_error_code(raw), errc::invalid_utf8);
}

TEST(DecodeErrors, NullBufferWithSize) {
    try {
        (void)decode_one(nullptr, 4);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::invalid_input));
    }
    // A null pointer with zero size is just empty input.
    try {
        (void)decode_one(nullptr, 0);
        FAIL() << "expected DecodeError";
    } catch (const DecodeError& e) {
        EXPECT_EQ(e.code(), make_error_code(errc::unterminated_value));
    }
}

TEST(DecodeErrors, MaxDepth) {
    DecodeOptions opts;
    opts.max_depth = 3;
    EXPECT_NO_THROW((void)decode_one(nested_arrays(3), opts));
    EXPECT_EQ(decode_error_code(nested_arrays(4), opts), errc::max_depth_exceeded);
    EXPECT_EQ(decode_error_code(R"({"a": {"b": {"c": {}}}})", opts),
              errc::max_depth_exceeded);

    EXPECT_NO_THROW((void)decode_one(nested_arrays(MJSON_MAX_DEPTH)));
    EXPECT_EQ(decode_error_code(nested_arrays(MJSON_MAX_DEPTH + 1)),
              errc::max_depth_exceeded);
}

TEST(DecodeErrors, ErrorCodeCategory) {
    const std::error_code ec = make_error_code(errc::trailing_data);
    EXPECT_STREQ(ec.category().name(), "mjson");
    EXPECT_FALSE(ec.message().empty());
}

// ═══════════════════════════════════════════════════════════════════════════════
// Exception-free variants
// ═══════════════════════════════════════════════════════════════════════════════

TEST(TryDecode, One) {
    auto ok = try_decode_one("[1, 2]");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value.size(), 2u);

    auto bad = try_decode_one("[1, 2");
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.ec, make_error_code(errc::unterminated_value));
    EXPECT_TRUE(bad.value.is_null());
}

TEST(TryDecode, Next) {
    auto ok = try_decode_next("7 8");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value.value.as_integer(), 7);
    EXPECT_EQ(ok.value.bytes_consumed, 1u);

    auto bad = try_decode_next("");
    EXPECT_FALSE(bad.has_value());
}
