/// @file test_float_serializer.cpp
/// @brief Unit tests for FloatSerializer and the non-finite value policy.

#include <mjson/mjson.hpp>

#include <gtest/gtest.h>

#include <cmath>
#include <cstring>
#include <limits>
#include <string>

using namespace mjson;

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();
constexpr double kInf = std::numeric_limits<double>::infinity();

double reparse(const std::string& text) {
    return decode_one(text).as_float();
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Finite values
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FloatSerializer, IntegralValuesKeepPoint) {
    EXPECT_EQ(FloatSerializer::to_string(0.0), "0.0");
    EXPECT_EQ(FloatSerializer::to_string(1.0), "1.0");
    EXPECT_EQ(FloatSerializer::to_string(-42.0), "-42.0");
    EXPECT_EQ(FloatSerializer::to_string(9007199254740992.0), "9007199254740992.0");
}

TEST(FloatSerializer, NegativeZero) {
    EXPECT_EQ(FloatSerializer::to_string(-0.0), "-0.0");
    EXPECT_TRUE(std::signbit(reparse("-0.0")));
}

TEST(FloatSerializer, ShortestForm) {
    EXPECT_EQ(FloatSerializer::to_string(0.1), "0.1");
    EXPECT_EQ(FloatSerializer::to_string(1.5), "1.5");
    EXPECT_EQ(FloatSerializer::to_string(-3.25), "-3.25");
    EXPECT_EQ(FloatSerializer::to_string(0.30000000000000004), "0.30000000000000004");
}

TEST(FloatSerializer, LargeAndSmallMagnitudesRoundTrip) {
    const double values[] = {
        1e16, 1e21, 1.7976931348623157e308, 2.2250738585072014e-308,
        5e-324, 1e-7, 123456.789e-20, 6.02214076e23,
    };
    for (double v : values) {
        const std::string text = FloatSerializer::to_string(v);
        EXPECT_EQ(reparse(text), v) << text;
        EXPECT_NE(text.find_first_of(".e"), std::string::npos) << text;
    }
}

TEST(FloatSerializer, WriteReturnsLength) {
    char buf[FloatSerializer::kBufferSize];
    const size_t n = FloatSerializer::write(buf, -1.7976931348623157e308, 0);
    ASSERT_LE(n, FloatSerializer::kBufferSize);
    EXPECT_EQ(reparse(std::string(buf, n)), -1.7976931348623157e308);
}

TEST(FloatSerializer, PolicyIgnoredForFiniteValues) {
    EXPECT_EQ(FloatSerializer::to_string(2.5, OPT_SANITIZE_NAN), "2.5");
    EXPECT_EQ(FloatSerializer::to_string(2.5, OPT_DISALLOW_NAN), "2.5");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Non-finite policy
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FloatSerializer, PolicyBitsProduceNull) {
    for (OptionFlags opts : {OPT_SANITIZE_NAN, OPT_DISALLOW_NAN, OPT_NONFINITE_AS_NULL}) {
        EXPECT_TRUE(FloatSerializer::nonfinite_as_null(opts));
        EXPECT_EQ(FloatSerializer::to_string(kNaN, opts), "null");
        EXPECT_EQ(FloatSerializer::to_string(kInf, opts), "null");
        EXPECT_EQ(FloatSerializer::to_string(-kInf, opts), "null");
    }
    EXPECT_FALSE(FloatSerializer::nonfinite_as_null(0));
    EXPECT_FALSE(FloatSerializer::nonfinite_as_null(OPT_INDENT_2 | OPT_SORT_KEYS));
}

#if MJSON_ALLOW_INF_AND_NAN

TEST(FloatSerializer, DefaultWritesTokens) {
    EXPECT_EQ(FloatSerializer::to_string(kNaN), "NaN");
    EXPECT_EQ(FloatSerializer::to_string(kInf), "Infinity");
    EXPECT_EQ(FloatSerializer::to_string(-kInf), "-Infinity");
}

TEST(FloatSerializer, TokensDecodeBack) {
    EXPECT_TRUE(std::isnan(reparse(encode(JsonValue(kNaN)))));
    EXPECT_EQ(reparse(encode(JsonValue(kInf))), kInf);
    EXPECT_EQ(reparse(encode(JsonValue(-kInf))), -kInf);
}

#else

TEST(FloatSerializer, StrictBuildThrows) {
    for (double v : {kNaN, kInf, -kInf}) {
        try {
            (void)FloatSerializer::to_string(v);
            FAIL() << "expected EncodeError";
        } catch (const EncodeError& e) {
            EXPECT_EQ(e.code(), make_error_code(errc::non_finite_float));
        }
    }
}

TEST(FloatSerializer, StrictBuildTryEncode) {
    auto r = try_encode(JsonValue(kNaN));
    EXPECT_EQ(r.ec, make_error_code(errc::non_finite_float));
    EXPECT_TRUE(r.value.empty());

    auto ok = try_encode(JsonValue(kNaN), OPT_SANITIZE_NAN);
    ASSERT_FALSE(ok.ec);
    EXPECT_EQ(ok.value, "null");
}

#endif

// ═══════════════════════════════════════════════════════════════════════════════
// Inside documents
// ═══════════════════════════════════════════════════════════════════════════════

TEST(FloatSerializerEncode, SanitizeInsideContainers) {
    JsonValue doc = JsonValue(Array{1.5, kNaN, -kInf});
    EXPECT_EQ(encode(doc, OPT_SANITIZE_NAN), "[1.5,null,null]");

    JsonValue obj = JsonValue(Object{{"value", kNaN}});
    EXPECT_EQ(encode(obj, OPT_DISALLOW_NAN), R"({"value":null})");
}

TEST(FloatSerializerEncode, SanitizeComposesWithIndent) {
    JsonValue obj = JsonValue(Object{{"value", kNaN}});
    EXPECT_EQ(encode(obj, OPT_INDENT_2 | OPT_SANITIZE_NAN), "{\n  \"value\": null\n}");
}
