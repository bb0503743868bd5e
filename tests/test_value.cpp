/// @file test_value.cpp
/// @brief Unit tests for mjson::JsonValue - constructors, types, access, mutation.

#include <mjson/mjson.hpp>

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

using namespace mjson;

// ═══════════════════════════════════════════════════════════════════════════════
// Constructors and type checking
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonValue, DefaultConstructorIsNull) {
    JsonValue v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.type(), Type::Null);
    EXPECT_TRUE(JsonValue(nullptr).is_null());
}

TEST(JsonValue, BoolConstructor) {
    JsonValue t(true);
    JsonValue f(false);
    EXPECT_TRUE(t.is_bool());
    EXPECT_TRUE(t.as_bool());
    EXPECT_FALSE(f.as_bool());
}

TEST(JsonValue, IntegerConstructors) {
    EXPECT_TRUE(JsonValue(42).is_integer());
    EXPECT_TRUE(JsonValue(int64_t(-5)).is_integer());
    EXPECT_TRUE(JsonValue(7u).is_integer());
    EXPECT_TRUE(JsonValue(uint64_t(7)).is_uinteger());
    EXPECT_TRUE(JsonValue(int128_t(1)).is_integer128());
    EXPECT_TRUE(JsonValue(uint128_t(1)).is_uinteger128());

    for (const JsonValue& v : {JsonValue(1), JsonValue(uint64_t(1)),
                               JsonValue(int128_t(1)), JsonValue(uint128_t(1))}) {
        EXPECT_TRUE(v.is_integral());
        EXPECT_TRUE(v.is_number());
        EXPECT_FALSE(v.is_float());
    }
}

TEST(JsonValue, FloatConstructor) {
    JsonValue v(3.14);
    EXPECT_TRUE(v.is_float());
    EXPECT_TRUE(v.is_number());
    EXPECT_FALSE(v.is_integral());
    EXPECT_DOUBLE_EQ(v.as_float(), 3.14);
}

TEST(JsonValue, StringConstructors) {
    JsonValue a("abc");
    JsonValue b(std::string("abc"));
    JsonValue c(std::string_view("abc"));
    JsonValue d(String::make("abc"));
    for (const JsonValue* v : {&a, &b, &c, &d}) {
        EXPECT_TRUE(v->is_string());
        EXPECT_EQ(v->as_string_view(), "abc");
    }
    EXPECT_EQ(a, d);
}

TEST(JsonValue, ContainerConstructors) {
    JsonValue arr(Array{1, "two", 3.0});
    EXPECT_TRUE(arr.is_array());
    EXPECT_EQ(arr.size(), 3u);

    JsonValue obj(Object{{"a", 1}, {"b", true}});
    EXPECT_TRUE(obj.is_object());
    EXPECT_EQ(obj.size(), 2u);

    EXPECT_TRUE(JsonValue::array().empty());
    EXPECT_TRUE(JsonValue::object().empty());
}

TEST(JsonValue, IsThirtyTwoBytes) {
    EXPECT_EQ(sizeof(JsonValue), 32u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Typed access
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonValue, IntegerWidening) {
    JsonValue small(int64_t(-3));
    EXPECT_TRUE(small.as_integer128() == -3);
    EXPECT_DOUBLE_EQ(small.as_float(), -3.0);

    JsonValue wide(int128_t(100));
    EXPECT_EQ(wide.as_integer(), 100);
    EXPECT_EQ(wide.as_uinteger(), 100u);

    JsonValue big(std::numeric_limits<uint64_t>::max());
    EXPECT_TRUE(big.as_uinteger128() == std::numeric_limits<uint64_t>::max());
    EXPECT_THROW((void)big.as_integer(), TypeError);
}

TEST(JsonValue, IntegerNarrowingOutOfRange) {
    EXPECT_THROW((void)JsonValue(-1).as_uinteger(), TypeError);
    EXPECT_THROW((void)JsonValue(-1).as_uinteger128(), TypeError);
    EXPECT_THROW((void)JsonValue(~uint128_t(0)).as_integer128(), TypeError);
    EXPECT_THROW((void)JsonValue(1.5).as_integer(), TypeError);
}

TEST(JsonValue, WrongTypeThrows) {
    JsonValue v("text");
    EXPECT_THROW((void)v.as_bool(), TypeError);
    EXPECT_THROW((void)v.as_float(), TypeError);
    EXPECT_THROW((void)v.as_array(), TypeError);
    EXPECT_THROW((void)v.as_object(), TypeError);
    EXPECT_THROW((void)JsonValue(1).as_string(), TypeError);

    try {
        (void)JsonValue(true).as_string_view();
        FAIL() << "expected TypeError";
    } catch (const TypeError& e) {
        EXPECT_NE(std::string(e.what()).find("bool"), std::string::npos);
    }
}

TEST(JsonValue, ArrayIndexing) {
    JsonValue arr(Array{10, 20});
    EXPECT_EQ(arr[0].as_integer(), 10);
    EXPECT_EQ(arr[size_t(1)].as_integer(), 20);
    EXPECT_THROW((void)arr[2], OutOfRangeError);

    const JsonValue& carr = arr;
    EXPECT_THROW((void)carr[5], OutOfRangeError);
}

TEST(JsonValue, ObjectLookup) {
    const JsonValue obj(Object{{"x", 1}, {"y", 2}});
    EXPECT_EQ(obj["x"].as_integer(), 1);
    EXPECT_TRUE(obj.contains("y"));
    EXPECT_FALSE(obj.contains("z"));
    EXPECT_EQ(obj.find("z"), nullptr);
    ASSERT_NE(obj.find("y"), nullptr);
    EXPECT_EQ(obj.find("y")->as_integer(), 2);
    EXPECT_THROW((void)obj["z"], OutOfRangeError);

    EXPECT_FALSE(JsonValue(1).contains("x"));
    EXPECT_EQ(JsonValue(1).find("x"), nullptr);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Mutation
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonValue, PushBack) {
    JsonValue arr = JsonValue::array();
    arr.push_back(1);
    arr.push_back("x");
    arr.push_back(JsonValue::object());
    EXPECT_EQ(arr.size(), 3u);
    EXPECT_TRUE(arr[2].is_object());
}

TEST(JsonValue, InsertReplacesInPlace) {
    JsonValue obj = JsonValue::object();
    obj.insert("a", 1);
    obj.insert("b", 2);
    obj.insert("a", 3);
    ASSERT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj["a"].as_integer(), 3);
    EXPECT_EQ(obj.as_object().storage().front().first.view(), "a");
}

TEST(JsonValue, SubscriptCreatesMember) {
    JsonValue obj = JsonValue::object();
    obj["new"] = "value";
    EXPECT_EQ(obj["new"].as_string(), "value");
}

TEST(JsonValue, EraseMember) {
    JsonValue obj(Object{{"a", 1}, {"b", 2}});
    EXPECT_TRUE(obj.as_object().erase("a"));
    EXPECT_FALSE(obj.as_object().erase("a"));
    EXPECT_EQ(obj.size(), 1u);
}

TEST(JsonValue, InitializerListLastWins) {
    Object obj{{"k", 1}, {"other", 0}, {"k", 2}};
    ASSERT_EQ(obj.size(), 2u);
    EXPECT_EQ(obj.at("k").as_integer(), 2);
    EXPECT_EQ(obj.storage().back().first.view(), "k");
}

TEST(JsonValue, LargeObjectUsesIndex) {
    JsonValue obj = JsonValue::object();
    for (int i = 0; i < 100; ++i) obj.insert("key" + std::to_string(i), i);
    EXPECT_EQ(obj.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(obj["key" + std::to_string(i)].as_integer(), i);
    }
    EXPECT_TRUE(obj.as_object().erase("key50"));
    EXPECT_FALSE(obj.contains("key50"));
    EXPECT_TRUE(obj.contains("key99"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Copy / move / equality
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonValue, CopyIsDeep) {
    JsonValue a(Array{1, 2});
    JsonValue b = a;
    b.push_back(3);
    EXPECT_EQ(a.size(), 2u);
    EXPECT_EQ(b.size(), 3u);
}

TEST(JsonValue, CopySharesStringStorage) {
    JsonValue a("shared text");
    JsonValue b = a;
    EXPECT_TRUE(a.as_string_handle().same_instance(b.as_string_handle()));
}

TEST(JsonValue, MoveLeavesNull) {
    JsonValue a(Array{1});
    JsonValue b = std::move(a);
    EXPECT_TRUE(b.is_array());
    EXPECT_TRUE(a.is_null());  // NOLINT(bugprone-use-after-move)
}

TEST(JsonValue, Swap) {
    JsonValue a(1);
    JsonValue b("x");
    a.swap(b);
    EXPECT_TRUE(a.is_string());
    EXPECT_EQ(b.as_integer(), 1);
}

TEST(JsonValue, NumericEqualityAcrossWidths) {
    EXPECT_EQ(JsonValue(5), JsonValue(uint64_t(5)));
    EXPECT_EQ(JsonValue(int128_t(-5)), JsonValue(-5));
    EXPECT_EQ(JsonValue(2), JsonValue(2.0));
    EXPECT_NE(JsonValue(-1), JsonValue(uint128_t(~uint128_t(0))));
}

TEST(JsonValue, ObjectEqualityIgnoresOrder) {
    EXPECT_EQ(JsonValue(Object{{"a", 1}, {"b", 2}}),
              JsonValue(Object{{"b", 2}, {"a", 1}}));
    EXPECT_NE(JsonValue(Object{{"a", 1}}), JsonValue(Object{{"a", 2}}));
    EXPECT_NE(JsonValue(Array{1, 2}), JsonValue(Array{2, 1}));
    EXPECT_NE(JsonValue("1"), JsonValue(1));
}

TEST(JsonValue, DumpMatchesEncode) {
    JsonValue v(Object{{"b", 1}, {"a", Array{true, nullptr}}});
    EXPECT_EQ(v.dump(), encode(v));
    EXPECT_EQ(v.dump(OPT_SORT_KEYS), R"({"a":[true,null],"b":1})");
}
