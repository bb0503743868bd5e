#pragma once

/// @file value.hpp
/// @brief Library core: JsonValue, a tagged union over the decoded value model.
///
/// Implementation:
///   - 32-byte tagged union: null, bool, int64, uint64, int128, uint128,
///     double, string, array, object
///   - Strings are shared, reference-counted String storage; copying a
///     string value acquires a reference instead of duplicating bytes
///   - Arrays and objects are uniquely owned heap blocks (deep copy)
///   - Manual resource management (copy/move/destroy)
///   - Numeric equality is exact across all integer widths

#include "config.hpp"
#include "error.hpp"
#include "fwd.hpp"
#include "string.hpp"

#include <cmath>
#include <cstring>
#include <limits>
#include <new>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace mjson {

class JsonValue {
    friend class detail::Parser;
public:
    JsonValue() noexcept : kind_(Type::Null) { u_.u128 = 0; }
    JsonValue(std::nullptr_t) noexcept : JsonValue() {}
    JsonValue(bool v) noexcept : kind_(Type::Bool) { u_.u128 = 0; u_.b = v; }

    JsonValue(int v) noexcept : kind_(Type::Integer) { u_.u128 = 0; u_.i = v; }
    JsonValue(long v) noexcept : kind_(Type::Integer) { u_.u128 = 0; u_.i = v; }
    JsonValue(long long v) noexcept : kind_(Type::Integer) { u_.u128 = 0; u_.i = v; }
    JsonValue(unsigned v) noexcept : kind_(Type::Integer) { u_.u128 = 0; u_.i = v; }
    JsonValue(unsigned long v) noexcept : kind_(Type::UInteger) { u_.u128 = 0; u_.u = v; }
    JsonValue(unsigned long long v) noexcept : kind_(Type::UInteger) { u_.u128 = 0; u_.u = v; }
    JsonValue(int128_t v) noexcept : kind_(Type::Integer128) { u_.i128 = v; }
    JsonValue(uint128_t v) noexcept : kind_(Type::UInteger128) { u_.u128 = v; }
    JsonValue(double v) noexcept : kind_(Type::Float) { u_.u128 = 0; u_.d = v; }

    JsonValue(const char* v) : JsonValue() {
        if (MJSON_UNLIKELY(!v)) return;
        init_string(String::make(v));
    }
    JsonValue(std::string_view v) : JsonValue() { init_string(String::make(v)); }
    JsonValue(const std::string& v) : JsonValue() { init_string(String::make(v)); }
    JsonValue(String v) : JsonValue() { init_string(std::move(v)); }

    JsonValue(const Array& v) : kind_(Type::Array) { u_.u128 = 0; u_.arr = new Array(v); }
    JsonValue(Array&& v) : kind_(Type::Array) { u_.u128 = 0; u_.arr = new Array(std::move(v)); }
    JsonValue(const Object& v) : kind_(Type::Object) { u_.u128 = 0; u_.obj = new Object(v); }
    JsonValue(Object&& v) : kind_(Type::Object) { u_.u128 = 0; u_.obj = new Object(std::move(v)); }

    JsonValue(const JsonValue& o) : kind_(o.kind_) { copy_payload(o); }
    JsonValue(JsonValue&& o) noexcept : kind_(o.kind_) {
        std::memcpy(&u_, &o.u_, sizeof(u_));
        o.kind_ = Type::Null;  // destroy() of the source becomes a no-op
    }
    JsonValue& operator=(const JsonValue& o) {
        if (this != &o) { JsonValue tmp(o); swap(tmp); }
        return *this;
    }
    JsonValue& operator=(JsonValue&& o) noexcept {
        if (this != &o) {
            destroy();
            kind_ = o.kind_;
            std::memcpy(&u_, &o.u_, sizeof(u_));
            o.kind_ = Type::Null;
        }
        return *this;
    }
    ~JsonValue() { destroy(); }

    void swap(JsonValue& o) noexcept {
        std::swap(kind_, o.kind_);
        Payload tmp;
        std::memcpy(&tmp, &u_, sizeof(u_));
        std::memcpy(&u_, &o.u_, sizeof(u_));
        std::memcpy(&o.u_, &tmp, sizeof(u_));
    }

    /// Freshly allocated empty containers (containers are never shared).
    [[nodiscard]] static JsonValue array() { return JsonValue(Array()); }
    [[nodiscard]] static JsonValue object() { return JsonValue(Object()); }

    [[nodiscard]] Type type() const noexcept { return kind_; }
    [[nodiscard]] bool is_null()        const noexcept { return kind_ == Type::Null; }
    [[nodiscard]] bool is_bool()        const noexcept { return kind_ == Type::Bool; }
    [[nodiscard]] bool is_integer()     const noexcept { return kind_ == Type::Integer; }
    [[nodiscard]] bool is_uinteger()    const noexcept { return kind_ == Type::UInteger; }
    [[nodiscard]] bool is_integer128()  const noexcept { return kind_ == Type::Integer128; }
    [[nodiscard]] bool is_uinteger128() const noexcept { return kind_ == Type::UInteger128; }
    [[nodiscard]] bool is_float()       const noexcept { return kind_ == Type::Float; }
    [[nodiscard]] bool is_string()      const noexcept { return kind_ == Type::String; }
    [[nodiscard]] bool is_array()       const noexcept { return kind_ == Type::Array; }
    [[nodiscard]] bool is_object()      const noexcept { return kind_ == Type::Object; }
    [[nodiscard]] bool is_integral() const noexcept {
        return is_integer() || is_uinteger() || is_integer128() || is_uinteger128();
    }
    [[nodiscard]] bool is_number() const noexcept { return is_integral() || is_float(); }

    bool as_bool() const {
        if (MJSON_UNLIKELY(!is_bool())) type_error("bool");
        return u_.b;
    }
    int64_t as_integer() const {
        if (is_integer()) return u_.i;
        IntRepr r = int_repr();
        if (is_integral()) {
            constexpr uint128_t kMaxPos = static_cast<uint128_t>(INT64_MAX);
            if (!r.negative && r.magnitude <= kMaxPos)
                return static_cast<int64_t>(r.magnitude);
            if (r.negative && r.magnitude <= kMaxPos + 1)
                return static_cast<int64_t>(-static_cast<int128_t>(r.magnitude));
        }
        type_error("integer");
    }
    uint64_t as_uinteger() const {
        if (is_uinteger()) return u_.u;
        IntRepr r = int_repr();
        if (is_integral() && !r.negative && r.magnitude <= UINT64_MAX)
            return static_cast<uint64_t>(r.magnitude);
        type_error("uinteger");
    }
    int128_t as_integer128() const {
        if (is_integral()) {
            IntRepr r = int_repr();
            constexpr uint128_t kMaxPos = static_cast<uint128_t>(-1) >> 1;
            if (!r.negative && r.magnitude <= kMaxPos)
                return static_cast<int128_t>(r.magnitude);
            if (r.negative && r.magnitude <= kMaxPos + 1)
                return static_cast<int128_t>(uint128_t(0) - r.magnitude);
        }
        type_error("integer128");
    }
    uint128_t as_uinteger128() const {
        if (is_integral()) {
            IntRepr r = int_repr();
            if (!r.negative || r.magnitude == 0) return r.magnitude;
        }
        type_error("uinteger128");
    }
    double as_float() const {
        switch (kind_) {
            case Type::Float:       return u_.d;
            case Type::Integer:     return static_cast<double>(u_.i);
            case Type::UInteger:    return static_cast<double>(u_.u);
            case Type::Integer128:  return static_cast<double>(u_.i128);
            case Type::UInteger128: return static_cast<double>(u_.u128);
            default: break;
        }
        type_error("number");
    }

    [[nodiscard]] std::string_view as_string_view() const {
        if (MJSON_UNLIKELY(!is_string())) type_error("string");
        return std::string_view(u_.str->text);
    }
    [[nodiscard]] std::string as_string() const {
        return std::string(as_string_view());
    }
    /// @brief Shared handle to the string storage (acquires a reference).
    [[nodiscard]] String as_string_handle() const {
        if (MJSON_UNLIKELY(!is_string())) type_error("string");
        detail::retain(u_.str);
        return String(u_.str, String::adopt);
    }

    [[nodiscard]] const Array& as_array() const {
        if (MJSON_UNLIKELY(!is_array())) type_error("array");
        return *u_.arr;
    }
    Array& as_array() {
        if (MJSON_UNLIKELY(!is_array())) type_error("array");
        return *u_.arr;
    }
    [[nodiscard]] const Object& as_object() const {
        if (MJSON_UNLIKELY(!is_object())) type_error("object");
        return *u_.obj;
    }
    Object& as_object() {
        if (MJSON_UNLIKELY(!is_object())) type_error("object");
        return *u_.obj;
    }

    JsonValue& operator[](size_t index) {
        auto& a = as_array();
        if (MJSON_UNLIKELY(index >= a.size())) index_error(index, a.size());
        return a[index];
    }
    const JsonValue& operator[](size_t index) const {
        const auto& a = as_array();
        if (MJSON_UNLIKELY(index >= a.size())) index_error(index, a.size());
        return a[index];
    }
    JsonValue& operator[](int index) { return operator[](static_cast<size_t>(index)); }
    const JsonValue& operator[](int index) const { return operator[](static_cast<size_t>(index)); }

    JsonValue& operator[](std::string_view key) { return as_object()[key]; }
    const JsonValue& operator[](std::string_view key) const { return as_object().at(key); }
    JsonValue& operator[](const char* key) { return operator[](std::string_view(key)); }
    const JsonValue& operator[](const char* key) const { return operator[](std::string_view(key)); }

    [[nodiscard]] bool contains(std::string_view key) const {
        return is_object() && u_.obj->contains(key);
    }
    [[nodiscard]] const JsonValue* find(std::string_view key) const {
        return is_object() ? u_.obj->find(key) : nullptr;
    }

    [[nodiscard]] size_t size() const noexcept {
        if (is_array())  return u_.arr->size();
        if (is_object()) return u_.obj->size();
        return 0;
    }
    [[nodiscard]] bool empty() const noexcept {
        if (is_null()) return true;
        if (is_array())  return u_.arr->empty();
        if (is_object()) return u_.obj->empty();
        if (is_string()) return u_.str->text.empty();
        return false;
    }

    void push_back(JsonValue v) { as_array().push_back(std::move(v)); }
    void insert(std::string_view key, JsonValue v) {
        as_object().insert(String::make_key(key), std::move(v));
    }

    [[nodiscard]] bool operator==(const JsonValue& other) const {
        if (is_integral() && other.is_integral()) {
            const IntRepr a = int_repr(), b = other.int_repr();
            return a.magnitude == b.magnitude &&
                   (a.negative == b.negative || a.magnitude == 0);
        }
        if (kind_ != other.kind_) {
            if (is_number() && other.is_number()) return as_float() == other.as_float();
            return false;
        }
        switch (kind_) {
            case Type::Null:   return true;
            case Type::Bool:   return u_.b == other.u_.b;
            case Type::Float:  return u_.d == other.u_.d;
            case Type::String:
                return u_.str == other.u_.str || u_.str->text == other.u_.str->text;
            case Type::Array:  return *u_.arr == *other.u_.arr;
            case Type::Object: return *u_.obj == *other.u_.obj;
            default:           return false;
        }
    }
    [[nodiscard]] bool operator!=(const JsonValue& other) const { return !(*this == other); }

    /// Serialize with encode option flags (see options.hpp).
    [[nodiscard]] std::string dump(uint32_t opts = 0) const;

private:
    Type kind_;
    union Payload {
        bool b;
        int64_t i;
        uint64_t u;
        int128_t i128;
        uint128_t u128;
        double d;
        detail::StringRep* str;
        Array* arr;
        Object* obj;
    } u_;

    /// Sign + magnitude view of any integer payload.
    struct IntRepr {
        bool negative = false;
        uint128_t magnitude = 0;
    };

    IntRepr int_repr() const noexcept {
        IntRepr r;
        switch (kind_) {
            case Type::Integer:
                r.negative = u_.i < 0;
                r.magnitude = r.negative ? uint128_t(0) - static_cast<uint128_t>(static_cast<int128_t>(u_.i))
                                         : static_cast<uint128_t>(u_.i);
                break;
            case Type::UInteger:
                r.magnitude = u_.u;
                break;
            case Type::Integer128:
                r.negative = u_.i128 < 0;
                r.magnitude = r.negative ? uint128_t(0) - static_cast<uint128_t>(u_.i128)
                                         : static_cast<uint128_t>(u_.i128);
                break;
            case Type::UInteger128:
                r.magnitude = u_.u128;
                break;
            default:
                break;
        }
        return r;
    }

    void init_string(String s) {
        if (MJSON_UNLIKELY(s.rep() == nullptr)) s = String();  // moved-from handle
        kind_ = Type::String;
        u_.str = s.release();
    }

    [[noreturn]] MJSON_NOINLINE void type_error(const char* expected) const {
        throw TypeError(std::string("expected ") + expected + ", got " + type_name(kind_));
    }

    [[noreturn]] MJSON_NOINLINE static void index_error(size_t index, size_t size) {
        throw OutOfRangeError("array index " + std::to_string(index) +
                              " out of range (size=" + std::to_string(size) + ")");
    }

    void copy_payload(const JsonValue& o) {
        switch (o.kind_) {
            case Type::String:
                detail::retain(o.u_.str);
                u_.str = o.u_.str;
                break;
            case Type::Array:
                u_.u128 = 0;
                u_.arr = new Array(*o.u_.arr);
                break;
            case Type::Object:
                u_.u128 = 0;
                u_.obj = new Object(*o.u_.obj);
                break;
            default:
                std::memcpy(&u_, &o.u_, sizeof(u_));
                break;
        }
    }

    void destroy() noexcept {
        switch (kind_) {
            case Type::String: detail::release(u_.str); break;
            case Type::Array:  delete u_.arr; break;
            case Type::Object: delete u_.obj; break;
            default: break;
        }
    }
};

static_assert(sizeof(JsonValue) == 32, "JsonValue must be exactly 32 bytes");

// ─── Object member functions ─────────────────────────────────────────────

inline Object::~Object() = default;
inline Object::Object(const Object& o) : entries(o.entries) {}
inline Object::Object(Object&& o) noexcept
    : entries(std::move(o.entries)), index_(std::move(o.index_)) {}
inline Object& Object::operator=(const Object& o) {
    if (this != &o) { entries = o.entries; index_.reset(); }
    return *this;
}
inline Object& Object::operator=(Object&& o) noexcept {
    if (this != &o) { entries = std::move(o.entries); index_ = std::move(o.index_); }
    return *this;
}
inline Object::Object(std::initializer_list<std::pair<std::string_view, JsonValue>> init) {
    entries.reserve(init.size());
    for (const auto& [k, v] : init) entries.emplace_back(String::make_key(k), v);
    dedup_last_wins();
}

inline void Object::ensure_index() const { if (use_index() && !index_) rebuild_index(); }
inline void Object::rebuild_index() const {
    if (!index_) index_ = std::make_unique<index_type>(entries.size() * 2);
    else         index_->clear();
    for (size_type i = 0; i < entries.size(); ++i)
        (*index_)[entries[i].first.view()] = i;
}

inline JsonValue* Object::find(std::string_view key) {
    const auto* self = this;
    return const_cast<JsonValue*>(self->find(key));
}
inline const JsonValue* Object::find(std::string_view key) const {
    if (use_index()) {
        ensure_index();
        auto it = index_->find(key);
        return it != index_->end() ? &entries[it->second].second : nullptr;
    }
    for (const auto& [k, v] : entries) if (k.view() == key) return &v;
    return nullptr;
}
inline const JsonValue& Object::at(std::string_view key) const {
    const auto* p = find(key);
    if (MJSON_UNLIKELY(!p)) throw OutOfRangeError("key not found: \"" + std::string(key) + "\"");
    return *p;
}
inline JsonValue& Object::operator[](std::string_view key) {
    if (auto* p = find(key)) return *p;
    entries.emplace_back(String::make_key(key), JsonValue{});
    index_.reset();
    return entries.back().second;
}
inline void Object::insert(Key key, JsonValue value) {
    if (auto* p = find(key.view())) {
        *p = std::move(value);
        return;
    }
    entries.emplace_back(std::move(key), std::move(value));
    index_.reset();
}
inline bool Object::erase(std::string_view key) {
    for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->first.view() == key) {
            entries.erase(it);
            index_.reset();
            return true;
        }
    }
    return false;
}
inline void Object::dedup_last_wins() {
    const size_type n = entries.size();
    if (n < 2) return;
    if (n >= kIndexThreshold) {
        // Forward pass: the index ends up pointing at each key's last slot.
        rebuild_index();
        if (index_->size() == n) return;
        // Decide survivors before moving anything: the index keys view the
        // storage of whichever duplicate was seen first.
        std::vector<bool> keep(n);
        for (size_type i = 0; i < n; ++i)
            keep[i] = index_->find(entries[i].first.view())->second == i;
        index_->clear();
        size_type write = 0;
        for (size_type i = 0; i < n; ++i) {
            if (keep[i]) {
                if (write != i) entries[write] = std::move(entries[i]);
                ++write;
            }
        }
        entries.resize(write);
        rebuild_index();
        return;
    }
    for (size_type i = 0; i < entries.size(); ) {
        bool has_later_dup = false;
        for (size_type j = i + 1; j < entries.size(); ++j) {
            if (entries[i].first == entries[j].first) { has_later_dup = true; break; }
        }
        if (MJSON_UNLIKELY(has_later_dup)) entries.erase(entries.begin() + static_cast<ptrdiff_t>(i));
        else ++i;
    }
}
inline bool Object::operator==(const Object& other) const {
    if (size() != other.size()) return false;
    // Member order does not take part in JSON object equality.
    for (const auto& [key, val] : entries) {
        const auto* p = other.find(key.view());
        if (!p || *p != val) return false;
    }
    return true;
}

} // namespace mjson

// The singleton registry owns the canonical empty string that String()
// hands out; it needs JsonValue complete, so it is pulled in last.
#include "singletons.hpp"
