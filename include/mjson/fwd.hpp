#pragma once

/// @file fwd.hpp
/// @brief Forward declarations and type aliases for mjson.

#include "config.hpp"
#include "detail/hash.hpp"
#include "string.hpp"

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mjson {

// ─── Forward declarations ───────────────────────────────────────────────
class JsonValue;
class KeyCache;
namespace detail { class Parser; }

// ─── 128-bit integers ───────────────────────────────────────────────────
__extension__ typedef __int128 int128_t;
__extension__ typedef unsigned __int128 uint128_t;

/// JSON value types
enum class Type : uint8_t {
    Null        = 0,
    Bool        = 1,
    Integer     = 2,
    UInteger    = 3,
    Integer128  = 4,
    UInteger128 = 5,
    Float       = 6,
    String      = 7,
    Array       = 8,
    Object      = 9
};

/// @brief Returns the string representation of a type.
inline const char* type_name(Type t) noexcept {
    switch (t) {
        case Type::Null:        return "null";
        case Type::Bool:        return "bool";
        case Type::Integer:     return "integer";
        case Type::UInteger:    return "uinteger";
        case Type::Integer128:  return "integer128";
        case Type::UInteger128: return "uinteger128";
        case Type::Float:       return "float";
        case Type::String:      return "string";
        case Type::Array:       return "array";
        case Type::Object:      return "object";
    }
    return "unknown";
}

// ─── Type aliases ───────────────────────────────────────────────────────

/// JSON array: ordered collection of values.
using Array = std::vector<JsonValue>;

/// @brief JSON object: insertion-ordered key-value pairs with unique keys.
///
/// Keys are shared String handles, usually coming straight out of the key
/// cache. Small objects are searched linearly; from kIndexThreshold entries
/// on, a hash index (string_view into the keys -> position) is built lazily
/// and dropped whenever the entry vector is restructured.
struct Object {
    using value_type = std::pair<Key, JsonValue>;
    using storage_type = std::vector<value_type>;
    using size_type = size_t;
    using index_type = std::unordered_map<std::string_view, size_type,
                                          detail::StringHash>;

    storage_type entries;
    mutable std::unique_ptr<index_type> index_;

    Object() = default;
    ~Object();
    Object(const Object&);
    Object(Object&&) noexcept;
    Object& operator=(const Object&);
    Object& operator=(Object&&) noexcept;

    /// Initializer-list constructor: {{"key", value}, ...}. Later duplicates win.
    Object(std::initializer_list<std::pair<std::string_view, JsonValue>> init);

    // ─── Capacity ────────────────────────────────────────────────────────
    bool empty() const noexcept { return entries.empty(); }
    size_type size() const noexcept { return entries.size(); }
    void reserve(size_type n) { entries.reserve(n); }

    // ─── Iterators ──────────────────────────────────────────────────────
    auto begin() noexcept { return entries.begin(); }
    auto end()   noexcept { return entries.end(); }
    auto begin()  const noexcept { return entries.begin(); }
    auto end()    const noexcept { return entries.end(); }

    // ─── Lookup / modification (defined in value.hpp) ───────────────────
    JsonValue* find(std::string_view key);
    const JsonValue* find(std::string_view key) const;
    bool contains(std::string_view key) const { return find(key) != nullptr; }
    const JsonValue& at(std::string_view key) const;
    JsonValue& operator[](std::string_view key);

    /// Insert or replace (last write wins, position of the existing entry kept).
    void insert(Key key, JsonValue value);
    bool erase(std::string_view key);

    void clear() noexcept {
        entries.clear();
        index_.reset();
    }

    bool operator==(const Object& other) const;
    bool operator!=(const Object& other) const { return !(*this == other); }

    const storage_type& storage() const noexcept { return entries; }

private:
    friend class detail::Parser;

    static constexpr size_type kIndexThreshold = 16;

    bool use_index() const noexcept { return entries.size() >= kIndexThreshold; }
    void ensure_index() const;
    void rebuild_index() const;

    /// Drop earlier duplicates after a batch of appends (last write wins).
    void dedup_last_wins();
};

} // namespace mjson
