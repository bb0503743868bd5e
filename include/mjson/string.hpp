#pragma once

/// @file string.hpp
/// @brief Immutable, reference-counted string storage shared between values.
///
/// Strings are the one payload the marshalling core deliberately shares:
///   - object keys come out of the key cache already materialized, and every
///     object that uses the key holds another reference to the same storage;
///   - the empty string is a single process-wide instance owned by the
///     singleton registry.
///
/// Ownership is explicit: copying a String acquires a reference, destroying
/// it releases one, and the storage is freed when the last reference goes.
/// The count is atomic, so handles may be copied and dropped from any thread.

#include "config.hpp"
#include "detail/hash.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace mjson {
namespace detail {

/// @brief Heap block behind a String handle.
struct StringRep {
    explicit StringRep(std::string_view s) : text(s.data(), s.size()) {}

    std::atomic<size_t> refs{1};
    /// Cached content hash; kNoHash until first computed.
    mutable std::atomic<uint64_t> cached_hash{0};
    const std::string text;

    static constexpr uint64_t kNoHash = 0;

    uint64_t hash() const noexcept {
        uint64_t h = cached_hash.load(std::memory_order_relaxed);
        if (MJSON_UNLIKELY(h == kNoHash)) {
            h = hash_bytes(text);
            if (h == kNoHash) h = 1;  // keep the sentinel free
            cached_hash.store(h, std::memory_order_relaxed);
        }
        return h;
    }
};

inline void retain(StringRep* rep) noexcept {
    rep->refs.fetch_add(1, std::memory_order_relaxed);
}

inline void release(StringRep* rep) noexcept {
    if (rep->refs.fetch_sub(1, std::memory_order_acq_rel) == 1) delete rep;
}

/// @brief Canonical empty string storage, owned by the singleton registry.
/// Returns a borrowed pointer; callers retain() it before storing.
/// Defined in singletons.hpp.
inline StringRep* empty_string_rep();

} // namespace detail

/// @brief Shared handle to an immutable string.
///
/// Equality is by content, never by identity: two handles with the same
/// bytes compare equal whether or not they point at the same storage.
/// same_instance() exposes identity for the cases that care (tests, the
/// key cache).
class String {
public:
    /// Tag for adopting a reference the caller already owns.
    struct adopt_t { explicit adopt_t() = default; };
    static constexpr adopt_t adopt{};

    /// @brief The canonical empty string.
    String() : rep_(detail::empty_string_rep()) { detail::retain(rep_); }

    /// @brief Take over one reference to rep (no increment).
    String(detail::StringRep* rep, adopt_t) noexcept : rep_(rep) {}

    String(const String& o) noexcept : rep_(o.rep_) { detail::retain(rep_); }
    String(String&& o) noexcept : rep_(std::exchange(o.rep_, nullptr)) {}
    String& operator=(const String& o) noexcept {
        String tmp(o);
        swap(tmp);
        return *this;
    }
    String& operator=(String&& o) noexcept {
        if (this != &o) {
            reset();
            rep_ = std::exchange(o.rep_, nullptr);
        }
        return *this;
    }
    ~String() { reset(); }

    void swap(String& o) noexcept { std::swap(rep_, o.rep_); }

    /// @brief Materialize a fresh string. Empty input yields the canonical
    /// empty string instead of an allocation.
    [[nodiscard]] static String make(std::string_view s) {
        if (s.empty()) return String();
        return String(new detail::StringRep(s), adopt);
    }

    /// @brief Materialize a fresh key: like make(), with the hash computed
    /// up front since every key is hashed by the object it lands in.
    [[nodiscard]] static String make_key(std::string_view s) {
        String k = make(s);
        (void)k.hash();
        return k;
    }

    [[nodiscard]] std::string_view view() const noexcept {
        return rep_ ? std::string_view(rep_->text) : std::string_view();
    }
    [[nodiscard]] const char* data() const noexcept { return view().data(); }
    [[nodiscard]] size_t size() const noexcept { return view().size(); }
    [[nodiscard]] bool empty() const noexcept { return view().empty(); }
    [[nodiscard]] std::string str() const { return std::string(view()); }
    operator std::string_view() const noexcept { return view(); }

    /// @brief Content hash (computed once, then cached in the storage).
    [[nodiscard]] uint64_t hash() const noexcept {
        return rep_ ? rep_->hash() : detail::hash_bytes(nullptr, 0);
    }

    /// @brief True when both handles share one storage block.
    [[nodiscard]] bool same_instance(const String& o) const noexcept {
        return rep_ == o.rep_;
    }

    /// @brief Current number of owners of the underlying storage.
    [[nodiscard]] size_t use_count() const noexcept {
        return rep_ ? rep_->refs.load(std::memory_order_relaxed) : 0;
    }

    /// @brief Borrowed pointer to the storage (no reference transferred).
    [[nodiscard]] detail::StringRep* rep() const noexcept { return rep_; }

    /// @brief Give up ownership of the storage without releasing it.
    [[nodiscard]] detail::StringRep* release() noexcept {
        return std::exchange(rep_, nullptr);
    }

    friend bool operator==(const String& a, const String& b) noexcept {
        return a.rep_ == b.rep_ || a.view() == b.view();
    }
    friend bool operator!=(const String& a, const String& b) noexcept {
        return !(a == b);
    }
    friend bool operator==(const String& a, std::string_view b) noexcept {
        return a.view() == b;
    }
    friend bool operator!=(const String& a, std::string_view b) noexcept {
        return a.view() != b;
    }
    friend bool operator<(const String& a, const String& b) noexcept {
        return a.view() < b.view();
    }

private:
    void reset() noexcept {
        if (rep_) {
            detail::release(rep_);
            rep_ = nullptr;
        }
    }

    detail::StringRep* rep_;
};

/// Object member names are strings that went through the key cache (or
/// bypassed it). Same handle type; the distinction is in how they are made.
using Key = String;

} // namespace mjson
