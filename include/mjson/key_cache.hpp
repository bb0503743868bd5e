#pragma once

/// @file key_cache.hpp
/// @brief Fixed-capacity interning table for object member names.
///
/// The decoder materializes every object key through intern(). Short keys
/// (up to MJSON_KEY_CACHE_MAX_KEY_LEN bytes) are looked up by content hash
/// in a table of MJSON_KEY_CACHE_CAPACITY slots; a slot holds one
/// (hash, key) pair and is overwritten unconditionally when a different key
/// lands on it. The table never grows and never evicts anything else.
///
/// A hit requires the stored hash to match and the stored bytes to equal the
/// probe. A matching hash over different bytes counts as a miss and the slot
/// is taken over by the new key.
///
/// Thread safety: slots are guarded by MJSON_KEY_CACHE_LOCK_STRIPES mutexes
/// (slot index modulo stripe count), so concurrent decodes sharing one cache
/// contend only when they touch the same stripe.
///
/// @code
///   mjson::KeyCache cache;
///   mjson::DecodeOptions opts;
///   opts.key_cache = &cache;
///   auto v = mjson::decode_one(R"({"id": 1})", opts);
///   auto s = cache.stats();   // s.misses == 1
/// @endcode

#include "config.hpp"
#include "string.hpp"

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string_view>

namespace mjson {

class KeyCache {
public:
    static constexpr size_t kCapacity  = MJSON_KEY_CACHE_CAPACITY;
    static constexpr size_t kMaxKeyLen = MJSON_KEY_CACHE_MAX_KEY_LEN;
    static constexpr size_t kStripes   = MJSON_KEY_CACHE_LOCK_STRIPES;

    /// @brief Counters since construction or the last clear().
    struct Stats {
        uint64_t hits      = 0;  ///< served from the table
        uint64_t misses    = 0;  ///< materialized and stored
        uint64_t bypasses  = 0;  ///< too long to cache
        size_t   occupancy = 0;  ///< slots currently holding a key
    };

    KeyCache() : slots_(new Slot[kCapacity]) {}
    ~KeyCache() { release_all(); }

    KeyCache(const KeyCache&) = delete;
    KeyCache& operator=(const KeyCache&) = delete;

    /// @brief Shared key for the given member name.
    ///
    /// Never fails for lack of a slot: a long key or a slot conflict just
    /// costs a fresh allocation.
    [[nodiscard]] Key intern(std::string_view bytes) {
        if (MJSON_UNLIKELY(bytes.size() > kMaxKeyLen)) {
            bypasses_.fetch_add(1, std::memory_order_relaxed);
            return String::make_key(bytes);
        }

        const uint64_t h = detail::hash_bytes(bytes);
        const size_t idx = static_cast<size_t>(h % kCapacity);
        Slot& slot = slots_[idx];

        std::lock_guard<std::mutex> lock(locks_[idx & (kStripes - 1)]);
        if (slot.key && slot.hash == h && slot.key->text == bytes) {
            hits_.fetch_add(1, std::memory_order_relaxed);
            detail::retain(slot.key);
            return Key(slot.key, String::adopt);
        }

        Key fresh = String::make_key(bytes);
        detail::StringRep* rep = fresh.rep();
        detail::retain(rep);  // the table's own reference
        if (slot.key) {
            detail::release(slot.key);
        } else {
            occupancy_.fetch_add(1, std::memory_order_relaxed);
        }
        slot.hash = h;
        slot.key = rep;
        misses_.fetch_add(1, std::memory_order_relaxed);
        return fresh;
    }

    /// @brief True when a key with these bytes currently occupies its slot.
    [[nodiscard]] bool contains(std::string_view bytes) const {
        if (bytes.size() > kMaxKeyLen) return false;
        const uint64_t h = detail::hash_bytes(bytes);
        const size_t idx = static_cast<size_t>(h % kCapacity);
        std::lock_guard<std::mutex> lock(locks_[idx & (kStripes - 1)]);
        const Slot& slot = slots_[idx];
        return slot.key && slot.hash == h && slot.key->text == bytes;
    }

    [[nodiscard]] Stats stats() const noexcept {
        Stats s;
        s.hits      = hits_.load(std::memory_order_relaxed);
        s.misses    = misses_.load(std::memory_order_relaxed);
        s.bypasses  = bypasses_.load(std::memory_order_relaxed);
        s.occupancy = occupancy_.load(std::memory_order_relaxed);
        return s;
    }

    [[nodiscard]] size_t occupancy() const noexcept {
        return occupancy_.load(std::memory_order_relaxed);
    }

    static constexpr size_t capacity() noexcept { return kCapacity; }

    /// @brief Drop every cached key and reset the counters.
    /// Keys already handed out stay valid; they own their storage.
    void clear() {
        release_all();
        hits_.store(0, std::memory_order_relaxed);
        misses_.store(0, std::memory_order_relaxed);
        bypasses_.store(0, std::memory_order_relaxed);
    }

    /// @brief The process-wide cache used when DecodeOptions names none.
    static KeyCache& global() {
        static KeyCache instance;
        return instance;
    }

private:
    struct Slot {
        uint64_t hash = 0;
        detail::StringRep* key = nullptr;
    };

    void release_all() {
        for (size_t i = 0; i < kCapacity; ++i) {
            std::lock_guard<std::mutex> lock(locks_[i & (kStripes - 1)]);
            Slot& slot = slots_[i];
            if (slot.key) {
                detail::release(slot.key);
                slot.key = nullptr;
                slot.hash = 0;
                occupancy_.fetch_sub(1, std::memory_order_relaxed);
            }
        }
    }

    std::unique_ptr<Slot[]> slots_;
    mutable std::array<std::mutex, kStripes> locks_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> bypasses_{0};
    std::atomic<size_t>   occupancy_{0};
};

} // namespace mjson
