#pragma once

/// @file singletons.hpp
/// @brief Process-wide registry of the shared true / false / null / "" values.
///
/// The registry is initialized once, lazily, on first demand, under
/// std::call_once: concurrent first use from several threads initializes
/// exactly once. After that every lookup is a plain read.
///
/// Every handle handed out is shared ownership: get() returns a
/// std::shared_ptr copy (the use count goes up, and back down when the
/// caller drops it). The registry keeps its own reference forever, so the
/// values are effectively immortal and are only reclaimed at process exit.
///
/// The canonical empty string lives here too. String() and
/// String::make("") hand out references to it, so every empty string
/// produced by the decoder (fast path or not) shares one storage block.

#include "value.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <mutex>

namespace mjson {

/// @brief Keys into the registry.
enum class Singleton : uint8_t {
    True        = 0,
    False       = 1,
    Null        = 2,
    EmptyString = 3
};

/// Shared, read-only handle to a registry value.
using SingletonRef = std::shared_ptr<const JsonValue>;

class Singletons {
public:
    /// @brief Acquire a shared handle to one of the registry values.
    [[nodiscard]] static SingletonRef get(Singleton which) {
        return storage().values[static_cast<size_t>(which)];
    }

    [[nodiscard]] static SingletonRef true_value()   { return get(Singleton::True); }
    [[nodiscard]] static SingletonRef false_value()  { return get(Singleton::False); }
    [[nodiscard]] static SingletonRef null_value()   { return get(Singleton::Null); }
    [[nodiscard]] static SingletonRef empty_string() { return get(Singleton::EmptyString); }

    /// @brief Borrowed pointer to the canonical empty string storage.
    [[nodiscard]] static detail::StringRep* empty_string_rep() {
        return storage().empty_rep;
    }

    /// @brief True once the registry has been initialized in this process.
    [[nodiscard]] static bool initialized() noexcept {
        return state().ready.load(std::memory_order_acquire);
    }

private:
    struct Storage {
        detail::StringRep* empty_rep = nullptr;
        std::array<SingletonRef, 4> values;
    };

    struct State {
        std::once_flag once;
        std::atomic<bool> ready{false};
        Storage storage;
    };

    static State& state() noexcept {
        static State s;
        return s;
    }

    static const Storage& storage() {
        State& s = state();
        std::call_once(s.once, [&s] {
            // The registry's own reference to the empty string is never
            // released.
            s.storage.empty_rep = new detail::StringRep(std::string_view());
            detail::retain(s.storage.empty_rep);
            String empty(s.storage.empty_rep, String::adopt);

            s.storage.values[static_cast<size_t>(Singleton::True)] =
                std::make_shared<const JsonValue>(true);
            s.storage.values[static_cast<size_t>(Singleton::False)] =
                std::make_shared<const JsonValue>(false);
            s.storage.values[static_cast<size_t>(Singleton::Null)] =
                std::make_shared<const JsonValue>(nullptr);
            s.storage.values[static_cast<size_t>(Singleton::EmptyString)] =
                std::make_shared<const JsonValue>(std::move(empty));
            s.ready.store(true, std::memory_order_release);
        });
        return s.storage;
    }
};

inline detail::StringRep* detail::empty_string_rep() {
    return Singletons::empty_string_rep();
}

} // namespace mjson
