// SPDX-License-Identifier: AGPL-3.0-or-later
#ifndef FAULTY_TTL_STORE_HPP
#define FAULTY_TTL_STORE_HPP

#include <atomic>
#include <chrono>
#include <expected>
#include <optional>
#include "common/Error.hpp"
#include "common/Types.hpp"
#include "interface/TTLStore.hpp"

// Forwards to another TTLStore until told to fail, then answers every call
// with StoreUnavailable.
class FaultyTTLStore : public dlock::TTLStore {
public:
    explicit FaultyTTLStore(dlock::TTLStore& s) : store {s}, failing {false}, calls {0} {}

    void fail(bool f) {
        failing = f;
    }

    [[nodiscard]] int callCount() const {
        return calls.load();
    }

    std::expected<bool, dlock::Error> setIfAbsent(const dlock::Key& key, const dlock::Value& value, std::chrono::milliseconds ttl) override {
        ++calls;
        if (failing) {
            return std::unexpected {unavailable()};
        }
        return store.setIfAbsent(key, value, ttl);
    }

    std::expected<bool, dlock::Error> setIfPresent(const dlock::Key& key, const dlock::Value& value, std::chrono::milliseconds ttl) override {
        ++calls;
        if (failing) {
            return std::unexpected {unavailable()};
        }
        return store.setIfPresent(key, value, ttl);
    }

    std::expected<std::optional<dlock::Value>, dlock::Error> get(const dlock::Key& key) const override {
        ++calls;
        if (failing) {
            return std::unexpected {unavailable()};
        }
        return store.get(key);
    }

    std::expected<bool, dlock::Error> erase(const dlock::Key& key) override {
        ++calls;
        if (failing) {
            return std::unexpected {unavailable()};
        }
        return store.erase(key);
    }
private:
    static dlock::Error unavailable() {
        return dlock::Error {dlock::ErrorCode::StoreUnavailable, "store offline"};
    }

    dlock::TTLStore& store;
    std::atomic<bool> failing;
    mutable std::atomic<int> calls;
};

#endif // FAULTY_TTL_STORE_HPP
