#pragma once

#include <atomic>
#include <chrono>

namespace bulbnet::net {

/**
 * @brief Process-wide default reply timeout applied to new `BulbConfig` values.
 *
 * Each client copies the value at construction; changing the default later
 * does not affect clients that already exist. Reads and writes are atomic, so
 * discovery workers may build configs while another thread adjusts it.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    static constexpr duration kBuiltinDefault{5000};

    /// Negative timeouts are clamped to zero.
    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

    static void setDefault(duration timeout) {
        storage().store(sanitize(timeout).count());
    }

    static duration defaultTimeout() {
        return duration{storage().load()};
    }

    /// Restores the previous default when it goes out of scope.
    class ScopedOverride {
    public:
        explicit ScopedOverride(duration timeout)
        : previous_(defaultTimeout()) {
            setDefault(timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            setDefault(previous_);
        }

    private:
        duration previous_;
    };

private:
    static std::atomic<duration::rep>& storage() {
        static std::atomic<duration::rep> millis{kBuiltinDefault.count()};
        return millis;
    }
};

} // namespace bulbnet::net
