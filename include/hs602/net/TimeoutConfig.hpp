#pragma once

#include "hs602/core/Config.hpp"

#include <atomic>
#include <chrono>

namespace hs602::net {

/**
 * @brief Process-wide default command timeout.
 *
 * `DeviceOptions` picks this up when no explicit timeout is given; every
 * dispatcher call still receives a concrete deadline.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    /** Set the process-wide default timeout (clamped to >= 0). */
    static void setDefault(duration timeout) {
        storage().store(sanitize(timeout).count(), std::memory_order_relaxed);
    }

    /** Access the current process-wide default timeout. */
    static duration defaultTimeout() {
        return duration{storage().load(std::memory_order_relaxed)};
    }

    /** RAII helper that temporarily overrides the default timeout. */
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

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

private:
    static std::atomic<duration::rep>& storage() {
        static std::atomic<duration::rep> timeout{config::HS602_COMMAND_TIMEOUT.count()};
        return timeout;
    }
};

} // namespace hs602::net
