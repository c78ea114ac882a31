#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace flipdot::io {

/**
 * @brief Process-wide read timeouts, one per kind of serial link.
 *
 * Signs answer within milliseconds but may be slow right after power-up, so
 * the sign bus waits 5 s. An ODK link waits 10 s because the diagnostic tool
 * sits idle between operator actions. Buses and bridges read the default
 * when they are constructed; a per-instance setter overrides it afterwards.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    enum class Link : std::uint8_t {
        SignBus,
        Odk,
    };

    static void setDefault(Link link, duration timeout) {
        slot(link).store(sanitize(timeout).count());
    }

    static duration defaultTimeout(Link link = Link::SignBus) {
        return duration{slot(link).load()};
    }

    /** Restores the previous default for @p link on destruction. */
    class ScopedOverride {
    public:
        ScopedOverride(Link link, duration timeout)
        : link_(link)
        , previous_(defaultTimeout(link)) {
            setDefault(link, timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            setDefault(link_, previous_);
        }

    private:
        Link link_;
        duration previous_;
    };

    /// Negative timeouts are treated as "poll once".
    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

private:
    using rep = duration::rep;

    static std::atomic<rep>& slot(Link link) {
        static std::atomic<rep> signBus{5000};
        static std::atomic<rep> odk{10000};
        return link == Link::Odk ? odk : signBus;
    }
};

} // namespace flipdot::io
