#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

#include "util/clock.hpp"

namespace harness {

// Steady clock that only moves when told to. Safe to read from the driver thread.
class ManualClock : public util::SteadyClock {
public:
    explicit ManualClock(std::chrono::nanoseconds start = std::chrono::nanoseconds{0}) : now_ns_(start.count()) {}

    time_point now() const noexcept override {
        const std::int64_t stale = stale_ns_.exchange(kNone, std::memory_order_acq_rel);
        if (stale != kNone) {
            return time_point{std::chrono::nanoseconds{stale}};
        }
        return time_point{std::chrono::nanoseconds{now_ns_.load(std::memory_order_acquire)}};
    }

    void advance(std::chrono::nanoseconds d) noexcept { now_ns_.fetch_add(d.count(), std::memory_order_acq_rel); }
    void set(std::chrono::nanoseconds t) noexcept { now_ns_.store(t.count(), std::memory_order_release); }

    // The next read returns `t` instead of the current time, as if the reader
    // had been preempted between sampling the clock and using the sample.
    void serve_stale_once(std::chrono::nanoseconds t) noexcept {
        stale_ns_.store(t.count(), std::memory_order_release);
    }

private:
    static constexpr std::int64_t kNone = std::numeric_limits<std::int64_t>::min();

    std::atomic<std::int64_t> now_ns_;
    mutable std::atomic<std::int64_t> stale_ns_{kNone};
};

} // namespace harness
