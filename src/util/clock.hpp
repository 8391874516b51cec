#pragma once

#include <chrono>
#include <cstdint>

namespace util {

// Thin monotonic clock abstraction so time-driven components can be tested
// deterministically. Subclasses override now(); now_ns() derives from it.
class SteadyClock {
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~SteadyClock() = default;
    virtual time_point now() const noexcept { return std::chrono::steady_clock::now(); }

    // Nanoseconds since the clock's epoch.
    [[nodiscard]] std::int64_t now_ns() const noexcept {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now().time_since_epoch()).count();
    }
};

} // namespace util
