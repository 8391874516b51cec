#pragma once

#include <chrono>
#include <type_traits>

#include "tickwheel/slot_layout.hpp"

namespace tickwheel {

// Wheel construction parameters.
struct WheelConfig {
    // Wall-clock length of one tick; the wheel's time resolution.
    Duration granularity{std::chrono::milliseconds{100}};

    // Interval used when a job is added without one.
    Duration default_interval{std::chrono::seconds{1}};
};

static_assert(std::is_trivially_copyable_v<WheelConfig>, "WheelConfig must be trivially copyable");

[[nodiscard]] inline constexpr WheelConfig default_wheel_config() noexcept {
    return WheelConfig{};
}

// True when granularity is positive and the default interval is not negative.
[[nodiscard]] bool validate_wheel_config(const WheelConfig& cfg) noexcept;

// Overrides fields from TICKWHEEL_GRANULARITY_MS and TICKWHEEL_INTERVAL_MS when set.
// Returns false if a variable is present but malformed; that field keeps its value.
bool load_wheel_config_from_env(WheelConfig& cfg) noexcept;

} // namespace tickwheel
