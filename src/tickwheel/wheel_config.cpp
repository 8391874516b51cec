#include "tickwheel/wheel_config.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <system_error>

#include "util/log.hpp"

namespace tickwheel {

namespace {

// Largest millisecond count representable as nanoseconds in a signed 64-bit value.
constexpr std::uint64_t kMaxMs = static_cast<std::uint64_t>(INT64_MAX) / 1'000'000;

// Parses a whole-string unsigned millisecond count. Empty or trailing garbage fails.
bool parse_ms(const char* text, std::uint64_t& out) noexcept {
    const std::size_t len = std::strlen(text);
    if (len == 0) {
        return false;
    }
    const auto res = std::from_chars(text, text + len, out);
    return res.ec == std::errc{} && res.ptr == text + len;
}

bool override_from_env(const char* name, Duration& field, bool allow_zero) noexcept {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return true;
    }
    std::uint64_t ms = 0;
    if (!parse_ms(raw, ms) || ms > kMaxMs || (!allow_zero && ms == 0)) {
        TICKWHEEL_LOG_WARN("ignoring %s=\"%s\": expected %s millisecond count", name, raw,
                           allow_zero ? "a" : "a positive");
        return false;
    }
    field = std::chrono::milliseconds{static_cast<std::int64_t>(ms)};
    return true;
}

} // namespace

bool validate_wheel_config(const WheelConfig& cfg) noexcept {
    return cfg.granularity > Duration::zero() && cfg.default_interval >= Duration::zero();
}

bool load_wheel_config_from_env(WheelConfig& cfg) noexcept {
    bool ok = override_from_env("TICKWHEEL_GRANULARITY_MS", cfg.granularity, false);
    ok = override_from_env("TICKWHEEL_INTERVAL_MS", cfg.default_interval, true) && ok;
    return ok;
}

} // namespace tickwheel
