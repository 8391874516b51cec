#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace tickwheel {

// Radix layout of the 32-bit tick counter:
//
//   bits 26..31  level 3   (64 slots, catch-all for the longest deadlines)
//   bits 20..25  level 2   (64 slots)
//   bits 14..19  level 1   (64 slots)
//   bits  8..13  level 0   (64 slots)
//   bits  0..7   main      (256 slots, one per tick)
//
// Slots are stored contiguously: main level first, then levels 0..3.
inline constexpr unsigned MAIN_BITS = 8;
inline constexpr unsigned LEVEL_BITS = 6;
inline constexpr std::size_t NUM_LEVELS = 4;
inline constexpr std::size_t MAIN_SIZE = std::size_t{1} << MAIN_BITS;
inline constexpr std::size_t LEVEL_SIZE = std::size_t{1} << LEVEL_BITS;
inline constexpr std::uint32_t MAIN_MASK = static_cast<std::uint32_t>(MAIN_SIZE - 1);
inline constexpr std::uint32_t LEVEL_MASK = static_cast<std::uint32_t>(LEVEL_SIZE - 1);
inline constexpr std::size_t NUM_SLOTS = MAIN_SIZE + LEVEL_SIZE * NUM_LEVELS;

// Pseudo-slot recorded for entries sitting in the due-now list.
inline constexpr std::size_t DUE_NOW_SLOT = NUM_SLOTS;

static_assert(MAIN_BITS + LEVEL_BITS * NUM_LEVELS == 32, "levels must cover the 32-bit tick space");
static_assert(NUM_SLOTS == 512, "unexpected slot count");

using Duration = std::chrono::nanoseconds;

[[nodiscard]] constexpr std::size_t level_base(std::size_t level) noexcept {
    return MAIN_SIZE + LEVEL_SIZE * level;
}

[[nodiscard]] constexpr std::uint32_t level_shift(std::size_t level) noexcept {
    return static_cast<std::uint32_t>(MAIN_BITS + LEVEL_BITS * level);
}

// Index of `tick` within cascade level `level`.
[[nodiscard]] constexpr std::uint32_t level_index(std::uint32_t tick, std::size_t level) noexcept {
    return (tick >> level_shift(level)) & LEVEL_MASK;
}

// Slot that holds an entry due at tick `next` while the wheel stands at `current`.
// `next - current` is taken modulo 2^32, so counter wraparound needs no special case.
[[nodiscard]] constexpr std::size_t slot_for(std::uint32_t next, std::uint32_t current) noexcept {
    std::uint32_t delta = next - current;
    if (delta < MAIN_SIZE) {
        return next & MAIN_MASK;
    }

    std::size_t level = 0;
    for (delta >>= MAIN_BITS; delta >= LEVEL_SIZE && level < NUM_LEVELS - 1; ++level) {
        delta >>= LEVEL_BITS;
    }
    return level_base(level) + level_index(next, level);
}

// Longest distance ahead of the current tick a deadline may lie. Distances are
// read as signed 32-bit values, so anything further would look overdue.
inline constexpr std::uint32_t MAX_DELTA_TICKS = 0x7FFF'FFFFu;

// True when `deadline` is at or behind `current` on the wrapping tick counter.
[[nodiscard]] constexpr bool tick_reached(std::uint32_t deadline, std::uint32_t current) noexcept {
    return static_cast<std::int32_t>(deadline - current) <= 0;
}

// Smallest tick at or after now + timeout (ceiling division).
// This is the only conversion from wall-clock time into the tick domain.
[[nodiscard]] constexpr std::uint32_t next_deadline(std::int64_t now_ns, Duration timeout,
                                                   Duration granularity) noexcept {
    const std::int64_t g = granularity.count();
    return static_cast<std::uint32_t>((now_ns + timeout.count() + g - 1) / g);
}

enum class Tier : std::uint8_t { DueNow, Main, Level0, Level1, Level2, Level3 };

inline const char* tier_name(Tier tier) noexcept {
    switch (tier) {
    case Tier::DueNow: return "due-now";
    case Tier::Main: return "main";
    case Tier::Level0: return "level0";
    case Tier::Level1: return "level1";
    case Tier::Level2: return "level2";
    case Tier::Level3: return "level3";
    }
    return "unknown";
}

// Where an entry currently lives: its tier and the index inside that tier.
struct SlotLocation {
    Tier tier{Tier::Main};
    std::uint32_t index{0};

    friend bool operator==(const SlotLocation&, const SlotLocation&) = default;
};

[[nodiscard]] constexpr SlotLocation decode_slot(std::size_t slot) noexcept {
    if (slot >= NUM_SLOTS) {
        return SlotLocation{Tier::DueNow, 0};
    }
    if (slot < MAIN_SIZE) {
        return SlotLocation{Tier::Main, static_cast<std::uint32_t>(slot)};
    }
    const std::size_t rel = slot - MAIN_SIZE;
    return SlotLocation{static_cast<Tier>(static_cast<std::size_t>(Tier::Level0) + rel / LEVEL_SIZE),
                        static_cast<std::uint32_t>(rel % LEVEL_SIZE)};
}

} // namespace tickwheel
