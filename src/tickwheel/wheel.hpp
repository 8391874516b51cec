#pragma once

#include <array>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <thread>

#include "tickwheel/job.hpp"
#include "tickwheel/slot_layout.hpp"
#include "tickwheel/timer_entry.hpp"
#include "tickwheel/wheel_config.hpp"
#include "util/clock.hpp"

namespace tickwheel {

// Counters for monitoring. Read a consistent copy with Wheel::stats().
struct WheelStats {
    std::uint64_t scheduled{0};          // placements from add/start/modify
    std::uint64_t fired{0};              // callbacks invoked
    std::uint64_t rescheduled{0};        // repeating entries placed again after firing
    std::uint64_t cascaded{0};           // entries demoted from a cascade level
    std::uint64_t ticks{0};              // ticks advanced
    std::uint64_t callback_failures{0};  // callbacks that threw
};

// Hierarchical timing wheel with its own driver thread.
//
// Design:
// - 512 FIFO slots: 256 one-tick slots on the main level and four cascade
//   levels of 64 slots each, addressing the whole 32-bit tick space
//   (see slot_layout.hpp). Insert, remove and per-tick work are O(1).
// - The driver wakes once per granularity, advances every elapsed tick in
//   order (missed ticks are caught up, never skipped), moves due slots into
//   the due-now list and fires them.
// - Entries due on the same tick fire in insertion order.
//
// Callbacks run on the driver thread with the wheel unlocked, one at a time.
// A slow callback delays the entries behind it and the next tick, so jobs
// must be short or hand their work to another thread. Callbacks may call
// back into the wheel. An exception escaping a callback is logged and
// counted; the driver moves on to the next due entry.
//
// Thread safety: every public member may be called from any thread. One
// reader/writer lock guards all slot state; len(), has_running() and the
// introspection queries take it shared, everything else exclusively.
// run(), close(), poll() and the destructor are additionally serialized so
// that at most one thread ever advances the wheel.
//
// A wheel must not be destroyed from inside one of its own callbacks; doing
// so is logged at Fatal and terminates the process.
class Wheel {
public:
    // A null clock means the process steady clock. Unusable config values
    // are replaced by the defaults (logged at Warn).
    explicit Wheel(WheelConfig cfg = default_wheel_config(),
                   std::unique_ptr<util::SteadyClock> clock = nullptr);
    ~Wheel();

    Wheel(const Wheel&) = delete;
    Wheel& operator=(const Wheel&) = delete;
    Wheel(Wheel&&) = delete;
    Wheel& operator=(Wheel&&) = delete;

    // Starts the driver thread. No-op when already running. A driver that
    // was stopped from inside a callback is joined first, so its last
    // callback never overlaps the new driver's.
    // From inside a callback, run() only resumes a driver that callback
    // stopped; any other call is ignored with a Warn log.
    // Throws std::system_error if the thread cannot be created.
    void run();

    // Stops the driver and waits for an in-flight callback to return.
    // Pending entries stay in place and are not fired. No-op when stopped.
    // Called from inside a callback it only signals the stop; the driver
    // thread is joined by the next run(), close() or poll(), or by the
    // destructor.
    void close();

    [[nodiscard]] bool has_running() const;

    // Scheduled entries, including those waiting in the due-now list. O(n).
    [[nodiscard]] std::size_t len() const;

    // Builds an entry without scheduling it; arm it with start().
    // target_count: PERSIST (0), ONE_SHOT (1) or any N.
    [[nodiscard]] TimerHandle new_job(std::shared_ptr<Job> job, std::uint32_t target_count,
                                      std::optional<Duration> interval = std::nullopt) const;
    [[nodiscard]] TimerHandle new_job_func(std::function<void()> fn, std::uint32_t target_count,
                                           std::optional<Duration> interval = std::nullopt) const;

    // Builds and schedules an entry due at now + interval.
    TimerHandle add_job(std::shared_ptr<Job> job, std::uint32_t target_count,
                        std::optional<Duration> interval = std::nullopt);
    TimerHandle add_one_shot_job(std::shared_ptr<Job> job, std::optional<Duration> interval = std::nullopt);
    TimerHandle add_persist_job(std::shared_ptr<Job> job, std::optional<Duration> interval = std::nullopt);

    TimerHandle add_job_func(std::function<void()> fn, std::uint32_t target_count, Duration interval);
    TimerHandle add_one_shot_job_func(std::function<void()> fn, Duration interval);
    TimerHandle add_persist_job_func(std::function<void()> fn, Duration interval);

    // (Re)arms an entry: detaches it, resets its fired count and schedules it
    // at now + interval. Works on exhausted and removed entries too.
    void start(const TimerHandle& handle);

    // Detaches an entry so it no longer fires. Idempotent; a handle that was
    // never scheduled is left untouched.
    void remove(const TimerHandle& handle);

    // Changes an entry's interval. A scheduled entry is re-armed from now with
    // its fired count reset; an unscheduled one just keeps the new interval
    // for its next start().
    void modify(const TimerHandle& handle, Duration interval);

    // Runs one driver pass at the clock's current time: advances elapsed
    // ticks and fires what is due. For wheels driven by an external loop or
    // a test clock. Returns false (and does nothing) while the driver thread
    // owns the wheel or when called from inside one of its callbacks.
    bool poll();

    [[nodiscard]] std::uint32_t current_tick() const;
    [[nodiscard]] Duration granularity() const noexcept { return granularity_; }
    [[nodiscard]] Duration default_interval() const noexcept { return default_interval_; }
    [[nodiscard]] WheelStats stats() const;

    // Where the entry is linked right now; nullopt when not scheduled.
    [[nodiscard]] std::optional<SlotLocation> locate(const TimerHandle& handle) const;
    [[nodiscard]] std::optional<std::uint32_t> deadline_tick(const TimerHandle& handle) const;
    [[nodiscard]] std::uint32_t fired_count(const TimerHandle& handle) const;
    [[nodiscard]] bool is_scheduled(const TimerHandle& handle) const;

private:
    using WriteLock = std::unique_lock<std::shared_mutex>;
    using ReadLock = std::shared_lock<std::shared_mutex>;

    bool owns(const TimerHandle& handle) const noexcept;
    bool in_dispatch() const noexcept;
    std::int64_t now_ns() const noexcept { return clock_->now_ns(); }
    Duration clamp_interval(Duration interval) const noexcept;

    void schedule_locked(const TimerHandle& handle, std::int64_t now_ns);
    void place_locked(TimerEntry& entry) noexcept;
    void cascade_locked() noexcept;
    void advance(std::int64_t now_ns, bool from_driver);
    bool fire(TimerEntry& entry, Job& job, std::uint32_t tick) noexcept;
    void signal_stop_locked();
    void driver_loop();
    void release_all() noexcept;

    Duration granularity_;
    Duration default_interval_;
    std::unique_ptr<util::SteadyClock> clock_;

    mutable std::shared_mutex mu_;
    std::array<EntryList, NUM_SLOTS> slots_{};
    EntryList due_now_{};
    std::uint32_t current_tick_{0};
    bool running_{false};
    WheelStats stats_{};

    // Serializes run(), close(), poll() and destruction outside callbacks.
    std::mutex lifecycle_mu_;

    // Stop signalling. The driver exits once generation_ moves past
    // active_generation_; run() from a callback catches it up again.
    std::mutex stop_mu_;
    std::condition_variable stop_cv_;
    std::uint64_t generation_{0};
    std::uint64_t active_generation_{0};
    std::thread driver_{};
};

} // namespace tickwheel
