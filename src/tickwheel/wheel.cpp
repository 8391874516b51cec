#include "tickwheel/wheel.hpp"

#include <exception>
#include <limits>
#include <system_error>
#include <utility>

#include "util/log.hpp"

namespace tickwheel {

namespace {

// Wheels whose advance() is on the current thread's stack, innermost first.
// Lets lifecycle calls made from inside a callback avoid waiting on the pass
// that is running them.
struct DispatchScope;
thread_local const DispatchScope* t_dispatch = nullptr;

struct DispatchScope {
    explicit DispatchScope(const Wheel* w) noexcept : wheel(w), prev(t_dispatch) { t_dispatch = this; }
    ~DispatchScope() { t_dispatch = prev; }

    DispatchScope(const DispatchScope&) = delete;
    DispatchScope& operator=(const DispatchScope&) = delete;

    const Wheel* wheel;
    const DispatchScope* prev;
};

} // namespace

Wheel::Wheel(WheelConfig cfg, std::unique_ptr<util::SteadyClock> clock)
    : granularity_(cfg.granularity)
    , default_interval_(cfg.default_interval)
    , clock_(clock ? std::move(clock) : std::make_unique<util::SteadyClock>()) {
    const WheelConfig defaults = default_wheel_config();
    if (granularity_ <= Duration::zero()) {
        TICKWHEEL_LOG_WARN("Wheel granularity=%lldns unusable; using %lldns",
                           static_cast<long long>(granularity_.count()),
                           static_cast<long long>(defaults.granularity.count()));
        granularity_ = defaults.granularity;
    }
    if (default_interval_ < Duration::zero()) {
        TICKWHEEL_LOG_WARN("Wheel default_interval=%lldns unusable; using %lldns",
                           static_cast<long long>(default_interval_.count()),
                           static_cast<long long>(defaults.default_interval.count()));
        default_interval_ = defaults.default_interval;
    }
    current_tick_ = static_cast<std::uint32_t>(now_ns() / granularity_.count());
}

Wheel::~Wheel() {
    if (in_dispatch()) {
        TICKWHEEL_LOG_FATAL("Wheel %p destroyed from inside one of its own callbacks", static_cast<const void*>(this));
        std::terminate();
    }
    close();
    release_all();
}

void Wheel::run() {
    if (in_dispatch()) {
        WriteLock lk(mu_);
        if (running_) {
            return;
        }
        if (driver_.joinable() && driver_.get_id() == std::this_thread::get_id()) {
            // The callback running now stopped this driver; keep it going.
            {
                std::lock_guard<std::mutex> g(stop_mu_);
                active_generation_ = generation_;
            }
            running_ = true;
            TICKWHEEL_LOG_DEBUG("Wheel driver resumed from a callback");
            return;
        }
        TICKWHEEL_LOG_WARN("Wheel::run ignored inside a callback of a stopped wheel");
        return;
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    std::thread stale;
    {
        WriteLock lk(mu_);
        if (running_) {
            return;
        }
        stale = std::move(driver_);
    }
    // A driver stopped from inside its own callback may still be finishing
    // that callback; it must be gone before the next one starts.
    if (stale.joinable()) {
        stale.join();
    }

    WriteLock lk(mu_);
    {
        std::lock_guard<std::mutex> g(stop_mu_);
        active_generation_ = generation_;
    }
    running_ = true;
    try {
        driver_ = std::thread(&Wheel::driver_loop, this);
    } catch (const std::system_error& e) {
        running_ = false;
        TICKWHEEL_LOG_ERROR("Wheel failed to start driver thread: %s", e.what());
        throw;
    }
}

void Wheel::close() {
    if (in_dispatch()) {
        WriteLock lk(mu_);
        if (running_) {
            signal_stop_locked();
        }
        return;
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    std::thread driver;
    {
        WriteLock lk(mu_);
        if (running_) {
            signal_stop_locked();
        }
        driver = std::move(driver_);
    }
    // Joined without the wheel lock so the driver can finish its current callback.
    if (driver.joinable()) {
        driver.join();
    }
}

bool Wheel::has_running() const {
    ReadLock lk(mu_);
    return running_;
}

std::size_t Wheel::len() const {
    ReadLock lk(mu_);
    std::size_t total = due_now_.size();
    for (const auto& slot : slots_) {
        total += slot.size();
    }
    return total;
}

TimerHandle Wheel::new_job(std::shared_ptr<Job> job, std::uint32_t target_count,
                           std::optional<Duration> interval) const {
    const Duration value = clamp_interval(interval.value_or(default_interval_));
    return std::make_shared<TimerEntry>(this, std::move(job), target_count, value);
}

TimerHandle Wheel::new_job_func(std::function<void()> fn, std::uint32_t target_count,
                                std::optional<Duration> interval) const {
    return new_job(make_job(std::move(fn)), target_count, interval);
}

TimerHandle Wheel::add_job(std::shared_ptr<Job> job, std::uint32_t target_count,
                           std::optional<Duration> interval) {
    TimerHandle handle = new_job(std::move(job), target_count, interval);
    const std::int64_t now = now_ns();

    WriteLock lk(mu_);
    schedule_locked(handle, now);
    return handle;
}

TimerHandle Wheel::add_one_shot_job(std::shared_ptr<Job> job, std::optional<Duration> interval) {
    return add_job(std::move(job), ONE_SHOT, interval);
}

TimerHandle Wheel::add_persist_job(std::shared_ptr<Job> job, std::optional<Duration> interval) {
    return add_job(std::move(job), PERSIST, interval);
}

TimerHandle Wheel::add_job_func(std::function<void()> fn, std::uint32_t target_count, Duration interval) {
    return add_job(make_job(std::move(fn)), target_count, interval);
}

TimerHandle Wheel::add_one_shot_job_func(std::function<void()> fn, Duration interval) {
    return add_job(make_job(std::move(fn)), ONE_SHOT, interval);
}

TimerHandle Wheel::add_persist_job_func(std::function<void()> fn, Duration interval) {
    return add_job(make_job(std::move(fn)), PERSIST, interval);
}

void Wheel::start(const TimerHandle& handle) {
    if (!owns(handle)) {
        return;
    }
    const std::int64_t now = now_ns();

    WriteLock lk(mu_);
    handle->unlink();  // no-op when unattached
    handle->fired_count_ = 0;
    schedule_locked(handle, now);
}

void Wheel::remove(const TimerHandle& handle) {
    if (!owns(handle)) {
        return;
    }
    std::shared_ptr<TimerEntry> released;
    {
        WriteLock lk(mu_);
        handle->unlink();
        released = std::move(handle->pinned_);
    }
}

void Wheel::modify(const TimerHandle& handle, Duration interval) {
    if (!owns(handle)) {
        return;
    }
    interval = clamp_interval(interval);
    const std::int64_t now = now_ns();

    WriteLock lk(mu_);
    handle->interval_ = interval;
    if (!handle->is_linked()) {
        return;
    }
    handle->unlink();
    handle->fired_count_ = 0;
    schedule_locked(handle, now);
}

bool Wheel::poll() {
    if (in_dispatch()) {
        TICKWHEEL_LOG_DEBUG("Wheel::poll ignored inside a callback");
        return false;
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
    std::thread stale;
    {
        WriteLock lk(mu_);
        if (running_) {
            TICKWHEEL_LOG_DEBUG("Wheel::poll ignored while the driver thread is running");
            return false;
        }
        stale = std::move(driver_);
    }
    if (stale.joinable()) {
        stale.join();
    }
    advance(now_ns(), false);
    return true;
}

std::uint32_t Wheel::current_tick() const {
    ReadLock lk(mu_);
    return current_tick_;
}

WheelStats Wheel::stats() const {
    ReadLock lk(mu_);
    return stats_;
}

std::optional<SlotLocation> Wheel::locate(const TimerHandle& handle) const {
    if (!owns(handle)) {
        return std::nullopt;
    }
    ReadLock lk(mu_);
    if (!handle->is_linked()) {
        return std::nullopt;
    }
    return decode_slot(handle->slot_);
}

std::optional<std::uint32_t> Wheel::deadline_tick(const TimerHandle& handle) const {
    if (!owns(handle)) {
        return std::nullopt;
    }
    ReadLock lk(mu_);
    if (!handle->is_linked()) {
        return std::nullopt;
    }
    return handle->deadline_tick_;
}

std::uint32_t Wheel::fired_count(const TimerHandle& handle) const {
    if (!owns(handle)) {
        return 0;
    }
    ReadLock lk(mu_);
    return handle->fired_count_;
}

bool Wheel::is_scheduled(const TimerHandle& handle) const {
    if (!owns(handle)) {
        return false;
    }
    ReadLock lk(mu_);
    return handle->is_linked();
}

bool Wheel::in_dispatch() const noexcept {
    for (const DispatchScope* scope = t_dispatch; scope != nullptr; scope = scope->prev) {
        if (scope->wheel == this) {
            return true;
        }
    }
    return false;
}

Duration Wheel::clamp_interval(Duration interval) const noexcept {
    if (interval < Duration::zero()) {
        return Duration::zero();  // a deadline may never lie behind the current tick
    }
    // One tick of slack for the ceiling in next_deadline().
    constexpr std::int64_t max_ticks = static_cast<std::int64_t>(MAX_DELTA_TICKS) - 1;
    const std::int64_t g = granularity_.count();
    if (g <= std::numeric_limits<std::int64_t>::max() / max_ticks && interval.count() > g * max_ticks) {
        TICKWHEEL_LOG_WARN("Wheel interval=%lldns exceeds %lld ticks; clamped",
                           static_cast<long long>(interval.count()), static_cast<long long>(max_ticks));
        return Duration{g * max_ticks};
    }
    return interval;
}

bool Wheel::owns(const TimerHandle& handle) const noexcept {
    if (!handle) {
        return false;
    }
    if (handle->owner_ != this) {
        TICKWHEEL_LOG_WARN("Wheel %p ignoring entry created by wheel %p",
                           static_cast<const void*>(this), static_cast<const void*>(handle->owner_));
        return false;
    }
    return true;
}

// Computes the deadline from `now_ns` and links the entry. An entry already
// due goes straight to the due-now list: its main slot has been drained for
// this tick and would only come round again 256 ticks later. `now_ns` is read
// before the lock, so the driver may have advanced past it in between; such
// a deadline is behind the current tick and is treated as due.
void Wheel::schedule_locked(const TimerHandle& handle, std::int64_t now_ns) {
    TimerEntry& entry = *handle;
    entry.deadline_tick_ = next_deadline(now_ns, entry.interval_, granularity_);
    entry.pinned_ = handle;
    if (tick_reached(entry.deadline_tick_, current_tick_)) {
        entry.deadline_tick_ = current_tick_;
        entry.slot_ = DUE_NOW_SLOT;
        due_now_.push_back(entry);
    } else {
        place_locked(entry);
    }
    ++stats_.scheduled;
}

void Wheel::place_locked(TimerEntry& entry) noexcept {
    entry.slot_ = slot_for(entry.deadline_tick_, current_tick_);
    slots_[entry.slot_].push_back(entry);
}

// Called when the main level wraps. Refines the current slot of level 0 into
// finer slots, and continues upwards while the level index is also zero.
void Wheel::cascade_locked() noexcept {
    for (std::size_t level = 0; level < NUM_LEVELS; ++level) {
        const std::uint32_t index = level_index(current_tick_, level);

        // Detach the whole slot first; re-placement never targets it again,
        // but a list being refilled while drained is not worth reasoning about.
        EntryList pending;
        pending.splice(pending.end(), slots_[level_base(level) + index]);
        while (!pending.empty()) {
            TimerEntry& entry = pending.front();
            pending.pop_front();
            place_locked(entry);
            ++stats_.cascaded;
        }

        if (index != 0) {
            break;
        }
    }
}

// One driver pass. `from_driver` passes stop after the callback in flight
// once close() has been called; the rest of the due-now list waits for the
// next pass.
void Wheel::advance(std::int64_t now_ns, bool from_driver) {
    const auto now_tick = static_cast<std::uint32_t>(now_ns / granularity_.count());
    const DispatchScope dispatch(this);

    WriteLock lk(mu_);
    // Signed view of the difference so a clock that steps back is not read as 2^32 ticks.
    const auto elapsed = static_cast<std::int32_t>(now_tick - current_tick_);
    if (elapsed > static_cast<std::int32_t>(MAIN_SIZE)) {
        TICKWHEEL_LOG_DEBUG("Wheel catching up %d ticks", elapsed);
    }
    for (std::int32_t past = elapsed; past > 0; --past) {
        ++current_tick_;
        ++stats_.ticks;
        const std::uint32_t index = current_tick_ & MAIN_MASK;
        if (index == 0) {
            cascade_locked();
        }
        due_now_.splice(due_now_.end(), slots_[index]);
    }

    while (!due_now_.empty() && (running_ || !from_driver)) {
        TimerEntry& entry = due_now_.front();
        due_now_.pop_front();

        // Keeps the entry alive through the callback even if it is finished
        // or removed concurrently.
        std::shared_ptr<TimerEntry> hold = std::move(entry.pinned_);
        ++entry.fired_count_;
        if (entry.target_count_ == PERSIST || entry.fired_count_ < entry.target_count_) {
            std::uint32_t next = next_deadline(now_ns, entry.interval_, granularity_);
            if (tick_reached(next, current_tick_)) {
                next = current_tick_ + 1;  // this tick's slot is already drained
            }
            entry.deadline_tick_ = next;
            place_locked(entry);
            entry.pinned_ = hold;
            ++stats_.rescheduled;
        }
        std::shared_ptr<Job> job = entry.job_;
        const std::uint32_t tick = current_tick_;

        lk.unlock();
        bool ok = true;
        if (job) {
            ok = fire(entry, *job, tick);
        }
        job.reset();
        hold.reset();
        lk.lock();

        ++stats_.fired;
        if (!ok) {
            ++stats_.callback_failures;
        }
    }
}

bool Wheel::fire(TimerEntry& entry, Job& job, std::uint32_t tick) noexcept {
    try {
        job.run();
        return true;
    } catch (const std::exception& e) {
        TICKWHEEL_LOG_ERROR("Wheel job %p threw at tick %u: %s", static_cast<const void*>(&entry), tick, e.what());
    } catch (...) {
        TICKWHEEL_LOG_ERROR("Wheel job %p threw a non-standard exception at tick %u",
                            static_cast<const void*>(&entry), tick);
    }
    return false;
}

void Wheel::signal_stop_locked() {
    running_ = false;
    {
        std::lock_guard<std::mutex> g(stop_mu_);
        ++generation_;
    }
    stop_cv_.notify_all();
}

void Wheel::driver_loop() {
    TICKWHEEL_LOG_INFO("Wheel driver started granularity=%lldns",
                       static_cast<long long>(granularity_.count()));

    Duration wait = granularity_;
    for (;;) {
        {
            std::unique_lock<std::mutex> lk(stop_mu_);
            if (stop_cv_.wait_for(lk, wait, [this] { return generation_ != active_generation_; })) {
                break;
            }
        }
        advance(now_ns(), true);

        // Sleep to the next tick boundary rather than a full granularity so
        // processing time does not accumulate as drift.
        wait = granularity_ - Duration{now_ns() % granularity_.count()};
    }

    TICKWHEEL_LOG_INFO("Wheel driver stopped at tick %u", current_tick());
}

// Unlinks every entry and drops the self-pins so nothing outlives the wheel
// through its own reference.
void Wheel::release_all() noexcept {
    EntryList all;
    {
        WriteLock lk(mu_);
        for (auto& slot : slots_) {
            all.splice(all.end(), slot);
        }
        all.splice(all.end(), due_now_);
    }
    while (!all.empty()) {
        TimerEntry& entry = all.front();
        all.pop_front();
        std::shared_ptr<TimerEntry> pin = std::move(entry.pinned_);
    }
}

} // namespace tickwheel
