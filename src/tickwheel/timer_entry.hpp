#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

#include <boost/intrusive/list.hpp>

#include "tickwheel/job.hpp"
#include "tickwheel/slot_layout.hpp"

namespace tickwheel {

class Wheel;

// Target counts with a name.
inline constexpr std::uint32_t PERSIST = 0;   // fire until removed
inline constexpr std::uint32_t ONE_SHOT = 1;

using EntryHook = boost::intrusive::list_base_hook<boost::intrusive::link_mode<boost::intrusive::auto_unlink>>;

// One schedule: the job, how often it runs and how many times.
//
// An entry is linked into at most one wheel list at a time (a slot or the
// due-now list). The auto_unlink hook lets it detach itself in O(1) without
// knowing which list holds it. All mutable state is owned by the Wheel that
// created the entry and is only touched under that wheel's lock.
//
// While linked, the entry pins itself (pinned_) so a caller may drop its
// handle to a scheduled timer; the pin is released when the entry leaves the
// wheel after its last firing or on remove().
class TimerEntry : public EntryHook {
public:
    TimerEntry(const Wheel* owner, std::shared_ptr<Job> job, std::uint32_t target_count,
               Duration interval) noexcept
        : owner_(owner), job_(std::move(job)), target_count_(target_count), interval_(interval) {}

    TimerEntry(const TimerEntry&) = delete;
    TimerEntry& operator=(const TimerEntry&) = delete;

    [[nodiscard]] std::uint32_t target_count() const noexcept { return target_count_; }

private:
    friend class Wheel;

    const Wheel* owner_{nullptr};
    std::shared_ptr<Job> job_;
    std::uint32_t deadline_tick_{0};
    std::uint32_t fired_count_{0};
    std::uint32_t target_count_{0};
    Duration interval_{0};
    std::size_t slot_{DUE_NOW_SLOT};  // valid only while linked
    std::shared_ptr<TimerEntry> pinned_{};
};

// Caller-side reference to an entry, returned by the Wheel factories.
using TimerHandle = std::shared_ptr<TimerEntry>;

// FIFO bucket. Size is O(n), as required by auto_unlink hooks.
using EntryList = boost::intrusive::list<TimerEntry, boost::intrusive::base_hook<EntryHook>,
                                         boost::intrusive::constant_time_size<false>>;

} // namespace tickwheel
