#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <memory>
#include <thread>

#include "tickwheel/wheel.hpp"
#include "tickwheel/wheel_config.hpp"
#include "util/log.hpp"

namespace {

// Counts its own firings; the wheel holds it through a shared_ptr<Job>.
class CountingJob final : public tickwheel::Job {
public:
    void run() override { fired_.fetch_add(1, std::memory_order_relaxed); }
    [[nodiscard]] std::uint64_t fired() const noexcept { return fired_.load(std::memory_order_relaxed); }

private:
    std::atomic<std::uint64_t> fired_{0};
};

std::chrono::milliseconds run_duration() {
    const char* raw = std::getenv("TICKWHEEL_RUN_MS");
    if (raw == nullptr) {
        return std::chrono::milliseconds{2000};
    }
    return std::chrono::milliseconds{std::strtoul(raw, nullptr, 10)};
}

} // namespace

int main() {
    tickwheel::WheelConfig cfg = tickwheel::default_wheel_config();
    if (!tickwheel::load_wheel_config_from_env(cfg)) {
        TICKWHEEL_LOG_WARN("Malformed wheel settings in the environment; keeping defaults for those fields");
    }
    TICKWHEEL_LOG_INFO("tickwheel_demo granularity=%lldms default_interval=%lldms",
                       static_cast<long long>(std::chrono::duration_cast<std::chrono::milliseconds>(cfg.granularity).count()),
                       static_cast<long long>(
                           std::chrono::duration_cast<std::chrono::milliseconds>(cfg.default_interval).count()));

    tickwheel::Wheel wheel(cfg);

    std::atomic<bool> one_shot_fired{false};
    std::atomic<std::uint64_t> counted{0};
    auto heartbeat = std::make_shared<CountingJob>();

    wheel.add_one_shot_job_func([&] {
        one_shot_fired.store(true, std::memory_order_relaxed);
        TICKWHEEL_LOG_INFO("one-shot job fired");
    }, cfg.granularity * 5);
    wheel.add_job_func([&] { counted.fetch_add(1, std::memory_order_relaxed); }, 3, cfg.granularity * 2);
    const tickwheel::TimerHandle persist = wheel.add_persist_job(heartbeat);

    wheel.run();

    const auto duration = run_duration();
    TICKWHEEL_LOG_INFO("tickwheel_demo running for %llu ms before shutdown.",
                       static_cast<unsigned long long>(duration.count()));
    std::this_thread::sleep_for(duration);

    wheel.remove(persist);
    wheel.close();

    const tickwheel::WheelStats stats = wheel.stats();
    TICKWHEEL_LOG_INFO("one_shot=%s counted=%llu/3 heartbeat=%llu pending=%zu",
                       one_shot_fired.load() ? "fired" : "pending",
                       static_cast<unsigned long long>(counted.load()),
                       static_cast<unsigned long long>(heartbeat->fired()), wheel.len());
    TICKWHEEL_LOG_INFO("Wheel ticks=%llu scheduled=%llu fired=%llu rescheduled=%llu cascaded=%llu failures=%llu",
                       static_cast<unsigned long long>(stats.ticks),
                       static_cast<unsigned long long>(stats.scheduled),
                       static_cast<unsigned long long>(stats.fired),
                       static_cast<unsigned long long>(stats.rescheduled),
                       static_cast<unsigned long long>(stats.cascaded),
                       static_cast<unsigned long long>(stats.callback_failures));
    return 0;
}
