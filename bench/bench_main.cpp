#include <atomic>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <vector>

#include "tickwheel/wheel.hpp"
#include "util/clock.hpp"
#include "util/log.hpp"

namespace {

// Clock advanced by hand so tick processing is measured without sleeping.
class BenchClock : public util::SteadyClock {
public:
    time_point now() const noexcept override {
        return time_point{std::chrono::nanoseconds{now_ns_.load(std::memory_order_relaxed)}};
    }
    void advance(std::chrono::nanoseconds d) noexcept { now_ns_.fetch_add(d.count(), std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> now_ns_{0};
};

void report(const char* what, std::size_t iterations, std::chrono::steady_clock::duration took) {
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(took).count();
    std::cout << what << ": " << iterations << " iterations took " << ns << " ns ("
              << (ns / static_cast<long long>(iterations)) << " ns/iter)\n";
}

} // namespace

int main() {
    util::set_log_level(util::LogLevel::Warn);

    tickwheel::WheelConfig cfg{};
    cfg.granularity = std::chrono::milliseconds{1};

    constexpr std::size_t entries = 100000;
    std::uint64_t fired = 0;

    {
        tickwheel::Wheel wheel(cfg, std::make_unique<BenchClock>());
        std::vector<tickwheel::TimerHandle> handles;
        handles.reserve(entries);

        auto start = std::chrono::steady_clock::now();
        for (std::size_t i = 0; i < entries; ++i) {
            // Spread deadlines over every level of the wheel.
            const auto interval = std::chrono::milliseconds{1 + (i * 7919) % (1u << 24)};
            handles.push_back(wheel.add_one_shot_job_func([&fired] { ++fired; }, interval));
        }
        report("add", entries, std::chrono::steady_clock::now() - start);

        start = std::chrono::steady_clock::now();
        for (const auto& h : handles) {
            wheel.remove(h);
        }
        report("remove", entries, std::chrono::steady_clock::now() - start);
    }

    {
        auto clock = std::make_unique<BenchClock>();
        BenchClock* clk = clock.get();
        tickwheel::Wheel wheel(cfg, std::move(clock));
        for (std::size_t i = 0; i < entries; ++i) {
            wheel.add_one_shot_job_func([&fired] { ++fired; }, std::chrono::milliseconds{1 + i % 65536});
        }

        constexpr std::size_t ticks = 65536;
        const auto start = std::chrono::steady_clock::now();
        for (std::size_t t = 0; t < ticks; ++t) {
            clk->advance(cfg.granularity);
            wheel.poll();
        }
        report("tick", ticks, std::chrono::steady_clock::now() - start);

        const tickwheel::WheelStats stats = wheel.stats();
        std::cout << "fired=" << stats.fired << " cascaded=" << stats.cascaded << " pending=" << wheel.len() << "\n";
    }
    return fired == entries ? 0 : 1;
}
