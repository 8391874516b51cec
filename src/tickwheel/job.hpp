#pragma once

#include <functional>
#include <memory>
#include <utility>

namespace tickwheel {

// Unit of work fired by the wheel. run() is invoked on the driver thread
// with the wheel unlocked; it should return quickly or hand work off,
// since every other due entry waits behind it.
class Job {
public:
    virtual ~Job() = default;
    virtual void run() = 0;
};

// Adapts a plain callable to the Job interface.
class JobFunc final : public Job {
public:
    explicit JobFunc(std::function<void()> fn) : fn_(std::move(fn)) {}

    void run() override {
        if (fn_) {
            fn_();
        }
    }

private:
    std::function<void()> fn_;
};

[[nodiscard]] inline std::shared_ptr<Job> make_job(std::function<void()> fn) {
    return std::make_shared<JobFunc>(std::move(fn));
}

} // namespace tickwheel
