#pragma once

#include <chrono>
#include <cstdint>

namespace Repealer {

/**
 * @brief High-resolution timer used for phase timings in logs.
 */
class Timer {
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;

    Timer() : start_(Clock::now()) {}

    void reset() {
        start_ = Clock::now();
    }

    double elapsed_ms() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

    double elapsed_sec() const {
        return elapsed_ms() / 1000.0;
    }

private:
    TimePoint start_;
};

/**
 * @brief Absolute point in time after which a bounded operation must give up.
 *
 * A zero budget means "no deadline".
 */
class Deadline {
public:
    using Clock = std::chrono::steady_clock;

    explicit Deadline(uint32_t budget_ms)
        : bounded_(budget_ms > 0),
          expires_(Clock::now() + std::chrono::milliseconds(budget_ms)) {}

    static Deadline unbounded() { return Deadline(0); }

    bool bounded() const { return bounded_; }

    bool expired() const { return bounded_ && Clock::now() >= expires_; }

    Clock::duration remaining() const {
        if (!bounded_) return Clock::duration::max();
        auto now = Clock::now();
        return now >= expires_ ? Clock::duration::zero() : expires_ - now;
    }

    Clock::time_point expires_at() const { return expires_; }

private:
    bool bounded_;
    Clock::time_point expires_;
};

} // namespace Repealer
