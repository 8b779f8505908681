#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <thread>

/**
 * @brief Fixed quantum scheduler clock
 *
 * Counts simulation cycles of a fixed step time and paces them against
 * the steady clock with sleep_until on a fixed grid (start + n * period),
 * so late cycles do not shift the following ones.
 *
 * Components never read this clock; they only get the step time. The
 * simulation time is cycles * step time regardless of how late a cycle
 * actually ran.
 */
class StepClock {
public:
    using clock = std::chrono::steady_clock;

private:
    double step_s_;
    std::chrono::nanoseconds period_;
    clock::time_point next_;
    std::uint64_t cycles_{0};
    std::uint64_t late_cycles_{0};

public:
    /**
     * @brief Construct the clock
     * @param step_s Step time in seconds, default 100 ms
     * @throws std::invalid_argument for step_s <= 0
     */
    explicit StepClock(double step_s = 0.1) : step_s_(step_s), period_(0) {
        if (!(step_s > 0.0)) {
            throw std::invalid_argument("step time must be a positive value.");
        }
        period_ = std::chrono::round<std::chrono::nanoseconds>(std::chrono::duration<double>(step_s));
        next_ = clock::now() + period_;
    }

    /**
     * @brief Step time handed to the components in seconds
     */
    double step_time() const { return step_s_; }

    std::chrono::nanoseconds period() const { return period_; }

    /**
     * @brief Account one completed cycle
     */
    void tick() { cycles_++; }

    std::uint64_t cycles() const { return cycles_; }

    /**
     * @brief Simulation time in seconds
     */
    double sim_time() const { return static_cast<double>(cycles_) * step_s_; }

    /**
     * @brief Sleep until the next grid point of the schedule
     *
     * A cycle that finished after its grid point is counted as late and
     * the next one starts immediately.
     */
    void wait_next() {
        if (clock::now() > next_) {
            late_cycles_++;
        }
        std::this_thread::sleep_until(next_);
        next_ += period_;
    }

    /**
     * @brief Restart the schedule from now
     */
    void resync() { next_ = clock::now() + period_; }

    std::uint64_t late_cycles() const { return late_cycles_; }
};
