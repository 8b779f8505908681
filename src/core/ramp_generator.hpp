#pragma once
#include <algorithm>
#include <stdexcept>

/**
 * @brief Rate-limited, bounded setpoint integrator
 *
 * Mimics a motor drive or a manually adjusted setpoint: the output moves
 * toward a target with at most rate*dt per step and never leaves
 * [lower, upper]. The target is either a bound (directional drive), the
 * current output (hold) or an arbitrary value.
 *
 * Saturation is exact: the output lands on the target or bound for any
 * dt, it never overshoots.
 */
class RampGenerator {
public:
    /// Travel request; bounds are resolved on every step
    enum class Direction { UP, DOWN, TARGET };

private:
    double output_{0.0};
    double target_{0.0};   ///< Used for Direction::TARGET
    Direction direction_{Direction::TARGET};
    double rate_{10.0};    ///< Units per second
    double lower_{0.0};
    double upper_{100.0};

    double clamp(double v) const {
        return std::max(lower_, std::min(upper_, v));
    }

public:
    RampGenerator() = default;

    RampGenerator(double rate, double lower, double upper) {
        set_limits(lower, upper);
        set_rate(rate);
    }

    /**
     * @brief Head toward the upper bound
     */
    void drive_to_max() { direction_ = Direction::UP; }

    /**
     * @brief Head toward the lower bound
     */
    void drive_to_min() { direction_ = Direction::DOWN; }

    /**
     * @brief Stop at the current output
     */
    void hold() {
        direction_ = Direction::TARGET;
        target_ = output_;
    }

    /**
     * @brief Head toward an arbitrary value, clamped into the bounds
     */
    void set_target(double value) {
        direction_ = Direction::TARGET;
        target_ = clamp(value);
    }

    /**
     * @brief Set the output immediately, bypassing the rate limit
     *
     * Intended for initial conditions. The value is clamped into the
     * bounds and the generator holds there afterwards.
     */
    void force_output(double value) {
        output_ = clamp(value);
        direction_ = Direction::TARGET;
        target_ = output_;
    }

    /**
     * @brief Advance the output toward the target
     * @param dt Step time in seconds
     */
    void step(double dt) {
        if (dt <= 0.0) {
            return;
        }
        double max_delta = rate_ * dt;
        double goal = target();
        double diff = goal - output_;
        if (diff > max_delta) {
            output_ += max_delta;
        } else if (diff < -max_delta) {
            output_ -= max_delta;
        } else {
            output_ = goal;
        }
        output_ = clamp(output_);
    }

    /**
     * @brief Set maximum rate of change
     * @param rate Units per second, must be positive
     * @throws std::invalid_argument for rate <= 0
     */
    void set_rate(double rate) {
        if (!(rate > 0.0)) {
            throw std::invalid_argument("rate must be a positive value.");
        }
        rate_ = rate;
    }

    /**
     * @brief Set output bounds, output and target are clamped into them
     * @throws std::invalid_argument if lower >= upper
     */
    void set_limits(double lower, double upper) {
        if (!(lower < upper)) {
            throw std::invalid_argument("lower limit must be below upper limit.");
        }
        lower_ = lower;
        upper_ = upper;
        output_ = clamp(output_);
        target_ = clamp(target_);
    }

    double output() const { return output_; }
    /**
     * @brief Value the output currently heads for
     */
    double target() const {
        switch (direction_) {
            case Direction::UP: return upper_;
            case Direction::DOWN: return lower_;
            case Direction::TARGET: break;
        }
        return target_;
    }

    Direction direction() const { return direction_; }
    double rate() const { return rate_; }
    double lower_limit() const { return lower_; }
    double upper_limit() const { return upper_; }

    bool at_upper_limit() const { return output_ >= upper_; }
    bool at_lower_limit() const { return output_ <= lower_; }
    bool is_moving() const { return output_ != target(); }
};
