#pragma once
#include "capabilities.hpp"
#include "command.hpp"
#include <optional>
#include <stdexcept>
#include <string>

/**
 * @brief PI controller with anti-windup and bumpless manual/auto transfer
 *
 * Implements the discrete parallel form
 * u = K*e + I,  I(k) = I(k-1) + K*e*dt/TN
 *
 * Where:
 * - the integral part is held at (limit - proportional) while the output
 *   is saturated, so the controller does not run away and leaves the
 *   limit as soon as the error changes sign
 * - outside AUTOMATIC the integral is recomputed each step so that
 *   I + K*e equals the follow-up value; switching to AUTOMATIC then
 *   continues from the follow-up without a jump
 *
 * A value controlling loop may use a slightly negative lower limit (e.g.
 * -1) so the controller can drive the actuator firmly against its closed
 * end.
 */
class PIController : public Steppable, public Observable {
private:
    // Parameters
    double gain_{1.0};            ///< Proportional gain K
    double integral_time_{10.0};  ///< Integral time constant TN in seconds
    double out_min_{0.0};
    double out_max_{100.0};

    // Inputs
    double error_{0.0};      ///< Control difference e
    double follow_up_{0.0};  ///< Tracked value while not automatic
    bool freeze_integrator_{false};
    ControlMode mode_{ControlMode::MANUAL};

    // State
    double integral_{0.0};
    double output_{0.0};
    double last_proportional_{0.0};
    std::optional<ControlMode> last_mode_;

    std::string name_{"unnamed"};

public:
    /**
     * @brief Execute one control step
     *
     * Never throws; all paths are clamped. A mode change since the
     * previous step is reported as "<name>ControlState" event.
     *
     * @param dt Time step in seconds
     */
    void step(double dt) override {
        if (mode_ != last_mode_) {
            emit(name_ + "ControlState",
                 last_mode_ ? to_string(*last_mode_) : std::string(),
                 to_string(mode_));
            last_mode_ = mode_;
        }

        bool automatic = mode_ == ControlMode::AUTOMATIC;

        double integral_delta = 0.0;
        if (automatic && !freeze_integrator_) {
            integral_delta = error_ * gain_ * dt / integral_time_;
        }

        double proportional = error_ * gain_;
        last_proportional_ = proportional;

        // Track the follow-up so the output matches it exactly
        if (!automatic) {
            integral_ = follow_up_ - proportional;
        }

        double sum = integral_ + integral_delta + proportional;

        if (sum > out_max_) {
            output_ = out_max_;
            integral_ = out_max_ - proportional;
        } else if (sum < out_min_) {
            output_ = out_min_;
            integral_ = out_min_ - proportional;
        } else {
            output_ = sum;
            integral_ += integral_delta;
        }

        if (!automatic) {
            output_ = follow_up_;
        }
    }

    void set_name(const std::string& name) { name_ = name; }
    const std::string& name() const { return name_; }

    void set_input(double error) { error_ = error; }
    double input() const { return error_; }

    /**
     * @brief Value the output is forced to while not in AUTOMATIC
     */
    void set_follow_up(double value) { follow_up_ = value; }
    double follow_up() const { return follow_up_; }

    void set_mode(ControlMode mode) { mode_ = mode; }
    ControlMode mode() const { return mode_; }

    void set_manual(bool manual) {
        mode_ = manual ? ControlMode::MANUAL : ControlMode::AUTOMATIC;
    }
    bool is_manual() const { return mode_ != ControlMode::AUTOMATIC; }

    /**
     * @brief Stop integration while keeping AUTOMATIC mode
     */
    void set_freeze_integrator(bool freeze) { freeze_integrator_ = freeze; }
    bool integrator_frozen() const { return freeze_integrator_; }

    void set_gain(double gain) { gain_ = gain; }
    double gain() const { return gain_; }

    /**
     * @brief Set integral time constant
     *
     * Time after which the integral part has added K times a constant
     * input. Initial value: 10 s.
     *
     * @throws std::invalid_argument for values <= 0
     */
    void set_integral_time(double tn) {
        if (!(tn > 0.0)) {
            throw std::invalid_argument("integral time must be a positive value.");
        }
        integral_time_ = tn;
    }
    double integral_time() const { return integral_time_; }

    /**
     * @brief Set output limits, default [0, 100]
     * @throws std::invalid_argument if min >= max
     */
    void set_limits(double out_min, double out_max) {
        if (!(out_min < out_max)) {
            throw std::invalid_argument("minimum output must be below maximum output.");
        }
        out_min_ = out_min;
        out_max_ = out_max;
    }

    /**
     * @brief Change only the lower output limit
     * @throws std::invalid_argument if it is not below the upper limit
     */
    void set_min_output(double out_min) { set_limits(out_min, out_max_); }

    double min_output() const { return out_min_; }
    double max_output() const { return out_max_; }

    double output() const { return output_; }
    double integral() const { return integral_; }
    double proportional() const { return last_proportional_; }

    bool is_saturated() const {
        return output_ <= out_min_ || output_ >= out_max_;
    }
};
