#pragma once
#include <algorithm>
#include <stdexcept>

/**
 * @brief Discrete time integrator with output limitation
 *
 * y(k) = clamp(y(k-1) + u * dt / tI, min, max)
 */
struct Integrator {
    double input{0.0};    ///< Integrated input u
    double output{0.0};   ///< Output y
    double out_min{0.0};  ///< Lower output limit
    double out_max{100.0}; ///< Upper output limit

    /**
     * @brief Execute one integration step
     * @param dt Time step in seconds
     */
    void step(double dt) {
        double value = output + input * dt / ti_;
        output = std::max(out_min, std::min(out_max, value));
    }

    /**
     * @brief Set integration time constant
     * @param ti Time in seconds after which a unit input has added one unit
     * @throws std::invalid_argument for ti <= 0
     */
    void set_time_constant(double ti) {
        if (!(ti > 0.0)) {
            throw std::invalid_argument("integration time must be a positive value.");
        }
        ti_ = ti;
    }

    double time_constant() const { return ti_; }

private:
    double ti_{10.0};
};
