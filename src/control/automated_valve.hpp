#pragma once
#include "../core/capabilities.hpp"
#include "../core/ramp_generator.hpp"
#include "../hw/iactuator.hpp"
#include "../safety/safety_input.hpp"
#include "valve_monitor.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <variant>

/**
 * @brief Motor operated valve with safety interlocks
 *
 * The actuator is a RampGenerator (25 %/s, travel -5..100 %) that follows
 * the operator's last command. Two permissive safety signals override the
 * command while they are FALSE:
 * - safe-to-close FALSE drives the valve closed
 * - safe-to-open FALSE drives the valve open (only if safe-to-close holds)
 * The operator command applies again once both signals are TRUE.
 *
 * Without an attached valve element the class models a valve that does
 * not exist in the network and only provides a position for simplified
 * modeling. With an element attached the opening is written to it every
 * step.
 *
 * Accepted commands (target must equal the valve name):
 * - int: -1 close, +1 open, anything else stop (switch released)
 * - bool: true open, false close
 * - double: move to opening in percent
 */
class AutomatedValve : public Steppable, public Commandable, public Observable {
public:
    /// Operator intent applied to the actuator each step
    enum class Drive { NONE, OPEN, CLOSE, HOLD, TARGET };

private:
    RampGenerator ramp_{25.0, -5.0, 100.0};
    ValveActuatorMonitor monitor_;
    SafetyInput safe_to_close_{"safeToClose"};
    SafetyInput safe_to_open_{"safeToOpen"};
    IValveElement* element_{nullptr};
    std::string name_{"unnamedAutomatedValve"};

    Drive drive_{Drive::NONE};
    double drive_target_{0.0};
    bool interlocked_{false};

    void apply_drive() {
        switch (drive_) {
            case Drive::OPEN: ramp_.drive_to_max(); break;
            case Drive::CLOSE: ramp_.drive_to_min(); break;
            case Drive::HOLD: ramp_.hold(); break;
            case Drive::TARGET: ramp_.set_target(drive_target_); break;
            case Drive::NONE: break;
        }
    }

public:
    void set_name(const std::string& name) {
        name_ = name;
        monitor_.set_name(name);
        safe_to_close_.set_name(name + "SafeToClose");
        safe_to_open_.set_name(name + "SafeToOpen");
    }
    const std::string& name() const { return name_; }

    void connect_events(EventQueue& queue) override {
        Observable::connect_events(queue);
        monitor_.connect_events(queue);
    }

    /**
     * @brief Attach the network valve element this actuator drives
     */
    void attach_element(IValveElement& element) {
        element_ = &element;
        element_->set(std::max(0.0, ramp_.output()));
    }

    bool has_element() const { return element_ != nullptr; }

    /**
     * @brief Initialize the characteristic of the attached valve element
     *
     * @param resistance_full_open Flow resistance at 100 % opening in Pa/(kg/s)
     * @param closed_factor values above 1.0 select the non-linear
     *        characteristic with this closed factor, otherwise linear
     * @throws std::invalid_argument without element or for resistance <= 0
     */
    void set_characteristic(double resistance_full_open, double closed_factor) {
        if (!element_) {
            throw std::invalid_argument(name_ + ": no valve element attached.");
        }
        if (!(resistance_full_open > 0.0)) {
            throw std::invalid_argument(name_ + ": resistance must be a positive value.");
        }
        element_->set_resistance_full_open(resistance_full_open);
        if (closed_factor > 1.0) {
            element_->set_characteristic(false, closed_factor);
        } else {
            element_->set_characteristic(true, 0.0);
        }
    }

    /**
     * @brief Set the initial position without travel time
     */
    void init_opening(double opening) {
        ramp_.force_output(opening);
        drive_ = Drive::NONE;
        if (element_) {
            element_->set(std::max(0.0, ramp_.output()));
        }
    }

    void step(double dt) override {
        bool close_ok = safe_to_close_.sample();
        bool open_ok = safe_to_open_.sample();
        interlocked_ = !close_ok || !open_ok;

        if (!close_ok) {
            ramp_.drive_to_min();
        } else if (!open_ok) {
            ramp_.drive_to_max();
        } else {
            apply_drive();
        }

        ramp_.step(dt);
        monitor_.update(ramp_.output());

        if (element_) {
            element_->set(std::max(0.0, ramp_.output()));
        }
        publish(name_, std::max(0.0, std::min(100.0, ramp_.output())));
    }

    bool handle_command(const Command& cmd) override {
        if (cmd.target != name_) {
            return false;
        }
        if (const auto* i = std::get_if<int>(&cmd.payload)) {
            switch (*i) {
                case -1: operate_close(); break;
                case +1: operate_open(); break;
                default: operate_stop(); break;
            }
        } else if (const auto* b = std::get_if<bool>(&cmd.payload)) {
            if (*b) {
                operate_open();
            } else {
                operate_close();
            }
        } else if (const auto* d = std::get_if<double>(&cmd.payload)) {
            operate_set_opening(*d);
        }
        return true;
    }

    void operate_open() { drive_ = Drive::OPEN; }
    void operate_close() { drive_ = Drive::CLOSE; }
    void operate_stop() { drive_ = Drive::HOLD; }

    void operate_set_opening(double opening) {
        drive_ = Drive::TARGET;
        drive_target_ = opening;
    }

    Drive drive() const { return drive_; }

    /**
     * @brief Actuator position in percent, may be slightly below 0
     */
    double opening() const { return ramp_.output(); }

    /**
     * @brief True while a safety signal overrides the operator
     */
    bool is_interlocked() const { return interlocked_; }

    SafetyInput& safe_to_close() { return safe_to_close_; }
    SafetyInput& safe_to_open() { return safe_to_open_; }

    RampGenerator& ramp() { return ramp_; }
    const RampGenerator& ramp() const { return ramp_; }
    const ValveActuatorMonitor& monitor() const { return monitor_; }
};
