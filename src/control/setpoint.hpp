#pragma once
#include "../core/capabilities.hpp"
#include "../core/ramp_generator.hpp"
#include <string>
#include <variant>

/**
 * @brief Operator adjustable setpoint
 *
 * A named RampGenerator that listens to SETPOINT_INCREASE,
 * SETPOINT_DECREASE and SETPOINT_STOP commands addressed to its name and
 * publishes its value under the same name every step.
 */
class Setpoint : public Steppable, public Commandable, public Observable {
private:
    RampGenerator ramp_;
    std::string name_{"unnamedSetpoint"};

public:
    Setpoint() = default;

    Setpoint(const std::string& name, double rate, double lower, double upper)
        : ramp_(rate, lower, upper), name_(name) {}

    void step(double dt) override {
        ramp_.step(dt);
        publish(name_, ramp_.output());
    }

    bool handle_command(const Command& cmd) override {
        if (cmd.target != name_) {
            return false;
        }
        if (const auto* c = std::get_if<ControlCommand>(&cmd.payload)) {
            switch (*c) {
                case ControlCommand::SETPOINT_INCREASE: ramp_.drive_to_max(); break;
                case ControlCommand::SETPOINT_DECREASE: ramp_.drive_to_min(); break;
                case ControlCommand::SETPOINT_STOP: ramp_.hold(); break;
                default: break;
            }
        }
        return true;
    }

    void set_name(const std::string& name) { name_ = name; }
    const std::string& name() const { return name_; }

    double value() const { return ramp_.output(); }

    RampGenerator& ramp() { return ramp_; }
    const RampGenerator& ramp() const { return ramp_; }
};
