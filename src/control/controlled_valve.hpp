#pragma once
#include "../core/pi_controller.hpp"
#include "automated_valve.hpp"
#include <string>
#include <variant>

/**
 * @brief Automated valve positioned by a cascaded PI controller
 *
 * In AUTOMATIC the controller output is the actuator target. In MANUAL
 * the controller tracks the actuator position as follow-up so the
 * change back to AUTOMATIC is bumpless.
 *
 * Operator commands go to "<name>ControlCommand" with a ControlCommand
 * payload. OUTPUT_INCREASE / OUTPUT_DECREASE take over the valve
 * temporarily; the following OUTPUT_CONTINUE stops it and returns to
 * AUTOMATIC if the controller was automatic before the override.
 *
 * A tripped safety interlock switches the controller to MANUAL.
 */
class ControlledValve : public Steppable, public Commandable, public Observable {
private:
    AutomatedValve valve_;
    PIController controller_;
    std::string name_{"unnamed"};
    std::string command_name_{"unnamedControlCommand"};
    bool output_override_{false};

public:
    ControlledValve() {
        controller_.set_min_output(-1.0);
    }

    void set_name(const std::string& name) {
        name_ = name;
        command_name_ = name + "ControlCommand";
        valve_.set_name(name);
        controller_.set_name(name);
    }
    const std::string& name() const { return name_; }

    void connect_events(EventQueue& queue) override {
        Observable::connect_events(queue);
        valve_.connect_events(queue);
        controller_.connect_events(queue);
    }

    void connect_telemetry(TelemetrySink& sink) override {
        Observable::connect_telemetry(sink);
        valve_.connect_telemetry(sink);
    }

    /**
     * @brief Control difference fed to the controller
     */
    void set_input(double error) { controller_.set_input(error); }

    void step(double dt) override {
        if (!controller_.is_manual()) {
            valve_.operate_set_opening(controller_.output());
        }

        valve_.step(dt);

        // interlocks are sampled inside the valve step; after the trip the
        // valve stays where the interlock left it
        if (valve_.is_interlocked() && !controller_.is_manual()) {
            controller_.set_manual(true);
            valve_.operate_stop();
            output_override_ = false;
        }

        controller_.set_follow_up(valve_.opening());
        controller_.step(dt);

        publish(name_ + "ControllerOutput", controller_.output());
    }

    bool handle_command(const Command& cmd) override {
        if (cmd.target != command_name_) {
            return false;
        }
        const auto* c = std::get_if<ControlCommand>(&cmd.payload);
        if (!c) {
            return true;
        }
        switch (*c) {
            case ControlCommand::AUTOMATIC:
                controller_.set_manual(false);
                output_override_ = false;
                break;
            case ControlCommand::MANUAL_OPERATION:
                controller_.set_manual(true);
                output_override_ = false;
                valve_.operate_stop();
                break;
            case ControlCommand::OUTPUT_INCREASE:
                output_override_ = output_override_ || !controller_.is_manual();
                controller_.set_manual(true);
                valve_.operate_open();
                break;
            case ControlCommand::OUTPUT_DECREASE:
                output_override_ = output_override_ || !controller_.is_manual();
                controller_.set_manual(true);
                valve_.operate_close();
                break;
            case ControlCommand::OUTPUT_CONTINUE:
                valve_.operate_stop();
                if (output_override_) {
                    controller_.set_manual(false);
                    output_override_ = false;
                }
                break;
            default:
                break;
        }
        return true;
    }

    const std::string& command_name() const { return command_name_; }

    bool override_active() const { return output_override_; }

    double opening() const { return valve_.opening(); }

    AutomatedValve& valve() { return valve_; }
    PIController& controller() { return controller_; }
    const PIController& controller() const { return controller_; }
};
