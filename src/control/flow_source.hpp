#pragma once
#include "../core/capabilities.hpp"
#include "../hw/iactuator.hpp"
#include "setpoint.hpp"
#include "valve_monitor.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <variant>

/**
 * @brief Flow source with a setpoint-driven flow, used in place of a valve
 *
 * The flow (kg/s) ramps like a valve actuator and is written to the
 * network flow source each step. Toward operators and telemetry it looks
 * like a valve: the position is reported as flow / max_flow * 100 %.
 *
 * Accepts the valve commands on its name (int tri-state and bool) and,
 * through its Setpoint, the SETPOINT_* commands on the same name.
 */
class ControlledFlowSource : public Steppable, public Commandable, public Observable {
private:
    Setpoint value_{"unnamedFlowSource", 20.0, 0.0, 80.0};
    ValveActuatorMonitor monitor_;
    IActuator* source_{nullptr};
    std::string name_{"unnamedFlowSource"};
    double max_flow_{80.0};  ///< Flow at 100 % pseudo position in kg/s

public:
    void set_name(const std::string& name) {
        name_ = name;
        value_.set_name(name);
        monitor_.set_name(name);
    }
    const std::string& name() const { return name_; }

    void connect_events(EventQueue& queue) override {
        Observable::connect_events(queue);
        monitor_.connect_events(queue);
    }

    /**
     * @brief Attach the network flow source
     */
    void attach_source(IActuator& source) {
        source_ = &source;
        source_->set(value_.value());
    }

    /**
     * @brief Set maximum flow and the time for a full 0 -> max ramp
     * @param max_flow Flow in kg/s at 100 %
     * @param time Seconds from zero to max flow
     * @throws std::invalid_argument for non-positive values
     */
    void set_characteristic(double max_flow, double time) {
        if (!(max_flow > 0.0)) {
            throw std::invalid_argument("maxFlow must be a positive value.");
        }
        if (!(time > 0.0)) {
            throw std::invalid_argument("time must be a positive value.");
        }
        value_.ramp().set_limits(0.0, max_flow);
        value_.ramp().set_rate(max_flow / time);
        max_flow_ = max_flow;
    }

    /**
     * @brief Initial flow without ramp time
     */
    void init_flow(double flow) {
        value_.ramp().force_output(flow);
        if (source_) {
            source_->set(value_.value());
        }
    }

    void step(double dt) override {
        value_.step(dt);
        if (source_) {
            source_->set(value_.value());
        }
        double position = position_percent();
        monitor_.update(position);
        publish(name_, position);
    }

    bool handle_command(const Command& cmd) override {
        if (cmd.target != name_) {
            return false;
        }
        if (const auto* i = std::get_if<int>(&cmd.payload)) {
            switch (*i) {
                case -1: set_to_min_flow(); break;
                case +1: set_to_max_flow(); break;
                default: stop_at_current_flow(); break;
            }
            return true;
        }
        if (const auto* b = std::get_if<bool>(&cmd.payload)) {
            if (*b) {
                set_to_max_flow();
            } else {
                set_to_min_flow();
            }
            return true;
        }
        return value_.handle_command(cmd);
    }

    void set_to_max_flow() { value_.ramp().drive_to_max(); }
    void set_to_min_flow() { value_.ramp().drive_to_min(); }
    void stop_at_current_flow() { value_.ramp().hold(); }

    double flow() const { return value_.value(); }
    double max_flow() const { return max_flow_; }

    double position_percent() const {
        return value_.value() / max_flow_ * 100.0;
    }

    Setpoint& setpoint() { return value_; }
};
