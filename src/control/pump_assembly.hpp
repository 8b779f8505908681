#pragma once
#include "../core/capabilities.hpp"
#include "../hw/iactuator.hpp"
#include "../safety/safety_input.hpp"
#include "automated_valve.hpp"
#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

/**
 * @brief Externally visible state of a pump assembly
 */
enum class PumpState { OFFLINE, READY, STARTUP, RUNNING };

inline std::string to_string(PumpState s) {
    switch (s) {
        case PumpState::OFFLINE: return "OFFLINE";
        case PumpState::READY: return "READY";
        case PumpState::STARTUP: return "STARTUP";
        case PumpState::RUNNING: return "RUNNING";
    }
    return "INVALID_PUMP_STATE";
}

/**
 * @brief Pump with suction and discharge valve and its start/stop sequencer
 *
 * The sequencer only allows what may be done with a real centrifugal pump:
 * it starts against an open suction and a closed discharge valve, waits
 * for a confirmation time, runs a startup phase and only then applies the
 * full head. A restart lock of 30 s counted from the last switch-on
 * prevents frequent starts.
 *
 * Sequence (index: visible state):
 * - 0 OFFLINE: -> 1 when ready
 * - 1 OFFLINE: -> 2 after 1.5 s, -> 0 when not ready
 * - 2 READY: -> 0 when not ready, -> 3 on start command
 * - 3 READY: -> 4 after 0.8 s, -> 0 when not ready
 * - 4 STARTUP: -> 5 after 3.0 s (energize), -> 0 when not ready
 * - 5 RUNNING: -> 0 on safety loss (valves close) or suction < 20 %
 * A stop command returns to 0 from any state.
 *
 * Timers are elapsed-time accumulators advanced by the step time, so the
 * sequence does not depend on the wall clock.
 */
class PumpAssembly : public Steppable, public Commandable, public Observable {
public:
    using Duration = std::chrono::nanoseconds;

    static constexpr Duration kConfirmTime = std::chrono::milliseconds(1500);
    static constexpr Duration kArmTime = std::chrono::milliseconds(800);
    static constexpr Duration kStartupTime = std::chrono::milliseconds(3000);
    static constexpr Duration kRestartLock = std::chrono::seconds(30);

    static constexpr double kSuctionOpenLimit = 95.0;    ///< % required for ready
    static constexpr double kDischargeClosedLimit = 1.0; ///< % allowed for ready and start
    static constexpr double kSuctionTripLimit = 20.0;    ///< % below trips a running pump

private:
    AutomatedValve suction_;
    AutomatedValve discharge_;
    SafetyInput safe_to_operate_{"safeToOperate"};

    IValveElement* suction_element_{nullptr};
    IValveElement* discharge_element_{nullptr};
    IActuator* pump_{nullptr};

    std::string name_{"unnamedPump"};

    double total_head_{0.0};
    double valve_resistance_{0.0};  ///< Full open resistance per valve, 0 = not set
    double effort_{0.0};

    int sequence_{0};
    PumpState state_{PumpState::OFFLINE};
    std::optional<PumpState> last_reported_;
    bool ready_{false};

    Duration state_elapsed_{0};
    std::optional<Duration> since_switch_on_;

    void go_offline() {
        sequence_ = 0;
        state_ = PumpState::OFFLINE;
        effort_ = 0.0;
    }

    void enter(int sequence) {
        sequence_ = sequence;
        state_elapsed_ = Duration::zero();
    }

    void apply_characteristic() {
        if (valve_resistance_ <= 0.0) {
            return;
        }
        if (suction_element_) {
            suction_element_->set_resistance_full_open(valve_resistance_);
            suction_element_->set_characteristic(true, 0.0);
        }
        if (discharge_element_) {
            discharge_element_->set_resistance_full_open(valve_resistance_);
            discharge_element_->set_characteristic(true, 0.0);
        }
    }

    void write_outputs() {
        if (suction_element_) {
            suction_element_->set(std::max(0.0, suction_.opening()));
        }
        if (discharge_element_) {
            // no check valve in the network model: a pump that is not
            // running keeps its discharge path closed
            discharge_element_->set(state_ == PumpState::RUNNING
                                        ? std::max(0.0, discharge_.opening())
                                        : 0.0);
        }
        if (pump_) {
            pump_->set(effort_);
        }
    }

public:
    PumpAssembly() {
        for (auto* v : {&suction_, &discharge_}) {
            v->ramp().set_rate(15.0);
            v->ramp().set_limits(-5.0, 100.0);
        }
        suction_.set_name(name_ + "SuctionValve");
        discharge_.set_name(name_ + "DischargeValve");
    }

    void set_name(const std::string& name) {
        name_ = name;
        suction_.set_name(name + "SuctionValve");
        discharge_.set_name(name + "DischargeValve");
        safe_to_operate_.set_name(name + "SafeToOperate");
    }
    const std::string& name() const { return name_; }

    void connect_events(EventQueue& queue) override {
        Observable::connect_events(queue);
        suction_.connect_events(queue);
        discharge_.connect_events(queue);
    }

    void connect_telemetry(TelemetrySink& sink) override {
        Observable::connect_telemetry(sink);
        suction_.connect_telemetry(sink);
        discharge_.connect_telemetry(sink);
    }

    /**
     * @brief Attach the network elements driven by this assembly
     */
    void attach_elements(IValveElement& suction, IActuator& pump, IValveElement& discharge) {
        suction_element_ = &suction;
        discharge_element_ = &discharge;
        pump_ = &pump;
        apply_characteristic();
        write_outputs();
    }

    /**
     * @brief Define the linear pump characteristic
     *
     * @param total_head Pressure against a closed discharge in Pa
     * @param working_pressure Pressure added in the design point in Pa
     * @param working_flow Flow in the design point in kg/s
     * @throws std::invalid_argument if working_pressure >= total_head or a
     *         value is not positive
     */
    void set_characteristic(double total_head, double working_pressure, double working_flow) {
        if (!(working_pressure < total_head)) {
            throw std::invalid_argument("totalHead has to be higher than the working pressure.");
        }
        if (!(working_flow > 0.0)) {
            throw std::invalid_argument("workingFlow has to be a positive value.");
        }
        if (!(working_pressure > 0.0)) {
            throw std::invalid_argument("workingPressure has to be a positive value.");
        }
        total_head_ = total_head;
        valve_resistance_ = (total_head - working_pressure) / working_flow * 0.5;
        if (state_ == PumpState::RUNNING) {
            effort_ = total_head_;
        }
        apply_characteristic();
    }

    /**
     * @brief Start the simulation with open valves or a running pump
     *
     * Open valves are set to 100 % without travel time. A running pump
     * enters the sequence in RUNNING and is energized.
     *
     * @throws std::invalid_argument for a running pump with closed suction
     */
    void set_initial_condition(bool pump_active, bool suction_open, bool discharge_open) {
        if (pump_active && !suction_open) {
            throw std::invalid_argument(name_ + ": a running pump needs an open suction valve.");
        }
        if (suction_open) {
            suction_.init_opening(100.0);
        }
        if (discharge_open) {
            discharge_.init_opening(100.0);
        }
        if (pump_active) {
            sequence_ = 5;
            state_ = PumpState::RUNNING;
            effort_ = total_head_;
        } else {
            go_offline();
        }
        state_elapsed_ = Duration::zero();
        write_outputs();
    }

    void step(double dt) override {
        auto quantum = std::chrono::round<Duration>(std::chrono::duration<double>(dt));
        bool safe = safe_to_operate_.sample();

        suction_.step(dt);
        discharge_.step(dt);

        state_elapsed_ += quantum;
        if (since_switch_on_) {
            *since_switch_on_ += quantum;
        }

        ready_ = safe
            && suction_.opening() >= kSuctionOpenLimit
            && discharge_.opening() <= kDischargeClosedLimit
            && (!since_switch_on_ || *since_switch_on_ >= kRestartLock);

        switch (sequence_) {
            case 0:
                if (ready_) {
                    enter(1);
                }
                break;
            case 1:
                if (state_elapsed_ >= kConfirmTime) {
                    state_ = PumpState::READY;
                    enter(2);
                }
                // the READY abort check also guards the confirmation time
                [[fallthrough]];
            case 2:
                if (!ready_) {
                    go_offline();
                }
                break;
            case 3:
                if (state_elapsed_ >= kArmTime) {
                    state_ = PumpState::STARTUP;
                    enter(4);
                } else if (!ready_) {
                    go_offline();
                }
                break;
            case 4:
                if (state_elapsed_ >= kStartupTime) {
                    enter(5);
                    since_switch_on_ = Duration::zero();
                    state_ = PumpState::RUNNING;
                    effort_ = total_head_;
                } else if (!ready_) {
                    go_offline();
                }
                break;
            case 5:
                if (!safe) {
                    go_offline();
                    operate_close_suction_valve();
                    operate_close_discharge_valve();
                } else if (suction_.opening() < kSuctionTripLimit) {
                    go_offline();
                }
                break;
        }

        write_outputs();

        publish(name_ + "Running", state_ == PumpState::RUNNING);
        if (state_ != last_reported_) {
            emit(name_ + "PumpState",
                 last_reported_ ? to_string(*last_reported_) : std::string(),
                 to_string(state_));
            last_reported_ = state_;
        }
    }

    /**
     * @brief Process commands addressed to the assembly
     *
     * Valve commands go to "<name>SuctionValve" / "<name>DischargeValve",
     * pump commands to "<name>Pump" (true start, false stop).
     */
    bool handle_command(const Command& cmd) override {
        if (cmd.target.compare(0, name_.size(), name_) != 0) {
            return false;
        }
        if (suction_.handle_command(cmd) || discharge_.handle_command(cmd)) {
            return true;
        }
        if (cmd.target == name_ + "Pump") {
            if (const auto* b = std::get_if<bool>(&cmd.payload)) {
                if (*b) {
                    operate_start_pump();
                } else {
                    operate_stop_pump();
                }
            }
            return true;
        }
        return false;
    }

    void operate_open_suction_valve() { suction_.operate_open(); }
    void operate_close_suction_valve() { suction_.operate_close(); }
    void operate_open_discharge_valve() { discharge_.operate_open(); }
    void operate_close_discharge_valve() { discharge_.operate_close(); }

    /**
     * @brief Start request, only accepted in READY with closed discharge
     * @return true if the start sequence was armed
     */
    bool operate_start_pump() {
        if (sequence_ == 2 && discharge_.opening() <= kDischargeClosedLimit) {
            enter(3);
            return true;
        }
        return false;
    }

    /**
     * @brief Unconditional stop from any state
     */
    void operate_stop_pump() {
        go_offline();
        write_outputs();
    }

    /**
     * @brief Latch the safe-to-operate signal
     * @throws std::invalid_argument if a provider is attached
     */
    void set_safe_to_operate(bool safe) { safe_to_operate_.set(safe); }
    SafetyInput& safe_to_operate() { return safe_to_operate_; }

    PumpState state() const { return state_; }
    int sequence() const { return sequence_; }
    bool is_ready() const { return ready_; }
    bool is_running() const { return state_ == PumpState::RUNNING; }
    double effort() const { return effort_; }
    double total_head() const { return total_head_; }
    double valve_resistance() const { return valve_resistance_; }

    /**
     * @brief Time since the last switch-on, empty if never switched on
     */
    std::optional<Duration> time_since_switch_on() const { return since_switch_on_; }

    AutomatedValve& suction_valve() { return suction_; }
    AutomatedValve& discharge_valve() { return discharge_; }
    const AutomatedValve& suction_valve() const { return suction_; }
    const AutomatedValve& discharge_valve() const { return discharge_; }
};
