#pragma once
#include "command.hpp"
#include "events.hpp"
#include "telemetry.hpp"
#include <string>

/**
 * @brief Component advanced once per time quantum by the scheduler
 *
 * step() must not block, sleep or do I/O and must not throw.
 */
class Steppable {
public:
    virtual ~Steppable() = default;

    /**
     * @brief Advance the component by one quantum
     * @param dt Step time in seconds
     */
    virtual void step(double dt) = 0;
};

/**
 * @brief Component that can claim operator commands
 */
class Commandable {
public:
    virtual ~Commandable() = default;

    /**
     * @brief Offer a command to this component
     * @return true if the command was addressed to and consumed by it
     */
    virtual bool handle_command(const Command& cmd) = 0;
};

/**
 * @brief Optional event and telemetry outputs of a component
 *
 * Both collaborators are optional; pushing to an unset one is a no-op.
 */
class Observable {
protected:
    EventQueue* events_{nullptr};
    TelemetrySink* telemetry_{nullptr};

    void emit(const std::string& name, const std::string& old_state,
              const std::string& new_state) {
        if (events_) {
            events_->emit(StateEvent{name, old_state, new_state});
        }
    }

    void publish(const std::string& name, double value) {
        if (telemetry_) telemetry_->push(name, value);
    }

    void publish(const std::string& name, bool value) {
        if (telemetry_) telemetry_->push(name, value);
    }

public:
    virtual ~Observable() = default;

    /**
     * @brief Route state change events into a queue
     */
    virtual void connect_events(EventQueue& queue) { events_ = &queue; }

    /**
     * @brief Push step outputs to a telemetry receiver
     */
    virtual void connect_telemetry(TelemetrySink& sink) { telemetry_ = &sink; }
};
