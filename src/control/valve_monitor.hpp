#pragma once
#include "../core/capabilities.hpp"
#include <optional>
#include <string>

/**
 * @brief End position watcher of a valve actuator
 *
 * Fed with the actuator position every step and reports the two end
 * switches as events "<name>_Closed" and "<name>_Open" ("true"/"false").
 * Both switches are announced on the first update.
 *
 * The actuator may travel below 0 %; the closed switch is reached at 0 %
 * so a closing drive always overruns it by a margin.
 */
class ValveActuatorMonitor : public Observable {
private:
    std::string name_{"unnamedValve"};
    double opening_{0.0};
    double closed_below_{0.0};
    double open_above_{100.0};
    std::optional<bool> closed_;
    std::optional<bool> open_;

    void report(const char* suffix, std::optional<bool>& state, bool now) {
        if (state != now) {
            emit(name_ + suffix,
                 state ? (*state ? "true" : "false") : "",
                 now ? "true" : "false");
            state = now;
        }
    }

public:
    void set_name(const std::string& name) { name_ = name; }
    const std::string& name() const { return name_; }

    /**
     * @brief Process the actuator position of this step
     * @param opening Actuator position in percent
     */
    void update(double opening) {
        opening_ = opening;
        report("_Closed", closed_, opening <= closed_below_);
        report("_Open", open_, opening >= open_above_);
    }

    double opening() const { return opening_; }
    bool is_closed() const { return closed_.value_or(false); }
    bool is_open() const { return open_.value_or(false); }
};
