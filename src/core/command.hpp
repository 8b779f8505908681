#pragma once
#include <string>
#include <variant>

/**
 * @brief Controller operating mode
 */
enum class ControlMode {
    MANUAL,     ///< Output shadows the follow-up value
    AUTOMATIC   ///< Output computed from the control error
};

/**
 * @brief Operator commands for controllers and setpoints
 *
 * OUTPUT_* commands are momentary overrides of a controlled valve,
 * SETPOINT_* commands move a named setpoint.
 */
enum class ControlCommand {
    AUTOMATIC,
    MANUAL_OPERATION,
    OUTPUT_INCREASE,
    OUTPUT_DECREASE,
    OUTPUT_CONTINUE,
    SETPOINT_INCREASE,
    SETPOINT_DECREASE,
    SETPOINT_STOP
};

inline std::string to_string(ControlMode mode) {
    return mode == ControlMode::AUTOMATIC ? "AUTOMATIC" : "MANUAL";
}

inline std::string to_string(ControlCommand cmd) {
    switch (cmd) {
        case ControlCommand::AUTOMATIC: return "AUTOMATIC";
        case ControlCommand::MANUAL_OPERATION: return "MANUAL_OPERATION";
        case ControlCommand::OUTPUT_INCREASE: return "OUTPUT_INCREASE";
        case ControlCommand::OUTPUT_DECREASE: return "OUTPUT_DECREASE";
        case ControlCommand::OUTPUT_CONTINUE: return "OUTPUT_CONTINUE";
        case ControlCommand::SETPOINT_INCREASE: return "SETPOINT_INCREASE";
        case ControlCommand::SETPOINT_DECREASE: return "SETPOINT_DECREASE";
        case ControlCommand::SETPOINT_STOP: return "SETPOINT_STOP";
    }
    return "INVALID_COMMAND";
}

/**
 * @brief Parse a command name as sent by operator panels
 * @param name Upper case command name, e.g. "OUTPUT_INCREASE"
 * @param out Receives the parsed command
 * @return false if the name is unknown
 */
inline bool parse_control_command(const std::string& name, ControlCommand& out) {
    static const ControlCommand all[] = {
        ControlCommand::AUTOMATIC, ControlCommand::MANUAL_OPERATION,
        ControlCommand::OUTPUT_INCREASE, ControlCommand::OUTPUT_DECREASE,
        ControlCommand::OUTPUT_CONTINUE, ControlCommand::SETPOINT_INCREASE,
        ControlCommand::SETPOINT_DECREASE, ControlCommand::SETPOINT_STOP};
    for (auto c : all) {
        if (to_string(c) == name) {
            out = c;
            return true;
        }
    }
    return false;
}

/**
 * @brief Operator command addressed to a named component
 *
 * The payload shape selects the meaning:
 * - bool: full open/close or start/stop
 * - int: momentary tri-state switch (-1 close, +1 open, 0 release)
 * - double: numeric target value
 * - ControlCommand: controller mode and setpoint operations
 */
struct Command {
    using Payload = std::variant<bool, int, double, ControlCommand>;

    std::string target;  ///< Name of the component that shall consume it
    Payload payload;     ///< Command value
};
