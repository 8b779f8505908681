#pragma once
#include "../core/capabilities.hpp"
#include "../core/command.hpp"
#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Offers operator commands to a chain of components
 *
 * Each registered component gets the command in registration order until
 * one reports it as consumed. Unclaimed commands are counted, they are
 * not an error.
 */
class CommandRouter {
private:
    std::vector<Commandable*> targets_;
    uint64_t consumed_{0};
    uint64_t unclaimed_{0};

public:
    void add(Commandable& target) { targets_.push_back(&target); }

    size_t size() const { return targets_.size(); }

    /**
     * @brief Deliver a command
     * @return true if a component consumed it
     */
    bool route(const Command& cmd) {
        for (auto* t : targets_) {
            if (t->handle_command(cmd)) {
                consumed_++;
                return true;
            }
        }
        unclaimed_++;
        return false;
    }

    uint64_t consumed_count() const { return consumed_; }
    uint64_t unclaimed_count() const { return unclaimed_; }
};

/**
 * @brief Decode a component command from its JSON wire form
 *
 * {"target": "<name>", "value": <payload>} where the JSON type selects
 * the payload: boolean -> bool, integer -> tri-state int, floating point
 * -> numeric target, string -> ControlCommand name. Integers outside the
 * int range are rejected.
 *
 * @param j Parsed message
 * @param error Receives the reason on failure
 * @return The command, empty if the message is not a valid command
 */
inline std::optional<Command> command_from_json(const nlohmann::json& j, std::string& error) {
    if (!j.is_object()) {
        error = "message is not an object";
        return std::nullopt;
    }
    auto target = j.find("target");
    if (target == j.end() || !target->is_string()) {
        error = "missing target";
        return std::nullopt;
    }
    auto value = j.find("value");
    if (value == j.end()) {
        error = "missing value";
        return std::nullopt;
    }

    Command cmd;
    cmd.target = target->get<std::string>();

    if (value->is_boolean()) {
        cmd.payload = value->get<bool>();
    } else if (value->is_number_unsigned()) {
        auto u = value->get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            error = "value out of range";
            return std::nullopt;
        }
        cmd.payload = static_cast<int>(u);
    } else if (value->is_number_integer()) {
        auto i = value->get<std::int64_t>();
        if (i < std::numeric_limits<int>::min() || i > std::numeric_limits<int>::max()) {
            error = "value out of range";
            return std::nullopt;
        }
        cmd.payload = static_cast<int>(i);
    } else if (value->is_number_float()) {
        double d = value->get<double>();
        if (!std::isfinite(d)) {
            error = "value is not finite";
            return std::nullopt;
        }
        cmd.payload = d;
    } else if (value->is_string()) {
        ControlCommand c;
        if (!parse_control_command(value->get<std::string>(), c)) {
            error = "unknown control command: " + value->get<std::string>();
            return std::nullopt;
        }
        cmd.payload = c;
    } else {
        error = "unsupported value type";
        return std::nullopt;
    }
    return cmd;
}

/**
 * @brief Encode a command in its JSON wire form
 */
inline nlohmann::json command_to_json(const Command& cmd) {
    nlohmann::json j{{"target", cmd.target}};
    std::visit([&j](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, ControlCommand>) {
            j["value"] = to_string(v);
        } else {
            j["value"] = v;
        }
    }, cmd.payload);
    return j;
}
