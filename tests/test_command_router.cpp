#include "../src/control/command_router.hpp"
#include "../src/control/automated_valve.hpp"
#include "../src/control/controlled_valve.hpp"
#include "../src/control/setpoint.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Test command routing and the JSON command codec
 *
 * This test suite verifies:
 * 1. Routing stops at the first consumer
 * 2. Unclaimed commands are counted
 * 3. JSON value types select the payload
 * 4. Malformed commands are rejected with a reason
 */

using json = nlohmann::json;

int main() {
    std::cout << "Testing command routing..." << std::endl;

    AutomatedValve drain;
    drain.set_name("DrainValve");
    ControlledValve level;
    level.set_name("LevelValve");
    Setpoint sp("LevelSetpoint", 2.0, 0.0, 100.0);

    CommandRouter router;
    router.add(drain);
    router.add(level);
    router.add(sp);
    assert(router.size() == 3);

    // Test 1: Routing
    {
        std::cout << "Test 1: Routing" << std::endl;
        assert(router.route(Command{"DrainValve", true}));
        assert(drain.drive() == AutomatedValve::Drive::OPEN);
        assert(router.route(Command{"LevelValveControlCommand", ControlCommand::AUTOMATIC}));
        assert(!level.controller().is_manual());
        assert(router.route(Command{"LevelSetpoint", ControlCommand::SETPOINT_INCREASE}));
        assert(router.consumed_count() == 3);
        std::cout << "  Commands reached their components" << std::endl;
    }

    // Test 2: Unclaimed
    {
        std::cout << "Test 2: Unclaimed commands" << std::endl;
        assert(!router.route(Command{"NoSuchValve", 1}));
        assert(router.unclaimed_count() == 1);
        assert(router.consumed_count() == 3);
        std::cout << "  Unknown target counted, not an error" << std::endl;
    }

    // Test 3: Decoding payload types
    {
        std::cout << "Test 3: JSON payload types" << std::endl;
        std::string error;

        auto c = command_from_json(json::parse(R"({"target":"FeedPumpPump","value":true})"), error);
        assert(c && c->target == "FeedPumpPump");
        assert(std::get<bool>(c->payload) == true);

        c = command_from_json(json::parse(R"({"target":"FeedValve","value":-1})"), error);
        assert(c && std::get<int>(c->payload) == -1);

        c = command_from_json(json::parse(R"({"target":"FeedValve","value":42.5})"), error);
        assert(c && std::get<double>(c->payload) == 42.5);

        c = command_from_json(json::parse(R"({"target":"LevelValveControlCommand","value":"OUTPUT_CONTINUE"})"), error);
        assert(c && std::get<ControlCommand>(c->payload) == ControlCommand::OUTPUT_CONTINUE);

        // encoder produces the same wire form
        auto j = command_to_json(*c);
        assert(j["target"] == "LevelValveControlCommand");
        assert(j["value"] == "OUTPUT_CONTINUE");
        assert(command_to_json(Command{"FeedValve", 1})["value"].is_number_integer());
        assert(command_to_json(Command{"FeedValve", 2.5})["value"].is_number_float());
        std::cout << "  bool, int, float and command names decoded" << std::endl;
    }

    // Test 4: Rejections
    {
        std::cout << "Test 4: Malformed commands" << std::endl;
        std::string error;
        assert(!command_from_json(json::parse(R"([1,2])"), error));
        assert(error == "message is not an object");
        assert(!command_from_json(json::parse(R"({"value":1})"), error));
        assert(error == "missing target");
        assert(!command_from_json(json::parse(R"({"target":"FeedValve"})"), error));
        assert(error == "missing value");
        assert(!command_from_json(json::parse(R"({"target":"FeedValve","value":"OPEN_WIDE"})"), error));
        assert(error.find("OPEN_WIDE") != std::string::npos);
        assert(!command_from_json(json::parse(R"({"target":"FeedValve","value":[1]})"), error));
        assert(error == "unsupported value type");

        // integers that do not fit an int are not wrapped
        assert(!command_from_json(json::parse(R"({"target":"FeedValve","value":4294967297})"), error));
        assert(error == "value out of range");
        assert(!command_from_json(json::parse(R"({"target":"FeedValve","value":18446744073709551615})"), error));
        assert(error == "value out of range");
        assert(!command_from_json(json::parse(R"({"target":"FeedValve","value":-4294967297})"), error));
        assert(error == "value out of range");
        assert(!command_from_json(json::parse(R"({"target":"FeedValve","value":2147483648})"), error));
        assert(error == "value out of range");
        auto edge = command_from_json(json::parse(R"({"target":"FeedValve","value":-2147483648})"), error);
        assert(edge);
        assert(std::get<int>(edge->payload) == -2147483647 - 1);

        ControlCommand parsed;
        assert(parse_control_command("SETPOINT_STOP", parsed));
        assert(parsed == ControlCommand::SETPOINT_STOP);
        assert(!parse_control_command("setpoint_stop", parsed));
        std::cout << "  Invalid messages rejected with reason" << std::endl;
    }

    std::cout << "All command routing tests passed!" << std::endl;
    return 0;
}
