#include <algorithm>
#include <iostream>
#include <signal.h>
#include <atomic>
#include <thread>
#include <chrono>
#include <iomanip>
#include <stdexcept>
#include <string>

#include "core/integrator.hpp"
#include "hw/sim_elements.hpp"
#include "control/automated_valve.hpp"
#include "control/controlled_valve.hpp"
#include "control/flow_source.hpp"
#include "control/pump_assembly.hpp"
#include "control/setpoint.hpp"
#include "control/loop.hpp"
#include "ipc/telemetry_pub.hpp"
#include "ipc/control_rep.hpp"

// Global flag for clean shutdown
std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    std::cout << "\nShutdown signal received (" << signal << "), stopping..." << std::endl;
    shutdown_requested.store(true);
}

/**
 * @brief Command line options of the training plant
 */
struct Options {
    std::string pub_endpoint{"tcp://127.0.0.1:5556"};
    std::string rep_endpoint{"tcp://127.0.0.1:5555"};
    double step_time{0.1};
};

Options parse_options(int argc, char** argv) {
    Options opt;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (i + 1 >= argc) {
            throw std::invalid_argument("missing value for " + arg);
        }
        std::string value = argv[++i];
        if (arg == "--pub") {
            opt.pub_endpoint = value;
        } else if (arg == "--rep") {
            opt.rep_endpoint = value;
        } else if (arg == "--step") {
            opt.step_time = std::stod(value);
        } else {
            throw std::invalid_argument("unknown option " + arg);
        }
    }
    return opt;
}

/**
 * @brief Feed tank used as process for the demo plant
 *
 * Stand-in for the network solver: the level integrates the feed flow
 * through pump and level valve minus drain and makeup outflow. Feeds
 * the level error to the level controller.
 */
struct FeedTank : Steppable {
    Integrator level;
    PumpAssembly& pump;
    SimValveElement& feed_element;
    AutomatedValve& drain;
    ControlledFlowSource& makeup;
    ControlledValve& level_valve;
    Setpoint& level_setpoint;

    FeedTank(PumpAssembly& p, SimValveElement& feed, AutomatedValve& d,
             ControlledFlowSource& m, ControlledValve& lv, Setpoint& sp)
        : pump(p), feed_element(feed), drain(d), makeup(m), level_valve(lv), level_setpoint(sp) {
        level.set_time_constant(60.0);
        level.output = 50.0;
    }

    void step(double dt) override {
        double feed = pump.is_running() ? feed_element.get() : 0.0;
        double out = std::max(0.0, drain.opening()) * 0.6 + makeup.position_percent() * 0.2;
        level.input = feed - out;
        level.step(dt);
        level_valve.set_input(level_setpoint.value() - level.output);
    }
};

int main(int argc, char** argv) {
    std::cout << "Plant Automation RT Simulator - Starting up..." << std::endl;

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    try {
        Options opt = parse_options(argc, argv);

        std::cout << "Initializing plant model..." << std::endl;

        SimValveElement suction_element("FeedPumpSuctionValve");
        SimValveElement discharge_element("FeedPumpDischargeValve");
        SimEffortSource pump_head("FeedPumpPump");
        SimValveElement level_element("LevelValve");
        SimFlowSource makeup_source("MakeupFlow");

        PumpAssembly pump;
        pump.set_name("FeedPump");
        pump.attach_elements(suction_element, pump_head, discharge_element);
        pump.set_characteristic(8.0e5, 5.0e5, 40.0);
        pump.set_initial_condition(false, true, false);

        ControlledValve level_valve;
        level_valve.set_name("LevelValve");
        level_valve.valve().attach_element(level_element);
        level_valve.valve().set_characteristic(2.0e4, 0.0);
        level_valve.controller().set_gain(4.0);
        level_valve.controller().set_integral_time(20.0);
        level_valve.valve().init_opening(30.0);

        AutomatedValve drain;
        drain.set_name("DrainValve");
        drain.init_opening(20.0);

        ControlledFlowSource makeup;
        makeup.set_name("MakeupFlow");
        makeup.attach_source(makeup_source);
        makeup.set_characteristic(40.0, 4.0);

        Setpoint level_setpoint("LevelSetpoint", 2.0, 0.0, 100.0);
        level_setpoint.ramp().force_output(50.0);

        FeedTank tank(pump, discharge_element, drain, makeup, level_valve, level_setpoint);

        // high-high level shuts the level valve, low level stops the pump
        level_valve.valve().safe_to_close().set_provider([&tank]() { return tank.level.output < 95.0; });
        pump.safe_to_operate().set_provider([&tank]() { return tank.level.output > 5.0; });

        std::cout << "Setting up automation loop..." << std::endl;
        AutomationLoop loop(opt.step_time);
        loop.add(tank);
        loop.add(pump);
        loop.add(level_valve);
        loop.add(drain);
        loop.add(makeup);
        loop.add(level_setpoint);

        loop.add_listener([](const StateEvent& e) {
            std::cout << "EVENT: " << e.name << " "
                      << (e.old_state.empty() ? "-" : e.old_state) << " -> "
                      << e.new_state << std::endl;
        });

        std::cout << "Setting up IPC..." << std::endl;
        TelemetryPub telemetry_pub(opt.pub_endpoint);
        ControlRep control_rep(opt.rep_endpoint);

        if (!telemetry_pub.is_connected()) {
            std::cerr << "Failed to bind telemetry publisher: " << telemetry_pub.last_error << std::endl;
            return 1;
        }

        if (!control_rep.is_connected()) {
            std::cerr << "Failed to bind control responder: " << control_rep.last_error << std::endl;
            return 1;
        }

        std::cout << "System ready! " << loop.component_count() << " components, step time "
                  << opt.step_time << " s" << std::endl;
        std::cout << "Connect operator panel to:" << std::endl;
        std::cout << "  Telemetry: " << telemetry_pub.get_bind_address() << std::endl;
        std::cout << "  Control:   " << control_rep.get_bind_address() << std::endl;
        std::cout << "Press Ctrl+C to stop" << std::endl;

        std::thread loop_thread([&]() {
            try {
                loop.run(telemetry_pub, control_rep);
            } catch (const std::exception& e) {
                std::cerr << "Automation loop error: " << e.what() << std::endl;
            }
            shutdown_requested.store(true);
        });

        auto last_stats_time = std::chrono::steady_clock::now();
        while (!shutdown_requested.load()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));

            auto now = std::chrono::steady_clock::now();
            if (std::chrono::duration_cast<std::chrono::seconds>(now - last_stats_time).count() >= 10) {
                auto stats = loop.get_stats();
                std::cout << "Loop stats: " << stats.cycles << " cycles, "
                          << stats.late_cycles << " late, "
                          << std::fixed << std::setprecision(1)
                          << stats.sim_time << " s sim time, "
                          << stats.commands_consumed << " commands" << std::endl;
                last_stats_time = now;
            }
        }

        std::cout << "Stopping automation loop..." << std::endl;
        loop.stop();

        if (loop_thread.joinable()) {
            loop_thread.join();
        }

        auto final_stats = loop.get_stats();
        std::cout << "Final statistics:" << std::endl;
        std::cout << "  Total cycles: " << final_stats.cycles << std::endl;
        std::cout << "  Late cycles: " << final_stats.late_cycles << std::endl;
        std::cout << "  Commands consumed: " << final_stats.commands_consumed << std::endl;
        std::cout << "  Commands unclaimed: " << final_stats.commands_unclaimed << std::endl;
        std::cout << "  Events: " << final_stats.events << std::endl;

        std::cout << "Shutdown complete." << std::endl;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
