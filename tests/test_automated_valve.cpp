// headers first, each must compile on its own
#include "../src/safety/safety_input.hpp"
#include "../src/control/automated_valve.hpp"
#include "../src/hw/sim_elements.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <vector>

/**
 * @brief Test AutomatedValve and its safety inputs
 *
 * This test suite verifies:
 * 1. Operator drive via int, bool and double commands
 * 2. Safety interlocks overriding the operator and releasing again
 * 3. Safe-to-close precedence over safe-to-open
 * 4. End switch events of the actuator monitor
 * 5. Valve element output and characteristic
 * 6. SafetyInput provider and latch rules
 */

static bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) < tol;
}

static void run(AutomatedValve& v, int steps, double dt = 0.1) {
    for (int i = 0; i < steps; i++) v.step(dt);
}

int main() {
    std::cout << "Testing AutomatedValve functionality..." << std::endl;

    // Test 1: Open and close by method
    {
        std::cout << "Test 1: Operate open/stop/close" << std::endl;
        AutomatedValve v;
        v.set_name("FeedValve");
        assert(v.opening() == 0.0);
        v.operate_open();
        run(v, 4);
        assert(near(v.opening(), 10.0));
        v.operate_stop();
        run(v, 10);
        assert(near(v.opening(), 10.0));
        v.operate_close();
        run(v, 10);
        assert(v.opening() == -5.0);
        std::cout << "  25 %/s travel, closing overruns to -5 %" << std::endl;
    }

    // Test 2: int and bool commands give identical trajectories
    {
        std::cout << "Test 2: Command shape equivalence" << std::endl;
        AutomatedValve a;
        AutomatedValve b;
        a.set_name("A");
        b.set_name("B");
        assert(a.handle_command(Command{"A", 1}));
        assert(b.handle_command(Command{"B", true}));
        for (int i = 0; i < 50; i++) {
            a.step(0.1);
            b.step(0.1);
            assert(a.opening() == b.opening());
        }
        assert(a.opening() == 100.0);

        assert(a.handle_command(Command{"A", -1}));
        assert(b.handle_command(Command{"B", false}));
        for (int i = 0; i < 50; i++) {
            a.step(0.1);
            b.step(0.1);
            assert(a.opening() == b.opening());
        }
        assert(a.opening() == -5.0);

        // released switch holds
        a.handle_command(Command{"A", 1});
        run(a, 2);
        a.handle_command(Command{"A", 0});
        assert(a.drive() == AutomatedValve::Drive::HOLD);
        double held = a.opening();
        run(a, 5);
        assert(a.opening() == held);
        std::cout << "  +1 == true, -1 == false, 0 holds" << std::endl;
    }

    // Test 3: Numeric target and name mismatch
    {
        std::cout << "Test 3: Numeric target" << std::endl;
        AutomatedValve v;
        v.set_name("FeedValve");
        assert(!v.handle_command(Command{"OtherValve", 1}));
        assert(v.drive() == AutomatedValve::Drive::NONE);
        assert(v.handle_command(Command{"FeedValve", 42.5}));
        run(v, 30);
        assert(v.opening() == 42.5);
        assert(v.drive() == AutomatedValve::Drive::TARGET);
        std::cout << "  Moved to 42.5 %, foreign names ignored" << std::endl;
    }

    // Test 4: Safe-to-close interlock
    {
        std::cout << "Test 4: Safe-to-close interlock" << std::endl;
        AutomatedValve v;
        v.set_name("FeedValve");
        bool close_ok = true;
        v.safe_to_close().set_provider([&close_ok]() { return close_ok; });
        v.operate_open();
        run(v, 20);
        assert(near(v.opening(), 50.0));

        close_ok = false;
        run(v, 1);
        assert(v.is_interlocked());
        assert(near(v.opening(), 47.5));
        run(v, 30);
        assert(v.opening() == -5.0);
        assert(v.safe_to_close().trip_count() == 1);

        // operator intent resumes once permitted again
        close_ok = true;
        run(v, 1);
        assert(!v.is_interlocked());
        assert(near(v.opening(), -2.5));
        std::cout << "  Closed while tripped, open drive resumes" << std::endl;
    }

    // Test 5: Safe-to-open and precedence
    {
        std::cout << "Test 5: Safe-to-open and precedence" << std::endl;
        AutomatedValve v;
        v.set_name("MinFlowValve");
        v.safe_to_open().set(false);
        v.operate_close();
        run(v, 10);
        assert(near(v.opening(), 25.0));

        v.safe_to_open().set(true);
        v.safe_to_close().set(false);
        run(v, 10);
        assert(near(v.opening(), 0.0));

        // both tripped: closing wins
        v.safe_to_open().set(false);
        run(v, 10);
        assert(v.opening() == -5.0);
        std::cout << "  Safe-to-close has precedence" << std::endl;
    }

    // Test 6: End switch events
    {
        std::cout << "Test 6: Monitor events" << std::endl;
        EventQueue queue;
        AutomatedValve v;
        v.set_name("FeedValve");
        v.connect_events(queue);

        v.step(0.1);
        auto events = queue.drain();
        assert(events.size() == 2);
        assert(events[0].name == "FeedValve_Closed");
        assert(events[0].old_state.empty() && events[0].new_state == "true");
        assert(events[1].name == "FeedValve_Open");
        assert(events[1].new_state == "false");

        v.operate_open();
        v.step(0.1);
        events = queue.drain();
        assert(events.size() == 1);
        assert(events[0].name == "FeedValve_Closed");
        assert(events[0].old_state == "true" && events[0].new_state == "false");

        run(v, 40);
        events = queue.drain();
        assert(events.size() == 1);
        assert(events[0].name == "FeedValve_Open");
        assert(events[0].new_state == "true");
        assert(v.monitor().is_open());
        assert(!v.monitor().is_closed());
        std::cout << "  Announced once, then edges only" << std::endl;
    }

    // Test 7: Valve element and telemetry
    {
        std::cout << "Test 7: Element and telemetry" << std::endl;
        SimValveElement element("FeedValve");
        TelemetryFrame frame;
        AutomatedValve v;
        v.set_name("FeedValve");
        v.connect_telemetry(frame);

        bool thrown = false;
        try {
            v.set_characteristic(1.0e4, 0.0);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        v.attach_element(element);
        assert(v.has_element());
        v.set_characteristic(1.0e4, 5.0);
        assert(element.resistance_full_open == 1.0e4);
        assert(!element.linear);
        assert(element.closed_factor == 5.0);
        v.set_characteristic(2.0e4, 1.0);
        assert(element.linear);

        thrown = false;
        try {
            v.set_characteristic(0.0, 1.0);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        v.init_opening(60.0);
        assert(element.opening == 60.0);
        v.operate_close();
        run(v, 40);
        assert(v.opening() == -5.0);
        assert(element.opening == 0.0);
        assert(frame.has_number("FeedValve"));
        assert(frame.number("FeedValve") == 0.0);
        std::cout << "  Element and telemetry stay within [0, 100]" << std::endl;
    }

    // Test 8: SafetyInput wiring rules
    {
        std::cout << "Test 8: SafetyInput rules" << std::endl;
        SafetyInput direct("direct");
        assert(direct.sample());
        direct.set(false);
        bool thrown = false;
        try {
            direct.set_provider([]() { return true; });
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
        assert(!direct.sample());
        assert(!direct.value());

        SafetyInput pulled("pulled");
        pulled.set_provider([]() { return true; });
        assert(pulled.has_provider());
        thrown = false;
        try {
            pulled.set(false);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            SafetyInput empty("empty");
            empty.set_provider(std::function<bool()>());
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
        std::cout << "  Provider and direct set are exclusive" << std::endl;
    }

    std::cout << "All AutomatedValve tests passed!" << std::endl;
    return 0;
}
