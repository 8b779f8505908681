#pragma once
#include "../core/capabilities.hpp"
#include "../core/clock.hpp"
#include "../core/events.hpp"
#include "../core/telemetry.hpp"
#include "command_router.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
using json = nlohmann::json;

inline json event_to_json(const StateEvent& e) {
  return {{"name", e.name}, {"old", e.old_state}, {"new", e.new_state}};
}

/**
 * @brief Fixed-step automation loop
 *
 * Owns the scheduling of all automation components of a plant:
 * - commands received between cycles are routed before the next step
 * - every component is stepped once per cycle in registration order
 * - events queued during the cycle are fanned out to the listeners
 * - one telemetry frame per cycle is published
 *
 * Everything runs on the loop thread; components need no locking.
 */
class AutomationLoop {
public:
  /// Loop counters for status replies and logging
  struct Stats {
    uint64_t cycles{0};
    uint64_t late_cycles{0};
    uint64_t commands_consumed{0};
    uint64_t commands_unclaimed{0};
    uint64_t bad_requests{0};
    uint64_t events{0};
    double sim_time{0.0};
  };

private:
  StepClock clock_;
  std::vector<Steppable*> components_;
  CommandRouter router_;
  EventQueue events_;
  EventDispatcher dispatcher_;
  TelemetryFrame frame_;
  std::atomic<bool> running_{true};
  uint64_t bad_requests_{0};

  // event output of the active run(), empty outside of it
  std::function<void(const StateEvent&)> event_out_;
  bool event_out_registered_{false};

  // snapshot readable from other threads while run() is active
  mutable std::mutex stats_mutex_;
  Stats stats_;

  void update_stats() {
    Stats st;
    st.cycles = clock_.cycles();
    st.late_cycles = clock_.late_cycles();
    st.commands_consumed = router_.consumed_count();
    st.commands_unclaimed = router_.unclaimed_count();
    st.bad_requests = bad_requests_;
    st.events = dispatcher_.total_dispatched();
    st.sim_time = clock_.sim_time();
    std::lock_guard<std::mutex> lock(stats_mutex_);
    stats_ = st;
  }

public:
  /**
   * @brief Constructor
   * @param step_s Step time in seconds
   */
  explicit AutomationLoop(double step_s = 0.1) : clock_(step_s) {}

  /**
   * @brief Register a component for stepping
   *
   * Commandable components join the command chain, Observable ones are
   * wired to the loop's event queue and telemetry frame.
   */
  template<class T>
  void add(T& component) {
    static_assert(std::is_base_of_v<Steppable, T>, "component must be Steppable");
    components_.push_back(&component);
    if constexpr (std::is_base_of_v<Commandable, T>) {
      router_.add(component);
    }
    if constexpr (std::is_base_of_v<Observable, T>) {
      component.connect_events(events_);
      component.connect_telemetry(frame_);
    }
  }

  void add_listener(EventDispatcher::Listener listener) {
    dispatcher_.add_listener(std::move(listener));
  }

  /**
   * @brief Route an operator command to the components
   * @return true if a component consumed it
   */
  bool submit(const Command& cmd) { return router_.route(cmd); }

  /**
   * @brief Execute one cycle without pacing
   */
  void run_cycle() {
    double dt = clock_.step_time();
    for (auto* c : components_) {
      c->step(dt);
    }
    clock_.tick();
    frame_.stamp(clock_.sim_time(), clock_.cycles());
    dispatcher_.dispatch(events_);
    update_stats();
  }

  /**
   * @brief Run cycles until stop() or a "stop" request
   * @param pub Telemetry publisher (template for flexibility)
   * @param rep Command responder (template for flexibility)
   */
  template<class Pub, class Rep>
  void run(Pub& pub, Rep& rep) {
    // one dispatcher entry for all runs, pointed at the current publisher
    if (!event_out_registered_) {
      add_listener([this](const StateEvent& e) {
        if (event_out_) {
          event_out_(e);
        }
      });
      event_out_registered_ = true;
    }
    struct EventOutReset {
      std::function<void(const StateEvent&)>& out;
      ~EventOutReset() { out = nullptr; }
    } reset{event_out_};
    event_out_ = [&pub](const StateEvent& e) {
      pub.send("event", event_to_json(e).dump());
    };
    clock_.resync();

    while (running_.load(std::memory_order_relaxed)) {
      // non-blocking command handling, all pending requests first
      while (rep.has_request()) {
        rep.reply(handle_request(rep.recv()));
      }
      if (!running_.load(std::memory_order_relaxed)) {
        break;
      }

      run_cycle();
      pub.send("telemetry", frame_.dump());

      clock_.wait_next();
    }
  }

  /**
   * @brief Handle one JSON request from an operator panel
   * @param s JSON request string
   * @return JSON reply string
   */
  std::string handle_request(const std::string& s) {
    std::string reply = process_request(s);
    update_stats();
    return reply;
  }

  /**
   * @brief Decode and execute one request without refreshing the stats
   */
  std::string process_request(const std::string& s) {
    auto j = json::parse(s, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
      bad_requests_++;
      return json{{"ok", false}, {"error", "malformed request"}}.dump();
    }

    if (j.contains("cmd")) {
      std::string cmd = j["cmd"].is_string() ? j["cmd"].get<std::string>() : "";
      if (cmd == "get_status") {
        update_stats();
        return status().dump();
      } else if (cmd == "stop") {
        stop();
        return json{{"ok", true}}.dump();
      }
      bad_requests_++;
      return json{{"ok", false}, {"error", "unknown cmd"}}.dump();
    }

    std::string error;
    auto command = command_from_json(j, error);
    if (!command) {
      bad_requests_++;
      return json{{"ok", false}, {"error", error}}.dump();
    }
    bool consumed = submit(*command);
    return json{{"ok", true}, {"consumed", consumed}}.dump();
  }

  json status() const {
    auto st = get_stats();
    return {
      {"ok", true},
      {"step_time", clock_.step_time()},
      {"sim_time", st.sim_time},
      {"cycles", st.cycles},
      {"late_cycles", st.late_cycles},
      {"components", components_.size()},
      {"commands_consumed", st.commands_consumed},
      {"commands_unclaimed", st.commands_unclaimed},
      {"events", st.events}
    };
  }

  void stop() { running_.store(false); }

  /**
   * @brief Re-arm a stopped loop so run() can be entered again
   */
  void restart() { running_.store(true); }
  bool is_running() const { return running_.load(); }

  /**
   * @brief Counters as of the last cycle or request, thread safe
   */
  Stats get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    return stats_;
  }

  const TelemetryFrame& frame() const { return frame_; }
  double step_time() const { return clock_.step_time(); }
  size_t component_count() const { return components_.size(); }
};
