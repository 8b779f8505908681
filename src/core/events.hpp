#pragma once
#include <cstdint>
#include <deque>
#include <functional>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief State change notification emitted by a component
 *
 * Fired on the step where a watched state differs from the previous
 * step. The old state is empty when a state is announced the first time.
 */
struct StateEvent {
    std::string name;       ///< Signal name, e.g. "FeedPumpPumpState"
    std::string old_state;  ///< State before the change
    std::string new_state;  ///< State after the change
};

/**
 * @brief FIFO of events produced during a step
 *
 * Components only append; the surrounding loop drains the queue
 * after each step and hands the events to the dispatcher.
 */
class EventQueue {
private:
    std::deque<StateEvent> events_;

public:
    void emit(StateEvent event) {
        events_.push_back(std::move(event));
    }

    bool empty() const { return events_.empty(); }

    size_t size() const { return events_.size(); }

    /**
     * @brief Remove and return all queued events in emission order
     */
    std::vector<StateEvent> drain() {
        std::vector<StateEvent> out(events_.begin(), events_.end());
        events_.clear();
        return out;
    }
};

/**
 * @brief Synchronous fan-out of queued events to listeners
 *
 * Listeners are called in registration order for every event. A listener
 * must not step or command the component that produced the event.
 */
class EventDispatcher {
public:
    using Listener = std::function<void(const StateEvent&)>;

private:
    std::vector<Listener> listeners_;
    uint64_t dispatched_{0};

public:
    void add_listener(Listener listener) {
        listeners_.push_back(std::move(listener));
    }

    size_t listener_count() const { return listeners_.size(); }

    /**
     * @brief Drain the queue and deliver each event to all listeners
     * @return Number of events delivered
     */
    size_t dispatch(EventQueue& queue) {
        auto events = queue.drain();
        for (const auto& event : events) {
            for (auto& listener : listeners_) {
                listener(event);
            }
        }
        dispatched_ += events.size();
        return events.size();
    }

    uint64_t total_dispatched() const { return dispatched_; }
};
