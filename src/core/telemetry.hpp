#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Receiver for per-step telemetry values
 *
 * Components push their outputs keyed by a stable name once per step.
 * Retention and decimation are the receiver's business.
 */
class TelemetrySink {
public:
    virtual ~TelemetrySink() = default;

    virtual void push(const std::string& name, double value) = 0;
    virtual void push(const std::string& name, bool value) = 0;
};

/**
 * @brief Latest-value snapshot of all telemetry of one loop cycle
 *
 * Keeps one entry per name; a push overwrites the previous value. The
 * frame is serialized once per cycle and sent on the telemetry socket.
 *
 * Message format:
 * {"t": <sim sec>, "cycle": <n>, "values": {"<name>": <number|bool>, ...}}
 */
class TelemetryFrame : public TelemetrySink {
private:
    std::map<std::string, double> numbers_;
    std::map<std::string, bool> flags_;
    double t_sec_{0.0};
    std::uint64_t cycle_{0};

public:
    void push(const std::string& name, double value) override {
        numbers_[name] = value;
    }

    void push(const std::string& name, bool value) override {
        flags_[name] = value;
    }

    /**
     * @brief Stamp the frame with the cycle that produced it
     */
    void stamp(double t_sec, std::uint64_t cycle) {
        t_sec_ = t_sec;
        cycle_ = cycle;
    }

    bool has_number(const std::string& name) const {
        return numbers_.count(name) != 0;
    }

    bool has_flag(const std::string& name) const {
        return flags_.count(name) != 0;
    }

    /**
     * @brief Get a numeric value, 0.0 if it was never pushed
     */
    double number(const std::string& name) const {
        auto it = numbers_.find(name);
        return it == numbers_.end() ? 0.0 : it->second;
    }

    /**
     * @brief Get a boolean value, false if it was never pushed
     */
    bool flag(const std::string& name) const {
        auto it = flags_.find(name);
        return it == flags_.end() ? false : it->second;
    }

    size_t size() const { return numbers_.size() + flags_.size(); }

    nlohmann::json to_json() const {
        nlohmann::json values = nlohmann::json::object();
        for (const auto& [name, v] : numbers_) values[name] = v;
        for (const auto& [name, v] : flags_) values[name] = v;
        return {{"t", t_sec_}, {"cycle", cycle_}, {"values", values}};
    }

    std::string dump() const { return to_json().dump(); }
};
