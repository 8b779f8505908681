#pragma once
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>
#include <utility>

/**
 * @brief Permissive safety signal of an automated component
 *
 * The signal is TRUE while the guarded action is permitted. It is either
 * latched by the surrounding system with set() or pulled from a provider
 * when the owning component samples it at the start of its step. Without
 * either it stays permissive.
 *
 * Using both ways for the same signal is a wiring error and is rejected.
 */
class SafetyInput {
private:
    std::string name_;
    std::function<bool()> provider_;
    bool latched_{true};
    bool latched_directly_{false};
    bool sampled_{true};
    uint64_t trip_count_{0};

public:
    explicit SafetyInput(std::string name = "safety") : name_(std::move(name)) {}

    /**
     * @brief Attach a pull provider, replacing a previous one
     * @throws std::invalid_argument if the signal was already set directly
     *         or the provider is empty
     */
    void set_provider(std::function<bool()> provider) {
        if (!provider) {
            throw std::invalid_argument(name_ + ": empty safety provider.");
        }
        if (latched_directly_) {
            throw std::invalid_argument(name_ + ": signal is already set directly, "
                                        "a provider makes no sense.");
        }
        provider_ = std::move(provider);
    }

    /**
     * @brief Latch the signal directly
     * @throws std::invalid_argument if a provider is attached
     */
    void set(bool permitted) {
        if (provider_) {
            throw std::invalid_argument(name_ + ": a provider is set, "
                                        "setting the signal directly makes no sense.");
        }
        latched_ = permitted;
        latched_directly_ = true;
    }

    /**
     * @brief Read the signal for the current step
     *
     * Called once at the start of a step; the result is also kept for
     * value().
     */
    bool sample() {
        bool now = provider_ ? provider_() : latched_;
        if (sampled_ && !now) {
            trip_count_++;
        }
        sampled_ = now;
        return now;
    }

    /**
     * @brief Value of the last sample
     */
    bool value() const { return sampled_; }

    bool has_provider() const { return static_cast<bool>(provider_); }

    /**
     * @brief Number of permitted -> not permitted transitions seen
     */
    uint64_t trip_count() const { return trip_count_; }

    const std::string& name() const { return name_; }
    void set_name(const std::string& name) { name_ = name; }
};
