#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <mvsearch/core/types.h>

namespace mvsearch::resilience {

// ============================================================================
// Circuit Breaker for outbound calls
// ============================================================================

class CircuitBreaker {
public:
    enum class State {
        Closed,  // Normal operation
        Open,    // Failing, reject requests
        HalfOpen // Testing recovery with a single trial call
    };

    struct Config {
        std::string name = "default";
        size_t failureThreshold = 5;                  // consecutive failures before opening
        std::chrono::milliseconds resetTimeout{30000}; // time in Open before a trial call
        std::chrono::milliseconds callTimeout{0};      // 0 disables slow-call accounting
        double errorThresholdPercentage = 0.0;         // 0 disables the percentage rule
        size_t volumeThreshold = 5;                    // min calls in window for percentage rule
        std::chrono::milliseconds rollingWindow{10000};

        static Config vectorStore();
        static Config documentStore();
        static Config llm();
    };

    struct Stats {
        State state = State::Closed;
        uint64_t fires = 0;
        uint64_t successes = 0;
        uint64_t failures = 0;
        uint64_t rejects = 0;
        uint64_t timeouts = 0;
        uint64_t stateChanges = 0;
        size_t consecutiveFailures = 0;
        std::optional<std::chrono::steady_clock::time_point> lastFailureTime;
    };

    using StateChangeListener =
        std::function<void(const std::string& name, State from, State to)>;

    CircuitBreaker();
    explicit CircuitBreaker(Config config);

    // Check if request should be allowed. In HalfOpen only one caller is admitted until the
    // trial call records its outcome.
    bool shouldAllow();

    // Record result
    void recordSuccess();
    void recordFailure();
    void recordTimeout();

    /**
     * @brief Run fn behind the breaker
     *
     * fn must return a Result<T>. Rejected calls return ErrorCode::CircuitOpen without invoking
     * fn. A call that succeeds but exceeds callTimeout is counted as a timeout failure and its
     * value is discarded.
     */
    template <typename F> auto execute(F&& fn) -> std::invoke_result_t<F&> {
        using R = std::invoke_result_t<F&>;
        if (!shouldAllow()) {
            return R(Error{ErrorCode::CircuitOpen, "Circuit '" + config_.name + "' is open"});
        }

        const auto start = std::chrono::steady_clock::now();
        try {
            R result = fn();
            const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start);
            if (config_.callTimeout.count() > 0 && elapsed > config_.callTimeout) {
                recordTimeout();
                return R(Error{ErrorCode::Timeout, "Call through '" + config_.name + "' took " +
                                                       std::to_string(elapsed.count()) + " ms"});
            }
            if (result) {
                recordSuccess();
            } else {
                recordFailure();
            }
            return result;
        } catch (const std::exception& e) {
            recordFailure();
            return R(Error{ErrorCode::InternalError, e.what()});
        } catch (...) {
            // Non-std throw still settles a half-open trial
            recordFailure();
            return R(Error{ErrorCode::InternalError,
                           "Call through '" + config_.name + "' threw a non-standard exception"});
        }
    }

    State getState() const;
    Stats getStats() const;
    const Config& getConfig() const { return config_; }
    const std::string& name() const { return config_.name; }

    // Force back to Closed and clear counters
    void reset();

    void setStateChangeListener(StateChangeListener listener);

private:
    using Transition = std::optional<std::pair<State, State>>;

    Transition transitionTo(State newState);
    bool shouldTransitionToHalfOpen() const;
    bool errorRateExceeded() const;
    void recordOutcome(bool success, std::chrono::steady_clock::time_point now);
    Transition onFailure();
    void notify(const Transition& transition);

    Config config_;
    mutable std::mutex mutex_;

    State state_ = State::Closed;
    size_t consecutiveFailures_ = 0;
    bool trialInFlight_ = false;

    std::chrono::steady_clock::time_point lastFailure_;
    std::chrono::steady_clock::time_point lastStateChange_;
    std::deque<std::pair<std::chrono::steady_clock::time_point, bool>> window_;

    Stats stats_;
    StateChangeListener listener_;
};

constexpr const char* circuitStateToString(CircuitBreaker::State state) {
    switch (state) {
        case CircuitBreaker::State::Closed:
            return "CLOSED";
        case CircuitBreaker::State::Open:
            return "OPEN";
        case CircuitBreaker::State::HalfOpen:
            return "HALF_OPEN";
    }
    return "UNKNOWN";
}

/**
 * @brief Registry of named breakers, one per external dependency
 */
class CircuitBreakerManager {
public:
    // Returns the existing breaker for name, creating it from config on first use
    std::shared_ptr<CircuitBreaker> getOrCreate(const std::string& name,
                                                const CircuitBreaker::Config& config);
    std::shared_ptr<CircuitBreaker> get(const std::string& name) const;

    std::map<std::string, CircuitBreaker::Stats> getAllStats() const;
    void resetAll();
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<CircuitBreaker>> breakers_;
};

} // namespace mvsearch::resilience
