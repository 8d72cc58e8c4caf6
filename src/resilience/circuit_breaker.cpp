#include <mvsearch/resilience/circuit_breaker.h>

#include <spdlog/spdlog.h>

namespace mvsearch::resilience {

// Presets open on consecutive failures only; the percentage rule is opt-in through config
CircuitBreaker::Config CircuitBreaker::Config::vectorStore() {
    Config c;
    c.name = "vector_store";
    c.failureThreshold = 5;
    c.resetTimeout = std::chrono::milliseconds(30000);
    c.callTimeout = std::chrono::milliseconds(10000);
    c.errorThresholdPercentage = 0.0;
    c.volumeThreshold = 5;
    return c;
}

CircuitBreaker::Config CircuitBreaker::Config::documentStore() {
    Config c;
    c.name = "document_store";
    c.failureThreshold = 5;
    c.resetTimeout = std::chrono::milliseconds(30000);
    c.callTimeout = std::chrono::milliseconds(5000);
    c.errorThresholdPercentage = 0.0;
    c.volumeThreshold = 5;
    return c;
}

CircuitBreaker::Config CircuitBreaker::Config::llm() {
    Config c;
    c.name = "llm";
    c.failureThreshold = 3;
    c.resetTimeout = std::chrono::milliseconds(60000);
    c.callTimeout = std::chrono::milliseconds(30000);
    c.errorThresholdPercentage = 0.0;
    c.volumeThreshold = 3;
    return c;
}

CircuitBreaker::CircuitBreaker() : CircuitBreaker(Config{}) {}

CircuitBreaker::CircuitBreaker(Config config)
    : config_(std::move(config)), lastStateChange_(std::chrono::steady_clock::now()) {}

bool CircuitBreaker::shouldAllow() {
    Transition transition;
    bool allowed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_) {
            case State::Closed:
                allowed = true;
                break;
            case State::Open:
                if (shouldTransitionToHalfOpen()) {
                    transition = transitionTo(State::HalfOpen);
                    trialInFlight_ = true;
                    allowed = true;
                }
                break;
            case State::HalfOpen:
                if (!trialInFlight_) {
                    trialInFlight_ = true;
                    allowed = true;
                }
                break;
        }
        if (allowed) {
            stats_.fires++;
        } else {
            stats_.rejects++;
        }
    }
    notify(transition);
    return allowed;
}

void CircuitBreaker::recordSuccess() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.successes++;
        recordOutcome(true, std::chrono::steady_clock::now());
        consecutiveFailures_ = 0;
        if (state_ == State::HalfOpen) {
            trialInFlight_ = false;
            transition = transitionTo(State::Closed);
        }
    }
    notify(transition);
}

void CircuitBreaker::recordFailure() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.failures++;
        transition = onFailure();
    }
    notify(transition);
}

void CircuitBreaker::recordTimeout() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.timeouts++;
        stats_.failures++;
        transition = onFailure();
    }
    notify(transition);
}

CircuitBreaker::Transition CircuitBreaker::onFailure() {
    auto now = std::chrono::steady_clock::now();
    recordOutcome(false, now);
    consecutiveFailures_++;
    lastFailure_ = now;
    stats_.lastFailureTime = now;

    if (state_ == State::HalfOpen) {
        trialInFlight_ = false;
        return transitionTo(State::Open);
    }
    if (state_ == State::Closed &&
        (consecutiveFailures_ >= config_.failureThreshold || errorRateExceeded())) {
        return transitionTo(State::Open);
    }
    return std::nullopt;
}

void CircuitBreaker::recordOutcome(bool success, std::chrono::steady_clock::time_point now) {
    window_.emplace_back(now, success);
    while (!window_.empty() && now - window_.front().first > config_.rollingWindow) {
        window_.pop_front();
    }
}

bool CircuitBreaker::errorRateExceeded() const {
    if (config_.errorThresholdPercentage <= 0.0 || window_.size() < config_.volumeThreshold ||
        window_.empty()) {
        return false;
    }
    size_t failed = 0;
    for (const auto& [ts, ok] : window_) {
        if (!ok)
            ++failed;
    }
    double pct = 100.0 * static_cast<double>(failed) / static_cast<double>(window_.size());
    return pct >= config_.errorThresholdPercentage;
}

CircuitBreaker::Transition CircuitBreaker::transitionTo(State newState) {
    if (state_ == newState) {
        return std::nullopt;
    }
    State previous = state_;
    state_ = newState;
    lastStateChange_ = std::chrono::steady_clock::now();
    stats_.stateChanges++;

    if (newState == State::Closed) {
        consecutiveFailures_ = 0;
        window_.clear();
    }
    return std::make_pair(previous, newState);
}

bool CircuitBreaker::shouldTransitionToHalfOpen() const {
    auto now = std::chrono::steady_clock::now();
    return now - lastFailure_ >= config_.resetTimeout;
}

void CircuitBreaker::notify(const Transition& transition) {
    if (!transition) {
        return;
    }
    auto [from, to] = *transition;
    if (to == State::Open) {
        spdlog::warn("Circuit breaker '{}' {} -> {}", config_.name, circuitStateToString(from),
                     circuitStateToString(to));
    } else {
        spdlog::info("Circuit breaker '{}' {} -> {}", config_.name, circuitStateToString(from),
                     circuitStateToString(to));
    }

    StateChangeListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(config_.name, from, to);
    }
}

CircuitBreaker::State CircuitBreaker::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

CircuitBreaker::Stats CircuitBreaker::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Stats out = stats_;
    out.state = state_;
    out.consecutiveFailures = consecutiveFailures_;
    return out;
}

void CircuitBreaker::reset() {
    Transition transition;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        trialInFlight_ = false;
        consecutiveFailures_ = 0;
        window_.clear();
        transition = transitionTo(State::Closed);
    }
    notify(transition);
}

void CircuitBreaker::setStateChangeListener(StateChangeListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

// ============================================================================
// CircuitBreakerManager
// ============================================================================

std::shared_ptr<CircuitBreaker>
CircuitBreakerManager::getOrCreate(const std::string& name, const CircuitBreaker::Config& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    if (it != breakers_.end()) {
        return it->second;
    }
    auto cfg = config;
    cfg.name = name;
    auto breaker = std::make_shared<CircuitBreaker>(std::move(cfg));
    breakers_.emplace(name, breaker);
    spdlog::debug("Registered circuit breaker '{}' (threshold={}, reset={}ms)", name,
                  config.failureThreshold, config.resetTimeout.count());
    return breaker;
}

std::shared_ptr<CircuitBreaker> CircuitBreakerManager::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = breakers_.find(name);
    return it == breakers_.end() ? nullptr : it->second;
}

std::map<std::string, CircuitBreaker::Stats> CircuitBreakerManager::getAllStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, CircuitBreaker::Stats> out;
    for (const auto& [name, breaker] : breakers_) {
        out.emplace(name, breaker->getStats());
    }
    return out;
}

void CircuitBreakerManager::resetAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [name, breaker] : breakers_) {
        breaker->reset();
    }
}

size_t CircuitBreakerManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return breakers_.size();
}

} // namespace mvsearch::resilience
