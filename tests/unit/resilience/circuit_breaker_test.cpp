#include <gtest/gtest.h>

#include <chrono>
#include <stdexcept>
#include <thread>
#include <vector>
#include <mvsearch/resilience/circuit_breaker.h>

using namespace mvsearch;
using namespace mvsearch::resilience;
using namespace std::chrono_literals;

class CircuitBreakerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.name = "test";
        config_.failureThreshold = 3;
        config_.resetTimeout = 50ms;
        config_.callTimeout = 0ms;
        config_.errorThresholdPercentage = 0.0;
    }

    void tripOpen(CircuitBreaker& breaker) {
        for (size_t i = 0; i < config_.failureThreshold; ++i) {
            ASSERT_TRUE(breaker.shouldAllow());
            breaker.recordFailure();
        }
        ASSERT_EQ(breaker.getState(), CircuitBreaker::State::Open);
    }

    CircuitBreaker::Config config_;
};

// ===== State Machine Tests =====

TEST_F(CircuitBreakerTest, StartsClosedAndAllows) {
    CircuitBreaker breaker(config_);
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Closed);
    EXPECT_TRUE(breaker.shouldAllow());
}

TEST_F(CircuitBreakerTest, OpensAfterConsecutiveFailures) {
    CircuitBreaker breaker(config_);
    breaker.recordFailure();
    breaker.recordFailure();
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Closed);
    breaker.recordFailure();
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Open);
    EXPECT_FALSE(breaker.shouldAllow());

    auto stats = breaker.getStats();
    EXPECT_EQ(stats.failures, 3u);
    EXPECT_EQ(stats.rejects, 1u);
    EXPECT_TRUE(stats.lastFailureTime.has_value());
}

TEST_F(CircuitBreakerTest, SuccessResetsConsecutiveCount) {
    CircuitBreaker breaker(config_);
    breaker.recordFailure();
    breaker.recordFailure();
    breaker.recordSuccess();
    EXPECT_EQ(breaker.getStats().consecutiveFailures, 0u);
    breaker.recordFailure();
    breaker.recordFailure();
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Closed);
}

TEST_F(CircuitBreakerTest, HalfOpenAfterResetTimeout) {
    CircuitBreaker breaker(config_);
    tripOpen(breaker);

    std::this_thread::sleep_for(80ms);
    EXPECT_TRUE(breaker.shouldAllow());
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::HalfOpen);
}

TEST_F(CircuitBreakerTest, HalfOpenAdmitsSingleTrial) {
    CircuitBreaker breaker(config_);
    tripOpen(breaker);
    std::this_thread::sleep_for(80ms);

    EXPECT_TRUE(breaker.shouldAllow());
    EXPECT_FALSE(breaker.shouldAllow());
    EXPECT_FALSE(breaker.shouldAllow());
}

TEST_F(CircuitBreakerTest, SuccessfulTrialCloses) {
    CircuitBreaker breaker(config_);
    tripOpen(breaker);
    std::this_thread::sleep_for(80ms);

    ASSERT_TRUE(breaker.shouldAllow());
    breaker.recordSuccess();
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Closed);
    EXPECT_TRUE(breaker.shouldAllow());
}

TEST_F(CircuitBreakerTest, FailedTrialReopens) {
    CircuitBreaker breaker(config_);
    tripOpen(breaker);
    std::this_thread::sleep_for(80ms);

    ASSERT_TRUE(breaker.shouldAllow());
    breaker.recordFailure();
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Open);
    EXPECT_FALSE(breaker.shouldAllow());
}

TEST_F(CircuitBreakerTest, ErrorPercentageOpensBeforeThreshold) {
    config_.failureThreshold = 100;
    config_.errorThresholdPercentage = 50.0;
    config_.volumeThreshold = 4;
    CircuitBreaker breaker(config_);

    breaker.recordSuccess();
    breaker.recordFailure();
    breaker.recordSuccess();
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Closed);
    breaker.recordFailure();
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Open);
}

TEST_F(CircuitBreakerTest, ResetForcesClosed) {
    CircuitBreaker breaker(config_);
    tripOpen(breaker);
    breaker.reset();
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Closed);
    EXPECT_TRUE(breaker.shouldAllow());
}

TEST_F(CircuitBreakerTest, ListenerSeesTransitions) {
    CircuitBreaker breaker(config_);
    std::vector<std::pair<CircuitBreaker::State, CircuitBreaker::State>> seen;
    breaker.setStateChangeListener(
        [&](const std::string& name, CircuitBreaker::State from, CircuitBreaker::State to) {
            EXPECT_EQ(name, "test");
            seen.emplace_back(from, to);
        });

    tripOpen(breaker);
    std::this_thread::sleep_for(80ms);
    ASSERT_TRUE(breaker.shouldAllow());
    breaker.recordSuccess();

    ASSERT_EQ(seen.size(), 3u);
    EXPECT_EQ(seen[0].second, CircuitBreaker::State::Open);
    EXPECT_EQ(seen[1].second, CircuitBreaker::State::HalfOpen);
    EXPECT_EQ(seen[2].second, CircuitBreaker::State::Closed);
}

// ===== Execute Tests =====

TEST_F(CircuitBreakerTest, ExecutePassesThroughValue) {
    CircuitBreaker breaker(config_);
    auto result = breaker.execute([]() -> Result<int> { return 42; });
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 42);
    EXPECT_EQ(breaker.getStats().successes, 1u);
}

TEST_F(CircuitBreakerTest, ExecuteCountsErrorResults) {
    CircuitBreaker breaker(config_);
    for (int i = 0; i < 3; ++i) {
        auto result =
            breaker.execute([]() -> Result<int> { return Error{ErrorCode::VectorStoreError}; });
        EXPECT_FALSE(result.has_value());
    }
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Open);
}

TEST_F(CircuitBreakerTest, ExecuteRejectsWhenOpen) {
    CircuitBreaker breaker(config_);
    tripOpen(breaker);

    bool invoked = false;
    auto result = breaker.execute([&]() -> Result<int> {
        invoked = true;
        return 1;
    });
    EXPECT_FALSE(invoked);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::CircuitOpen);
}

TEST_F(CircuitBreakerTest, ExecuteConvertsExceptions) {
    CircuitBreaker breaker(config_);
    auto result = breaker.execute([]() -> Result<int> { throw std::runtime_error("boom"); });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InternalError);
    EXPECT_EQ(breaker.getStats().failures, 1u);
}

TEST_F(CircuitBreakerTest, NonStandardThrowSettlesHalfOpenTrial) {
    CircuitBreaker breaker(config_);
    tripOpen(breaker);
    std::this_thread::sleep_for(80ms);

    auto result = breaker.execute([]() -> Result<int> { throw 42; });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InternalError);
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Open);

    std::this_thread::sleep_for(80ms);
    EXPECT_TRUE(breaker.shouldAllow());
}

TEST_F(CircuitBreakerTest, SlowCallCountsAsTimeout) {
    config_.callTimeout = 10ms;
    CircuitBreaker breaker(config_);
    auto result = breaker.execute([]() -> Result<int> {
        std::this_thread::sleep_for(40ms);
        return 7;
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Timeout);

    auto stats = breaker.getStats();
    EXPECT_EQ(stats.timeouts, 1u);
    EXPECT_EQ(stats.failures, 1u);
}

// ===== Preset Tests =====

TEST_F(CircuitBreakerTest, PresetsCarryTheirNames) {
    EXPECT_EQ(CircuitBreaker::Config::vectorStore().name, "vector_store");
    EXPECT_EQ(CircuitBreaker::Config::documentStore().name, "document_store");
    EXPECT_EQ(CircuitBreaker::Config::llm().name, "llm");
    EXPECT_EQ(CircuitBreaker::Config::llm().failureThreshold, 3u);
}

TEST_F(CircuitBreakerTest, PresetsOpenOnConsecutiveFailuresOnly) {
    EXPECT_DOUBLE_EQ(CircuitBreaker::Config::vectorStore().errorThresholdPercentage, 0.0);
    EXPECT_DOUBLE_EQ(CircuitBreaker::Config::documentStore().errorThresholdPercentage, 0.0);
    EXPECT_DOUBLE_EQ(CircuitBreaker::Config::llm().errorThresholdPercentage, 0.0);

    // Mostly failing traffic below the consecutive threshold keeps the preset closed
    CircuitBreaker breaker(CircuitBreaker::Config::vectorStore());
    for (int round = 0; round < 4; ++round) {
        breaker.recordSuccess();
        for (int i = 0; i < 3; ++i) {
            breaker.recordFailure();
        }
    }
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Closed);
}

TEST_F(CircuitBreakerTest, DefaultConstructedBreaker) {
    CircuitBreaker breaker;
    EXPECT_EQ(breaker.getConfig().name, "default");
    EXPECT_EQ(breaker.getState(), CircuitBreaker::State::Closed);
    EXPECT_TRUE(breaker.shouldAllow());
}

TEST_F(CircuitBreakerTest, StateNames) {
    EXPECT_STREQ(circuitStateToString(CircuitBreaker::State::Closed), "CLOSED");
    EXPECT_STREQ(circuitStateToString(CircuitBreaker::State::Open), "OPEN");
    EXPECT_STREQ(circuitStateToString(CircuitBreaker::State::HalfOpen), "HALF_OPEN");
}

// ===== Manager Tests =====

TEST_F(CircuitBreakerTest, ManagerReturnsSameInstancePerName) {
    CircuitBreakerManager manager;
    auto a = manager.getOrCreate("vector_store", config_);
    auto b = manager.getOrCreate("vector_store", CircuitBreaker::Config::llm());
    EXPECT_EQ(a.get(), b.get());
    EXPECT_EQ(a->name(), "vector_store");
    EXPECT_EQ(a->getConfig().failureThreshold, config_.failureThreshold);
    EXPECT_EQ(manager.size(), 1u);
    EXPECT_EQ(manager.get("missing"), nullptr);
}

TEST_F(CircuitBreakerTest, ManagerResetAll) {
    CircuitBreakerManager manager;
    auto a = manager.getOrCreate("a", config_);
    auto b = manager.getOrCreate("b", config_);
    tripOpen(*a);
    tripOpen(*b);

    auto stats = manager.getAllStats();
    ASSERT_EQ(stats.size(), 2u);
    EXPECT_EQ(stats["a"].state, CircuitBreaker::State::Open);

    manager.resetAll();
    EXPECT_EQ(a->getState(), CircuitBreaker::State::Closed);
    EXPECT_EQ(b->getState(), CircuitBreaker::State::Closed);
}
