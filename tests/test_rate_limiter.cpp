#include <gtest/gtest.h>
#include "../provider/RateLimiter.hpp"
#include "../provider/ProviderErrors.hpp"
#include "../core/adapters/InMemoryTelemetryStore.hpp"
#include "../core/sim/SimulatedClock.hpp"
#include <memory>
#include <thread>
#include <vector>

using namespace tripseg;
using namespace std::chrono_literals;

class RateLimiterTest : public ::testing::Test {
protected:
    void SetUp() override {
        clock_ = std::make_shared<sim::SimulatedClock>();
        store_ = std::make_shared<adapters::InMemoryTelemetryStore>();
    }

    Timestamp farDeadline() const { return clock_->now() + 1h; }

    std::shared_ptr<sim::SimulatedClock> clock_;
    std::shared_ptr<adapters::InMemoryTelemetryStore> store_;
};

TEST_F(RateLimiterTest, TenCallsAtThreePerSecondTakeOverThreeSeconds) {
    provider::RateLimiter limiter(clock_);

    for (int i = 0; i < 10; ++i) {
        limiter.acquire(farDeadline());
    }

    // Spacing (350 ms) dominates the window, so the tenth call starts at 9 x 350 ms
    EXPECT_EQ(clock_->totalSlept(), 3150ms);
    EXPECT_LE(limiter.callsInWindow(), 3u);
}

TEST_F(RateLimiterTest, WindowAloneAdmitsThreePerSecond) {
    provider::RateLimiterConfig config;
    config.minSpacing = 0ms;
    provider::RateLimiter limiter(clock_, config);

    for (int i = 0; i < 3; ++i) {
        limiter.acquire(farDeadline());
    }
    EXPECT_EQ(clock_->totalSlept(), 0ms);

    for (int i = 0; i < 7; ++i) {
        limiter.acquire(farDeadline());
    }
    EXPECT_EQ(clock_->totalSlept(), 3000ms);
}

TEST_F(RateLimiterTest, BackoffHoldsCallers) {
    provider::RateLimiter limiter(clock_);
    limiter.applyBackoff();

    ASSERT_TRUE(limiter.backoffUntil().has_value());
    EXPECT_EQ(*limiter.backoffUntil(), clock_->now() + 60s);

    limiter.acquire(clock_->now() + 90s);
    EXPECT_GE(clock_->totalSlept(), 60000ms);
}

TEST_F(RateLimiterTest, AdmissionPastDeadlineThrowsTimeout) {
    provider::RateLimiter limiter(clock_);
    limiter.applyBackoff();

    Timestamp start = clock_->now();
    EXPECT_THROW(limiter.acquire(start + 30s), provider::ProviderTimeout);
    EXPECT_EQ(clock_->now(), start);
    EXPECT_EQ(limiter.callsInWindow(), 0u);
}

TEST_F(RateLimiterTest, BackoffSurvivesRestart) {
    {
        provider::RateLimiter limiter(clock_, {}, store_);
        limiter.applyBackoff();
    }

    provider::RateLimiter restarted(clock_, {}, store_);
    ASSERT_TRUE(restarted.backoffUntil().has_value());
    EXPECT_EQ(*restarted.backoffUntil(), clock_->now() + 60s);
}

TEST_F(RateLimiterTest, RepeatedBackoffNeverShortens) {
    provider::RateLimiter limiter(clock_);
    limiter.applyBackoff();
    Timestamp first = *limiter.backoffUntil();

    clock_->advance(10s);
    limiter.applyBackoff();
    EXPECT_EQ(*limiter.backoffUntil(), first + 10s);
}

TEST(RateLimiterRealClockTest, ConcurrentCallersShareOneBudget) {
    auto clock = std::make_shared<SystemClock>();
    provider::RateLimiterConfig config;
    config.minSpacing = 0ms;
    provider::RateLimiter limiter(clock, config);

    auto start = std::chrono::steady_clock::now();
    std::vector<std::thread> workers;
    for (int i = 0; i < 6; ++i) {
        workers.emplace_back([&]() { limiter.acquire(clock->now() + 10s); });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    auto elapsed = std::chrono::steady_clock::now() - start;

    // Three calls fit in the first window, the other three wait for it to roll
    EXPECT_GE(elapsed, 950ms);
    EXPECT_LT(elapsed, 5s);
}
