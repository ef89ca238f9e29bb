/**
 * @file test_aimd.cpp
 * @brief Unit tests for the AIMD concurrency controller.
 */

#include "scheduler/aimd.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace cloudslash;
using namespace std::chrono_literals;

namespace {

constexpr Duration kFast = 50ms;
constexpr Duration kSlow = 250ms;

}  // namespace

TEST(AimdTest, AdditiveIncreaseThenMultiplicativeDecrease) {
    auto t0 = std::chrono::steady_clock::now();
    AimdController aimd(10, 5, 20);
    EXPECT_EQ(aimd.concurrency(), 10u);

    EXPECT_TRUE(aimd.feedback(kFast, false, t0 + 200ms));
    EXPECT_EQ(aimd.concurrency(), 15u);

    EXPECT_TRUE(aimd.feedback(kFast, true, t0 + 400ms));
    EXPECT_EQ(aimd.concurrency(), 7u);

    EXPECT_TRUE(aimd.feedback(kFast, true, t0 + 600ms));
    EXPECT_EQ(aimd.concurrency(), 5u);

    // Floor holds under repeated throttling.
    EXPECT_FALSE(aimd.feedback(kFast, true, t0 + 800ms));
    EXPECT_FALSE(aimd.feedback(kFast, true, t0 + 1000ms));
    EXPECT_EQ(aimd.concurrency(), 5u);
}

TEST(AimdTest, IncreaseIsCappedAtMax) {
    auto t0 = std::chrono::steady_clock::now();
    AimdController aimd(18, 5, 20);
    aimd.feedback(kFast, false, t0 + 200ms);
    EXPECT_EQ(aimd.concurrency(), 20u);
    EXPECT_FALSE(aimd.feedback(kFast, false, t0 + 400ms));
    EXPECT_EQ(aimd.concurrency(), 20u);
}

TEST(AimdTest, CooldownBlocksBackToBackAdjustments) {
    auto t0 = std::chrono::steady_clock::now();
    AimdController aimd(10, 5, 20);

    // Still inside the cooldown measured from construction.
    EXPECT_FALSE(aimd.feedback(kFast, true, t0));
    EXPECT_EQ(aimd.concurrency(), 10u);

    aimd.feedback(kFast, false, t0 + 200ms);
    EXPECT_FALSE(aimd.feedback(kFast, true, t0 + 250ms));
    EXPECT_EQ(aimd.concurrency(), 15u);

    EXPECT_TRUE(aimd.feedback(kFast, true, t0 + 301ms));
    EXPECT_EQ(aimd.concurrency(), 7u);
}

TEST(AimdTest, SlowSuccessLeavesTargetAlone) {
    auto t0 = std::chrono::steady_clock::now();
    AimdController aimd(10, 5, 20);
    EXPECT_FALSE(aimd.feedback(kSlow, false, t0 + 200ms));
    EXPECT_EQ(aimd.concurrency(), 10u);

    // A slow success does not restart the cooldown.
    EXPECT_TRUE(aimd.feedback(kFast, false, t0 + 210ms));
    EXPECT_EQ(aimd.concurrency(), 15u);
}

TEST(AimdTest, InitialIsClampedIntoBounds) {
    EXPECT_EQ(AimdController(1, 5, 20).concurrency(), 5u);
    EXPECT_EQ(AimdController(99, 5, 20).concurrency(), 20u);
}

TEST(AimdTest, ConfiguredStepAndThreshold) {
    AimdConfig config;
    config.additive_step = 2;
    config.latency_threshold_ms = 500;
    config.cooldown_ms = 10;

    auto t0 = std::chrono::steady_clock::now();
    AimdController aimd(10, 1, 100, config);
    EXPECT_TRUE(aimd.feedback(kSlow, false, t0 + 50ms));
    EXPECT_EQ(aimd.concurrency(), 12u);
    EXPECT_TRUE(aimd.feedback(kFast, true, t0 + 70ms));
    EXPECT_EQ(aimd.concurrency(), 6u);
}

TEST(AimdTest, FromSchedulerConfig) {
    SchedulerConfig config;
    AimdController aimd(config);
    EXPECT_EQ(aimd.concurrency(), 50u);
    EXPECT_EQ(aimd.min_workers(), 5u);
    EXPECT_EQ(aimd.max_workers(), 500u);
}
