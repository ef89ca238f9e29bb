/**
 * @file test_adaptive_scheduler.cpp
 * @brief Unit tests for the AIMD-driven worker pool.
 */

#include "scheduler/adaptive_scheduler.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace cloudslash;
using namespace std::chrono_literals;

// ─── Helpers ─────────────────────────────────

namespace {

SchedulerConfig small_config() {
    SchedulerConfig config;
    config.initial_workers = 4;
    config.min_workers = 1;
    config.max_workers = 8;
    config.queue_capacity = 16;
    config.control_interval_ms = 10;
    config.idle_sleep_ms = 1;
    return config;
}

template <typename Pred>
bool eventually(Pred pred, std::chrono::milliseconds timeout = 5s) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return pred();
}

Task counting_task(std::atomic<int>& counter) {
    return [&counter](std::stop_token) -> Result<void> {
        counter.fetch_add(1);
        return {};
    };
}

}  // namespace

// ─── Execution ───────────────────────────────

TEST(AdaptiveSchedulerTest, RunsEverySubmittedTask) {
    AdaptiveScheduler scheduler(small_config());
    scheduler.start();

    std::atomic<int> counter{0};
    for (int i = 0; i < 200; ++i) {
        ASSERT_TRUE(scheduler.submit(counting_task(counter)));
    }

    EXPECT_TRUE(eventually([&] { return counter.load() == 200; }));
    scheduler.stop();

    auto stats = scheduler.stats();
    EXPECT_EQ(stats.tasks_completed, 200u);
    EXPECT_EQ(stats.tasks_failed, 0u);
    EXPECT_EQ(stats.queued, 0u);
}

TEST(AdaptiveSchedulerTest, GrowsPoolToTarget) {
    auto config = small_config();
    config.initial_workers = 3;
    AdaptiveScheduler scheduler(config);
    scheduler.start();

    EXPECT_TRUE(eventually([&] { return scheduler.active_workers() == 3; }));
    scheduler.stop();
    EXPECT_EQ(scheduler.active_workers(), 0u);
}

TEST(AdaptiveSchedulerTest, SubmitBlocksWhileQueueIsFull) {
    auto config = small_config();
    config.queue_capacity = 2;
    AdaptiveScheduler scheduler(config);

    std::atomic<int> counter{0};
    ASSERT_TRUE(scheduler.try_submit(counting_task(counter)));
    ASSERT_TRUE(scheduler.try_submit(counting_task(counter)));
    EXPECT_FALSE(scheduler.try_submit(counting_task(counter)));

    std::atomic<bool> submitted{false};
    std::jthread producer([&] {
        submitted = scheduler.submit(counting_task(counter));
    });

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(submitted.load());

    // Workers drain the queue and free a slot.
    scheduler.start();
    EXPECT_TRUE(eventually([&] { return submitted.load(); }));
    EXPECT_TRUE(eventually([&] { return counter.load() == 3; }));
    scheduler.stop();
}

TEST(AdaptiveSchedulerTest, StopReleasesBlockedSubmitter) {
    auto config = small_config();
    config.queue_capacity = 1;
    AdaptiveScheduler scheduler(config);

    std::atomic<int> counter{0};
    ASSERT_TRUE(scheduler.submit(counting_task(counter)));

    std::atomic<bool> returned{false};
    std::atomic<bool> accepted{true};
    std::jthread producer([&] {
        accepted = scheduler.submit(counting_task(counter));
        returned = true;
    });

    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(returned.load());

    scheduler.stop();
    EXPECT_TRUE(eventually([&] { return returned.load(); }));
    EXPECT_FALSE(accepted.load());
    EXPECT_FALSE(scheduler.submit(counting_task(counter)));
}

// ─── Errors ──────────────────────────────────

TEST(AdaptiveSchedulerTest, ExceptionsBecomePanickedErrors) {
    AdaptiveScheduler scheduler(small_config());

    std::mutex mutex;
    std::vector<Error> errors;
    scheduler.set_error_handler([&](const Error& error) {
        std::lock_guard lock(mutex);
        errors.push_back(error);
    });
    scheduler.start();

    std::atomic<int> counter{0};
    scheduler.submit([](std::stop_token) -> Result<void> {
        throw std::runtime_error("describe-instances exploded");
    });
    scheduler.submit([](std::stop_token) -> Result<void> {
        return Error{ErrorCode::TaskFailed, "AccessDenied", "ec2:DescribeVolumes"};
    });
    scheduler.submit(counting_task(counter));

    EXPECT_TRUE(eventually([&] {
        std::lock_guard lock(mutex);
        return errors.size() == 2 && counter.load() == 1;
    }));
    scheduler.stop();

    std::lock_guard lock(mutex);
    ASSERT_EQ(errors.size(), 2u);
    auto panicked = std::find_if(errors.begin(), errors.end(), [](const Error& e) {
        return e.code == ErrorCode::TaskPanicked;
    });
    ASSERT_NE(panicked, errors.end());
    EXPECT_NE(panicked->message.find("describe-instances exploded"), std::string::npos);
    EXPECT_EQ(scheduler.stats().tasks_failed, 2u);
}

TEST(AdaptiveSchedulerTest, ThrowingObserversDoNotKillWorkers) {
    AdaptiveScheduler scheduler(small_config());
    scheduler.set_throttle_classifier([](const Error&) -> bool {
        throw std::logic_error("classifier bug");
    });
    scheduler.set_error_handler([](const Error&) {
        throw std::runtime_error("handler bug");
    });
    scheduler.start();

    for (int i = 0; i < 3; ++i) {
        scheduler.submit([](std::stop_token) -> Result<void> {
            return Error{ErrorCode::Throttled, "Rate exceeded"};
        });
    }
    std::atomic<int> counter{0};
    scheduler.submit(counting_task(counter));

    EXPECT_TRUE(eventually([&] { return scheduler.stats().tasks_completed == 4; }));
    scheduler.stop();

    auto stats = scheduler.stats();
    EXPECT_EQ(counter.load(), 1);
    EXPECT_EQ(stats.tasks_failed, 3u);
    EXPECT_EQ(stats.observer_failures, 6u);
}

// ─── Feedback ────────────────────────────────

TEST(AdaptiveSchedulerTest, ThrottledTasksHalveConcurrency) {
    auto config = small_config();
    config.initial_workers = 40;
    config.min_workers = 2;
    config.max_workers = 40;
    config.queue_capacity = 64;
    config.aimd.cooldown_ms = 0;
    AdaptiveScheduler scheduler(config);
    scheduler.start();

    std::atomic<int> done{0};
    for (int i = 0; i < 10; ++i) {
        scheduler.submit([&done](std::stop_token) -> Result<void> {
            done.fetch_add(1);
            return Error{ErrorCode::Throttled, "Rate exceeded"};
        });
    }

    EXPECT_TRUE(eventually([&] { return done.load() == 10; }));
    EXPECT_TRUE(eventually([&] { return scheduler.stats().tasks_completed == 10; }));
    EXPECT_EQ(scheduler.aimd().concurrency(), 2u);

    // Surplus workers retire on their own.
    EXPECT_TRUE(eventually([&] { return scheduler.active_workers() <= 2; }));
    scheduler.stop();
}

TEST(AdaptiveSchedulerTest, CustomThrottleClassifier) {
    auto config = small_config();
    config.initial_workers = 8;
    config.aimd.cooldown_ms = 0;
    AdaptiveScheduler scheduler(config);
    scheduler.set_throttle_classifier([](const Error& error) {
        return error.message.find("429") != std::string::npos;
    });
    scheduler.start();

    scheduler.submit([](std::stop_token) -> Result<void> {
        return Error{ErrorCode::TaskFailed, "HTTP 429 Too Many Requests"};
    });
    EXPECT_TRUE(eventually([&] { return scheduler.stats().tasks_completed == 1; }));
    EXPECT_EQ(scheduler.aimd().concurrency(), 4u);

    // The default code no longer counts once a classifier is installed;
    // a fast unclassified failure is fed back like any fast call.
    scheduler.submit([](std::stop_token) -> Result<void> {
        return Error{ErrorCode::Throttled, "Rate exceeded"};
    });
    EXPECT_TRUE(eventually([&] { return scheduler.stats().tasks_completed == 2; }));
    EXPECT_EQ(scheduler.aimd().concurrency(), 9u);
    scheduler.stop();
}

TEST(AdaptiveSchedulerTest, FastSuccessesGrowConcurrency) {
    auto config = small_config();
    config.initial_workers = 2;
    config.max_workers = 32;
    config.aimd.cooldown_ms = 0;
    AdaptiveScheduler scheduler(config);
    scheduler.start();

    std::atomic<int> counter{0};
    for (int i = 0; i < 10; ++i) scheduler.submit(counting_task(counter));

    EXPECT_TRUE(eventually([&] { return scheduler.stats().tasks_completed == 10; }));
    EXPECT_EQ(scheduler.aimd().concurrency(), 32u);
    scheduler.stop();
}

// ─── Cancellation ────────────────────────────

TEST(AdaptiveSchedulerTest, ExternalCancellationStopsScheduler) {
    AdaptiveScheduler scheduler(small_config());
    std::stop_source cancel;
    scheduler.start(cancel.get_token());

    std::atomic<int> counter{0};
    ASSERT_TRUE(scheduler.submit(counting_task(counter)));
    EXPECT_TRUE(eventually([&] { return counter.load() == 1; }));

    cancel.request_stop();
    EXPECT_TRUE(scheduler.stopped());
    EXPECT_FALSE(scheduler.submit(counting_task(counter)));
    EXPECT_TRUE(eventually([&] { return scheduler.active_workers() == 0; }));
    scheduler.stop();
}

TEST(AdaptiveSchedulerTest, RunningTasksObserveStop) {
    AdaptiveScheduler scheduler(small_config());
    scheduler.start();

    std::atomic<bool> started{false};
    std::atomic<bool> saw_stop{false};
    scheduler.submit([&](std::stop_token token) -> Result<void> {
        started = true;
        while (!token.stop_requested()) std::this_thread::sleep_for(1ms);
        saw_stop = true;
        return {};
    });

    ASSERT_TRUE(eventually([&] { return started.load(); }));
    scheduler.stop();
    EXPECT_TRUE(saw_stop.load());
}
