/**
 * @file adaptive_scheduler.hpp
 * @brief Self-sizing worker pool driven by AIMD feedback.
 * @author Dimitris Kafetzis
 *
 * Scanners wrap every provider call as a Task and submit it. A control loop
 * grows the pool towards the AIMD target; surplus workers retire on their
 * own. The bounded queue is the only backpressure: submit() blocks while it
 * is full.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "scheduler/aimd.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>

namespace cloudslash {

/// A fallible unit of work. The token fires on stop() or external cancellation.
using Task = std::function<Result<void>(std::stop_token)>;

/// Decides whether a task error means the provider is rate limiting us.
using ThrottleClassifier = std::function<bool(const Error&)>;

/// Observer for task failures, including exceptions converted to errors.
/// Invoked on worker threads. Exceptions it throws are counted in
/// SchedulerStats::observer_failures and otherwise dropped; the same holds
/// for a throwing ThrottleClassifier, whose error then counts as no throttle.
using TaskErrorHandler = std::function<void(const Error&)>;

/// Default classifier: ErrorCode::Throttled.
[[nodiscard]] bool is_throttle_error(const Error& error) noexcept;

struct SchedulerStats {
    size_t active_workers = 0;
    uint32_t concurrency = 0;
    uint64_t tasks_completed = 0;
    uint64_t tasks_failed = 0;
    uint64_t observer_failures = 0;   ///< Classifier or error handler threw
    size_t queued = 0;
};

/**
 * @brief Dynamically sized worker pool.
 *
 * Single use: once stopped (or cancelled) it cannot be restarted.
 * The classifier and error handler must be installed before start().
 */
class AdaptiveScheduler {
public:
    explicit AdaptiveScheduler(const SchedulerConfig& config = {});
    ~AdaptiveScheduler();

    AdaptiveScheduler(const AdaptiveScheduler&) = delete;
    AdaptiveScheduler& operator=(const AdaptiveScheduler&) = delete;

    /**
     * @brief Enqueue a task, blocking while the queue is full.
     * @return false if the scheduler stopped before the task was queued.
     */
    bool submit(Task task);

    /// Non-blocking variant; false when full or stopped.
    bool try_submit(Task task);

    /**
     * @brief Launch the control loop.
     *
     * Requesting stop on `cancel` stops the control loop and releases idle
     * workers and blocked submitters. Running tasks see it through their token.
     */
    void start(std::stop_token cancel = {});

    /// Signal shutdown and block until every worker has exited.
    void stop();

    void set_throttle_classifier(ThrottleClassifier classifier);
    void set_error_handler(TaskErrorHandler handler);

    /// True once stop() was called or the start() token fired.
    [[nodiscard]] bool stopped() const noexcept { return shutdown_.stop_requested(); }

    [[nodiscard]] SchedulerStats stats() const;
    [[nodiscard]] size_t active_workers() const noexcept;
    [[nodiscard]] AimdController& aimd() noexcept { return aimd_; }
    [[nodiscard]] const AimdController& aimd() const noexcept { return aimd_; }

private:
    struct Worker {
        std::jthread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    void control_loop();
    void spawn_workers(size_t count);
    void reap_finished_workers();
    void worker_loop(const std::shared_ptr<std::atomic<bool>>& finished);
    bool try_retire();
    std::optional<Task> try_dequeue();
    void execute(Task& task);
    bool classify(const Error& error) noexcept;
    void notify_error(const Error& error) noexcept;

    SchedulerConfig config_;
    AimdController aimd_;
    ThrottleClassifier classify_throttle_ = is_throttle_error;
    TaskErrorHandler on_error_;

    std::stop_source shutdown_;
    std::optional<std::stop_callback<std::function<void()>>> cancel_link_;

    mutable std::mutex queue_mutex_;
    std::condition_variable_any not_full_;
    std::deque<Task> queue_;

    std::mutex workers_mutex_;
    std::list<Worker> workers_;
    std::atomic<size_t> active_workers_{0};

    std::mutex control_mutex_;
    std::condition_variable_any control_cv_;
    std::jthread control_thread_;

    std::atomic<bool> started_{false};
    std::atomic<uint64_t> tasks_completed_{0};
    std::atomic<uint64_t> tasks_failed_{0};
    std::atomic<uint64_t> observer_failures_{0};
};

}  // namespace cloudslash
