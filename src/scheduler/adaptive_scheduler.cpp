/**
 * @file adaptive_scheduler.cpp
 * @brief AdaptiveScheduler implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/adaptive_scheduler.hpp"

#include <chrono>
#include <exception>
#include <string>

namespace cloudslash {

bool is_throttle_error(const Error& error) noexcept {
    return error.code == ErrorCode::Throttled;
}

AdaptiveScheduler::AdaptiveScheduler(const SchedulerConfig& config)
    : config_(config), aimd_(config) {}

AdaptiveScheduler::~AdaptiveScheduler() {
    stop();
}

// ─────────────────────────────────────────────
// Submission
// ─────────────────────────────────────────────

bool AdaptiveScheduler::submit(Task task) {
    std::unique_lock lock(queue_mutex_);
    bool has_room = not_full_.wait(lock, shutdown_.get_token(), [this] {
        return queue_.size() < config_.queue_capacity;
    });
    if (!has_room || shutdown_.stop_requested()) return false;

    queue_.push_back(std::move(task));
    return true;
}

bool AdaptiveScheduler::try_submit(Task task) {
    std::lock_guard lock(queue_mutex_);
    if (shutdown_.stop_requested() || queue_.size() >= config_.queue_capacity) {
        return false;
    }
    queue_.push_back(std::move(task));
    return true;
}

std::optional<Task> AdaptiveScheduler::try_dequeue() {
    std::optional<Task> task;
    {
        std::lock_guard lock(queue_mutex_);
        if (queue_.empty()) return std::nullopt;
        task = std::move(queue_.front());
        queue_.pop_front();
    }
    not_full_.notify_one();
    return task;
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

void AdaptiveScheduler::start(std::stop_token cancel) {
    if (started_.exchange(true)) return;

    if (cancel.stop_possible()) {
        cancel_link_.emplace(cancel, std::function<void()>{[this] {
            shutdown_.request_stop();
        }});
    }

    control_thread_ = std::jthread([this] { control_loop(); });
}

void AdaptiveScheduler::stop() {
    shutdown_.request_stop();
    control_cv_.notify_all();

    if (control_thread_.joinable()) {
        control_thread_.join();
    }

    std::list<Worker> remaining;
    {
        std::lock_guard lock(workers_mutex_);
        remaining.swap(workers_);
    }
    for (auto& worker : remaining) {
        if (worker.thread.joinable()) worker.thread.join();
    }
    cancel_link_.reset();
}

void AdaptiveScheduler::set_throttle_classifier(ThrottleClassifier classifier) {
    classify_throttle_ = std::move(classifier);
}

void AdaptiveScheduler::set_error_handler(TaskErrorHandler handler) {
    on_error_ = std::move(handler);
}

// ─────────────────────────────────────────────
// Control Loop
// ─────────────────────────────────────────────

void AdaptiveScheduler::control_loop() {
    const auto interval = std::chrono::milliseconds{config_.control_interval_ms};
    auto token = shutdown_.get_token();

    while (!token.stop_requested()) {
        reap_finished_workers();

        size_t target = aimd_.concurrency();
        size_t current = active_workers_.load();
        if (current < target) {
            spawn_workers(target - current);
        }

        std::unique_lock lock(control_mutex_);
        control_cv_.wait_for(lock, token, interval, [] { return false; });
    }
}

void AdaptiveScheduler::spawn_workers(size_t count) {
    std::lock_guard lock(workers_mutex_);
    for (size_t i = 0; i < count; ++i) {
        auto finished = std::make_shared<std::atomic<bool>>(false);
        // Counted before the thread runs so the next tick cannot overshoot.
        active_workers_.fetch_add(1);
        workers_.push_back(Worker{
            std::jthread([this, finished] { worker_loop(finished); }),
            finished
        });
    }
}

void AdaptiveScheduler::reap_finished_workers() {
    std::lock_guard lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (!it->finished->load()) {
            ++it;
            continue;
        }
        if (it->thread.joinable()) it->thread.join();
        it = workers_.erase(it);
    }
}

// ─────────────────────────────────────────────
// Workers
// ─────────────────────────────────────────────

bool AdaptiveScheduler::try_retire() {
    size_t current = active_workers_.load();
    while (current > aimd_.concurrency()) {
        if (active_workers_.compare_exchange_weak(current, current - 1)) {
            return true;
        }
    }
    return false;
}

void AdaptiveScheduler::worker_loop(const std::shared_ptr<std::atomic<bool>>& finished) {
    const auto idle = std::chrono::milliseconds{config_.idle_sleep_ms};
    auto token = shutdown_.get_token();

    while (!token.stop_requested()) {
        if (try_retire()) {
            finished->store(true);
            return;
        }

        auto task = try_dequeue();
        if (!task) {
            std::this_thread::sleep_for(idle);
            continue;
        }
        execute(*task);
    }

    active_workers_.fetch_sub(1);
    finished->store(true);
}

void AdaptiveScheduler::execute(Task& task) {
    auto token = shutdown_.get_token();
    auto started = std::chrono::steady_clock::now();

    Result<void> result = [&]() -> Result<void> {
        try {
            return task(token);
        } catch (const std::exception& e) {
            return Error{ErrorCode::TaskPanicked, std::string{"task threw: "} + e.what()};
        } catch (...) {
            return Error{ErrorCode::TaskPanicked, "task threw a non-standard exception"};
        }
    }();

    auto latency = std::chrono::duration_cast<Duration>(std::chrono::steady_clock::now() - started);
    bool throttled = !result && classify(result.error());
    aimd_.feedback(latency, throttled);

    if (!result) {
        tasks_failed_.fetch_add(1);
        notify_error(result.error());
    }
    tasks_completed_.fetch_add(1);
}

bool AdaptiveScheduler::classify(const Error& error) noexcept {
    if (!classify_throttle_) return false;
    try {
        return classify_throttle_(error);
    } catch (...) {
        observer_failures_.fetch_add(1);
        return false;
    }
}

void AdaptiveScheduler::notify_error(const Error& error) noexcept {
    if (!on_error_) return;
    try {
        on_error_(error);
    } catch (...) {
        observer_failures_.fetch_add(1);
    }
}

// ─────────────────────────────────────────────
// Stats
// ─────────────────────────────────────────────

SchedulerStats AdaptiveScheduler::stats() const {
    SchedulerStats s;
    s.active_workers = active_workers_.load();
    s.concurrency = aimd_.concurrency();
    s.tasks_completed = tasks_completed_.load();
    s.tasks_failed = tasks_failed_.load();
    s.observer_failures = observer_failures_.load();
    {
        std::lock_guard lock(queue_mutex_);
        s.queued = queue_.size();
    }
    return s;
}

size_t AdaptiveScheduler::active_workers() const noexcept {
    return active_workers_.load();
}

}  // namespace cloudslash
