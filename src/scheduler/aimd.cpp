/**
 * @file aimd.cpp
 * @brief AimdController implementation.
 * @author Dimitris Kafetzis
 */

#include "scheduler/aimd.hpp"

#include <algorithm>

namespace cloudslash {

AimdController::AimdController(uint32_t initial, uint32_t min_workers, uint32_t max_workers,
                               const AimdConfig& config)
    : min_workers_(min_workers)
    , max_workers_(std::max(min_workers, max_workers))
    , additive_step_(config.additive_step)
    , latency_threshold_(config.latency_threshold_ms)
    , cooldown_(config.cooldown_ms)
    , concurrency_(std::clamp(initial, min_workers_, max_workers_))
    , last_change_(std::chrono::steady_clock::now()) {}

AimdController::AimdController(const SchedulerConfig& config)
    : AimdController(config.initial_workers, config.min_workers, config.max_workers, config.aimd) {}

uint32_t AimdController::concurrency() const noexcept {
    return concurrency_.load(std::memory_order_acquire);
}

bool AimdController::feedback(Duration latency, bool throttled) {
    return feedback(latency, throttled, std::chrono::steady_clock::now());
}

bool AimdController::feedback(Duration latency, bool throttled, SteadyTime now) {
    std::lock_guard lock(mutex_);

    if (now - last_change_ < cooldown_) return false;

    uint32_t current = concurrency_.load(std::memory_order_relaxed);
    uint32_t next = current;

    if (throttled) {
        next = std::max(current / 2, min_workers_);
    } else if (latency < latency_threshold_) {
        next = std::min(current + additive_step_, max_workers_);
    } else {
        return false;
    }

    concurrency_.store(next, std::memory_order_release);
    last_change_ = now;
    return next != current;
}

}  // namespace cloudslash
