/**
 * @file aimd.hpp
 * @brief Additive-increase / multiplicative-decrease concurrency controller.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>

namespace cloudslash {

/**
 * @brief Tracks the target worker count from task feedback.
 *
 * Throttled feedback halves the target (floored at min); fast successes add
 * `additive_step` (capped at max). Adjustments are at least `cooldown`
 * apart, measured from the previous adjustment or from construction.
 * Invariant: min <= concurrency() <= max.
 */
class AimdController {
public:
    AimdController(uint32_t initial, uint32_t min_workers, uint32_t max_workers,
                   const AimdConfig& config = {});
    explicit AimdController(const SchedulerConfig& config);

    [[nodiscard]] uint32_t concurrency() const noexcept;
    [[nodiscard]] uint32_t min_workers() const noexcept { return min_workers_; }
    [[nodiscard]] uint32_t max_workers() const noexcept { return max_workers_; }

    /// Returns true when the target changed.
    bool feedback(Duration latency, bool throttled);
    bool feedback(Duration latency, bool throttled, SteadyTime now);

private:
    const uint32_t min_workers_;
    const uint32_t max_workers_;
    const uint32_t additive_step_;
    const std::chrono::milliseconds latency_threshold_;
    const std::chrono::milliseconds cooldown_;

    std::atomic<uint32_t> concurrency_;
    std::mutex mutex_;
    SteadyTime last_change_;
};

}  // namespace cloudslash
