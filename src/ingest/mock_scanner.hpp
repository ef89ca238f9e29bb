/**
 * @file mock_scanner.hpp
 * @brief Synthetic cloud account scanner for demos, tests and benchmarks.
 * @author Dimitris Kafetzis
 *
 * Models an account as VPCs, each with an internet gateway, public and
 * private subnets, instances with root volumes, spare volumes, Elastic IPs
 * and a NAT gateway. Every simulated API call is a scheduler task; a
 * configurable fraction of calls fail with ErrorCode::Throttled so the AIMD
 * loop has something to react to.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "graph/resource_graph.hpp"
#include "scheduler/adaptive_scheduler.hpp"

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>
#include <string_view>

namespace cloudslash {

struct MockAccountOptions {
    std::string region = "us-east-1";
    std::string account_id = "123456789012";
    size_t vpcs = 2;
    size_t subnets_per_vpc = 2;          ///< Even indices public, odd private
    size_t instances_per_subnet = 4;
    size_t stopped_every = 4;            ///< Every Nth instance is stopped (0 = none)
    double throttle_rate = 0.0;          ///< Probability a call reports Throttled
    std::chrono::microseconds call_latency{0};
    uint32_t max_attempts = 5;           ///< Per call, before the scope is recorded as failed
    uint32_t seed = 42;
};

struct ScanSummary {
    size_t calls = 0;
    size_t throttled = 0;
    size_t failed_scopes = 0;
    size_t rounds = 0;
};

/// ARN of an EC2 resource in the synthetic account.
[[nodiscard]] std::string mock_arn(const MockAccountOptions& options,
                                   std::string_view kind, std::string_view id);

/// Number of distinct resources a complete scan produces.
[[nodiscard]] size_t expected_resource_count(const MockAccountOptions& options);

class MockScanner {
public:
    MockScanner(ResourceGraph& graph, MockAccountOptions options, Logger& logger);

    /**
     * @brief Enumerate the synthetic account through `scheduler`.
     *
     * The scheduler must already be started. Throttled calls are retried in
     * later rounds; calls that exhaust their attempts are recorded with
     * ResourceGraph::add_scope_error and the scan still succeeds (partial).
     * Fails if `cancel` fires or the scheduler stops with calls outstanding.
     */
    Result<ScanSummary> scan(AdaptiveScheduler& scheduler, std::stop_token cancel = {});

    [[nodiscard]] const MockAccountOptions& options() const noexcept { return options_; }

private:
    ResourceGraph& graph_;
    MockAccountOptions options_;
    Logger& logger_;
};

}  // namespace cloudslash
