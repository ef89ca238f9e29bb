/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 * @author Dimitris Kafetzis
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "core/result.hpp"

namespace cloudslash {

struct AimdConfig {
    uint32_t additive_step = 5;
    uint32_t latency_threshold_ms = 100;   ///< Successes faster than this grow concurrency
    uint32_t cooldown_ms = 100;            ///< Minimum spacing between two adjustments
};

struct SchedulerConfig {
    uint32_t initial_workers = 50;
    uint32_t min_workers = 5;
    uint32_t max_workers = 500;
    uint32_t queue_capacity = 1000;
    uint32_t control_interval_ms = 50;
    uint32_t idle_sleep_ms = 10;
    AimdConfig aimd;
};

struct ReachabilityConfig {
    std::vector<std::string> ingress_types = {
        "AWS::EC2::InternetGateway",
        "AWS::EC2::VPNGateway"
    };
};

struct RemediationConfig {
    std::filesystem::path output_dir = "./cloudslash-out";
    std::string restore_region = "us-east-1";
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    SchedulerConfig scheduler;
    ReachabilityConfig reachability;
    RemediationConfig remediation;
    TelemetryConfig telemetry;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Keys that are absent keep their defaults. The result is validated with
 * validate_config() before it is returned.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Check cross-field invariants (worker bounds, queue capacity, log level).
 */
Result<void> validate_config(const Config& config);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace cloudslash
