/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 * @author Dimitris Kafetzis
 */

#include "core/config.hpp"
#include "core/logger.hpp"

#include <toml++/toml.hpp>

#include <cstdint>
#include <format>
#include <limits>
#include <utility>

namespace cloudslash {

namespace {

/// Reads an optional unsigned 32-bit key; absent keys keep `out` unchanged.
template <typename Section>
Result<void> read_u32(Section section, std::string_view section_name,
                      std::string_view key, uint32_t& out) {
    auto value = section[key].template value<int64_t>();
    if (!value) return {};
    if (*value < 0 || *value > int64_t{std::numeric_limits<uint32_t>::max()}) {
        return Error{ErrorCode::Config,
                     std::format("{}.{} out of range: {}", section_name, key, *value)};
    }
    out = static_cast<uint32_t>(*value);
    return {};
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::Config, "Configuration file not found: " + path.string(),
                     path.string()};
    }

    Config config;
    try {
        auto tbl = toml::parse_file(path.string());

        // [scheduler]
        if (auto scheduler = tbl["scheduler"]; scheduler.is_table()) {
            auto& s = config.scheduler;
            for (auto [key, field] : {
                     std::pair{"initial_workers", &s.initial_workers},
                     std::pair{"min_workers", &s.min_workers},
                     std::pair{"max_workers", &s.max_workers},
                     std::pair{"queue_capacity", &s.queue_capacity},
                     std::pair{"control_interval_ms", &s.control_interval_ms},
                     std::pair{"idle_sleep_ms", &s.idle_sleep_ms}}) {
                if (auto read = read_u32(scheduler, "scheduler", key, *field); !read) {
                    return read.error();
                }
            }

            // [scheduler.aimd]
            if (auto aimd = scheduler["aimd"]; aimd.is_table()) {
                for (auto [key, field] : {
                         std::pair{"additive_step", &s.aimd.additive_step},
                         std::pair{"latency_threshold_ms", &s.aimd.latency_threshold_ms},
                         std::pair{"cooldown_ms", &s.aimd.cooldown_ms}}) {
                    if (auto read = read_u32(aimd, "scheduler.aimd", key, *field); !read) {
                        return read.error();
                    }
                }
            }
        }

        // [reachability]
        if (auto reach = tbl["reachability"]; reach.is_table()) {
            if (auto types = reach["ingress_types"].as_array()) {
                config.reachability.ingress_types.clear();
                for (const auto& entry : *types) {
                    if (auto name = entry.value<std::string>()) {
                        config.reachability.ingress_types.push_back(*name);
                    }
                }
            }
        }

        // [remediation]
        if (auto remediation = tbl["remediation"]; remediation.is_table()) {
            config.remediation.output_dir =
                remediation["output_dir"].value_or(std::string{"./cloudslash-out"});
            config.remediation.restore_region =
                remediation["restore_region"].value_or(std::string{"us-east-1"});
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            for (auto [key, field] : {
                     std::pair{"max_file_size_mb", &config.telemetry.max_file_size_mb},
                     std::pair{"rotate_count", &config.telemetry.rotate_count}}) {
                if (auto read = read_u32(telemetry, "telemetry", key, *field); !read) {
                    return read.error();
                }
            }
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Config,
                     std::string{"TOML parse error: "} + std::string{err.description()},
                     path.string()};
    }

    if (auto valid = validate_config(config); !valid) {
        return valid.error();
    }
    return config;
}

Result<void> validate_config(const Config& config) {
    const auto& s = config.scheduler;
    if (s.min_workers == 0) {
        return Error{ErrorCode::Config, "scheduler.min_workers must be at least 1"};
    }
    if (s.min_workers > s.max_workers) {
        return Error{ErrorCode::Config, "scheduler.min_workers exceeds scheduler.max_workers"};
    }
    if (s.initial_workers < s.min_workers || s.initial_workers > s.max_workers) {
        return Error{ErrorCode::Config,
                     "scheduler.initial_workers must lie within [min_workers, max_workers]"};
    }
    if (s.queue_capacity == 0) {
        return Error{ErrorCode::Config, "scheduler.queue_capacity must be positive"};
    }
    if (s.control_interval_ms == 0) {
        return Error{ErrorCode::Config, "scheduler.control_interval_ms must be positive"};
    }
    if (!parse_log_level(config.telemetry.log_level)) {
        return Error{ErrorCode::Config, "unknown telemetry.log_level: " + config.telemetry.log_level};
    }
    return {};
}

Config default_config() {
    return Config{};
}

}  // namespace cloudslash
