/**
 * @file main.cpp
 * @brief CloudSlash command-line entry point.
 * @author Dimitris Kafetzis
 *
 * Wires the modules into one audit pipeline:
 *   Config → Logger → Scheduler → Scanner → Waste rules → Reachability → Remediation
 */

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"
#include "graph/impact.hpp"
#include "graph/reachability.hpp"
#include "graph/resource_graph.hpp"
#include "ingest/mock_scanner.hpp"
#include "ingest/waste_rules.hpp"
#include "remediation/script_generator.hpp"
#include "scheduler/adaptive_scheduler.hpp"
#include "telemetry/log_sinks.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

using namespace cloudslash;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║            CloudSlash v1.0.0              ║
  ║   Cloud Waste Audit & Safe Remediation    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::filesystem::path out_dir;
    std::string log_dir;
    bool demo_mode = false;
};

CLIArgs parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--out-dir" && i + 1 < argc) {
            args.out_dir = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--demo") {
            args.demo_mode = true;
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: cloudslash [OPTIONS]\n"
                      << "  --config <path>    Configuration file (default: config/default.toml)\n"
                      << "  --out-dir <path>   Directory for remediation artifacts\n"
                      << "  --log-dir <path>   Log output directory (empty: stdout)\n"
                      << "  --demo             Audit a synthetic account, then exit\n"
                      << "  --help, -h         Show this help message\n";
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << " (see --help)" << std::endl;
            std::exit(2);
        }
    }
    return args;
}

/**
 * @brief Run the full audit against the synthetic account.
 * @return process exit code.
 */
int run_demo(const Config& config, Logger& logger, std::stop_token cancel) {
    logger.info("=== Demo Mode ===");

    ResourceGraph graph;
    AdaptiveScheduler scheduler(config.scheduler);
    scheduler.set_error_handler([&logger](const Error& error) {
        if (error.code != ErrorCode::Throttled) {
            logger.warn(std::format("task failed [{}] {}: {}", to_string(error.code),
                                    error.subject, error.message));
        }
    });
    scheduler.start(cancel);

    MockAccountOptions account;
    account.vpcs = 3;
    account.subnets_per_vpc = 4;
    account.instances_per_subnet = 6;
    account.throttle_rate = 0.05;
    account.call_latency = std::chrono::milliseconds{2};

    MockScanner scanner(graph, account, logger);
    auto scan = scanner.scan(scheduler, cancel);
    auto sched_stats = scheduler.stats();
    scheduler.stop();

    if (!scan) {
        logger.error(std::format("scan aborted: {}", scan.error().message));
        return 1;
    }
    logger.info(std::format("scheduler: {} task(s), {} failed, final concurrency {}",
                            sched_stats.tasks_completed, sched_stats.tasks_failed,
                            sched_stats.concurrency));
    if (graph.is_partial()) {
        logger.warn(std::format("scan is partial: {} scope(s) failed", graph.scope_errors().size()));
    }

    size_t flagged = apply_waste_rules(graph, std::chrono::system_clock::now());
    logger.info(std::format("waste rules flagged {} resource(s)", flagged));

    ReachabilityAnalyzer reachability(std::make_shared<DefaultTraversalPolicy>(config.reachability));
    auto report = reachability.analyze(graph);
    logger.info(std::format("reachability: {} reachable, {} dark matter",
                            report.reachable.size(), report.dark_matter.size()));

    ImpactAnalyzer impact(graph);
    for (const auto& node : graph.waste_nodes()) {
        if (!node.is_actionable_waste()) continue;
        if (auto blast = impact.analyze_impact(node.id); blast && blast->active_count > 0) {
            logger.info(std::format("{}: blast radius {} ({} active)", node.id,
                                    blast->affected_count(), blast->active_count));
        }
    }

    RemediationGenerator generator(graph, logger);
    auto artifacts = generator.generate_all(config.remediation.output_dir,
                                            config.remediation.restore_region);
    if (!artifacts) {
        logger.error(std::format("remediation failed [{}]: {} {}", to_string(artifacts.error().code),
                                 artifacts.error().message, artifacts.error().subject));
        return 1;
    }

    std::cout << graph.dump_stats() << "\n"
              << "Artifacts:\n"
              << "  " << artifacts->safe_cleanup_script.string() << " ("
              << artifacts->deletion_count << " deletions)\n"
              << "  " << artifacts->ignore_script.string() << "\n"
              << "  " << artifacts->restoration_plan.string() << std::endl;

    logger.info("=== Demo Complete ===");
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    print_banner();

    auto args = parse_args(argc, argv);

    // Load configuration
    Config config = default_config();
    if (std::filesystem::exists(args.config_path)) {
        auto config_result = load_config(args.config_path);
        if (!config_result) {
            std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
            return 2;
        }
        config = std::move(config_result).value();
    } else {
        std::cerr << "Config " << args.config_path << " not found, using defaults." << std::endl;
    }

    // Apply CLI overrides
    if (!args.out_dir.empty()) config.remediation.output_dir = args.out_dir;
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "cloudslash",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    Logger logger(std::move(log_sink),
                  parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info));
    logger.info("CloudSlash starting...");
    logger.info(std::format("Workers: initial {}, bounds [{}, {}], queue {}",
                            config.scheduler.initial_workers, config.scheduler.min_workers,
                            config.scheduler.max_workers, config.scheduler.queue_capacity));

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source cancel;
    std::jthread signal_watch([&cancel](std::stop_token token) {
        while (!token.stop_requested()) {
            if (g_shutdown_requested) {
                cancel.request_stop();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    if (!args.demo_mode) {
        logger.error("No cloud provider backend is configured; run with --demo.");
        std::cerr << "No cloud provider backend is configured; run with --demo." << std::endl;
        return 1;
    }

    int rc = run_demo(config, logger, cancel.get_token());
    logger.info("CloudSlash stopped.");
    logger.flush();
    return rc;
}
