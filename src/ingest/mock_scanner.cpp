/**
 * @file mock_scanner.cpp
 * @brief MockScanner: synthetic topology emitted through the scheduler.
 * @author Dimitris Kafetzis
 *
 * Edge directions follow the graph convention (dependent -> dependency):
 *   instance -> subnet -> vpc, volume -> instance, eip -> nat -> subnet.
 * Network flow is added as FlowsTo edges for reachability:
 *   igw -> subnet -> instance.
 */

#include "ingest/mock_scanner.hpp"

#include "graph/property_value.hpp"

#include <condition_variable>
#include <format>
#include <memory>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

namespace cloudslash {

namespace {

enum class ScanCall : uint8_t {
    Vpcs,
    Subnets,
    Instances,
    Volumes,
    Addresses,
    NatGateways
};

constexpr std::string_view to_string(ScanCall call) noexcept {
    switch (call) {
        case ScanCall::Vpcs:        return "ec2:DescribeVpcs";
        case ScanCall::Subnets:     return "ec2:DescribeSubnets";
        case ScanCall::Instances:   return "ec2:DescribeInstances";
        case ScanCall::Volumes:     return "ec2:DescribeVolumes";
        case ScanCall::Addresses:   return "ec2:DescribeAddresses";
        case ScanCall::NatGateways: return "ec2:DescribeNatGateways";
    }
    return "ec2:Unknown";
}

struct ScanScope {
    ScanCall call;
    size_t vpc = 0;
    size_t subnet = 0;
    uint32_t attempts = 0;
};

// Shared between scan() and its in-flight tasks so a task that outlives
// an aborted scan never touches freed state.
struct RoundState {
    explicit RoundState(MockAccountOptions opts) : options(std::move(opts)), rng(options.seed) {}

    const MockAccountOptions options;

    std::mutex mutex;
    std::condition_variable_any done;
    size_t outstanding = 0;
    std::vector<ScanScope> retry;
    size_t throttled = 0;

    std::mutex rng_mutex;
    std::mt19937 rng;
    std::uniform_real_distribution<double> coin{0.0, 1.0};
};

constexpr std::string_view kInstanceType = "AWS::EC2::Instance";
constexpr std::string_view kVolumeType = "AWS::EC2::Volume";
constexpr std::string_view kSubnetType = "AWS::EC2::Subnet";
constexpr std::string_view kVpcType = "AWS::EC2::VPC";
constexpr std::string_view kIgwType = "AWS::EC2::InternetGateway";
constexpr std::string_view kEipType = "AWS::EC2::EIP";
constexpr std::string_view kNatType = "AWS::EC2::NatGateway";

std::string vpc_id(size_t v) { return std::format("vpc-{:04}", v); }
std::string igw_id(size_t v) { return std::format("igw-{:04}", v); }
std::string nat_id(size_t v) { return std::format("nat-{:04}", v); }
std::string subnet_id(size_t v, size_t s) { return std::format("subnet-{:04}{:02}", v, s); }
std::string instance_id(size_t v, size_t s, size_t i) { return std::format("i-{:04}{:02}{:04}", v, s, i); }
std::string root_volume_id(size_t v, size_t s, size_t i) { return std::format("vol-{:04}{:02}{:04}", v, s, i); }
std::string spare_volume_id(size_t v, size_t s) { return std::format("vol-{:04}{:02}spare", v, s); }

std::string scope_name(const MockAccountOptions& options, const ScanScope& scope) {
    switch (scope.call) {
        case ScanCall::Instances:
        case ScanCall::Volumes:
            return std::format("{}/{}/{}", options.region, to_string(scope.call),
                               subnet_id(scope.vpc, scope.subnet));
        default:
            return std::format("{}/{}/{}", options.region, to_string(scope.call), vpc_id(scope.vpc));
    }
}

bool is_public(size_t subnet) { return subnet % 2 == 0; }

// ─────────────────────────────────────────────
// Per-call ingestion
// ─────────────────────────────────────────────

void ingest_vpc(ResourceGraph& graph, const MockAccountOptions& o, size_t v) {
    auto vpc = mock_arn(o, "vpc", vpc_id(v));
    auto igw = mock_arn(o, "internet-gateway", igw_id(v));
    graph.add_node(vpc, kVpcType, {
        {"State", std::string{"available"}},
        {"CidrBlock", std::format("10.{}.0.0/16", v % 256)},
        {"Region", o.region}
    });
    graph.add_node(igw, kIgwType, {{"Region", o.region}});
    graph.add_typed_edge(igw, vpc, EdgeType::AttachedTo);
}

void ingest_subnets(ResourceGraph& graph, const MockAccountOptions& o, size_t v) {
    auto vpc = mock_arn(o, "vpc", vpc_id(v));
    auto igw = mock_arn(o, "internet-gateway", igw_id(v));
    for (size_t s = 0; s < o.subnets_per_vpc; ++s) {
        auto subnet = mock_arn(o, "subnet", subnet_id(v, s));
        graph.add_node(subnet, kSubnetType, {
            {std::string{kNetworkTypeProperty}, std::string{is_public(s) ? "Public" : "Private"}},
            {"CidrBlock", std::format("10.{}.{}.0/24", v % 256, s % 256)},
            {"VpcId", vpc_id(v)}
        });
        graph.add_typed_edge(subnet, vpc, EdgeType::AttachedTo);
        graph.add_typed_edge(igw, subnet, EdgeType::FlowsTo);
    }
}

void ingest_instances(ResourceGraph& graph, const MockAccountOptions& o, size_t v, size_t s) {
    auto subnet = mock_arn(o, "subnet", subnet_id(v, s));
    auto now = std::chrono::system_clock::now();
    for (size_t i = 0; i < o.instances_per_subnet; ++i) {
        auto instance = mock_arn(o, "instance", instance_id(v, s, i));
        bool stopped = o.stopped_every > 0 && (i + 1) % o.stopped_every == 0;

        PropertyBag props = {
            {"State", std::string{stopped ? "stopped" : "running"}},
            {"InstanceType", std::string{"t3.medium"}},
            {"LaunchTime", now - std::chrono::hours{24 * (stopped ? 60 : 5)}},
            {"SubnetId", subnet_id(v, s)}
        };
        // One stopped instance per account is a documented standby.
        if (stopped && v == 0 && s == 0 && i + 1 == o.stopped_every) {
            props.emplace(std::string{kTagsProperty},
                          StringMap{{std::string{kIgnoreTag}, "justified:DisasterRecovery"}});
        }

        graph.add_node(instance, kInstanceType, std::move(props));
        graph.set_cost(instance, 30.37);
        graph.add_typed_edge(instance, subnet, EdgeType::AttachedTo);
        graph.add_typed_edge(subnet, instance, EdgeType::FlowsTo);
    }
}

void ingest_volumes(ResourceGraph& graph, const MockAccountOptions& o, size_t v, size_t s) {
    for (size_t i = 0; i < o.instances_per_subnet; ++i) {
        auto volume = mock_arn(o, "volume", root_volume_id(v, s, i));
        auto instance = mock_arn(o, "instance", instance_id(v, s, i));
        graph.add_node(volume, kVolumeType, {
            {"State", std::string{"in-use"}},
            {"Size", 20.0},
            {"AttachedInstanceId", instance_id(v, s, i)}
        });
        graph.set_cost(volume, 1.60);
        graph.add_typed_edge(volume, instance, EdgeType::AttachedTo);
    }

    auto spare = mock_arn(o, "volume", spare_volume_id(v, s));
    graph.add_node(spare, kVolumeType, {
        {"State", std::string{"available"}},
        {"Size", 100.0}
    });
    graph.set_cost(spare, 8.00);
    graph.set_source_location(spare, "terraform/storage.tf");
}

void ingest_addresses(ResourceGraph& graph, const MockAccountOptions& o, size_t v) {
    auto nat_eip = mock_arn(o, "eip", std::format("eipalloc-{:04}nat", v));
    auto free_eip = mock_arn(o, "eip", std::format("eipalloc-{:04}free", v));

    graph.add_node(nat_eip, kEipType, {
        {"PublicIp", std::format("203.0.{}.10", v % 256)},
        {"AssociationId", std::format("eipassoc-{:04}", v)}
    });
    graph.add_typed_edge(nat_eip, mock_arn(o, "natgateway", nat_id(v)), EdgeType::AttachedTo);

    graph.add_node(free_eip, kEipType, {
        {"PublicIp", std::format("203.0.{}.99", v % 256)},
        {"AssociationId", std::string{}}
    });
    graph.set_cost(free_eip, 3.60);
}

void ingest_nat_gateway(ResourceGraph& graph, const MockAccountOptions& o, size_t v) {
    auto nat = mock_arn(o, "natgateway", nat_id(v));
    graph.add_node(nat, kNatType, {
        {"State", std::string{"available"}},
        {"Region", o.region}
    });
    graph.set_cost(nat, 32.40);
    if (o.subnets_per_vpc > 0) {
        graph.add_typed_edge(nat, mock_arn(o, "subnet", subnet_id(v, 0)), EdgeType::AttachedTo);
    }
}

void ingest(ResourceGraph& graph, const MockAccountOptions& o, const ScanScope& scope) {
    switch (scope.call) {
        case ScanCall::Vpcs:        ingest_vpc(graph, o, scope.vpc); break;
        case ScanCall::Subnets:     ingest_subnets(graph, o, scope.vpc); break;
        case ScanCall::Instances:   ingest_instances(graph, o, scope.vpc, scope.subnet); break;
        case ScanCall::Volumes:     ingest_volumes(graph, o, scope.vpc, scope.subnet); break;
        case ScanCall::Addresses:   ingest_addresses(graph, o, scope.vpc); break;
        case ScanCall::NatGateways: ingest_nat_gateway(graph, o, scope.vpc); break;
    }
}

std::vector<ScanScope> initial_scopes(const MockAccountOptions& o) {
    std::vector<ScanScope> scopes;
    for (size_t v = 0; v < o.vpcs; ++v) {
        scopes.push_back({ScanCall::Vpcs, v});
        scopes.push_back({ScanCall::Subnets, v});
        scopes.push_back({ScanCall::Addresses, v});
        scopes.push_back({ScanCall::NatGateways, v});
        for (size_t s = 0; s < o.subnets_per_vpc; ++s) {
            scopes.push_back({ScanCall::Instances, v, s});
            scopes.push_back({ScanCall::Volumes, v, s});
        }
    }
    return scopes;
}

}  // namespace

std::string mock_arn(const MockAccountOptions& options, std::string_view kind, std::string_view id) {
    return std::format("arn:aws:ec2:{}:{}:{}/{}", options.region, options.account_id, kind, id);
}

size_t expected_resource_count(const MockAccountOptions& o) {
    size_t per_subnet = 1 + 2 * o.instances_per_subnet + 1;   // subnet, instances, root volumes, spare
    size_t per_vpc = 5 + o.subnets_per_vpc * per_subnet;     // vpc, igw, nat, two eips
    return o.vpcs * per_vpc;
}

MockScanner::MockScanner(ResourceGraph& graph, MockAccountOptions options, Logger& logger)
    : graph_(graph), options_(std::move(options)), logger_(logger) {}

Result<ScanSummary> MockScanner::scan(AdaptiveScheduler& scheduler, std::stop_token cancel) {
    ScanSummary summary;
    auto state = std::make_shared<RoundState>(options_);

    std::vector<ScanScope> pending = initial_scopes(options_);
    logger_.info(std::format("mock scan: {} vpc(s), {} call(s) queued", options_.vpcs, pending.size()));

    while (!pending.empty()) {
        ++summary.rounds;
        {
            std::lock_guard lock(state->mutex);
            state->outstanding = pending.size();
            state->retry.clear();
        }

        for (auto& scope : pending) {
            ++scope.attempts;
            ++summary.calls;

            ResourceGraph& graph = graph_;
            bool queued = scheduler.submit([state, scope, &graph](std::stop_token token) -> Result<void> {
                const MockAccountOptions& options = state->options;
                auto finish = [&](bool throttled) {
                    std::lock_guard lock(state->mutex);
                    if (throttled) {
                        state->retry.push_back(scope);
                        ++state->throttled;
                    }
                    if (--state->outstanding == 0) state->done.notify_all();
                };

                if (options.call_latency.count() > 0) {
                    std::this_thread::sleep_for(options.call_latency);
                }

                bool throttled = false;
                if (options.throttle_rate > 0.0) {
                    std::lock_guard lock(state->rng_mutex);
                    throttled = state->coin(state->rng) < options.throttle_rate;
                }
                if (throttled) {
                    finish(true);
                    return Error{ErrorCode::Throttled, "Rate exceeded", scope_name(options, scope)};
                }
                if (token.stop_requested()) {
                    finish(false);
                    return Error{ErrorCode::TaskFailed, "call cancelled", scope_name(options, scope)};
                }

                ingest(graph, options, scope);
                finish(false);
                return {};
            });

            if (!queued) {
                return make_error<ScanSummary>(ErrorCode::TaskFailed,
                                               "scheduler stopped before the scan was queued",
                                               scope_name(options_, scope));
            }
        }

        {
            std::unique_lock lock(state->mutex);
            while (state->outstanding > 0) {
                if (cancel.stop_requested()) {
                    return make_error<ScanSummary>(ErrorCode::Generic, "scan cancelled");
                }
                if (scheduler.stopped()) {
                    return make_error<ScanSummary>(
                        ErrorCode::TaskFailed,
                        std::format("scheduler stopped with {} call(s) outstanding", state->outstanding));
                }
                state->done.wait_for(lock, cancel, std::chrono::milliseconds{50},
                                     [&] { return state->outstanding == 0; });
            }
            pending = std::move(state->retry);
            state->retry.clear();
            summary.throttled = state->throttled;
        }

        std::vector<ScanScope> retry;
        for (const auto& scope : pending) {
            if (scope.attempts >= options_.max_attempts) {
                graph_.add_scope_error(scope_name(options_, scope),
                                       std::format("gave up after {} throttled attempt(s)", scope.attempts));
                ++summary.failed_scopes;
            } else {
                retry.push_back(scope);
            }
        }
        pending = std::move(retry);

        if (!pending.empty()) {
            logger_.debug(std::format("mock scan round {}: retrying {} throttled call(s)",
                                      summary.rounds, pending.size()));
        }
    }

    logger_.info(std::format("mock scan finished: {} call(s), {} throttled, {} failed scope(s)",
                             summary.calls, summary.throttled, summary.failed_scopes));
    return summary;
}

}  // namespace cloudslash
