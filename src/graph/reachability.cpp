/**
 * @file reachability.cpp
 * @brief Policy-gated BFS flood from ingress points.
 * @author Dimitris Kafetzis
 */

#include "graph/reachability.hpp"

#include <algorithm>
#include <queue>

namespace cloudslash {

namespace {

constexpr std::string_view kInternetGatewayType = "AWS::EC2::InternetGateway";

}  // namespace

// ─────────────────────────────────────────────
// DefaultTraversalPolicy
// ─────────────────────────────────────────────

DefaultTraversalPolicy::DefaultTraversalPolicy()
    : DefaultTraversalPolicy(ReachabilityConfig{}) {}

DefaultTraversalPolicy::DefaultTraversalPolicy(const ReachabilityConfig& config)
    : ingress_types_(config.ingress_types.begin(), config.ingress_types.end()) {}

bool DefaultTraversalPolicy::is_ingress(const Node& node) const {
    return ingress_types_.contains(node.type);
}

bool DefaultTraversalPolicy::can_traverse(const Node& source, const Node& target,
                                          const Edge& /*edge*/) const {
    // Air gap: an internet gateway never reaches a private node in one hop.
    // Multi-hop paths are allowed until route and security-group rules are
    // evaluated here.
    const auto* network_type = find_property(target.properties, kNetworkTypeProperty);
    if (!network_type) return true;

    const auto* value = as_string(*network_type);
    if (value && *value == "Private" && source.type == kInternetGatewayType) {
        return false;
    }
    return true;
}

// ─────────────────────────────────────────────
// ReachabilityAnalyzer
// ─────────────────────────────────────────────

ReachabilityAnalyzer::ReachabilityAnalyzer()
    : policy_(std::make_shared<DefaultTraversalPolicy>()) {}

ReachabilityAnalyzer::ReachabilityAnalyzer(std::shared_ptr<const TraversalPolicy> policy)
    : policy_(std::move(policy)) {}

ReachabilityReport ReachabilityAnalyzer::analyze(ResourceGraph& graph) const {
    return graph.write([this](GraphState& state) {
        std::queue<Node*> frontier;

        // 1. Seed: every node starts dark; ingress points are reachable.
        for (auto& [id, node] : state.nodes) {
            node.reachability = Reachability::DarkMatter;
            if (policy_->is_ingress(node)) {
                node.reachability = Reachability::Reachable;
                frontier.push(&node);
            }
        }

        // 2. Flood along forward edges that the policy allows.
        while (!frontier.empty()) {
            Node* current = frontier.front();
            frontier.pop();

            for (const auto& edge : state.out_edges(current->id)) {
                Node* target = state.find(edge.peer);
                if (!target || target->reachability == Reachability::Reachable) continue;

                if (policy_->can_traverse(*current, *target, edge)) {
                    target->reachability = Reachability::Reachable;
                    frontier.push(target);
                }
            }
        }

        // 3. Sweep: whatever was not flooded stays dark.
        ReachabilityReport report;
        for (const auto& [id, node] : state.nodes) {
            if (node.reachability == Reachability::Reachable) {
                report.reachable.push_back(id);
            } else {
                report.dark_matter.push_back(id);
            }
        }
        std::sort(report.reachable.begin(), report.reachable.end());
        std::sort(report.dark_matter.begin(), report.dark_matter.end());
        return report;
    });
}

}  // namespace cloudslash
