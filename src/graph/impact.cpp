/**
 * @file impact.cpp
 * @brief ImpactAnalyzer: BFS closure over forward edges.
 * @author Dimitris Kafetzis
 */

#include "graph/impact.hpp"

#include <queue>
#include <unordered_set>

namespace cloudslash {

std::optional<ImpactReport> ImpactAnalyzer::analyze_impact(const NodeId& id) const {
    return graph_.read([&](const GraphState& state) {
        return analyze_impact(state, id);
    });
}

std::optional<ImpactReport> ImpactAnalyzer::analyze_impact(const GraphState& state, const NodeId& id) {
    const Node* target = state.find(id);
    if (!target) return std::nullopt;

    ImpactReport report;
    report.target = *target;

    std::unordered_set<NodeId> visited{id};
    std::queue<NodeId> frontier;

    auto record = [&](const Node& node, std::vector<Node>& bucket) {
        report.total_risk_score += node.risk_score;
        if (!node.is_waste) ++report.active_count;
        bucket.push_back(node);
    };

    for (const auto& edge : state.out_edges(id)) {
        if (!visited.insert(edge.peer).second) continue;
        if (const Node* node = state.find(edge.peer)) {
            record(*node, report.direct_impact);
        }
        frontier.push(edge.peer);
    }

    while (!frontier.empty()) {
        auto current = std::move(frontier.front());
        frontier.pop();

        for (const auto& edge : state.out_edges(current)) {
            if (!visited.insert(edge.peer).second) continue;
            if (const Node* node = state.find(edge.peer)) {
                record(*node, report.cascading_impact);
            }
            frontier.push(edge.peer);
        }
    }

    return report;
}

}  // namespace cloudslash
