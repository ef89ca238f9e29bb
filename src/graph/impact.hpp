/**
 * @file impact.hpp
 * @brief Blast-radius analysis for a deletion candidate.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "graph/node.hpp"
#include "graph/resource_graph.hpp"

#include <optional>
#include <vector>

namespace cloudslash {

struct ImpactReport {
    Node target;
    std::vector<Node> direct_impact;      ///< One hop of forward edges
    std::vector<Node> cascading_impact;   ///< Closure beyond the first hop, BFS order
    int total_risk_score = 0;             ///< Sum over direct and cascading nodes
    size_t active_count = 0;              ///< Affected nodes not flagged as waste

    [[nodiscard]] size_t affected_count() const noexcept {
        return direct_impact.size() + cascading_impact.size();
    }
};

/**
 * @brief Read-only report of everything downstream of a node.
 */
class ImpactAnalyzer {
public:
    explicit ImpactAnalyzer(const ResourceGraph& graph) : graph_(graph) {}

    /// std::nullopt for an unknown node ID.
    [[nodiscard]] std::optional<ImpactReport> analyze_impact(const NodeId& id) const;

    [[nodiscard]] static std::optional<ImpactReport> analyze_impact(const GraphState& state,
                                                                    const NodeId& id);

private:
    const ResourceGraph& graph_;
};

}  // namespace cloudslash
