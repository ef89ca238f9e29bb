/**
 * @file dependency_orderer.hpp
 * @brief Safe deletion ordering over a subset of the resource graph.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "graph/resource_graph.hpp"

#include <vector>

namespace cloudslash {

/**
 * @brief Orders a node subset so it can be deleted sequentially.
 *
 * A forward edge A -> B means A depends on B (instance -> subnet -> vpc).
 * The returned order lists dependents before their dependencies:
 * `[instance, subnet, vpc]`. Edges leaving the subset are ignored, and so
 * are FlowsTo edges (see is_dependency_edge).
 *
 * A cycle inside the subset yields ErrorCode::CycleDetected whose subject is
 * the node at which the cycle closed; no partial order is returned.
 */
class DependencyOrderer {
public:
    explicit DependencyOrderer(const ResourceGraph& graph) : graph_(graph) {}

    [[nodiscard]] Result<std::vector<NodeId>> topological_sort(const std::vector<NodeId>& subset) const;

    /// Same algorithm on an already-locked snapshot.
    [[nodiscard]] static Result<std::vector<NodeId>> topological_sort(const GraphState& state,
                                                                      const std::vector<NodeId>& subset);

private:
    const ResourceGraph& graph_;
};

}  // namespace cloudslash
