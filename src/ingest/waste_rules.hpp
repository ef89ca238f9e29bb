/**
 * @file waste_rules.hpp
 * @brief Minimal waste heuristics over the ingested graph.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "graph/node.hpp"
#include "graph/resource_graph.hpp"

#include <optional>
#include <string>

namespace cloudslash {

struct WasteFinding {
    int score = 0;
    std::string reason;
};

/**
 * @brief Classify one node: unattached volumes, unassociated Elastic IPs
 *        and stopped instances are waste.
 */
[[nodiscard]] std::optional<WasteFinding> classify_waste(const Node& node);

/**
 * @brief Run classify_waste over a snapshot and mark every finding.
 *
 * Suppression tags are honoured by ResourceGraph::mark_waste; ignored
 * nodes are skipped.
 * @return number of nodes flagged as waste (justified ones included).
 */
size_t apply_waste_rules(ResourceGraph& graph, Timestamp now);

}  // namespace cloudslash
