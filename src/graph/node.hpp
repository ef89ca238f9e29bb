/**
 * @file node.hpp
 * @brief Resource node and edge value types.
 * @author Dimitris Kafetzis
 */

#pragma once

#include "core/types.hpp"
#include "graph/property_value.hpp"

#include <string>

namespace cloudslash {

/**
 * @brief A discovered cloud resource.
 *
 * `id` is unique within a graph (typically an ARN). Nodes are never removed
 * during a run; waste marking only flips flags.
 */
struct Node {
    NodeId id;
    std::string type{kUnknownType};
    PropertyBag properties;

    bool is_waste = false;
    bool justified = false;          ///< Waste, but accepted by the owner
    std::string justification;
    bool ignored = false;            ///< Hidden by the operator for this run
    int risk_score = 0;              ///< [0, 100]
    double cost = 0.0;               ///< Estimated monthly cost
    std::string source_location;     ///< e.g. the IaC file that declares it
    Reachability reachability = Reachability::Unknown;

    [[nodiscard]] bool is_placeholder() const noexcept { return type == kUnknownType; }

    /// Counted in remediation totals: waste that nobody justified or ignored.
    [[nodiscard]] bool is_actionable_waste() const noexcept {
        return is_waste && !justified && !ignored;
    }
};

/**
 * @brief One adjacency entry. In the forward list `peer` is the edge target;
 *        in the reverse list it is the edge source.
 */
struct Edge {
    NodeId peer;
    EdgeType type = EdgeType::Unknown;
    int weight = 1;

    bool operator==(const Edge&) const = default;
};

}  // namespace cloudslash
