/**
 * @file reachability.hpp
 * @brief Ingress-reachability classification ("reachable" vs "dark matter").
 * @author Dimitris Kafetzis
 *
 * A single whole-graph BFS starts at every ingress node and follows forward
 * edges that the traversal policy allows. Nodes the flood never reaches are
 * classified DarkMatter, which raises confidence that a waste finding is real.
 */

#pragma once

#include "core/config.hpp"
#include "core/types.hpp"
#include "graph/node.hpp"
#include "graph/resource_graph.hpp"

#include <memory>
#include <string>
#include <unordered_set>
#include <vector>

namespace cloudslash {

/**
 * @brief Decides where a traffic flood may start and which edges it may cross.
 *
 * This is the extension point for route-table, security-group and NACL
 * evaluation.
 */
class TraversalPolicy {
public:
    virtual ~TraversalPolicy() = default;

    [[nodiscard]] virtual bool is_ingress(const Node& node) const = 0;
    [[nodiscard]] virtual bool can_traverse(const Node& source, const Node& target,
                                            const Edge& edge) const = 0;
};

/**
 * @brief Ingress by resource type; blocks ingress gateways flowing directly
 *        into a node whose NetworkType is "Private".
 */
class DefaultTraversalPolicy : public TraversalPolicy {
public:
    DefaultTraversalPolicy();
    explicit DefaultTraversalPolicy(const ReachabilityConfig& config);

    [[nodiscard]] bool is_ingress(const Node& node) const override;
    [[nodiscard]] bool can_traverse(const Node& source, const Node& target,
                                    const Edge& edge) const override;

private:
    std::unordered_set<std::string> ingress_types_;
};

struct ReachabilityReport {
    std::vector<NodeId> reachable;
    std::vector<NodeId> dark_matter;
};

class ReachabilityAnalyzer {
public:
    ReachabilityAnalyzer();
    explicit ReachabilityAnalyzer(std::shared_ptr<const TraversalPolicy> policy);

    /**
     * @brief Classify every node and store the result on the node.
     *
     * Holds the exclusive graph lock for the whole traversal. Both lists in
     * the report are sorted by ID.
     */
    ReachabilityReport analyze(ResourceGraph& graph) const;

private:
    std::shared_ptr<const TraversalPolicy> policy_;
};

[[nodiscard]] inline bool is_dark_matter(const Node& node) noexcept {
    return node.reachability == Reachability::DarkMatter;
}

}  // namespace cloudslash
