/**
 * @file resource_graph.hpp
 * @brief Thread-safe dependency graph of discovered cloud resources.
 * @author Dimitris Kafetzis
 *
 * Scheduler workers upsert nodes and edges concurrently while scanning;
 * heuristics later mark waste and the analyzers traverse the graph. One
 * reader/writer lock guards nodes, forward and reverse adjacency together so
 * every mutation is a single transaction and every traversal sees a
 * consistent snapshot.
 */

#pragma once

#include "core/types.hpp"
#include "graph/node.hpp"
#include "graph/property_value.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cloudslash {

using NodeMap = std::unordered_map<NodeId, Node>;
using AdjacencyMap = std::unordered_map<NodeId, std::vector<Edge>>;

/**
 * @brief The data guarded by the graph lock.
 */
struct GraphState {
    NodeMap nodes;
    AdjacencyMap edges;           ///< source -> [target]
    AdjacencyMap reverse_edges;   ///< target -> [source]

    [[nodiscard]] const Node* find(const NodeId& id) const;
    [[nodiscard]] Node* find(const NodeId& id);
    [[nodiscard]] const std::vector<Edge>& out_edges(const NodeId& id) const;
    [[nodiscard]] const std::vector<Edge>& in_edges(const NodeId& id) const;
};

/// A discovery failure recorded against the scope (region, service) it hit.
struct ScopeError {
    std::string scope;
    std::string message;
};

struct GraphStats {
    size_t node_count = 0;
    size_t edge_count = 0;
    size_t waste_count = 0;
    size_t justified_count = 0;
    size_t ignored_count = 0;
    double actionable_monthly_cost = 0.0;
};

class ResourceGraph {
public:
    ResourceGraph() = default;

    ResourceGraph(const ResourceGraph&) = delete;
    ResourceGraph& operator=(const ResourceGraph&) = delete;

    // ── Ingestion ─────────────────────────────

    /**
     * @brief Insert or merge a node.
     *
     * Existing nodes receive the incoming properties (last writer wins per
     * key) and are promoted from the Unknown placeholder type when a
     * concrete type arrives. Empty IDs are ignored.
     */
    void add_node(const NodeId& id, std::string_view type, PropertyBag properties = {});

    /// Equivalent to add_typed_edge(source, target, EdgeType::Unknown, 1).
    void add_edge(const NodeId& source, const NodeId& target);

    /**
     * @brief Insert a de-duplicated (source, target, type) edge.
     *
     * Endpoints that have not been seen yet are created as Unknown
     * placeholders so edges may arrive before their resources' own scans.
     */
    void add_typed_edge(const NodeId& source, const NodeId& target, EdgeType type, int weight = 1);

    // ── Annotation ────────────────────────────

    /**
     * @brief Flag a node as waste unless its `cloudslash:ignore` tag suppresses it.
     */
    void mark_waste(const NodeId& id, int score);
    void mark_waste(const NodeId& id, int score, Timestamp now);

    /// Exclude a node from waste rules, totals and remediation.
    bool set_ignored(const NodeId& id, bool ignored = true);

    bool set_cost(const NodeId& id, double monthly_cost);
    bool set_source_location(const NodeId& id, std::string location);
    bool set_property(const NodeId& id, const std::string& key, PropertyValue value);

    void add_scope_error(std::string scope, std::string message);
    [[nodiscard]] std::vector<ScopeError> scope_errors() const;
    [[nodiscard]] bool is_partial() const;

    // ── Queries ───────────────────────────────

    [[nodiscard]] std::vector<NodeId> get_upstream(const NodeId& id) const;
    [[nodiscard]] std::vector<NodeId> get_downstream(const NodeId& id) const;
    [[nodiscard]] std::optional<Node> get_node(const NodeId& id) const;
    [[nodiscard]] bool contains(const NodeId& id) const;
    [[nodiscard]] std::vector<Edge> out_edges(const NodeId& id) const;
    [[nodiscard]] std::vector<Edge> in_edges(const NodeId& id) const;

    /// Every node reachable from `id` ignoring edge direction, `id` included.
    [[nodiscard]] std::vector<NodeId> connected_component(const NodeId& id) const;

    [[nodiscard]] std::vector<Node> nodes() const;
    [[nodiscard]] std::vector<Node> waste_nodes() const;
    [[nodiscard]] size_t node_count() const;
    [[nodiscard]] size_t edge_count() const;
    [[nodiscard]] GraphStats stats() const;
    [[nodiscard]] std::string dump_stats() const;

    // ── Snapshot access for analysis routines ──

    /// Run `fn(const GraphState&)` with the shared lock held throughout.
    template <typename F>
    decltype(auto) read(F&& fn) const {
        std::shared_lock lock(mutex_);
        return fn(static_cast<const GraphState&>(state_));
    }

    /// Run `fn(GraphState&)` with the exclusive lock held throughout.
    template <typename F>
    decltype(auto) write(F&& fn) {
        std::unique_lock lock(mutex_);
        return fn(state_);
    }

private:
    static Node& ensure_node(GraphState& state, const NodeId& id);

    mutable std::shared_mutex mutex_;
    GraphState state_;
    std::vector<ScopeError> scope_errors_;
};

}  // namespace cloudslash
