/**
 * @file resource_graph.cpp
 * @brief ResourceGraph implementation: upserts, waste marking and queries.
 * @author Dimitris Kafetzis
 */

#include "graph/resource_graph.hpp"
#include "graph/suppression.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <queue>
#include <unordered_set>

namespace cloudslash {

namespace {

const std::vector<Edge> kNoEdges;

}  // namespace

// ─────────────────────────────────────────────
// GraphState
// ─────────────────────────────────────────────

const Node* GraphState::find(const NodeId& id) const {
    auto it = nodes.find(id);
    return it == nodes.end() ? nullptr : &it->second;
}

Node* GraphState::find(const NodeId& id) {
    auto it = nodes.find(id);
    return it == nodes.end() ? nullptr : &it->second;
}

const std::vector<Edge>& GraphState::out_edges(const NodeId& id) const {
    auto it = edges.find(id);
    return it == edges.end() ? kNoEdges : it->second;
}

const std::vector<Edge>& GraphState::in_edges(const NodeId& id) const {
    auto it = reverse_edges.find(id);
    return it == reverse_edges.end() ? kNoEdges : it->second;
}

// ─────────────────────────────────────────────
// Ingestion
// ─────────────────────────────────────────────

Node& ResourceGraph::ensure_node(GraphState& state, const NodeId& id) {
    auto [it, inserted] = state.nodes.try_emplace(id);
    if (inserted) {
        it->second.id = id;
    }
    return it->second;
}

void ResourceGraph::add_node(const NodeId& id, std::string_view type, PropertyBag properties) {
    if (id.empty()) return;

    std::unique_lock lock(mutex_);
    auto it = state_.nodes.find(id);
    if (it == state_.nodes.end()) {
        Node node;
        node.id = id;
        node.type = std::string{type};
        node.properties = std::move(properties);
        state_.nodes.emplace(id, std::move(node));
        return;
    }

    auto& node = it->second;
    for (auto& [key, value] : properties) {
        node.properties.insert_or_assign(key, std::move(value));
    }
    if (node.is_placeholder() && type != kUnknownType) {
        node.type = std::string{type};
    }
}

void ResourceGraph::add_edge(const NodeId& source, const NodeId& target) {
    add_typed_edge(source, target, EdgeType::Unknown, 1);
}

void ResourceGraph::add_typed_edge(const NodeId& source, const NodeId& target,
                                   EdgeType type, int weight) {
    if (source.empty() || target.empty()) return;

    std::unique_lock lock(mutex_);
    ensure_node(state_, source);
    ensure_node(state_, target);

    auto& forward = state_.edges[source];
    auto duplicate = std::any_of(forward.begin(), forward.end(), [&](const Edge& e) {
        return e.peer == target && e.type == type;
    });
    if (duplicate) return;

    forward.push_back(Edge{target, type, weight});
    state_.reverse_edges[target].push_back(Edge{source, type, weight});
}

// ─────────────────────────────────────────────
// Annotation
// ─────────────────────────────────────────────

void ResourceGraph::mark_waste(const NodeId& id, int score) {
    mark_waste(id, score, std::chrono::system_clock::now());
}

void ResourceGraph::mark_waste(const NodeId& id, int score, Timestamp now) {
    std::unique_lock lock(mutex_);
    auto* node = state_.find(id);
    if (!node) return;

    auto decision = evaluate_suppression(*node, now);
    switch (decision.verdict) {
        case WasteVerdict::Suppress:
            return;
        case WasteVerdict::MarkJustified:
            node->justified = true;
            node->justification = std::move(decision.justification);
            break;
        case WasteVerdict::Mark:
            break;
    }
    node->is_waste = true;
    node->risk_score = std::clamp(score, 0, 100);
}

bool ResourceGraph::set_ignored(const NodeId& id, bool ignored) {
    std::unique_lock lock(mutex_);
    auto* node = state_.find(id);
    if (!node) return false;
    node->ignored = ignored;
    return true;
}

bool ResourceGraph::set_cost(const NodeId& id, double monthly_cost) {
    std::unique_lock lock(mutex_);
    auto* node = state_.find(id);
    if (!node) return false;
    node->cost = monthly_cost;
    return true;
}

bool ResourceGraph::set_source_location(const NodeId& id, std::string location) {
    std::unique_lock lock(mutex_);
    auto* node = state_.find(id);
    if (!node) return false;
    node->source_location = std::move(location);
    return true;
}

bool ResourceGraph::set_property(const NodeId& id, const std::string& key, PropertyValue value) {
    std::unique_lock lock(mutex_);
    auto* node = state_.find(id);
    if (!node) return false;
    node->properties.insert_or_assign(key, std::move(value));
    return true;
}

void ResourceGraph::add_scope_error(std::string scope, std::string message) {
    std::unique_lock lock(mutex_);
    scope_errors_.push_back(ScopeError{std::move(scope), std::move(message)});
}

std::vector<ScopeError> ResourceGraph::scope_errors() const {
    std::shared_lock lock(mutex_);
    return scope_errors_;
}

bool ResourceGraph::is_partial() const {
    std::shared_lock lock(mutex_);
    return !scope_errors_.empty();
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

std::vector<NodeId> ResourceGraph::get_upstream(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    std::vector<NodeId> upstream;
    for (const auto& edge : state_.in_edges(id)) {
        upstream.push_back(edge.peer);
    }
    return upstream;
}

std::vector<NodeId> ResourceGraph::get_downstream(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    std::vector<NodeId> downstream;
    for (const auto& edge : state_.out_edges(id)) {
        downstream.push_back(edge.peer);
    }
    return downstream;
}

std::optional<Node> ResourceGraph::get_node(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    if (const auto* node = state_.find(id)) return *node;
    return std::nullopt;
}

bool ResourceGraph::contains(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    return state_.nodes.contains(id);
}

std::vector<Edge> ResourceGraph::out_edges(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    return state_.out_edges(id);
}

std::vector<Edge> ResourceGraph::in_edges(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    return state_.in_edges(id);
}

std::vector<NodeId> ResourceGraph::connected_component(const NodeId& id) const {
    std::shared_lock lock(mutex_);
    if (!state_.nodes.contains(id)) return {};

    std::vector<NodeId> component;
    std::unordered_set<NodeId> visited{id};
    std::queue<NodeId> frontier;
    frontier.push(id);

    while (!frontier.empty()) {
        auto current = std::move(frontier.front());
        frontier.pop();
        component.push_back(current);

        auto enqueue = [&](const std::vector<Edge>& adjacent) {
            for (const auto& edge : adjacent) {
                if (visited.insert(edge.peer).second) {
                    frontier.push(edge.peer);
                }
            }
        };
        enqueue(state_.out_edges(current));
        enqueue(state_.in_edges(current));
    }

    return component;
}

std::vector<Node> ResourceGraph::nodes() const {
    std::shared_lock lock(mutex_);
    std::vector<Node> out;
    out.reserve(state_.nodes.size());
    for (const auto& [id, node] : state_.nodes) {
        out.push_back(node);
    }
    return out;
}

std::vector<Node> ResourceGraph::waste_nodes() const {
    std::shared_lock lock(mutex_);
    std::vector<Node> out;
    for (const auto& [id, node] : state_.nodes) {
        if (node.is_waste) out.push_back(node);
    }
    std::sort(out.begin(), out.end(), [](const Node& a, const Node& b) { return a.id < b.id; });
    return out;
}

size_t ResourceGraph::node_count() const {
    std::shared_lock lock(mutex_);
    return state_.nodes.size();
}

size_t ResourceGraph::edge_count() const {
    std::shared_lock lock(mutex_);
    size_t total = 0;
    for (const auto& [id, adjacent] : state_.edges) {
        total += adjacent.size();
    }
    return total;
}

GraphStats ResourceGraph::stats() const {
    std::shared_lock lock(mutex_);
    GraphStats stats;
    stats.node_count = state_.nodes.size();
    for (const auto& [id, adjacent] : state_.edges) {
        stats.edge_count += adjacent.size();
    }
    for (const auto& [id, node] : state_.nodes) {
        if (!node.is_waste) continue;
        ++stats.waste_count;
        if (node.justified) ++stats.justified_count;
        if (node.ignored) ++stats.ignored_count;
        if (node.is_actionable_waste()) stats.actionable_monthly_cost += node.cost;
    }
    return stats;
}

std::string ResourceGraph::dump_stats() const {
    auto s = stats();
    return std::format("Nodes: {} | Edges: {} | Waste: {} ({} justified, {} ignored) | Actionable: ${:.2f}/mo",
                       s.node_count, s.edge_count, s.waste_count, s.justified_count, s.ignored_count,
                       s.actionable_monthly_cost);
}

}  // namespace cloudslash
