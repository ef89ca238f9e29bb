/**
 * @file waste_rules.cpp
 * @brief Minimal waste heuristics.
 * @author Dimitris Kafetzis
 */

#include "ingest/waste_rules.hpp"

#include "graph/property_value.hpp"

#include <vector>

namespace cloudslash {

namespace {

std::string_view string_property(const Node& node, std::string_view key) {
    const auto* value = find_property(node.properties, key);
    if (!value) return {};
    const auto* text = as_string(*value);
    return text ? std::string_view{*text} : std::string_view{};
}

}  // namespace

std::optional<WasteFinding> classify_waste(const Node& node) {
    if (node.type == "AWS::EC2::Volume" && string_property(node, "State") == "available") {
        return WasteFinding{40, "Unattached volume"};
    }
    if (node.type == "AWS::EC2::EIP") {
        const auto* value = find_property(node.properties, "AssociationId");
        const auto* association = value ? as_string(*value) : nullptr;
        if (association == nullptr || association->empty()) {
            return WasteFinding{30, "Unassociated Elastic IP"};
        }
    }
    if (node.type == "AWS::EC2::Instance" && string_property(node, "State") == "stopped") {
        return WasteFinding{60, "Stopped instance"};
    }
    return std::nullopt;
}

size_t apply_waste_rules(ResourceGraph& graph, Timestamp now) {
    std::vector<std::pair<NodeId, WasteFinding>> findings;
    for (const auto& node : graph.nodes()) {
        if (node.ignored) continue;
        if (auto finding = classify_waste(node)) {
            findings.emplace_back(node.id, std::move(*finding));
        }
    }

    size_t flagged = 0;
    for (auto& [id, finding] : findings) {
        graph.mark_waste(id, finding.score, now);
        auto node = graph.get_node(id);
        if (node && node->is_waste) {
            graph.set_property(id, std::string{kReasonProperty}, std::move(finding.reason));
            ++flagged;
        }
    }
    return flagged;
}

}  // namespace cloudslash
