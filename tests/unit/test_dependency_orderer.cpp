/**
 * @file test_dependency_orderer.cpp
 * @brief Unit tests for safe deletion ordering.
 */

#include "graph/dependency_orderer.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <format>
#include <unordered_map>

using namespace cloudslash;

// ─── Helper ──────────────────────────────────

namespace {

/// Asserts every in-subset edge source appears before its target.
void expect_dependents_first(const ResourceGraph& graph, const std::vector<NodeId>& order) {
    std::unordered_map<NodeId, size_t> position;
    for (size_t i = 0; i < order.size(); ++i) position[order[i]] = i;

    graph.read([&](const GraphState& state) {
        for (const auto& [source, edges] : state.edges) {
            if (!position.contains(source)) continue;
            for (const auto& edge : edges) {
                if (!position.contains(edge.peer)) continue;
                EXPECT_LT(position[source], position[edge.peer])
                    << source << " must be deleted before " << edge.peer;
            }
        }
    });
}

}  // namespace

TEST(DependencyOrdererTest, InstanceSubnetVpcDeletesDependentsFirst) {
    ResourceGraph graph;
    graph.add_node("vpc", "AWS::EC2::VPC");
    graph.add_node("subnet", "AWS::EC2::Subnet");
    graph.add_node("instance", "AWS::EC2::Instance");
    graph.add_typed_edge("instance", "subnet", EdgeType::AttachedTo);
    graph.add_typed_edge("subnet", "vpc", EdgeType::AttachedTo);

    DependencyOrderer orderer(graph);
    auto order = orderer.topological_sort({"vpc", "subnet", "instance"});

    ASSERT_TRUE(order.has_value()) << order.error().message;
    EXPECT_EQ(*order, (std::vector<NodeId>{"instance", "subnet", "vpc"}));
}

TEST(DependencyOrdererTest, CycleIsAnErrorNotAPartialOrder) {
    ResourceGraph graph;
    graph.add_edge("A", "B");
    graph.add_edge("B", "A");

    DependencyOrderer orderer(graph);
    auto order = orderer.topological_sort({"A", "B"});

    ASSERT_FALSE(order.has_value());
    EXPECT_EQ(order.error().code, ErrorCode::CycleDetected);
    EXPECT_EQ(order.error().subject, "A");
    EXPECT_EQ(order.error().message, "cycle detected involving A");
}

TEST(DependencyOrdererTest, SelfLoopIsACycle) {
    ResourceGraph graph;
    graph.add_edge("sg-1", "sg-1");
    auto order = DependencyOrderer(graph).topological_sort({"sg-1"});
    ASSERT_FALSE(order);
    EXPECT_EQ(order.error().subject, "sg-1");
}

TEST(DependencyOrdererTest, EdgesLeavingTheSubsetAreIgnored) {
    ResourceGraph graph;
    // A cycle outside the subset must not matter.
    graph.add_edge("vol", "i-1");
    graph.add_edge("i-1", "subnet");
    graph.add_edge("subnet", "i-1");
    graph.add_edge("eip", "nat");

    auto order = DependencyOrderer(graph).topological_sort({"eip", "vol"});
    ASSERT_TRUE(order.has_value()) << order.error().message;
    EXPECT_EQ(order->size(), 2u);
}

TEST(DependencyOrdererTest, TrafficEdgesAreNotDependencies) {
    ResourceGraph graph;
    graph.add_typed_edge("i-1", "subnet", EdgeType::AttachedTo);
    graph.add_typed_edge("subnet", "i-1", EdgeType::FlowsTo);
    graph.add_typed_edge("subnet", "vpc", EdgeType::AttachedTo);

    auto order = DependencyOrderer(graph).topological_sort({"subnet", "vpc", "i-1"});
    ASSERT_TRUE(order.has_value()) << order.error().message;
    EXPECT_EQ(*order, (std::vector<NodeId>{"i-1", "subnet", "vpc"}));
}

TEST(DependencyOrdererTest, EmptySubset) {
    ResourceGraph graph;
    graph.add_edge("a", "b");
    auto order = DependencyOrderer(graph).topological_sort({});
    ASSERT_TRUE(order.has_value());
    EXPECT_TRUE(order->empty());
}

TEST(DependencyOrdererTest, DuplicatesAndUnknownIdsAppearOnce) {
    ResourceGraph graph;
    graph.add_edge("i-1", "subnet");

    auto order = DependencyOrderer(graph).topological_sort({"subnet", "ghost", "i-1", "subnet"});
    ASSERT_TRUE(order.has_value());
    ASSERT_EQ(order->size(), 3u);
    EXPECT_NE(std::find(order->begin(), order->end(), "ghost"), order->end());
    expect_dependents_first(graph, *order);
}

TEST(DependencyOrdererTest, DiamondRespectsAllEdges) {
    ResourceGraph graph;
    graph.add_edge("eni", "i-1");
    graph.add_edge("eni", "sg");
    graph.add_edge("i-1", "subnet");
    graph.add_edge("sg", "vpc");
    graph.add_edge("subnet", "vpc");

    std::vector<NodeId> subset{"vpc", "sg", "subnet", "i-1", "eni"};
    auto order = DependencyOrderer(graph).topological_sort(subset);
    ASSERT_TRUE(order.has_value());
    EXPECT_EQ(order->size(), subset.size());
    EXPECT_EQ(order->front(), "eni");
    EXPECT_EQ(order->back(), "vpc");
    expect_dependents_first(graph, *order);
}

TEST(DependencyOrdererTest, LongChainDoesNotOverflowTheStack) {
    ResourceGraph graph;
    constexpr size_t kLength = 50'000;
    std::vector<NodeId> subset;
    subset.reserve(kLength);
    for (size_t i = 0; i < kLength; ++i) {
        subset.push_back(std::format("n{}", i));
        if (i > 0) graph.add_edge(subset[i - 1], subset[i]);
    }

    std::reverse(subset.begin(), subset.end());
    auto order = DependencyOrderer(graph).topological_sort(subset);
    ASSERT_TRUE(order.has_value());
    ASSERT_EQ(order->size(), kLength);
    EXPECT_EQ(order->front(), "n0");
    EXPECT_EQ(order->back(), std::format("n{}", kLength - 1));
}

TEST(DependencyOrdererTest, LongCycleIsDetected) {
    ResourceGraph graph;
    constexpr size_t kLength = 10'000;
    std::vector<NodeId> subset;
    for (size_t i = 0; i < kLength; ++i) {
        subset.push_back(std::format("n{}", i));
        graph.add_edge(std::format("n{}", i), std::format("n{}", (i + 1) % kLength));
    }

    auto order = DependencyOrderer(graph).topological_sort(subset);
    ASSERT_FALSE(order.has_value());
    EXPECT_EQ(order.error().code, ErrorCode::CycleDetected);
}
