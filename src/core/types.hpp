/**
 * @file types.hpp
 * @brief Fundamental types used throughout CloudSlash.
 * @author Dimitris Kafetzis
 *
 * Defines NodeId, EdgeType, Reachability and the clock vocabulary shared by
 * the scheduler and the resource graph. All types have value semantics.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace cloudslash {

// ─────────────────────────────────────────────
// Identity & Time
// ─────────────────────────────────────────────

using NodeId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Duration = std::chrono::microseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

/// Type tag given to nodes created implicitly by an edge insertion.
inline constexpr std::string_view kUnknownType = "Unknown";

// ─────────────────────────────────────────────
// Edge Types
// ─────────────────────────────────────────────

/**
 * @brief Relationship kinds between two resources.
 *
 * A forward edge points from the dependent resource to the resource it
 * depends on (an instance is AttachedTo its subnet).
 */
enum class EdgeType : uint8_t {
    AttachedTo,
    SecuredBy,
    Contains,
    FlowsTo,
    Unknown
};

[[nodiscard]] constexpr std::string_view to_string(EdgeType type) noexcept {
    switch (type) {
        case EdgeType::AttachedTo: return "AttachedTo";
        case EdgeType::SecuredBy:  return "SecuredBy";
        case EdgeType::Contains:   return "Contains";
        case EdgeType::FlowsTo:    return "FlowsTo";
        case EdgeType::Unknown:    return "Unknown";
    }
    return "Unknown";
}

/// FlowsTo records network traffic, not a lifetime dependency.
[[nodiscard]] constexpr bool is_dependency_edge(EdgeType type) noexcept {
    return type != EdgeType::FlowsTo;
}

// ─────────────────────────────────────────────
// Reachability
// ─────────────────────────────────────────────

enum class Reachability : uint8_t {
    Unknown,       ///< Analysis has not run yet
    Reachable,     ///< A traffic path exists from an ingress point
    DarkMatter     ///< No discoverable path from any ingress point
};

[[nodiscard]] constexpr std::string_view to_string(Reachability state) noexcept {
    switch (state) {
        case Reachability::Unknown:    return "unknown";
        case Reachability::Reachable:  return "reachable";
        case Reachability::DarkMatter: return "dark_matter";
    }
    return "unknown";
}

}  // namespace cloudslash
