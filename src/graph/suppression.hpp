/**
 * @file suppression.hpp
 * @brief The `cloudslash:ignore` tag language used to suppress waste findings.
 * @author Dimitris Kafetzis
 *
 * Owners opt resources out of waste reports by tagging them. The tag value is
 * trimmed and lower-cased, then matched against these forms:
 *
 *   true                permanently suppressed
 *   cost<N              suppressed while the node's monthly cost is below N
 *   justified:<text>    reported as waste but marked justified
 *   YYYY-MM-DD          suppressed until that UTC date
 *   <N>d | <N>h         suppressed for a grace period after creation
 *
 * Anything else is not a suppression and the node is marked normally.
 */

#pragma once

#include "core/types.hpp"
#include "graph/node.hpp"

#include <array>
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace cloudslash {

/// Properties consulted, in order, for a resource's creation time.
inline constexpr std::array<std::string_view, 4> kCreationTimeKeys = {
    "LaunchTime", "CreateTime", "StartTime", "Created"
};

enum class SuppressionKind : uint8_t {
    None,
    Permanent,
    CostBelow,
    Justified,
    Until,
    GracePeriod
};

struct SuppressionRule {
    SuppressionKind kind = SuppressionKind::None;
    double cost_limit = 0.0;
    std::string justification;
    Timestamp until{};
    std::chrono::hours grace{0};
};

enum class WasteVerdict : uint8_t {
    Mark,             ///< Flag as waste
    MarkJustified,    ///< Flag as waste, excluded from actionable totals
    Suppress          ///< Leave the node untouched
};

struct SuppressionDecision {
    WasteVerdict verdict = WasteVerdict::Mark;
    std::string justification;
};

/**
 * @brief Parse a raw tag value into a rule. Unrecognized values yield
 *        SuppressionKind::None.
 */
[[nodiscard]] SuppressionRule parse_suppression(std::string_view raw);

/**
 * @brief Parse a strict `YYYY-MM-DD` date as midnight UTC.
 */
[[nodiscard]] std::optional<Timestamp> parse_iso_date(std::string_view text);

/**
 * @brief Creation time from the first creation-time property holding a timestamp.
 */
[[nodiscard]] std::optional<Timestamp> creation_time(const Node& node);

/**
 * @brief Decide what MarkWaste should do with `node` at time `now`.
 */
[[nodiscard]] SuppressionDecision evaluate_suppression(const Node& node, Timestamp now);

}  // namespace cloudslash
