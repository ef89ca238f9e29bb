/**
 * @file property_value.hpp
 * @brief Tagged-union property values for the open resource property bag.
 * @author Dimitris Kafetzis
 *
 * Scanners attach arbitrary metadata to resources (tags, launch times,
 * network classification). PropertyValue keeps that bag open-schema while
 * staying type-safe: every value is one of a small closed set of kinds.
 */

#pragma once

#include "core/types.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace cloudslash {

using StringList = std::vector<std::string>;
using StringMap = std::map<std::string, std::string>;

using PropertyValue = std::variant<std::string, double, bool, Timestamp, StringList, StringMap>;
using PropertyBag = std::unordered_map<std::string, PropertyValue>;

// Well-known property keys shared with scanners and heuristics.
inline constexpr std::string_view kTagsProperty = "Tags";
inline constexpr std::string_view kReasonProperty = "Reason";
inline constexpr std::string_view kNetworkTypeProperty = "NetworkType";
inline constexpr std::string_view kIgnoreTag = "cloudslash:ignore";

// ── Typed accessors (nullptr when absent or of another kind) ──

[[nodiscard]] const std::string* as_string(const PropertyValue& value) noexcept;
[[nodiscard]] std::optional<double> as_number(const PropertyValue& value) noexcept;
[[nodiscard]] std::optional<bool> as_bool(const PropertyValue& value) noexcept;
[[nodiscard]] std::optional<Timestamp> as_timestamp(const PropertyValue& value) noexcept;
[[nodiscard]] const StringList* as_string_list(const PropertyValue& value) noexcept;
[[nodiscard]] const StringMap* as_string_map(const PropertyValue& value) noexcept;

/// Look up a key and return the value if present.
[[nodiscard]] const PropertyValue* find_property(const PropertyBag& bag, std::string_view key);

/// Render a value for reports and log lines (timestamps as ISO 8601 UTC).
[[nodiscard]] std::string to_string(const PropertyValue& value);

/// Format a timestamp as `YYYY-MM-DDTHH:MM:SSZ`.
[[nodiscard]] std::string format_timestamp(Timestamp ts);

}  // namespace cloudslash
