/**
 * @file suppression.cpp
 * @brief Suppression tag parsing and evaluation.
 * @author Dimitris Kafetzis
 */

#include "graph/suppression.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace cloudslash {

namespace {

std::string normalize(std::string_view raw) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!raw.empty() && is_space(static_cast<unsigned char>(raw.front()))) raw.remove_prefix(1);
    while (!raw.empty() && is_space(static_cast<unsigned char>(raw.back()))) raw.remove_suffix(1);

    std::string out{raw};
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool all_digits(std::string_view text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::optional<double> parse_double(std::string_view text) {
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

std::optional<long> parse_long(std::string_view text) {
    if (!all_digits(text)) return std::nullopt;
    long value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

// Grace periods saturate at 100 years.
constexpr long kMaxGraceHours = 24L * 365 * 100;

std::optional<std::chrono::hours> parse_grace(std::string_view amount, char unit) {
    if (!all_digits(amount)) return std::nullopt;
    const long per_unit = unit == 'd' ? 24 : 1;
    auto value = parse_long(amount);
    if (!value || *value > kMaxGraceHours / per_unit) {
        return std::chrono::hours{kMaxGraceHours};
    }
    return std::chrono::hours{*value * per_unit};
}

}  // namespace

std::optional<Timestamp> parse_iso_date(std::string_view text) {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;

    auto year = parse_long(text.substr(0, 4));
    auto month = parse_long(text.substr(5, 2));
    auto day = parse_long(text.substr(8, 2));
    if (!year || !month || !day) return std::nullopt;

    std::chrono::year_month_day ymd{
        std::chrono::year{static_cast<int>(*year)},
        std::chrono::month{static_cast<unsigned>(*month)},
        std::chrono::day{static_cast<unsigned>(*day)}
    };
    if (!ymd.ok()) return std::nullopt;

    return Timestamp{std::chrono::sys_days{ymd}};
}

SuppressionRule parse_suppression(std::string_view raw) {
    const std::string value = normalize(raw);
    std::string_view view{value};
    SuppressionRule rule;

    if (view == "true") {
        rule.kind = SuppressionKind::Permanent;
        return rule;
    }

    if (view.starts_with("cost<")) {
        if (auto limit = parse_double(view.substr(5))) {
            rule.kind = SuppressionKind::CostBelow;
            rule.cost_limit = *limit;
        }
        return rule;
    }

    if (view.starts_with("justified:")) {
        rule.kind = SuppressionKind::Justified;
        rule.justification = std::string{view.substr(10)};
        return rule;
    }

    if (auto date = parse_iso_date(view)) {
        rule.kind = SuppressionKind::Until;
        rule.until = *date;
        return rule;
    }

    if (view.size() >= 2 && (view.back() == 'd' || view.back() == 'h')) {
        if (auto grace = parse_grace(view.substr(0, view.size() - 1), view.back())) {
            rule.kind = SuppressionKind::GracePeriod;
            rule.grace = *grace;
        }
    }

    return rule;
}

std::optional<Timestamp> creation_time(const Node& node) {
    for (auto key : kCreationTimeKeys) {
        if (const auto* value = find_property(node.properties, key)) {
            if (auto ts = as_timestamp(*value)) return ts;
        }
    }
    return std::nullopt;
}

SuppressionDecision evaluate_suppression(const Node& node, Timestamp now) {
    const auto* tags_value = find_property(node.properties, kTagsProperty);
    if (!tags_value) return {};

    const auto* tags = as_string_map(*tags_value);
    if (!tags) return {};

    auto tag = tags->find(std::string{kIgnoreTag});
    if (tag == tags->end()) return {};

    auto rule = parse_suppression(tag->second);
    switch (rule.kind) {
        case SuppressionKind::None:
            return {};

        case SuppressionKind::Permanent:
            return {WasteVerdict::Suppress, {}};

        case SuppressionKind::CostBelow:
            if (node.cost < rule.cost_limit) return {WasteVerdict::Suppress, {}};
            return {};

        case SuppressionKind::Justified:
            return {WasteVerdict::MarkJustified, std::move(rule.justification)};

        case SuppressionKind::Until:
            if (now < rule.until) return {WasteVerdict::Suppress, {}};
            return {};

        case SuppressionKind::GracePeriod: {
            auto created = creation_time(node);
            if (created && std::chrono::floor<std::chrono::hours>(now - *created) < rule.grace) {
                return {WasteVerdict::Suppress, {}};
            }
            return {};
        }
    }
    return {};
}

}  // namespace cloudslash
