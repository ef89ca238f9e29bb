/**
 * @file property_value.cpp
 * @brief PropertyValue accessors and rendering.
 * @author Dimitris Kafetzis
 */

#include "graph/property_value.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>
#include <type_traits>

namespace cloudslash {

const std::string* as_string(const PropertyValue& value) noexcept {
    return std::get_if<std::string>(&value);
}

std::optional<double> as_number(const PropertyValue& value) noexcept {
    if (auto* v = std::get_if<double>(&value)) return *v;
    return std::nullopt;
}

std::optional<bool> as_bool(const PropertyValue& value) noexcept {
    if (auto* v = std::get_if<bool>(&value)) return *v;
    return std::nullopt;
}

std::optional<Timestamp> as_timestamp(const PropertyValue& value) noexcept {
    if (auto* v = std::get_if<Timestamp>(&value)) return *v;
    return std::nullopt;
}

const StringList* as_string_list(const PropertyValue& value) noexcept {
    return std::get_if<StringList>(&value);
}

const StringMap* as_string_map(const PropertyValue& value) noexcept {
    return std::get_if<StringMap>(&value);
}

const PropertyValue* find_property(const PropertyBag& bag, std::string_view key) {
    auto it = bag.find(std::string{key});
    if (it == bag.end()) return nullptr;
    return &it->second;
}

std::string format_timestamp(Timestamp ts) {
    auto time_t_val = std::chrono::system_clock::to_time_t(ts);
    std::tm utc{};
    gmtime_r(&time_t_val, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%FT%TZ");
    return oss.str();
}

std::string to_string(const PropertyValue& value) {
    return std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return v;
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, Timestamp>) {
            return format_timestamp(v);
        } else if constexpr (std::is_same_v<T, StringList>) {
            std::string out = "[";
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) out += ",";
                out += v[i];
            }
            return out + "]";
        } else {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) out += ",";
                out += key + "=" + val;
                first = false;
            }
            return out + "}";
        }
    }, value);
}

}  // namespace cloudslash
