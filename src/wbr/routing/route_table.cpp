/**
 * @file route_table.cpp
 * @brief Weight coercion and normalization for RouteTable.
 */
#include "wbr/routing/route_table.hpp"
#include "wbr/config/constants.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <string_view>
#include <system_error>

namespace wbr::routing {

namespace {
using namespace wbr::config::constants;

std::string_view trim(std::string_view s) noexcept {
    constexpr std::string_view ws = " \t\r\n\f\v";
    const auto b = s.find_first_not_of(ws);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::optional<double> parse_number(std::string_view text) noexcept {
    auto s = trim(text);
    if (!s.empty() && s.front() == '+') {
        s.remove_prefix(1);
        if (!s.empty() && s.front() == '-') return std::nullopt; // "+-5"
    }
    if (s.empty()) return std::nullopt;

    double v = 0.0;
    const auto* first = s.data();
    const auto* last  = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, v);
    if (ec != std::errc{} || ptr != last) return std::nullopt; // trailing junk
    return v;
}
} // namespace

std::optional<double> coerce_weight(const RawWeight& w) noexcept {
    std::optional<double> v;
    if (std::holds_alternative<std::monostate>(w)) {
        v = 0.0; // missing percentage counts as 0%
    } else if (const auto* d = std::get_if<double>(&w)) {
        v = *d;
    } else {
        v = parse_number(std::get<std::string>(w));
    }
    if (!v || !std::isfinite(*v)) return std::nullopt;
    return v;
}

RouteTable RouteTable::build(std::span<const Route> routes, bool has_else) {
    RouteTable t;
    t.has_else_ = has_else;
    t.entries_.reserve(routes.size());

    // 1) filter non-coercible, clamp the rest
    double total = 0.0;
    for (std::size_t i = 0; i < routes.size(); ++i) {
        const auto v = coerce_weight(routes[i].weight);
        if (!v) continue;
        const double clamped = std::clamp(*v, PERCENT_MIN, PERCENT_MAX);
        total += clamped;
        t.entries_.push_back(TableEntry{i, clamped});
    }
    if (t.entries_.empty()) return t;

    // 2) all zero: no preference expressed -> equal shares
    if (total == 0.0) {
        const double share = PERCENT_MAX / static_cast<double>(t.entries_.size());
        for (auto& e : t.entries_) e.normalized_weight = share;
        return t;
    }

    // 3) rescale to PERCENT_MAX, order untouched
    for (auto& e : t.entries_) {
        e.normalized_weight = e.normalized_weight / total * PERCENT_MAX;
    }
    return t;
}

double RouteTable::total() const noexcept {
    double sum = 0.0;
    for (const auto& e : entries_) sum += e.normalized_weight;
    return sum;
}

} // namespace wbr::routing
