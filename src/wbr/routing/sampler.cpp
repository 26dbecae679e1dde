#include "wbr/routing/sampler.hpp"
#include "wbr/config/constants.hpp"

namespace wbr::routing {

SelectionResult select_at(const RouteTable& table, double draw) noexcept {
    SelectionResult out{};
    out.draw_value = draw;
    const auto& entries = table.entries();
    if (entries.empty()) return SelectionResult{};

    double cumulative = 0.0;
    for (const auto& e : entries) {
        cumulative += e.normalized_weight;
        if (draw <= cumulative) {
            out.selected_route_index = e.route_index;
            return out;
        }
    }
    // closed-interval fallback: the upper boundary belongs to the last entry
    out.selected_route_index = entries.back().route_index;
    return out;
}

SelectionResult select(const RouteTable& table, RandomSource& rng) {
    if (table.empty()) return SelectionResult{};
    using namespace wbr::config::constants;
    return select_at(table, rng.uniform(PERCENT_MIN, PERCENT_MAX));
}

} // namespace wbr::routing
