#pragma once
/**
 * @file sampler.hpp
 * @brief Cumulative-interval selection over a RouteTable.
 */
#include <cstddef>
#include <optional>

#include "wbr/routing/random_source.hpp"
#include "wbr/routing/route_table.hpp"

namespace wbr::routing {

/// Outcome of one draw.
struct SelectionResult final {
    std::optional<std::size_t> selected_route_index; ///< Empty only when the table is empty
    double draw_value{0.0};                          ///< Raw sample in [0,100); 0 if no draw

    bool operator==(const SelectionResult&) const = default;
};

/**
 * @brief Map a draw value onto the table's cumulative intervals.
 * @details First entry with `draw <= cumulative` wins (input order breaks ties).
 *          Falls back to the last entry when drift leaves the draw unmatched.
 */
SelectionResult select_at(const RouteTable& table, double draw) noexcept;

/**
 * @brief Draw once from `rng` and select a route.
 * @note `rng` is not consulted when the table is empty.
 */
SelectionResult select(const RouteTable& table, RandomSource& rng);

} // namespace wbr::routing
