#pragma once
/**
 * @file route_table.hpp
 * @brief Normalized probability distribution over a list of routes.
 * @details Built once per evaluation and immutable afterwards. Malformed weights
 *          degrade to a filtered, clamped or equal-weight table; building never fails.
 */

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "wbr/routing/route.hpp"

namespace wbr::routing {

/**
 * @brief Coerce a raw weight to a finite number.
 * @return The numeric value (unclamped), or std::nullopt when the weight is
 *         non-numeric text or non-finite. An absent weight coerces to 0.
 */
std::optional<double> coerce_weight(const RawWeight& w) noexcept;

/** @struct TableEntry
 *  @brief One valid route and its share of the 0..100 interval.
 */
struct TableEntry {
    std::size_t route_index{0};     ///< Index into the configured RouteList
    double      normalized_weight{0.0}; ///< Share in percent (>= 0)

    bool operator==(const TableEntry&) const = default;
};

/** @class RouteTable
 *  @brief Ordered entries whose normalized weights sum to 100 when non-empty.
 */
class RouteTable {
public:
    RouteTable() = default;

    /**
     * @brief Validate and normalize routes.
     * @param routes Configured routes in host order.
     * @param has_else Whether the catch-all output is enabled.
     * @return Table preserving input order; empty when no weight is coercible.
     */
    static RouteTable build(std::span<const Route> routes, bool has_else = false);

    [[nodiscard]] const std::vector<TableEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool has_else() const noexcept { return has_else_; }

    /// Sum of normalized weights (100 within tolerance, or 0 when empty).
    [[nodiscard]] double total() const noexcept;

private:
    std::vector<TableEntry> entries_;
    bool has_else_{false};
};

} // namespace wbr::routing
