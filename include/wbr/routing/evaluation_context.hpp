#pragma once
/**
 * @file evaluation_context.hpp
 * @brief Lifetime scope of one node execution: compute once, read many times.
 * @details Owns a copy of the route configuration plus the memoized RouteTable and
 *          SelectionResult. Not thread-safe; each concurrent evaluation owns its own.
 */

#include <cstdint>
#include <optional>
#include <string>

#include "wbr/routing/route.hpp"
#include "wbr/routing/route_table.hpp"
#include "wbr/routing/sampler.hpp"

namespace wbr::routing {

/** @class EvaluationContext
 *  @brief Holds at most one settled selection for one graph-node execution.
 */
class EvaluationContext {
public:
    /// Construct for one evaluation; `id` is carried into observability events.
    explicit EvaluationContext(RouteConfig config, uint64_t id = 0);

    EvaluationContext(const EvaluationContext&) = delete;
    EvaluationContext& operator=(const EvaluationContext&) = delete;
    EvaluationContext(EvaluationContext&&) noexcept = default;
    EvaluationContext& operator=(EvaluationContext&&) noexcept = default;

    [[nodiscard]] const RouteConfig& config() const noexcept { return config_; }
    [[nodiscard]] uint64_t id() const noexcept { return id_; }

    /// True once the table and selection have been stored.
    [[nodiscard]] bool settled() const noexcept { return selection_.has_value(); }

    /**
     * @brief Store the table and selection for this evaluation.
     * @return false (and leaves state unchanged) if already settled.
     */
    bool settle(RouteTable table, SelectionResult selection, std::string status);

    /// @pre settled()
    [[nodiscard]] const RouteTable& table() const noexcept { return *table_; }
    /// @pre settled()
    [[nodiscard]] const SelectionResult& selection() const noexcept { return *selection_; }

    /// Selected route, or nullptr when unsettled or nothing was selected.
    [[nodiscard]] const Route* selected_route() const noexcept;

    /// Advisory status ("Selected: Route A", "No routes configured", ...).
    [[nodiscard]] const std::string& status() const noexcept { return status_; }

private:
    RouteConfig                    config_;
    uint64_t                       id_{0};
    std::optional<RouteTable>      table_;
    std::optional<SelectionResult> selection_;
    std::string                    status_;
};

} // namespace wbr::routing
