#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: dispatch events + counters.
 * @details The engine records one event per settled evaluation when an observer
 *          is attached; the default sink prints one JSON line per event.
 */

#include <string>
#include <optional>
#include <cstddef>
#include <cstdint>

namespace wbr::obs {

    /** @struct Counters
     *  @brief Process-level counters for dispatch decisions.
     */
    struct Counters {
        uint64_t decisions{0};        ///< Total settled evaluations recorded
        uint64_t routes_selected{0};  ///< Evaluations that selected a route
        uint64_t no_valid_route{0};   ///< Routes configured but none had a usable weight
        uint64_t unconfigured{0};     ///< Evaluations with no routes at all
    };

    /** @enum DispatchReason
     *  @brief Why an evaluation settled the way it did.
     */
    enum class DispatchReason : uint8_t {
        WeightedDraw,   ///< A route was drawn from the table
        NoValidRoute,   ///< Every configured weight was unusable
        NoRoutes        ///< Configuration was empty
    };

    /// Stable label for a reason (used in log lines).
    const char* to_string(DispatchReason r) noexcept;

    /** @struct DispatchEvent
     *  @brief Payload describing a single dispatch decision.
     */
    struct DispatchEvent {
        uint64_t                   context_id{0};  ///< EvaluationContext id
        std::optional<std::size_t> route_index;    ///< Selected route (if any)
        std::string                route_name;     ///< Selected route name (empty if none)
        double                     draw_value{0.0}; ///< Raw sample in [0,100)
        std::size_t                candidates{0};  ///< Valid entries in the table
        DispatchReason             reason{DispatchReason::WeightedDraw};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single dispatch event.
        virtual void record(const DispatchEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide JSON-line observer writing to stdout.
    Observer* make_simple_observer();

} // namespace wbr::obs
