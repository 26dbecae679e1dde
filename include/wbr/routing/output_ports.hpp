#pragma once
/**
 * @file output_ports.hpp
 * @brief Output identifiers a dispatcher node exposes for a given configuration.
 * @details One port per route (`route_<i>_result`, 1-based) plus `default_result`
 *          when the Else output is enabled. Ports change whenever routes are
 *          added or removed, so hosts re-query this list after config edits.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "wbr/routing/route.hpp"

namespace wbr::routing {

/** @struct OutputPort
 *  @brief One addressable output.
 */
struct OutputPort {
    std::string                id;          ///< Host-facing identifier
    std::string                label;       ///< Display label, e.g. "Route A (50%)"
    std::optional<std::size_t> route_index; ///< Empty for the Else port

    bool operator==(const OutputPort&) const = default;
};

/// Decoded port id.
struct PortRef {
    bool        is_else{false};
    std::size_t route_index{0}; ///< 0-based; meaningful when !is_else
};

/// Ports for `config`, routes first (in order), Else last if enabled.
std::vector<OutputPort> describe_outputs(const RouteConfig& config);

/// Port id of the route at `route_index` (0-based).
std::string route_port_id(std::size_t route_index);

/// Parse a port id; std::nullopt for anything that is not a well-formed port id.
std::optional<PortRef> parse_port_id(std::string_view id) noexcept;

/// Weight rendered as configured: numbers in shortest round-trip form ("50", "12.3456789"), text verbatim, "0" if absent.
std::string format_weight(const RawWeight& w);

} // namespace wbr::routing
