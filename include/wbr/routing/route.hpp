/**
 * @file route.hpp
 * @brief Route model shared by the route table, the dispatcher and the config loader.
 *
 * A `Route` is one configured output branch. Weights arrive from upstream
 * configuration untyped: they may be missing, numeric, or arbitrary text. The
 * raw value is kept as-is here; coercion and clamping happen when a
 * `RouteTable` is built.
 */
#pragma once

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace wbr::routing {

/**
 * @brief Weight exactly as configured.
 *
 * @note Semantics:
 *  - monostate:   no percentage given (counts as 0).
 *  - double:      numeric percentage, possibly out of range or non-finite.
 *  - std::string: textual percentage, coerced later (may be non-numeric).
 */
using RawWeight = std::variant<std::monostate, double, std::string>;

/**
 * @brief One configured branch.
 *
 * @note No uniqueness is enforced on `name`; duplicates are independent entries.
 */
struct Route final {
  /// Output identifier, e.g. "Route A".
  std::string name;

  /// Configured percentage (semantically 0..100).
  RawWeight weight{};

  /// Literal emitted instead of the passthrough payload when selected.
  std::optional<std::string> override_value;

  bool operator==(const Route&) const = default;
};

/**
 * @brief Convenience alias for an ordered list of routes.
 */
using RouteList = std::vector<Route>;

/**
 * @brief Route configuration supplied by the host before each evaluation.
 */
struct RouteConfig final {
  RouteList routes;         ///< Ordered routes (order is the tie-break order)
  bool      enable_else{false}; ///< Whether a catch-all "Else" output exists

  bool operator==(const RouteConfig&) const = default;
};

} // namespace wbr::routing
