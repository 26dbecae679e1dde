#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the dispatcher and its loader.
 * @details These values eliminate magic numbers from the codebase. Route tables and
 *          dispatcher settings are overridden via the config Loader.
 */

#include <cstdint>
#include <string_view>

namespace wbr::config::constants {

// =====================
// Percentage scale
// Route weights are percentages; tables always normalize to PERCENT_MAX.
// =====================
inline constexpr double PERCENT_MIN = 0.0;    ///< Lower clamp for a configured weight
inline constexpr double PERCENT_MAX = 100.0;  ///< Upper clamp and normalized table total

/// Allowed drift of a normalized table total from PERCENT_MAX.
inline constexpr double NORMALIZATION_TOLERANCE = 1e-6;

// =====================
// Override handling
// =====================
/// Override text (case-insensitive, trimmed) that means "no override".
inline constexpr std::string_view OVERRIDE_UNSET_SENTINEL = "none";

// =====================
// Output port naming (ids the host engine uses to address outputs)
// =====================
inline constexpr std::string_view ROUTE_PORT_PREFIX = "route_";   ///< route_<i>_result, 1-based
inline constexpr std::string_view ROUTE_PORT_SUFFIX = "_result";
inline constexpr std::string_view ELSE_PORT_ID      = "default_result";
inline constexpr std::string_view ELSE_PORT_LABEL   = "Else";
inline constexpr std::string_view ROUTE_NAME_PREFIX = "Route ";   ///< Fallback name: "Route <i>"

// =====================
// Default route table (used when no file is supplied)
// =====================
inline constexpr std::string_view DEFAULT_ROUTE_A_NAME   = "Route A";
inline constexpr std::string_view DEFAULT_ROUTE_B_NAME   = "Route B";
inline constexpr double           DEFAULT_ROUTE_A_WEIGHT = 50.0;
inline constexpr double           DEFAULT_ROUTE_B_WEIGHT = 50.0;
inline constexpr bool             DEFAULT_ENABLE_ELSE    = false;

// =====================
// Randomness
// =====================
/// Seed value meaning "draw a nondeterministic seed from std::random_device".
inline constexpr uint64_t SEED_NONDETERMINISTIC = 0;

// =====================
// Status messages (advisory, surfaced to the host for observability)
// =====================
inline constexpr std::string_view STATUS_NO_ROUTES       = "No routes configured";
inline constexpr std::string_view STATUS_SELECTED_PREFIX = "Selected: ";
inline constexpr std::string_view STATUS_ELSE_FALLBACK   =
    "No route selected - using input data as fallback for Else output";
inline constexpr std::string_view STATUS_ELSE_DISABLED   =
    "No route selected and Else output is disabled";

} // namespace wbr::config::constants
