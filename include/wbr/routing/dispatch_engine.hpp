#pragma once
/**
 * @file dispatch_engine.hpp
 * @brief One-shot weighted dispatch per EvaluationContext with output gating.
 *
 * The first accessor call on a context builds the RouteTable and draws exactly
 * once; the result is stored on the context so every later accessor (any order,
 * any number of times) sees the same selection. At most one route output is
 * active per context. Inactive outputs carry no payload and must be pruned by
 * the host (do not traverse that edge).
 *
 * The engine itself holds no per-evaluation state and never throws for
 * malformed configuration.
 */

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "wbr/obs/observability.hpp"
#include "wbr/routing/evaluation_context.hpp"
#include "wbr/routing/random_source.hpp"
#include "wbr/routing/sampler.hpp"

namespace wbr::routing {

/// Configured override text emitted verbatim by a selected route.
struct Literal final {
    std::string text;
    bool operator==(const Literal&) const = default;
};

/**
 * @brief Result of one output accessor.
 * @tparam T Passthrough payload type (text, record, ...).
 */
template <class T>
struct RouteOutput final {
    std::variant<std::monostate, T, Literal> payload; ///< monostate when suppressed
    bool active{false};                               ///< false => prune this edge

    [[nodiscard]] bool is_passthrough() const noexcept { return std::holds_alternative<T>(payload); }
    [[nodiscard]] bool is_literal() const noexcept { return std::holds_alternative<Literal>(payload); }
};

/** @struct Verdict
 *  @brief Payload-independent gate decision for one output.
 */
struct Verdict final {
    bool active{false};
    std::optional<std::string> literal; ///< Set when an active route emits its override

    bool operator==(const Verdict&) const = default;
};

/// True when `v` should replace the passthrough (non-blank, not the "none" sentinel).
bool usable_override(const std::optional<std::string>& v) noexcept;

/** @class DispatchEngine
 *  @brief Stateless orchestrator; all selection state lives on the context.
 */
class DispatchEngine {
public:
    /**
     * @param rng Random source used for the single draw per context.
     * @param observer Optional sink receiving one event per settled context.
     */
    explicit DispatchEngine(RandomSource& rng, obs::Observer* observer = nullptr) noexcept
    : rng_(&rng), observer_(observer) {}

    /// Settle `ctx` if needed and return its (cached) selection.
    const SelectionResult& ensure_selection(EvaluationContext& ctx);

    // --------------------------- Gate decisions -------------------------------
    Verdict route_verdict(EvaluationContext& ctx, std::string_view route_name);
    Verdict route_verdict_at(EvaluationContext& ctx, std::size_t route_index);
    Verdict else_verdict(EvaluationContext& ctx);
    /// Resolve `route_<i>_result` / `default_result`; unknown ids are suppressed.
    Verdict port_verdict(EvaluationContext& ctx, std::string_view port_id);

    // --------------------------- Typed accessors -----------------------------
    template <class T>
    RouteOutput<T> route_output(EvaluationContext& ctx, std::string_view route_name, const T& passthrough) {
        return emit(route_verdict(ctx, route_name), passthrough);
    }

    template <class T>
    RouteOutput<T> route_output_at(EvaluationContext& ctx, std::size_t route_index, const T& passthrough) {
        return emit(route_verdict_at(ctx, route_index), passthrough);
    }

    template <class T>
    RouteOutput<T> else_output(EvaluationContext& ctx, const T& passthrough) {
        return emit(else_verdict(ctx), passthrough);
    }

    template <class T>
    RouteOutput<T> port_output(EvaluationContext& ctx, std::string_view port_id, const T& passthrough) {
        return emit(port_verdict(ctx, port_id), passthrough);
    }

private:
    template <class T>
    static RouteOutput<T> emit(const Verdict& v, const T& passthrough) {
        RouteOutput<T> out;
        out.active = v.active;
        if (!v.active) return out;
        if (v.literal) out.payload = Literal{*v.literal};
        else           out.payload.template emplace<T>(passthrough);
        return out;
    }

    Verdict verdict_for(const Route& selected) const;
    void report(const EvaluationContext& ctx) const;

    RandomSource*  rng_;
    obs::Observer* observer_;
};

} // namespace wbr::routing
