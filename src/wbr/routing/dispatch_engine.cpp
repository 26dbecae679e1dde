/**
 * @file dispatch_engine.cpp
 * @brief Memoized selection and per-output gating.
 */
#include "wbr/routing/dispatch_engine.hpp"
#include "wbr/routing/output_ports.hpp"
#include "wbr/config/constants.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace wbr::routing {

using namespace wbr::config::constants;

bool usable_override(const std::optional<std::string>& v) noexcept {
    if (!v) return false;
    std::string_view s{*v};
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    if (s.empty()) return false;
    if (s.size() != OVERRIDE_UNSET_SENTINEL.size()) return true;
    return !std::equal(s.begin(), s.end(), OVERRIDE_UNSET_SENTINEL.begin(),
                       [](char a, char b) {
                           return std::tolower(static_cast<unsigned char>(a)) == b;
                       });
}

const SelectionResult& DispatchEngine::ensure_selection(EvaluationContext& ctx) {
    if (ctx.settled()) return ctx.selection();

    const auto& cfg = ctx.config();
    auto table = RouteTable::build(cfg.routes, cfg.enable_else);

    std::string status;
    SelectionResult sel{};
    if (cfg.routes.empty()) {
        status = STATUS_NO_ROUTES;
    } else if (table.empty()) {
        status = cfg.enable_else ? STATUS_ELSE_FALLBACK : STATUS_ELSE_DISABLED;
    } else {
        sel = select(table, *rng_); // the only draw for this context
        status = STATUS_SELECTED_PREFIX;
        status += cfg.routes[*sel.selected_route_index].name;
    }

    ctx.settle(std::move(table), sel, std::move(status));
    report(ctx);
    return ctx.selection();
}

Verdict DispatchEngine::verdict_for(const Route& selected) const {
    Verdict v{.active = true, .literal = std::nullopt};
    if (usable_override(selected.override_value)) v.literal = *selected.override_value;
    return v;
}

Verdict DispatchEngine::route_verdict(EvaluationContext& ctx, std::string_view route_name) {
    ensure_selection(ctx);
    const Route* selected = ctx.selected_route();
    if (!selected || selected->name != route_name) return Verdict{};
    return verdict_for(*selected);
}

Verdict DispatchEngine::route_verdict_at(EvaluationContext& ctx, std::size_t route_index) {
    const auto& sel = ensure_selection(ctx);
    if (!sel.selected_route_index || *sel.selected_route_index != route_index) return Verdict{};
    const Route* selected = ctx.selected_route();
    if (!selected) return Verdict{};
    return verdict_for(*selected);
}

Verdict DispatchEngine::else_verdict(EvaluationContext& ctx) {
    const auto& sel = ensure_selection(ctx);
    const auto& cfg = ctx.config();
    // Else is a fallback for "routes exist but none is usable", never for "no config".
    const bool active = cfg.enable_else && !cfg.routes.empty() && !sel.selected_route_index;
    return Verdict{.active = active, .literal = std::nullopt};
}

Verdict DispatchEngine::port_verdict(EvaluationContext& ctx, std::string_view port_id) {
    const auto ref = parse_port_id(port_id);
    if (!ref) {
        ensure_selection(ctx);
        return Verdict{};
    }
    return ref->is_else ? else_verdict(ctx) : route_verdict_at(ctx, ref->route_index);
}

void DispatchEngine::report(const EvaluationContext& ctx) const {
    if (!observer_) return;
    const auto& sel = ctx.selection();
    obs::DispatchEvent e;
    e.context_id = ctx.id();
    e.route_index = sel.selected_route_index;
    e.draw_value = sel.draw_value;
    e.candidates = ctx.table().size();
    if (const Route* r = ctx.selected_route()) {
        e.route_name = r->name;
        e.reason = obs::DispatchReason::WeightedDraw;
    } else {
        e.reason = ctx.config().routes.empty() ? obs::DispatchReason::NoRoutes
                                               : obs::DispatchReason::NoValidRoute;
    }
    observer_->record(e);
}

} // namespace wbr::routing
