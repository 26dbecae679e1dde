#include "wbr/routing/evaluation_context.hpp"

#include <utility>

namespace wbr::routing {

EvaluationContext::EvaluationContext(RouteConfig config, uint64_t id)
: config_(std::move(config)), id_(id) {}

bool EvaluationContext::settle(RouteTable table, SelectionResult selection, std::string status) {
    if (settled()) return false; // first settle wins
    table_     = std::move(table);
    selection_ = selection;
    status_    = std::move(status);
    return true;
}

const Route* EvaluationContext::selected_route() const noexcept {
    if (!selection_ || !selection_->selected_route_index) return nullptr;
    const auto idx = *selection_->selected_route_index;
    if (idx >= config_.routes.size()) return nullptr;
    return &config_.routes[idx];
}

} // namespace wbr::routing
