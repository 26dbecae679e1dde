/**
 * @file output_ports.cpp
 * @brief Port id formatting/parsing and label rendering.
 */
#include "wbr/routing/output_ports.hpp"
#include "wbr/config/constants.hpp"

#include <charconv>
#include <system_error>

namespace wbr::routing {

using namespace wbr::config::constants;

std::string format_weight(const RawWeight& w) {
    if (const auto* d = std::get_if<double>(&w)) {
        char buf[64];
        const auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), *d); // shortest round-trip
        return (ec == std::errc{}) ? std::string(buf, ptr) : std::string{"0"};
    }
    if (const auto* s = std::get_if<std::string>(&w)) return *s;
    return "0";
}

std::string route_port_id(std::size_t route_index) {
    std::string id{ROUTE_PORT_PREFIX};
    id += std::to_string(route_index + 1);
    id += ROUTE_PORT_SUFFIX;
    return id;
}

std::vector<OutputPort> describe_outputs(const RouteConfig& config) {
    std::vector<OutputPort> ports;
    ports.reserve(config.routes.size() + (config.enable_else ? 1 : 0));
    for (std::size_t i = 0; i < config.routes.size(); ++i) {
        const auto& r = config.routes[i];
        ports.push_back(OutputPort{
            .id = route_port_id(i),
            .label = r.name + " (" + format_weight(r.weight) + "%)",
            .route_index = i});
    }
    if (config.enable_else) {
        ports.push_back(OutputPort{
            .id = std::string(ELSE_PORT_ID),
            .label = std::string(ELSE_PORT_LABEL),
            .route_index = std::nullopt});
    }
    return ports;
}

std::optional<PortRef> parse_port_id(std::string_view id) noexcept {
    if (id == ELSE_PORT_ID) return PortRef{.is_else = true, .route_index = 0};

    if (id.size() <= ROUTE_PORT_PREFIX.size() + ROUTE_PORT_SUFFIX.size()) return std::nullopt;
    if (!id.starts_with(ROUTE_PORT_PREFIX) || !id.ends_with(ROUTE_PORT_SUFFIX)) return std::nullopt;
    id.remove_prefix(ROUTE_PORT_PREFIX.size());
    id.remove_suffix(ROUTE_PORT_SUFFIX.size());

    std::size_t ordinal = 0;
    const auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), ordinal);
    if (ec != std::errc{} || ptr != id.data() + id.size() || ordinal == 0) return std::nullopt;
    return PortRef{.is_else = false, .route_index = ordinal - 1};
}

} // namespace wbr::routing
