/**
* @file config_loader.cpp
 * @brief Defaults and JSON route table parser (nlohmann::json).
 */
#include "wbr/config/config_loader.hpp"
#include "wbr/config/constants.hpp"

#include <fstream>
#include <utility>

#include <nlohmann/json.hpp>

namespace wbr::config {
    using namespace wbr::routing;
    using namespace wbr::config::constants;
    using json = nlohmann::json;

    namespace {

    wbr_detail::unexpected<ConfigError> fail(ConfigErr code, std::string msg, std::size_t offset = 0) {
        return wbr_detail::make_unexpected(ConfigError{code, offset, std::move(msg)});
    }

    std::string where(std::size_t i, const char* key) {
        return "routes[" + std::to_string(i) + "]." + key;
    }

    /// number -> double, string -> raw text, null/missing -> absent.
    bool read_weight(const json& entry, RawWeight& out) {
        const auto it = entry.find("percentage");
        if (it == entry.end() || it->is_null()) { out = std::monostate{}; return true; }
        if (it->is_number())                    { out = it->get<double>();     return true; }
        if (it->is_string())                    { out = it->get<std::string>(); return true; }
        return false;
    }

    wbr_detail::expected<Route, ConfigError> read_route(const json& entry, std::size_t i) {
        if (!entry.is_object()) return fail(ConfigErr::Type, "routes[" + std::to_string(i) + "] must be an object");

        Route r;
        const auto name = entry.find("route_name");
        if (name == entry.end() || name->is_null()) {
            r.name = std::string(ROUTE_NAME_PREFIX) + std::to_string(i + 1);
        } else if (name->is_string()) {
            r.name = name->get<std::string>();
        } else {
            return fail(ConfigErr::Type, where(i, "route_name") + " must be a string");
        }

        if (!read_weight(entry, r.weight)) {
            return fail(ConfigErr::Type, where(i, "percentage") + " must be a number, string or null");
        }

        const auto ov = entry.find("output_value");
        if (ov != entry.end() && !ov->is_null()) {
            if (!ov->is_string()) return fail(ConfigErr::Type, where(i, "output_value") + " must be a string");
            r.override_value = ov->get<std::string>();
        }

        for (const auto& kv : entry.items()) {
            if (kv.key() != "route_name" && kv.key() != "percentage" && kv.key() != "output_value") {
                return fail(ConfigErr::Syntax, "unknown key " + where(i, kv.key().c_str()));
            }
        }
        return r;
    }

    } // namespace

    DispatcherConfig Loader::defaults() {
        DispatcherConfig dc;
        dc.routing.routes = {
            Route{.name = std::string(DEFAULT_ROUTE_A_NAME), .weight = DEFAULT_ROUTE_A_WEIGHT, .override_value = std::nullopt},
            Route{.name = std::string(DEFAULT_ROUTE_B_NAME), .weight = DEFAULT_ROUTE_B_WEIGHT, .override_value = std::nullopt}
        };
        dc.routing.enable_else = DEFAULT_ENABLE_ELSE;
        dc.seed = SEED_NONDETERMINISTIC;
        dc.log_decisions = false;
        return dc;
    }

    LoadResult Loader::load_from_file(const std::string& path) {
        std::ifstream in(path);
        if (!in) return fail(ConfigErr::Io, "cannot open " + path);
        return load_from_stream(in);
    }

    LoadResult Loader::load_from_stream(std::istream& in) {
        json doc;
        try {
            doc = json::parse(in);
        } catch (const json::parse_error& e) {
            if (in.bad()) return fail(ConfigErr::Io, "read error");
            return fail(ConfigErr::Syntax, e.what(), e.byte);
        }
        if (!doc.is_object()) return fail(ConfigErr::Type, "top level must be an object");

        DispatcherConfig dc;
        dc.routing.enable_else = DEFAULT_ENABLE_ELSE;
        dc.seed = SEED_NONDETERMINISTIC;

        for (const auto& kv : doc.items()) {
            const auto& key = kv.key();
            const auto& val = kv.value();
            if (key == "else") {
                if (!val.is_boolean()) return fail(ConfigErr::Type, "'else' must be a boolean");
                dc.routing.enable_else = val.get<bool>();
            } else if (key == "log") {
                if (!val.is_boolean()) return fail(ConfigErr::Type, "'log' must be a boolean");
                dc.log_decisions = val.get<bool>();
            } else if (key == "seed") {
                if (!val.is_number_unsigned()) return fail(ConfigErr::Type, "'seed' must be a non-negative integer");
                dc.seed = val.get<uint64_t>();
            } else if (key == "routes") {
                if (!val.is_array()) return fail(ConfigErr::Type, "'routes' must be an array");
                dc.routing.routes.reserve(val.size());
                for (std::size_t i = 0; i < val.size(); ++i) {
                    auto r = read_route(val[i], i);
                    if (!r) return wbr_detail::make_unexpected(std::move(r.error()));
                    dc.routing.routes.push_back(std::move(*r));
                }
            } else {
                return fail(ConfigErr::Syntax, "unknown key: " + key);
            }
        }
        return dc;
    }

} // namespace wbr::config
