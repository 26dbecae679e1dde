/**
* @file observability.cpp
 * @brief Observer that counts outcomes and prints one JSON line per decision.
 */
#include "wbr/obs/observability.hpp"
#include <mutex>
#include <cstdio>

#include <nlohmann/json.hpp>

namespace wbr::obs {

    const char* to_string(DispatchReason r) noexcept {
        switch (r) {
            case DispatchReason::WeightedDraw: return "weighted_draw";
            case DispatchReason::NoValidRoute: return "no_valid_route";
            case DispatchReason::NoRoutes:     return "no_routes";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        void record(const DispatchEvent& e) override {
            std::lock_guard<std::mutex> lk(mu_);
            ctr_.decisions++;
            switch (e.reason) {
                case DispatchReason::WeightedDraw: ctr_.routes_selected++; break;
                case DispatchReason::NoValidRoute: ctr_.no_valid_route++;  break;
                case DispatchReason::NoRoutes:     ctr_.unconfigured++;    break;
            }
            // route names are user text; the serializer escapes them, invalid UTF-8 becomes U+FFFD
            nlohmann::json line = {
                {"context_id", e.context_id},
                {"route", e.route_name},
                {"route_index", nullptr},
                {"draw", e.draw_value},
                {"candidates", e.candidates},
                {"reason", to_string(e.reason)}};
            if (e.route_index) line["route_index"] = *e.route_index;
            const auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            std::printf("%s\n", text.c_str());
            std::fflush(stdout);
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace wbr::obs
