#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: built-in defaults or a JSON route table file.
 * @details All defaults reference named constants to avoid magic numbers.
 *
 * File format:
 * @code
 *   {
 *     "else": true,
 *     "seed": 42,
 *     "log": false,
 *     "routes": [
 *       {"route_name": "Route A", "percentage": 50},
 *       {"route_name": "Route B", "percentage": "30", "output_value": "fixed reply"},
 *       {"route_name": "Route C"}
 *     ]
 *   }
 * @endcode
 * `percentage` keeps its JSON type: numbers become numeric weights, strings stay
 * raw text, null/missing means absent. A missing or null `route_name` becomes
 * "Route <i>". The RouteTable decides which weights are usable.
 */

#include <cstddef>
#include <cstdint>
#include <istream>
#include <string>

#include "wbr/compat/expected.hpp"
#include "wbr/routing/route.hpp"

namespace wbr::config {

    /** @struct DispatcherConfig
     *  @brief Aggregate of everything the dispatcher needs at startup.
     */
    struct DispatcherConfig {
        wbr::routing::RouteConfig routing;  ///< Route table + else flag
        uint64_t seed{0};                   ///< 0 => process-level generator
        bool     log_decisions{false};      ///< Attach the JSON-line observer
    };

    /// Loader error codes.
    enum class ConfigErr : uint8_t {
        Io = 1,   ///< File could not be opened/read
        Syntax,   ///< Not valid JSON, or an unknown key
        Type      ///< Valid JSON, but a value has the wrong type
    };

    /** @struct ConfigError
     *  @brief Error code plus location for human-readable reporting.
     */
    struct ConfigError {
        ConfigErr   code{ConfigErr::Syntax};
        std::size_t offset{0};   ///< Byte offset of a JSON syntax error; 0 otherwise
        std::string message;
    };

    using LoadResult = wbr_detail::expected<DispatcherConfig, ConfigError>;

    /** @class Loader
     *  @brief Source of dispatcher configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Built-in table: Route A 50 / Route B 50, no overrides, else disabled.
        static DispatcherConfig defaults();

        /**
         * @brief Load configuration from a JSON file.
         * @param path Route table file.
         * @return Parsed config, or ConfigError (Io/Syntax/Type).
         */
        static LoadResult load_from_file(const std::string& path);

        /// Parse from any stream (file contents, embedded strings, tests).
        static LoadResult load_from_stream(std::istream& in);
    };

} // namespace wbr::config
