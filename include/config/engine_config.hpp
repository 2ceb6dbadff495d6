/**
 * @file engine_config.hpp
 * @brief Complete engine configuration and JSON file loading.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "irr": { "initial_guess": 0.1, "max_iterations": 100, "tolerance": 1e-6 },
 *   "projection": {
 *     "as_of_date": "2025-12-31",
 *     "num_periods": 20,
 *     "management_fee_rate": 0.02,
 *     "nav_curve_mode": "profile_j_curve"
 *   },
 *   "strategy_profiles": { "fallback_strategy": "Private Equity" },
 *   "modeling_assumptions": {
 *     "Venture Capital": { "expected_moic": 2.5, "target_irr": 0.20 }
 *   },
 *   "allocation": { "max_allocation": { "Venture Capital": 250000 } }
 * }
 * @endcode
 *
 * Every section is optional; missing sections and keys keep their defaults.
 */

#ifndef PRIVCAP_CONFIG_ENGINE_CONFIG_HPP
#define PRIVCAP_CONFIG_ENGINE_CONFIG_HPP

#include "allocation/allocation_optimizer.hpp"
#include "metrics/xirr_solver.hpp"
#include "model/fund.hpp"
#include "projection/projection_engine.hpp"
#include "projection/strategy_profile.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace privcap
{
    namespace config
    {

        /**
         * @struct EngineConfig
         * @brief All tunable parameters of the engine.
         */
        struct EngineConfig
        {
            metrics::XirrOptions irr;
            projection::ProjectionConfig projection;
            projection::StrategyProfileTable strategy_profiles;
            model::AssumptionMap modeling_assumptions;
            allocation::AllocationConstraints allocation;

            /**
             * @brief Projection engine built from the projection and profile sections.
             */
            projection::ProjectionEngine make_projection_engine() const;

            nlohmann::json to_json() const;

            /**
             * @brief Build from a parsed document.
             *
             * "modeling_assumptions" may be an object keyed by strategy or an
             * array of rows carrying a "strategy" field.
             * @throws std::invalid_argument on invalid values, including keys
             *         of the wrong JSON type.
             */
            static EngineConfig from_json(const nlohmann::json &j);
        };

        /**
         * @brief Parse a JSON file.
         * @throws std::runtime_error if the file cannot be opened or parsed.
         */
        nlohmann::json load_json(const std::string &filepath);

        /**
         * @brief Load an EngineConfig from a JSON file.
         * @throws std::runtime_error if the file cannot be read or parsed
         * @throws std::invalid_argument if a value is invalid
         */
        EngineConfig load_config(const std::string &filepath);

    } // namespace config
} // namespace privcap

#endif // PRIVCAP_CONFIG_ENGINE_CONFIG_HPP
