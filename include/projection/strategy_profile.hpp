/**
 * @file strategy_profile.hpp
 * @brief Per-strategy pacing parameters for the projection engine.
 *
 * Each row describes where capital calls peak, where distributions
 * bottom out (both as fractions of the horizon) and how deep the early NAV
 * write-down runs. Strategies not in the table resolve to a named fallback
 * row, and the lookup reports when that happened.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "strategy_profiles": {
 *     "fallback_strategy": "Private Equity",
 *     "profiles": {
 *       "Private Credit": {
 *         "call_peak_fraction": 0.25, "call_steepness": 2.0,
 *         "dist_trough_fraction": 0.15, "dist_steepness": 2.5,
 *         "j_curve_depth": 0.02
 *       }
 *     }
 *   }
 * }
 * @endcode
 */

#ifndef PRIVCAP_PROJECTION_STRATEGY_PROFILE_HPP
#define PRIVCAP_PROJECTION_STRATEGY_PROFILE_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace privcap
{
    namespace projection
    {

        /**
         * @struct StrategyShapeParams
         * @brief Horizon-independent shape parameters of one strategy.
         */
        struct StrategyShapeParams
        {
            double call_peak_fraction = 0.4;   ///< Call S-curve midpoint as a fraction of the horizon
            double call_steepness = 2.0;
            double dist_trough_fraction = 0.4; ///< Distribution J-curve trough as a fraction of the horizon
            double dist_steepness = 1.5;
            double j_curve_depth = 0.08;       ///< Annualized NAV write-down before the trough

            /**
             * @throws std::invalid_argument if a fraction is outside [0, 1],
             *         a steepness is not positive or the depth is negative.
             */
            void validate() const;

            nlohmann::json to_json() const;
            static StrategyShapeParams from_json(const nlohmann::json &j);
        };

        /**
         * @struct ResolvedShapeParams
         * @brief Shape parameters bound to a concrete horizon.
         */
        struct ResolvedShapeParams
        {
            std::string profile_name; ///< Table row actually used
            bool used_fallback = false;
            int call_peak = 0;        ///< floor(n * call_peak_fraction)
            double call_steepness = 0.0;
            int dist_trough = 0;      ///< floor(n * dist_trough_fraction)
            double dist_steepness = 0.0;
            double j_curve_depth = 0.0;

            nlohmann::json to_json() const;
        };

        /**
         * @class StrategyProfileTable
         * @brief Strategy name to shape parameters, with an explicit fallback row.
         *
         * A default-constructed table holds the four built-in strategies with
         * "Private Equity" as fallback.
         */
        class StrategyProfileTable
        {
        public:
            StrategyProfileTable();

            /**
             * @brief Add or replace a row.
             * @throws std::invalid_argument if params are invalid or the name is empty.
             */
            void set_profile(const std::string &strategy, const StrategyShapeParams &params);

            bool has_profile(const std::string &strategy) const;

            /**
             * @brief Name the row used for unknown strategies.
             * @throws std::invalid_argument if no such row exists.
             */
            void set_fallback_strategy(const std::string &strategy);

            const std::string &fallback_strategy() const { return fallback_strategy_; }
            const std::map<std::string, StrategyShapeParams> &profiles() const { return profiles_; }

            /**
             * @brief Resolve a strategy for an n-period horizon.
             *
             * Exact name match; anything else resolves to the fallback row
             * with used_fallback = true.
             */
            ResolvedShapeParams lookup(const std::string &strategy, int num_periods) const;

            nlohmann::json to_json() const;

            /**
             * @brief Overlay configured rows on the built-in table.
             *
             * Keys: "profiles" (object of rows), "fallback_strategy" (string).
             * @throws std::invalid_argument on invalid rows or an unknown fallback.
             */
            static StrategyProfileTable from_json(const nlohmann::json &j);

        private:
            std::map<std::string, StrategyShapeParams> profiles_;
            std::string fallback_strategy_;
        };

    } // namespace projection
} // namespace privcap

#endif // PRIVCAP_PROJECTION_STRATEGY_PROFILE_HPP
