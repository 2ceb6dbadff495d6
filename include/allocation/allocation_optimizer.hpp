/**
 * @file allocation_optimizer.hpp
 * @brief New-commitment pacing to hold strategy exposures at target.
 *
 * Given current exposure per strategy, the distributions expected to come
 * back over the planning horizon and a budget of new capital, the optimizer
 * closes each strategy's gap to its target share of the projected
 * portfolio, subject to per-strategy bounds, and scales down
 * proportionally when the gaps exceed the budget.
 *
 * Example configuration:
 * @code{.json}
 * {
 *   "allocation": {
 *     "min_allocation": { "Real Estate": 10000 },
 *     "max_allocation": { "Venture Capital": 250000 },
 *     "verbose": false
 *   }
 * }
 * @endcode
 */

#ifndef PRIVCAP_ALLOCATION_ALLOCATION_OPTIMIZER_HPP
#define PRIVCAP_ALLOCATION_ALLOCATION_OPTIMIZER_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace privcap
{
    namespace allocation
    {

        /**
         * @struct AllocationConstraints
         * @brief Optional per-strategy bounds on new capital.
         */
        struct AllocationConstraints
        {
            std::map<std::string, double> min_allocation; ///< Floor per strategy (default 0)
            std::map<std::string, double> max_allocation; ///< Cap per strategy (default available capital)
            bool verbose = false;                         ///< Warn on stderr about suspicious inputs

            /**
             * @brief Validate bounds
             * @throws std::invalid_argument if a floor is negative or exceeds its cap
             */
            void validate() const;

            double min_for(const std::string &strategy) const;
            double max_for(const std::string &strategy, double available_capital) const;

            nlohmann::json to_json() const;
            static AllocationConstraints from_json(const nlohmann::json &j);
        };

        /**
         * @struct AllocationResult
         * @brief Recommended new capital per strategy with the inputs that produced it.
         */
        struct AllocationResult
        {
            std::map<std::string, double> allocations; ///< >= 0, keyed by strategy
            std::map<std::string, double> gaps;        ///< target_value - projected_value (signed)
            double total_allocated = 0.0;              ///< Sum of allocations after scaling
            double scale_factor = 1.0;                 ///< < 1 when the budget was binding
            double projected_total = 0.0;              ///< Portfolio size after distributions and new capital

            nlohmann::json to_json() const;
        };

        /**
         * @brief Allocate new capital toward target exposures.
         *
         * projected_total = sum(current) - sum(projected_distributions) + available_capital.
         * For each strategy in target_fractions:
         *   gap = projected_total * f - (current - projected_distributions)
         *   allocation = max(0, max(min, min(gap, max)))
         * If the allocations exceed available_capital every one is scaled by
         * available_capital / total.
         *
         * @param current_exposures Current NAV by strategy
         * @param target_fractions Target share of the portfolio by strategy
         * @param available_capital Budget for new commitments (>= 0)
         * @param projected_distributions Expected distributions by strategy over the horizon
         * @param constraints Per-strategy bounds
         * @return AllocationResult; total_allocated never exceeds available_capital
         * @throws std::invalid_argument if available_capital < 0 or constraints are invalid
         */
        AllocationResult calculate_optimal_allocation(const std::map<std::string, double> &current_exposures,
                                                      const std::map<std::string, double> &target_fractions,
                                                      double available_capital,
                                                      const std::map<std::string, double> &projected_distributions,
                                                      const AllocationConstraints &constraints = AllocationConstraints());

    } // namespace allocation
} // namespace privcap

#endif // PRIVCAP_ALLOCATION_ALLOCATION_OPTIMIZER_HPP
