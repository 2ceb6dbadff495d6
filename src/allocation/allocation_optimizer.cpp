/**
 * @file allocation_optimizer.cpp
 * @brief Implementation of the exposure-targeting allocation rule.
 */

#include "allocation/allocation_optimizer.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace privcap
{
    namespace allocation
    {

        namespace
        {

            double value_or_zero(const std::map<std::string, double> &values, const std::string &key)
            {
                auto it = values.find(key);
                return it == values.end() ? 0.0 : it->second;
            }

            double sum_values(const std::map<std::string, double> &values)
            {
                double total = 0.0;
                for (const auto &entry : values)
                {
                    total += entry.second;
                }
                return total;
            }

            // Scaled allocations can overshoot the budget by a few ulps; trim from the back
            void pin_to_budget(std::map<std::string, double> &allocations, double budget)
            {
                double total = sum_values(allocations);
                for (auto it = allocations.rbegin(); it != allocations.rend() && total > budget; ++it)
                {
                    while (it->second > 0.0 && total > budget)
                    {
                        double reduced = std::max(0.0, it->second - (total - budget));
                        it->second = reduced < it->second ? reduced : std::nextafter(it->second, 0.0);
                        total = sum_values(allocations);
                    }
                }
            }

        } // anonymous namespace

        // ============================================================================
        // AllocationConstraints Implementation
        // ============================================================================

        void AllocationConstraints::validate() const
        {
            for (const auto &entry : min_allocation)
            {
                if (entry.second < 0.0)
                {
                    throw std::invalid_argument(
                        "min_allocation for '" + entry.first + "' must be non-negative, got: " +
                        std::to_string(entry.second));
                }

                auto cap = max_allocation.find(entry.first);
                if (cap != max_allocation.end() && entry.second > cap->second)
                {
                    throw std::invalid_argument(
                        "min_allocation (" + std::to_string(entry.second) +
                        ") cannot exceed max_allocation (" + std::to_string(cap->second) +
                        ") for '" + entry.first + "'");
                }
            }

            for (const auto &entry : max_allocation)
            {
                if (entry.second < 0.0)
                {
                    throw std::invalid_argument(
                        "max_allocation for '" + entry.first + "' must be non-negative, got: " +
                        std::to_string(entry.second));
                }
            }
        }

        double AllocationConstraints::min_for(const std::string &strategy) const
        {
            return value_or_zero(min_allocation, strategy);
        }

        double AllocationConstraints::max_for(const std::string &strategy, double available_capital) const
        {
            auto it = max_allocation.find(strategy);
            return it == max_allocation.end() ? available_capital : it->second;
        }

        nlohmann::json AllocationConstraints::to_json() const
        {
            return nlohmann::json{
                {"min_allocation", min_allocation},
                {"max_allocation", max_allocation},
                {"verbose", verbose}};
        }

        AllocationConstraints AllocationConstraints::from_json(const nlohmann::json &j)
        {
            AllocationConstraints constraints;

            if (j.contains("min_allocation"))
            {
                constraints.min_allocation = j.at("min_allocation").get<std::map<std::string, double>>();
            }
            if (j.contains("max_allocation"))
            {
                constraints.max_allocation = j.at("max_allocation").get<std::map<std::string, double>>();
            }
            constraints.verbose = j.value("verbose", false);

            constraints.validate();
            return constraints;
        }

        nlohmann::json AllocationResult::to_json() const
        {
            return nlohmann::json{
                {"allocations", allocations},
                {"gaps", gaps},
                {"total_allocated", total_allocated},
                {"scale_factor", scale_factor},
                {"projected_total", projected_total}};
        }

        // ============================================================================
        // Allocation rule
        // ============================================================================

        AllocationResult calculate_optimal_allocation(const std::map<std::string, double> &current_exposures,
                                                      const std::map<std::string, double> &target_fractions,
                                                      double available_capital,
                                                      const std::map<std::string, double> &projected_distributions,
                                                      const AllocationConstraints &constraints)
        {
            if (available_capital < 0.0)
            {
                throw std::invalid_argument(
                    "available_capital must be non-negative, got: " + std::to_string(available_capital));
            }
            constraints.validate();

            if (constraints.verbose)
            {
                double fraction_sum = sum_values(target_fractions);
                if (std::abs(fraction_sum - 1.0) > 0.01)
                {
                    std::cerr << "Warning: target fractions sum to " << fraction_sum << "\n";
                }
            }

            AllocationResult result;
            result.projected_total = sum_values(current_exposures) - sum_values(projected_distributions) +
                                     available_capital;

            double total = 0.0;
            for (const auto &target : target_fractions)
            {
                const std::string &strategy = target.first;

                double target_value = result.projected_total * target.second;
                double projected_value = value_or_zero(current_exposures, strategy) -
                                         value_or_zero(projected_distributions, strategy);
                double gap = target_value - projected_value;

                double allocation = std::max(constraints.min_for(strategy),
                                             std::min(gap, constraints.max_for(strategy, available_capital)));
                allocation = std::max(0.0, allocation);

                result.gaps[strategy] = gap;
                result.allocations[strategy] = allocation;
                total += allocation;
            }

            if (total > available_capital)
            {
                result.scale_factor = available_capital / total;
                for (auto &entry : result.allocations)
                {
                    entry.second *= result.scale_factor;
                }
                pin_to_budget(result.allocations, available_capital);
                total = sum_values(result.allocations);

                if (constraints.verbose)
                {
                    std::cerr << "Allocations scaled by " << result.scale_factor
                              << " to fit available capital " << available_capital << "\n";
                }
            }

            result.total_allocated = total;
            return result;
        }

    } // namespace allocation
} // namespace privcap
