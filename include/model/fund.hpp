/**
 * @file fund.hpp
 * @brief Fund reference data and per-strategy modeling assumptions.
 */

#ifndef PRIVCAP_MODEL_FUND_HPP
#define PRIVCAP_MODEL_FUND_HPP

#include <nlohmann/json.hpp>

#include <map>
#include <string>

namespace privcap
{
    namespace model
    {

        /**
         * @struct Fund
         * @brief Static description of a closed-end fund commitment.
         */
        struct Fund
        {
            int fund_id = 0;
            std::string fund_name;
            int vintage_year = 0;          ///< 0 when unknown
            std::string primary_strategy;  ///< e.g. "Private Equity"
            std::string sub_strategy;      ///< e.g. "Buyout"
            double total_commitment = 0.0; ///< Committed capital (positive)

            nlohmann::json to_json() const;
            static Fund from_json(const nlohmann::json &j);
        };

        /**
         * @struct ModelingAssumption
         * @brief Forecast parameters for one strategy.
         *
         * Defaults match the values used when a strategy has no assumption
         * row (2.0x MOIC, 15% target IRR).
         */
        struct ModelingAssumption
        {
            std::string strategy;
            double expected_moic = 2.0;                 ///< Gross multiple on remaining commitment
            double target_irr = 0.15;                   ///< Annual growth once past the J-curve trough
            double investment_period_years = 5.0;
            double fund_life_years = 10.0;
            double nav_initial_qtr_depreciation = 0.0;  ///< Quarterly NAV return during the initial dip (negative)
            int nav_initial_depreciation_qtrs = 0;      ///< Length of the initial dip in quarters

            /**
             * @brief Validate parameter ranges.
             * @throws std::invalid_argument if a value is out of range.
             */
            void validate() const;

            nlohmann::json to_json() const;
            static ModelingAssumption from_json(const nlohmann::json &j);
        };

        /// Assumptions keyed by strategy name.
        using AssumptionMap = std::map<std::string, ModelingAssumption>;

    } // namespace model
} // namespace privcap

#endif // PRIVCAP_MODEL_FUND_HPP
