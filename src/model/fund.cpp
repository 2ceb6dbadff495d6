/**
 * @file fund.cpp
 * @brief JSON conversion and validation for Fund and ModelingAssumption.
 */

#include "model/fund.hpp"

#include <stdexcept>

namespace privcap
{
    namespace model
    {

        nlohmann::json Fund::to_json() const
        {
            return nlohmann::json{
                {"fund_id", fund_id},
                {"fund_name", fund_name},
                {"vintage_year", vintage_year},
                {"primary_strategy", primary_strategy},
                {"sub_strategy", sub_strategy},
                {"total_commitment", total_commitment}};
        }

        Fund Fund::from_json(const nlohmann::json &j)
        {
            if (!j.contains("fund_id"))
            {
                throw std::invalid_argument("Fund record must specify 'fund_id'");
            }

            Fund fund;
            fund.fund_id = j.at("fund_id").get<int>();
            fund.fund_name = j.value("fund_name", "");
            fund.vintage_year = j.value("vintage_year", 0);
            fund.primary_strategy = j.value("primary_strategy", "");
            fund.sub_strategy = j.value("sub_strategy", "");
            fund.total_commitment = j.value("total_commitment", 0.0);
            return fund;
        }

        void ModelingAssumption::validate() const
        {
            if (expected_moic < 0.0)
            {
                throw std::invalid_argument(
                    "expected_moic must be non-negative, got: " + std::to_string(expected_moic));
            }
            if (target_irr <= -1.0)
            {
                throw std::invalid_argument(
                    "target_irr must be greater than -100%, got: " + std::to_string(target_irr));
            }
            if (nav_initial_depreciation_qtrs < 0)
            {
                throw std::invalid_argument(
                    "nav_initial_depreciation_qtrs must be non-negative, got: " +
                    std::to_string(nav_initial_depreciation_qtrs));
            }
            if (investment_period_years < 0.0 || fund_life_years < 0.0)
            {
                throw std::invalid_argument("Fund period lengths must be non-negative");
            }
        }

        nlohmann::json ModelingAssumption::to_json() const
        {
            return nlohmann::json{
                {"strategy", strategy},
                {"expected_moic", expected_moic},
                {"target_irr", target_irr},
                {"investment_period_years", investment_period_years},
                {"fund_life_years", fund_life_years},
                {"nav_initial_qtr_depreciation", nav_initial_qtr_depreciation},
                {"nav_initial_depreciation_qtrs", nav_initial_depreciation_qtrs}};
        }

        ModelingAssumption ModelingAssumption::from_json(const nlohmann::json &j)
        {
            ModelingAssumption a;
            a.strategy = j.value("strategy", "");
            a.expected_moic = j.value("expected_moic", a.expected_moic);
            a.target_irr = j.value("target_irr", a.target_irr);
            a.investment_period_years = j.value("investment_period_years", a.investment_period_years);
            a.fund_life_years = j.value("fund_life_years", a.fund_life_years);
            a.nav_initial_qtr_depreciation = j.value("nav_initial_qtr_depreciation", a.nav_initial_qtr_depreciation);
            a.nav_initial_depreciation_qtrs = j.value("nav_initial_depreciation_qtrs", a.nav_initial_depreciation_qtrs);
            a.validate();
            return a;
        }

    } // namespace model
} // namespace privcap
