/**
 * @file cash_flow.cpp
 * @brief CashFlow record helpers and JSON conversion.
 */

#include "model/cash_flow.hpp"
#include "model/date_utils.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace privcap
{
    namespace model
    {

        namespace
        {

            std::string to_lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return std::tolower(c); });
                return s;
            }

        } // anonymous namespace

        std::string to_string(CashFlowType type)
        {
            switch (type)
            {
            case CashFlowType::CALL_INVESTMENT:
                return "call_investment";
            case CashFlowType::CALL_FEES:
                return "call_fees";
            case CashFlowType::DISTRIBUTION_RETURN_OF_CAPITAL:
                return "distribution_return_of_capital";
            case CashFlowType::DISTRIBUTION_PROFIT:
                return "distribution_profit";
            case CashFlowType::NAV_UPDATE:
                return "nav_update";
            }
            return "unknown";
        }

        CashFlowType parse_cash_flow_type(const std::string &name)
        {
            std::string s = to_lower(name);
            if (s == "call_investment")
                return CashFlowType::CALL_INVESTMENT;
            if (s == "call_fees")
                return CashFlowType::CALL_FEES;
            if (s == "distribution_return_of_capital")
                return CashFlowType::DISTRIBUTION_RETURN_OF_CAPITAL;
            if (s == "distribution_profit")
                return CashFlowType::DISTRIBUTION_PROFIT;
            if (s == "nav_update")
                return CashFlowType::NAV_UPDATE;
            throw std::invalid_argument(
                "Unknown cash flow type: '" + name + "'. Valid options: call_investment, call_fees, "
                                                     "distribution_return_of_capital, distribution_profit, nav_update");
        }

        bool CashFlow::is_fee() const
        {
            return to_string(type).find("fee") != std::string::npos;
        }

        nlohmann::json CashFlow::to_json() const
        {
            return nlohmann::json{
                {"transaction_id", transaction_id},
                {"fund_id", fund_id},
                {"date", date},
                {"type", to_string(type)},
                {"amount", amount},
                {"description", description}};
        }

        CashFlow CashFlow::from_json(const nlohmann::json &j)
        {
            for (const char *key : {"fund_id", "date", "type", "amount"})
            {
                if (!j.contains(key))
                {
                    throw std::invalid_argument(std::string("Cash flow record must specify '") + key + "'");
                }
            }

            CashFlow cf;
            cf.transaction_id = j.value("transaction_id", 0LL);
            cf.fund_id = j.at("fund_id").get<int>();
            cf.date = j.at("date").get<std::string>();
            require_valid_date(cf.date);
            cf.type = parse_cash_flow_type(j.at("type").get<std::string>());
            cf.amount = j.at("amount").get<double>();
            cf.description = j.value("description", "");
            return cf;
        }

        std::vector<CashFlow> sort_by_date(const std::vector<CashFlow> &flows)
        {
            std::vector<CashFlow> sorted(flows);
            std::stable_sort(sorted.begin(), sorted.end(),
                             [](const CashFlow &a, const CashFlow &b)
                             { return a.date < b.date; });
            return sorted;
        }

    } // namespace model
} // namespace privcap
