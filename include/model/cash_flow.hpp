/**
 * @file cash_flow.hpp
 * @brief Ledger record shared by every layer of the engine.
 *
 * Sign convention: amounts are stored exactly as booked. Capital leaving
 * the investor (investment calls, fee calls) is negative, capital returned
 * (return of capital, profit) is positive. A nav_update record carries the
 * latest mark-to-market NAV in its amount and is never part of a cash sum.
 */

#ifndef PRIVCAP_MODEL_CASH_FLOW_HPP
#define PRIVCAP_MODEL_CASH_FLOW_HPP

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace privcap
{
    namespace model
    {

        /**
         * @enum CashFlowType
         * @brief Transaction categories booked against a fund.
         */
        enum class CashFlowType
        {
            CALL_INVESTMENT,                ///< Capital drawn for investments
            CALL_FEES,                      ///< Capital drawn for management fees
            DISTRIBUTION_RETURN_OF_CAPITAL, ///< Return of invested cost
            DISTRIBUTION_PROFIT,            ///< Realized gain
            NAV_UPDATE                      ///< Mark-to-market NAV snapshot
        };

        /**
         * @brief snake_case name of a cash-flow type ("call_fees", ...).
         */
        std::string to_string(CashFlowType type);

        /**
         * @brief Parse a snake_case type name (case-insensitive).
         * @throws std::invalid_argument for unknown names.
         */
        CashFlowType parse_cash_flow_type(const std::string &name);

        /**
         * @struct CashFlow
         * @brief One immutable ledger entry.
         */
        struct CashFlow
        {
            long long transaction_id = 0; ///< Source-system identifier
            int fund_id = 0;              ///< Owning fund
            std::string date;             ///< Booking date (YYYY-MM-DD)
            CashFlowType type = CashFlowType::CALL_INVESTMENT;
            double amount = 0.0;          ///< Signed amount (see file comment)
            std::string description;      ///< Free text, optional

            bool is_nav_update() const { return type == CashFlowType::NAV_UPDATE; }

            /// Cash actually moved between investor and fund.
            bool is_cash_movement() const { return !is_nav_update(); }

            bool is_call() const { return is_cash_movement() && amount < 0.0; }
            bool is_distribution() const { return is_cash_movement() && amount > 0.0; }

            /// True when the type name denotes a fee.
            bool is_fee() const;

            nlohmann::json to_json() const;

            /**
             * @brief Build from a JSON object.
             *
             * Required keys: fund_id, date, type, amount.
             * @throws std::invalid_argument on a missing key, bad date or unknown type.
             */
            static CashFlow from_json(const nlohmann::json &j);
        };

        /**
         * @brief Stable chronological ordering of records.
         */
        std::vector<CashFlow> sort_by_date(const std::vector<CashFlow> &flows);

    } // namespace model
} // namespace privcap

#endif // PRIVCAP_MODEL_CASH_FLOW_HPP
