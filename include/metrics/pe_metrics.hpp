/**
 * @file pe_metrics.hpp
 * @brief Private-capital performance metrics (IRR, TVPI, DPI, RVPI, MOIC).
 *
 * Sign convention: cash_flows are signed raw amounts. Paid-in is the
 * magnitude of the negative flows, distributions the sum of the positive
 * flows. Any ratio whose denominator is not strictly positive is reported
 * as absent and a note explains why.
 *
 * IRR uses the terminal-mark convention: the current NAV is treated as a
 * final inflow dated at the last transaction date.
 */

#ifndef PRIVCAP_METRICS_PE_METRICS_HPP
#define PRIVCAP_METRICS_PE_METRICS_HPP

#include "metrics/xirr_solver.hpp"
#include "model/cash_flow.hpp"
#include "model/fund.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace privcap
{
    namespace metrics
    {

        /**
         * @struct MetricsResult
         * @brief Performance snapshot of one entity or a pooled group.
         */
        struct MetricsResult
        {
            double paid_in = 0.0;
            double distributions = 0.0;
            double current_nav = 0.0;
            double total_value = 0.0;          ///< distributions + current_nav
            double total_commitment = 0.0;
            double unfunded_commitment = 0.0;  ///< total_commitment - paid_in

            std::optional<double> irr;
            std::optional<double> tvpi;
            std::optional<double> dpi;
            std::optional<double> rvpi;
            std::optional<double> moic;
            std::optional<double> called_percent;      ///< 0..100 scale
            std::optional<double> distributed_percent; ///< 0..100 scale

            XirrStatus irr_status = XirrStatus::NOT_COMPUTED;
            int entity_count = 1;
            std::vector<std::string> notes; ///< Reasons for absent fields

            nlohmann::json to_json() const;
        };

        // Ratio metrics. Each returns std::nullopt when the denominator is <= 0.

        std::optional<double> calculate_tvpi(double total_value, double paid_in);
        std::optional<double> calculate_dpi(double distributions, double paid_in);
        std::optional<double> calculate_rvpi(double nav, double paid_in);
        std::optional<double> calculate_moic(double total_value, double invested_capital);
        std::optional<double> calculate_called_percent(double paid_in, double total_commitment);
        std::optional<double> calculate_distributed_percent(double distributions, double total_commitment);

        /**
         * @brief Recompute every ratio field of a result from its totals.
         *
         * total_value and unfunded_commitment are refreshed as well. A note is
         * appended for each ratio that comes out absent.
         */
        void compute_ratios(MetricsResult &result);

        /**
         * @brief Complete metric set for one entity's dated cash flows.
         *
         * @param cash_flows Signed amounts (nav_update excluded by the caller)
         * @param dates Dates aligned with cash_flows
         * @param total_commitment Committed capital
         * @param current_nav Latest mark-to-market NAV
         * @param options IRR solver controls
         * @return MetricsResult with entity_count = 1
         */
        MetricsResult calculate_all_metrics(const std::vector<double> &cash_flows,
                                            const std::vector<std::string> &dates,
                                            double total_commitment,
                                            double current_nav,
                                            const XirrOptions &options = XirrOptions());

        /**
         * @brief Most recent nav_update amount for a fund.
         *
         * The latest date wins; among records on the same date, the one later
         * in the input wins.
         * @return std::nullopt if the fund has no nav_update records.
         */
        std::optional<double> latest_nav_mark(const std::vector<model::CashFlow> &records, int fund_id);

        /**
         * @brief Metrics for one fund from the raw ledger.
         *
         * Records belonging to other funds are ignored. current_nav comes from
         * the latest nav_update (0 with a note when there is none).
         */
        MetricsResult compute_fund_metrics(const model::Fund &fund,
                                           const std::vector<model::CashFlow> &records,
                                           const XirrOptions &options = XirrOptions());

    } // namespace metrics
} // namespace privcap

#endif // PRIVCAP_METRICS_PE_METRICS_HPP
