/**
 * @file metrics_aggregator.hpp
 * @brief Pooled metrics across funds and hierarchy-level rollups.
 *
 * Pooled multiples are recomputed from summed totals (a paid-in weighted
 * view), never averaged. A pooled IRR needs the underlying dated flows and
 * is computed by aggregate_irr().
 */

#ifndef PRIVCAP_METRICS_METRICS_AGGREGATOR_HPP
#define PRIVCAP_METRICS_METRICS_AGGREGATOR_HPP

#include "metrics/pe_metrics.hpp"
#include "metrics/xirr_solver.hpp"
#include "model/cash_flow.hpp"
#include "model/fund.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace privcap
{
    namespace metrics
    {

        /**
         * @enum HierarchyLevel
         * @brief Grouping key for rollups.
         */
        enum class HierarchyLevel
        {
            PORTFOLIO,    ///< Everything in one group
            STRATEGY,     ///< By Fund::primary_strategy
            SUB_STRATEGY, ///< By Fund::sub_strategy
            FUND          ///< One group per fund
        };

        std::string to_string(HierarchyLevel level);

        /**
         * @brief Parse a level name (case-insensitive, '-' or '_' separators).
         * @throws std::invalid_argument for unknown names.
         */
        HierarchyLevel parse_hierarchy_level(const std::string &name);

        /**
         * @brief Group key of a fund at a level.
         *
         * Empty strategy names map to "Unclassified"; FUND level keys by fund_id.
         */
        std::string hierarchy_key(const model::Fund &fund, HierarchyLevel level);

        /**
         * @brief Pool per-entity results.
         *
         * Sums paid_in, distributions, current_nav and total_commitment and
         * recomputes all ratios from the totals. irr is left absent with status
         * NOT_COMPUTED.
         */
        MetricsResult aggregate_metrics(const std::vector<MetricsResult> &results);

        /**
         * @brief Pool per-entity results and fill irr from the combined flows.
         */
        MetricsResult aggregate_metrics(const std::vector<MetricsResult> &results,
                                        const std::vector<model::CashFlow> &combined_flows,
                                        const XirrOptions &options = XirrOptions());

        /**
         * @brief IRR over the union of several funds' records.
         *
         * Cash movements are ordered by date (stable). The terminal value is
         * the sum of each fund's latest nav_update, appended at the last
         * cash-movement date.
         */
        XirrResult aggregate_irr(const std::vector<model::CashFlow> &combined_flows,
                                 const XirrOptions &options = XirrOptions());

        /**
         * @brief As above with an explicit terminal NAV; nav_update records are ignored.
         */
        XirrResult aggregate_irr(const std::vector<model::CashFlow> &combined_flows,
                                 double terminal_nav,
                                 const XirrOptions &options = XirrOptions());

        /**
         * @struct HierarchyGroup
         * @brief One rollup row.
         */
        struct HierarchyGroup
        {
            std::string key;
            HierarchyLevel level = HierarchyLevel::PORTFOLIO;
            std::vector<int> fund_ids; ///< Funds whose metrics were pooled
            MetricsResult metrics;

            nlohmann::json to_json() const;
        };

        /**
         * @brief Metrics for every group at the requested level.
         *
         * Each fund's notes are copied into its group's notes as "fund N: ...".
         * A malformed record date only leaves the IRR absent; the fund still
         * counts toward the group totals. A fund whose computation throws
         * (negative commitment) is left out of the totals with the error noted.
         * Groups are returned in key order.
         */
        std::vector<HierarchyGroup> compute_hierarchy_metrics(const std::vector<model::Fund> &funds,
                                                              const std::vector<model::CashFlow> &records,
                                                              HierarchyLevel level,
                                                              const XirrOptions &options = XirrOptions());

    } // namespace metrics
} // namespace privcap

#endif // PRIVCAP_METRICS_METRICS_AGGREGATOR_HPP
