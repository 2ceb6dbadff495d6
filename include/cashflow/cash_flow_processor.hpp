/**
 * @file cash_flow_processor.hpp
 * @brief Aggregation, filtering and J-curve analysis over cash-flow records.
 *
 * Every function is a pure transformation of the records it is given.
 * nav_update records never contribute to a summed amount: they are
 * valuation marks, not cash.
 *
 * Usage:
 * @code
 *   auto yearly = CashFlowProcessor::aggregate_by_period(flows, AggregationPeriod::YEARLY);
 *   auto curve  = CashFlowProcessor::calculate_j_curve(flows, AggregationPeriod::YEARLY);
 *   auto report = CashFlowProcessor::generate_cash_flow_summary(flows, true,
 *                                                               AggregationPeriod::QUARTERLY,
 *                                                               "2025-12-31");
 * @endcode
 */

#ifndef PRIVCAP_CASHFLOW_CASH_FLOW_PROCESSOR_HPP
#define PRIVCAP_CASHFLOW_CASH_FLOW_PROCESSOR_HPP

#include "model/cash_flow.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace privcap
{
    namespace cashflow
    {

        /**
         * @enum AggregationPeriod
         * @brief Bucket granularity for period aggregation.
         */
        enum class AggregationPeriod
        {
            MONTHLY,   ///< "YYYY-MM"
            QUARTERLY, ///< "YYYY-Qn"
            YEARLY,    ///< "YYYY"
            ALL_TIME   ///< single "all_time" bucket
        };

        std::string to_string(AggregationPeriod period);

        /**
         * @brief Parse a period name (case-insensitive).
         *
         * Accepts monthly/m, quarterly/q, yearly/annual/y, all_time/all.
         * @throws std::invalid_argument for unknown names.
         */
        AggregationPeriod parse_period(const std::string &name);

        /**
         * @struct CumulativePoint
         * @brief Running total after one record.
         */
        struct CumulativePoint
        {
            std::string date;
            double cumulative;
        };

        /**
         * @struct CallsAndDistributions
         * @brief Sign partition of a record set.
         */
        struct CallsAndDistributions
        {
            std::vector<model::CashFlow> calls;
            std::vector<model::CashFlow> distributions;
        };

        /**
         * @struct JCurvePoint
         * @brief Net and cumulative flow for one period bucket.
         */
        struct JCurvePoint
        {
            std::string period;
            double net_flow;
            double cumulative_flow;

            nlohmann::json to_json() const;
        };

        /**
         * @struct YtdMetrics
         * @brief Year-to-date activity up to a reference date.
         */
        struct YtdMetrics
        {
            double calls = 0.0;         ///< Magnitude of calls in the window
            double distributions = 0.0; ///< Distributions in the window
            double net_flow = 0.0;      ///< distributions - calls
            int transaction_count = 0;  ///< Records dated inside the window (all types)
            int reference_year = 0;

            nlohmann::json to_json() const;
        };

        /**
         * @struct CashFlowSummary
         * @brief Composite report over a record set.
         */
        struct CashFlowSummary
        {
            double total_calls = 0.0;
            double total_distributions = 0.0;
            double net_cash_flow = 0.0;
            int call_count = 0;
            int distribution_count = 0;
            int total_transactions = 0;
            std::optional<std::string> earliest_date;
            std::optional<std::string> latest_date;
            AggregationPeriod period = AggregationPeriod::YEARLY;
            std::map<std::string, double> aggregated_by_period;
            std::vector<JCurvePoint> j_curve;
            YtdMetrics ytd;

            nlohmann::json to_json() const;
        };

        /**
         * @class CashFlowProcessor
         * @brief Stateless cash-flow analytics.
         *
         * Thread safety: all methods are static and free of shared state.
         */
        class CashFlowProcessor
        {
        public:
            /**
             * @brief Bucket key of a date for the given period.
             * @throws std::invalid_argument if the date is malformed.
             */
            static std::string period_key(const std::string &date, AggregationPeriod period);

            /**
             * @brief Sum signed amounts per period bucket.
             * @param flows Records in any order.
             * @param period Bucket granularity.
             * @return Map from period key to net amount (keys in lexicographic order).
             */
            static std::map<std::string, double> aggregate_by_period(
                const std::vector<model::CashFlow> &flows,
                AggregationPeriod period);

            /**
             * @brief Running total of signed amounts in date order.
             *
             * Records are sorted ascending by date first (stable, so same-day
             * records keep their input order).
             */
            static std::vector<CumulativePoint> calculate_cumulative_cash_flows(
                const std::vector<model::CashFlow> &flows);

            /**
             * @brief Partition records into calls (amount < 0) and distributions (amount > 0).
             * @param include_fees When false, fee-typed records are dropped from the calls side.
             */
            static CallsAndDistributions separate_calls_and_distributions(
                const std::vector<model::CashFlow> &flows,
                bool include_fees = true);

            /**
             * @brief sum(distributions) - sum(|calls|).
             */
            static double calculate_net_cash_flow(
                const std::vector<model::CashFlow> &calls,
                const std::vector<model::CashFlow> &distributions);

            /**
             * @brief Keep records with start <= date <= end; an absent bound is open.
             */
            static std::vector<model::CashFlow> filter_by_date_range(
                const std::vector<model::CashFlow> &flows,
                const std::optional<std::string> &start_date,
                const std::optional<std::string> &end_date);

            static std::vector<model::CashFlow> filter_by_fund(
                const std::vector<model::CashFlow> &flows,
                const std::vector<int> &fund_ids);

            /**
             * @brief Net and cumulative flow per period, in key order.
             *
             * Keys sort lexicographically, which is chronological for all
             * period types as long as years have four digits.
             */
            static std::vector<JCurvePoint> calculate_j_curve(
                const std::vector<model::CashFlow> &flows,
                AggregationPeriod period = AggregationPeriod::YEARLY);

            /**
             * @brief Calls and distributions between Jan 1 of the reference year and the reference date.
             * @throws std::invalid_argument if reference_date is malformed.
             */
            static YtdMetrics calculate_ytd_metrics(
                const std::vector<model::CashFlow> &flows,
                const std::string &reference_date);

            /**
             * @brief Totals, period buckets, J-curve and YTD in one record.
             */
            static CashFlowSummary generate_cash_flow_summary(
                const std::vector<model::CashFlow> &flows,
                bool include_fees,
                AggregationPeriod period,
                const std::string &reference_date);

        private:
            static double sum_magnitudes(const std::vector<model::CashFlow> &flows);
        };

    } // namespace cashflow
} // namespace privcap

#endif // PRIVCAP_CASHFLOW_CASH_FLOW_PROCESSOR_HPP
