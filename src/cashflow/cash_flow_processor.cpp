/**
 * @file cash_flow_processor.cpp
 * @brief Implementation of CashFlowProcessor.
 */

#include "cashflow/cash_flow_processor.hpp"
#include "model/date_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iterator>
#include <stdexcept>

namespace privcap
{
    namespace cashflow
    {

        using model::CashFlow;

        namespace
        {

            std::string to_lower(std::string s)
            {
                std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                               { return std::tolower(c); });
                return s;
            }

        } // anonymous namespace

        // ===================================================================
        // Period names
        // ===================================================================

        std::string to_string(AggregationPeriod period)
        {
            switch (period)
            {
            case AggregationPeriod::MONTHLY:
                return "monthly";
            case AggregationPeriod::QUARTERLY:
                return "quarterly";
            case AggregationPeriod::YEARLY:
                return "yearly";
            case AggregationPeriod::ALL_TIME:
                return "all_time";
            }
            return "unknown";
        }

        AggregationPeriod parse_period(const std::string &name)
        {
            auto s = to_lower(name);
            if (s == "monthly" || s == "m")
                return AggregationPeriod::MONTHLY;
            if (s == "quarterly" || s == "q")
                return AggregationPeriod::QUARTERLY;
            if (s == "yearly" || s == "annual" || s == "annually" || s == "y")
                return AggregationPeriod::YEARLY;
            if (s == "all_time" || s == "all")
                return AggregationPeriod::ALL_TIME;
            throw std::invalid_argument("Invalid aggregation period: " + name);
        }

        // ===================================================================
        // Serialization
        // ===================================================================

        nlohmann::json JCurvePoint::to_json() const
        {
            return nlohmann::json{
                {"period", period},
                {"net_flow", net_flow},
                {"cumulative_flow", cumulative_flow}};
        }

        nlohmann::json YtdMetrics::to_json() const
        {
            return nlohmann::json{
                {"ytd_calls", calls},
                {"ytd_distributions", distributions},
                {"ytd_net_flow", net_flow},
                {"ytd_transaction_count", transaction_count},
                {"reference_year", reference_year}};
        }

        nlohmann::json CashFlowSummary::to_json() const
        {
            nlohmann::json curve = nlohmann::json::array();
            for (const auto &point : j_curve)
            {
                curve.push_back(point.to_json());
            }

            nlohmann::json j{
                {"total_calls", total_calls},
                {"total_distributions", total_distributions},
                {"net_cash_flow", net_cash_flow},
                {"call_count", call_count},
                {"distribution_count", distribution_count},
                {"total_transactions", total_transactions},
                {"period", to_string(period)},
                {"aggregated_by_period", aggregated_by_period},
                {"j_curve", curve},
                {"ytd_metrics", ytd.to_json()}};
            j["earliest_date"] = earliest_date ? nlohmann::json(*earliest_date) : nlohmann::json(nullptr);
            j["latest_date"] = latest_date ? nlohmann::json(*latest_date) : nlohmann::json(nullptr);
            return j;
        }

        // ===================================================================
        // Aggregation
        // ===================================================================

        std::string CashFlowProcessor::period_key(const std::string &date, AggregationPeriod period)
        {
            model::require_valid_date(date);

            switch (period)
            {
            case AggregationPeriod::YEARLY:
                return date.substr(0, 4);
            case AggregationPeriod::QUARTERLY:
                return date.substr(0, 4) + "-Q" + std::to_string(model::quarter_of(date));
            case AggregationPeriod::MONTHLY:
                return date.substr(0, 7);
            case AggregationPeriod::ALL_TIME:
                return "all_time";
            }
            return "all_time";
        }

        std::map<std::string, double> CashFlowProcessor::aggregate_by_period(
            const std::vector<CashFlow> &flows,
            AggregationPeriod period)
        {
            std::map<std::string, double> aggregated;
            for (const auto &cf : flows)
            {
                if (!cf.is_cash_movement())
                    continue;
                aggregated[period_key(cf.date, period)] += cf.amount;
            }
            return aggregated;
        }

        std::vector<CumulativePoint> CashFlowProcessor::calculate_cumulative_cash_flows(
            const std::vector<CashFlow> &flows)
        {
            std::vector<CumulativePoint> series;
            double cumulative = 0.0;

            for (const auto &cf : model::sort_by_date(flows))
            {
                if (!cf.is_cash_movement())
                    continue;
                cumulative += cf.amount;
                series.push_back({cf.date, cumulative});
            }
            return series;
        }

        CallsAndDistributions CashFlowProcessor::separate_calls_and_distributions(
            const std::vector<CashFlow> &flows,
            bool include_fees)
        {
            CallsAndDistributions split;
            for (const auto &cf : flows)
            {
                if (cf.is_call())
                {
                    if (include_fees || !cf.is_fee())
                    {
                        split.calls.push_back(cf);
                    }
                }
                else if (cf.is_distribution())
                {
                    split.distributions.push_back(cf);
                }
            }
            return split;
        }

        double CashFlowProcessor::calculate_net_cash_flow(
            const std::vector<CashFlow> &calls,
            const std::vector<CashFlow> &distributions)
        {
            double total_distributions = 0.0;
            for (const auto &cf : distributions)
            {
                total_distributions += cf.amount;
            }
            return total_distributions - sum_magnitudes(calls);
        }

        // ===================================================================
        // Filters
        // ===================================================================

        std::vector<CashFlow> CashFlowProcessor::filter_by_date_range(
            const std::vector<CashFlow> &flows,
            const std::optional<std::string> &start_date,
            const std::optional<std::string> &end_date)
        {
            if (start_date)
                model::require_valid_date(*start_date);
            if (end_date)
                model::require_valid_date(*end_date);

            std::vector<CashFlow> filtered;
            for (const auto &cf : flows)
            {
                if (start_date && cf.date < *start_date)
                    continue;
                if (end_date && cf.date > *end_date)
                    continue;
                filtered.push_back(cf);
            }
            return filtered;
        }

        std::vector<CashFlow> CashFlowProcessor::filter_by_fund(
            const std::vector<CashFlow> &flows,
            const std::vector<int> &fund_ids)
        {
            std::vector<CashFlow> filtered;
            std::copy_if(flows.begin(), flows.end(), std::back_inserter(filtered),
                         [&fund_ids](const CashFlow &cf)
                         {
                             return std::find(fund_ids.begin(), fund_ids.end(), cf.fund_id) != fund_ids.end();
                         });
            return filtered;
        }

        // ===================================================================
        // J-curve and YTD
        // ===================================================================

        std::vector<JCurvePoint> CashFlowProcessor::calculate_j_curve(
            const std::vector<CashFlow> &flows,
            AggregationPeriod period)
        {
            // std::map iterates keys in lexicographic order
            auto aggregated = aggregate_by_period(flows, period);

            std::vector<JCurvePoint> curve;
            curve.reserve(aggregated.size());
            double cumulative = 0.0;

            for (const auto &entry : aggregated)
            {
                cumulative += entry.second;
                curve.push_back({entry.first, entry.second, cumulative});
            }
            return curve;
        }

        YtdMetrics CashFlowProcessor::calculate_ytd_metrics(
            const std::vector<CashFlow> &flows,
            const std::string &reference_date)
        {
            auto window = filter_by_date_range(flows, model::year_start(reference_date), reference_date);
            auto split = separate_calls_and_distributions(window, true);

            YtdMetrics ytd;
            ytd.calls = sum_magnitudes(split.calls);
            ytd.distributions = sum_magnitudes(split.distributions);
            ytd.net_flow = ytd.distributions - ytd.calls;
            ytd.transaction_count = static_cast<int>(window.size());
            ytd.reference_year = model::extract_year(reference_date);
            return ytd;
        }

        CashFlowSummary CashFlowProcessor::generate_cash_flow_summary(
            const std::vector<CashFlow> &flows,
            bool include_fees,
            AggregationPeriod period,
            const std::string &reference_date)
        {
            auto split = separate_calls_and_distributions(flows, include_fees);

            CashFlowSummary summary;
            summary.period = period;
            summary.total_calls = sum_magnitudes(split.calls);
            summary.total_distributions = sum_magnitudes(split.distributions);
            summary.net_cash_flow = summary.total_distributions - summary.total_calls;
            summary.call_count = static_cast<int>(split.calls.size());
            summary.distribution_count = static_cast<int>(split.distributions.size());
            summary.total_transactions = static_cast<int>(flows.size());

            if (!flows.empty())
            {
                auto bounds = std::minmax_element(flows.begin(), flows.end(),
                                                  [](const CashFlow &a, const CashFlow &b)
                                                  { return a.date < b.date; });
                summary.earliest_date = bounds.first->date;
                summary.latest_date = bounds.second->date;
            }

            summary.aggregated_by_period = aggregate_by_period(flows, period);
            summary.j_curve = calculate_j_curve(flows, period);
            summary.ytd = calculate_ytd_metrics(flows, reference_date);
            return summary;
        }

        double CashFlowProcessor::sum_magnitudes(const std::vector<CashFlow> &flows)
        {
            double total = 0.0;
            for (const auto &cf : flows)
            {
                total += std::abs(cf.amount);
            }
            return total;
        }

    } // namespace cashflow
} // namespace privcap
