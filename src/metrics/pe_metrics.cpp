/**
 * @file pe_metrics.cpp
 * @brief Implementation of private-capital performance metrics.
 */

#include "metrics/pe_metrics.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace privcap
{
    namespace metrics
    {

        namespace
        {

            std::optional<double> safe_ratio(double numerator, double denominator)
            {
                if (denominator <= 0.0)
                {
                    return std::nullopt;
                }
                return numerator / denominator;
            }

            nlohmann::json optional_to_json(const std::optional<double> &value)
            {
                return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
            }

        } // anonymous namespace

        // ===================================================================
        // Ratios
        // ===================================================================

        std::optional<double> calculate_tvpi(double total_value, double paid_in)
        {
            return safe_ratio(total_value, paid_in);
        }

        std::optional<double> calculate_dpi(double distributions, double paid_in)
        {
            return safe_ratio(distributions, paid_in);
        }

        std::optional<double> calculate_rvpi(double nav, double paid_in)
        {
            return safe_ratio(nav, paid_in);
        }

        std::optional<double> calculate_moic(double total_value, double invested_capital)
        {
            return safe_ratio(total_value, invested_capital);
        }

        std::optional<double> calculate_called_percent(double paid_in, double total_commitment)
        {
            auto ratio = safe_ratio(paid_in, total_commitment);
            if (ratio)
                *ratio *= 100.0;
            return ratio;
        }

        std::optional<double> calculate_distributed_percent(double distributions, double total_commitment)
        {
            auto ratio = safe_ratio(distributions, total_commitment);
            if (ratio)
                *ratio *= 100.0;
            return ratio;
        }

        void compute_ratios(MetricsResult &result)
        {
            result.total_value = result.distributions + result.current_nav;
            result.unfunded_commitment = result.total_commitment - result.paid_in;

            result.tvpi = calculate_tvpi(result.total_value, result.paid_in);
            result.dpi = calculate_dpi(result.distributions, result.paid_in);
            result.rvpi = calculate_rvpi(result.current_nav, result.paid_in);
            result.moic = calculate_moic(result.total_value, result.paid_in);
            result.called_percent = calculate_called_percent(result.paid_in, result.total_commitment);
            result.distributed_percent = calculate_distributed_percent(result.distributions,
                                                                       result.total_commitment);

            if (!result.tvpi)
            {
                result.notes.push_back("tvpi, dpi, rvpi, moic: paid-in capital is not positive");
            }
            if (!result.called_percent)
            {
                result.notes.push_back("called_percent, distributed_percent: commitment is not positive");
            }
        }

        // ===================================================================
        // Entity metrics
        // ===================================================================

        MetricsResult calculate_all_metrics(const std::vector<double> &cash_flows,
                                            const std::vector<std::string> &dates,
                                            double total_commitment,
                                            double current_nav,
                                            const XirrOptions &options)
        {
            MetricsResult result;
            result.total_commitment = total_commitment;
            result.current_nav = current_nav;

            for (double cf : cash_flows)
            {
                if (cf < 0.0)
                    result.paid_in += std::abs(cf);
                else if (cf > 0.0)
                    result.distributions += cf;
            }

            compute_ratios(result);

            if (cash_flows.empty())
            {
                result.irr_status = XirrStatus::INSUFFICIENT_DATA;
                result.notes.push_back("irr: no cash flows");
                return result;
            }

            std::vector<double> irr_flows;
            std::vector<std::string> irr_dates;

            if (cash_flows.size() == dates.size())
            {
                std::vector<size_t> order(cash_flows.size());
                std::iota(order.begin(), order.end(), 0);
                std::stable_sort(order.begin(), order.end(), [&dates](size_t a, size_t b)
                                 { return dates[a] < dates[b]; });

                irr_flows.reserve(order.size() + 1);
                irr_dates.reserve(order.size() + 1);
                for (size_t idx : order)
                {
                    irr_flows.push_back(cash_flows[idx]);
                    irr_dates.push_back(dates[idx]);
                }

                // Terminal mark
                irr_flows.push_back(current_nav);
                irr_dates.push_back(irr_dates.back());
            }
            else
            {
                // Let the solver report the mismatch
                irr_flows = cash_flows;
                irr_dates = dates;
            }

            XirrResult irr = XirrSolver(options).solve(irr_flows, irr_dates);
            result.irr = irr.rate;
            result.irr_status = irr.status;
            if (!irr.success())
            {
                result.notes.push_back("irr: " + irr.message);
            }
            return result;
        }

        std::optional<double> latest_nav_mark(const std::vector<model::CashFlow> &records, int fund_id)
        {
            const model::CashFlow *latest = nullptr;
            for (const auto &cf : records)
            {
                if (cf.fund_id != fund_id || !cf.is_nav_update())
                    continue;
                if (latest == nullptr || cf.date >= latest->date)
                {
                    latest = &cf;
                }
            }

            if (latest == nullptr)
                return std::nullopt;
            return latest->amount;
        }

        MetricsResult compute_fund_metrics(const model::Fund &fund,
                                           const std::vector<model::CashFlow> &records,
                                           const XirrOptions &options)
        {
            std::vector<double> amounts;
            std::vector<std::string> dates;
            for (const auto &cf : records)
            {
                if (cf.fund_id != fund.fund_id || !cf.is_cash_movement())
                    continue;
                amounts.push_back(cf.amount);
                dates.push_back(cf.date);
            }

            auto nav = latest_nav_mark(records, fund.fund_id);

            MetricsResult result = calculate_all_metrics(amounts, dates, fund.total_commitment,
                                                         nav.value_or(0.0), options);
            if (!nav)
            {
                result.notes.push_back("current_nav: no nav_update for fund " +
                                       std::to_string(fund.fund_id) + ", assumed 0");
            }
            return result;
        }

        nlohmann::json MetricsResult::to_json() const
        {
            return nlohmann::json{
                {"paid_in", paid_in},
                {"distributions", distributions},
                {"current_nav", current_nav},
                {"total_value", total_value},
                {"total_commitment", total_commitment},
                {"unfunded_commitment", unfunded_commitment},
                {"irr", optional_to_json(irr)},
                {"tvpi", optional_to_json(tvpi)},
                {"dpi", optional_to_json(dpi)},
                {"rvpi", optional_to_json(rvpi)},
                {"moic", optional_to_json(moic)},
                {"called_percent", optional_to_json(called_percent)},
                {"distributed_percent", optional_to_json(distributed_percent)},
                {"irr_status", to_string(irr_status)},
                {"entity_count", entity_count},
                {"notes", notes}};
        }

    } // namespace metrics
} // namespace privcap
