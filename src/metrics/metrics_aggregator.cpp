/**
 * @file metrics_aggregator.cpp
 * @brief Implementation of pooled and hierarchical metrics.
 */

#include "metrics/metrics_aggregator.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <map>
#include <set>
#include <stdexcept>

namespace privcap
{
    namespace metrics
    {

        namespace
        {

            std::string normalize(const std::string &name)
            {
                std::string s;
                for (unsigned char c : name)
                {
                    s += (c == '-' || c == ' ') ? '_' : static_cast<char>(std::tolower(c));
                }
                return s;
            }

            std::string or_unclassified(const std::string &name)
            {
                return name.empty() ? "Unclassified" : name;
            }

            XirrResult solve_with_terminal(const std::vector<model::CashFlow> &combined_flows,
                                           double terminal_nav,
                                           const XirrOptions &options)
            {
                std::vector<model::CashFlow> movements;
                for (const auto &cf : combined_flows)
                {
                    if (cf.is_cash_movement())
                        movements.push_back(cf);
                }

                std::vector<double> amounts;
                std::vector<std::string> dates;
                amounts.reserve(movements.size() + 1);
                dates.reserve(movements.size() + 1);
                for (const auto &cf : model::sort_by_date(movements))
                {
                    amounts.push_back(cf.amount);
                    dates.push_back(cf.date);
                }

                if (!amounts.empty())
                {
                    amounts.push_back(terminal_nav);
                    dates.push_back(dates.back());
                }

                return XirrSolver(options).solve(amounts, dates);
            }

            MetricsResult pool_totals(const std::vector<MetricsResult> &results)
            {
                MetricsResult pooled;
                pooled.entity_count = static_cast<int>(results.size());

                for (const auto &r : results)
                {
                    pooled.paid_in += r.paid_in;
                    pooled.distributions += r.distributions;
                    pooled.current_nav += r.current_nav;
                    pooled.total_commitment += r.total_commitment;
                }

                compute_ratios(pooled);
                pooled.irr_status = XirrStatus::NOT_COMPUTED;
                return pooled;
            }

        } // anonymous namespace

        std::string to_string(HierarchyLevel level)
        {
            switch (level)
            {
            case HierarchyLevel::PORTFOLIO:
                return "portfolio";
            case HierarchyLevel::STRATEGY:
                return "strategy";
            case HierarchyLevel::SUB_STRATEGY:
                return "sub_strategy";
            case HierarchyLevel::FUND:
                return "fund";
            }
            return "unknown";
        }

        HierarchyLevel parse_hierarchy_level(const std::string &name)
        {
            auto s = normalize(name);
            if (s == "portfolio")
                return HierarchyLevel::PORTFOLIO;
            if (s == "strategy" || s == "primary_strategy")
                return HierarchyLevel::STRATEGY;
            if (s == "sub_strategy" || s == "substrategy")
                return HierarchyLevel::SUB_STRATEGY;
            if (s == "fund")
                return HierarchyLevel::FUND;
            throw std::invalid_argument("Unknown hierarchy level: " + name);
        }

        std::string hierarchy_key(const model::Fund &fund, HierarchyLevel level)
        {
            switch (level)
            {
            case HierarchyLevel::PORTFOLIO:
                return "Portfolio";
            case HierarchyLevel::STRATEGY:
                return or_unclassified(fund.primary_strategy);
            case HierarchyLevel::SUB_STRATEGY:
                return or_unclassified(fund.sub_strategy);
            case HierarchyLevel::FUND:
                return std::to_string(fund.fund_id);
            }
            return "Portfolio";
        }

        // ===================================================================
        // Pooling
        // ===================================================================

        MetricsResult aggregate_metrics(const std::vector<MetricsResult> &results)
        {
            MetricsResult pooled = pool_totals(results);
            pooled.notes.push_back("irr: pooled IRR requires combined cash flows (see aggregate_irr)");
            return pooled;
        }

        MetricsResult aggregate_metrics(const std::vector<MetricsResult> &results,
                                        const std::vector<model::CashFlow> &combined_flows,
                                        const XirrOptions &options)
        {
            MetricsResult pooled = pool_totals(results);

            XirrResult irr = aggregate_irr(combined_flows, options);
            pooled.irr = irr.rate;
            pooled.irr_status = irr.status;
            if (!irr.success())
            {
                pooled.notes.push_back("irr: " + irr.message);
            }
            return pooled;
        }

        XirrResult aggregate_irr(const std::vector<model::CashFlow> &combined_flows,
                                 const XirrOptions &options)
        {
            std::set<int> fund_ids;
            for (const auto &cf : combined_flows)
            {
                fund_ids.insert(cf.fund_id);
            }

            double terminal_nav = 0.0;
            for (int id : fund_ids)
            {
                terminal_nav += latest_nav_mark(combined_flows, id).value_or(0.0);
            }

            return solve_with_terminal(combined_flows, terminal_nav, options);
        }

        XirrResult aggregate_irr(const std::vector<model::CashFlow> &combined_flows,
                                 double terminal_nav,
                                 const XirrOptions &options)
        {
            return solve_with_terminal(combined_flows, terminal_nav, options);
        }

        // ===================================================================
        // Hierarchy
        // ===================================================================

        nlohmann::json HierarchyGroup::to_json() const
        {
            return nlohmann::json{
                {"key", key},
                {"level", to_string(level)},
                {"fund_ids", fund_ids},
                {"metrics", metrics.to_json()}};
        }

        std::vector<HierarchyGroup> compute_hierarchy_metrics(const std::vector<model::Fund> &funds,
                                                              const std::vector<model::CashFlow> &records,
                                                              HierarchyLevel level,
                                                              const XirrOptions &options)
        {
            struct Accumulator
            {
                std::vector<int> fund_ids;
                std::vector<MetricsResult> results;
                std::vector<model::CashFlow> flows;
                std::vector<std::string> notes;
            };

            std::map<std::string, Accumulator> groups;

            for (const auto &fund : funds)
            {
                auto &acc = groups[hierarchy_key(fund, level)];

                std::vector<model::CashFlow> fund_flows;
                std::copy_if(records.begin(), records.end(), std::back_inserter(fund_flows),
                             [&fund](const model::CashFlow &cf)
                             { return cf.fund_id == fund.fund_id; });

                const std::string prefix = "fund " + std::to_string(fund.fund_id) + ": ";
                try
                {
                    if (fund.total_commitment < 0.0)
                    {
                        throw std::invalid_argument("negative total_commitment");
                    }

                    // A bad record only costs the fields it touches; the fund stays in the totals
                    MetricsResult result = compute_fund_metrics(fund, fund_flows, options);
                    for (const auto &note : result.notes)
                    {
                        acc.notes.push_back(prefix + note);
                    }
                    acc.results.push_back(std::move(result));
                }
                catch (const std::exception &e)
                {
                    acc.notes.push_back(prefix + e.what());
                    continue;
                }

                acc.fund_ids.push_back(fund.fund_id);
                acc.flows.insert(acc.flows.end(), fund_flows.begin(), fund_flows.end());
            }

            std::vector<HierarchyGroup> rollup;
            rollup.reserve(groups.size());

            for (auto &entry : groups)
            {
                HierarchyGroup group;
                group.key = entry.first;
                group.level = level;
                group.fund_ids = entry.second.fund_ids;
                group.metrics = aggregate_metrics(entry.second.results, entry.second.flows, options);
                group.metrics.notes.insert(group.metrics.notes.end(),
                                           entry.second.notes.begin(), entry.second.notes.end());
                rollup.push_back(std::move(group));
            }

            return rollup;
        }

    } // namespace metrics
} // namespace privcap
