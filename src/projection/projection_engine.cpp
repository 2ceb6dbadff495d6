/**
 * @file projection_engine.cpp
 * @brief Implementation of ProjectionEngine.
 */

#include "projection/projection_engine.hpp"
#include "model/date_utils.hpp"
#include "projection/shape_curves.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace privcap
{
    namespace projection
    {

        namespace
        {

            nlohmann::json series_to_json(const Eigen::VectorXd &v)
            {
                return std::vector<double>(v.data(), v.data() + v.size());
            }

            void require_non_negative_periods(int num_periods)
            {
                if (num_periods < 0)
                {
                    throw std::invalid_argument(
                        "Number of projection periods must be non-negative, got: " + std::to_string(num_periods));
                }
            }

        } // anonymous namespace

        std::string to_string(NavCurveMode mode)
        {
            switch (mode)
            {
            case NavCurveMode::PROFILE_J_CURVE:
                return "profile_j_curve";
            case NavCurveMode::ASSUMPTION_SCHEDULE:
                return "assumption_schedule";
            }
            return "unknown";
        }

        NavCurveMode parse_nav_curve_mode(const std::string &name)
        {
            std::string s = name;
            std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
                           { return std::tolower(c); });

            if (s == "profile_j_curve" || s == "profile" || s == "j_curve")
                return NavCurveMode::PROFILE_J_CURVE;
            if (s == "assumption_schedule" || s == "schedule")
                return NavCurveMode::ASSUMPTION_SCHEDULE;

            throw std::invalid_argument(
                "Unknown NAV curve mode: '" + name + "'. Valid options: profile_j_curve, assumption_schedule");
        }

        // ============================================================================
        // ProjectionConfig Implementation
        // ============================================================================

        void ProjectionConfig::validate() const
        {
            if (management_fee_rate < 0.0)
            {
                throw std::invalid_argument(
                    "management_fee_rate must be non-negative, got: " + std::to_string(management_fee_rate));
            }
            if (fee_step_down_factor < 0.0)
            {
                throw std::invalid_argument(
                    "fee_step_down_factor must be non-negative, got: " + std::to_string(fee_step_down_factor));
            }
            require_non_negative_periods(num_periods);
            model::require_valid_date(as_of_date);
        }

        nlohmann::json ProjectionConfig::to_json() const
        {
            return nlohmann::json{
                {"management_fee_rate", management_fee_rate},
                {"fee_step_down_years", fee_step_down_years},
                {"fee_step_down_factor", fee_step_down_factor},
                {"num_periods", num_periods},
                {"as_of_date", as_of_date},
                {"nav_curve_mode", to_string(nav_curve_mode)},
                {"verbose", verbose}};
        }

        ProjectionConfig ProjectionConfig::from_json(const nlohmann::json &j)
        {
            ProjectionConfig config;
            config.management_fee_rate = j.value("management_fee_rate", config.management_fee_rate);
            config.fee_step_down_years = j.value("fee_step_down_years", config.fee_step_down_years);
            config.fee_step_down_factor = j.value("fee_step_down_factor", config.fee_step_down_factor);
            config.num_periods = j.value("num_periods", config.num_periods);
            config.as_of_date = j.value("as_of_date", config.as_of_date);
            if (j.contains("nav_curve_mode"))
            {
                config.nav_curve_mode = parse_nav_curve_mode(j["nav_curve_mode"].get<std::string>());
            }
            config.verbose = j.value("verbose", config.verbose);
            config.validate();
            return config;
        }

        // ============================================================================
        // Records
        // ============================================================================

        FundState FundState::from_metrics(const model::Fund &fund, const metrics::MetricsResult &metrics)
        {
            FundState state;
            state.fund = fund;
            state.unfunded_commitment = std::max(0.0, metrics.unfunded_commitment);
            state.current_nav = metrics.current_nav;
            return state;
        }

        nlohmann::json FundState::to_json() const
        {
            nlohmann::json j = fund.to_json();
            j["unfunded_commitment"] = unfunded_commitment;
            j["current_nav"] = current_nav;
            return j;
        }

        FundState FundState::from_json(const nlohmann::json &j)
        {
            FundState state;
            state.fund = model::Fund::from_json(j);
            state.unfunded_commitment = j.value("unfunded_commitment", 0.0);
            state.current_nav = j.value("current_nav", 0.0);
            return state;
        }

        nlohmann::json ProjectionPeriod::to_json() const
        {
            return nlohmann::json{
                {"period", period_index},
                {"date", date},
                {"call_investment", call_investment},
                {"management_fees", management_fees},
                {"distribution", distribution},
                {"nav", nav},
                {"nav_change", nav_change}};
        }

        nlohmann::json FundProjection::to_json() const
        {
            nlohmann::json rows = nlohmann::json::array();
            for (const auto &p : periods)
            {
                rows.push_back(p.to_json());
            }
            return nlohmann::json{
                {"fund_id", fund_id},
                {"fund_name", fund_name},
                {"strategy", strategy},
                {"resolved_profile", resolved_profile.to_json()},
                {"used_fallback_profile", used_fallback_profile},
                {"projection", rows},
                {"notes", notes}};
        }

        StrategySeries::StrategySeries(int num_periods)
            : calls(Eigen::VectorXd::Zero(num_periods)),
              distributions(Eigen::VectorXd::Zero(num_periods)),
              fees(Eigen::VectorXd::Zero(num_periods)),
              nav(Eigen::VectorXd::Zero(num_periods))
        {
        }

        nlohmann::json StrategySeries::to_json() const
        {
            return nlohmann::json{
                {"calls", series_to_json(calls)},
                {"distributions", series_to_json(distributions)},
                {"fees", series_to_json(fees)},
                {"nav", series_to_json(nav)}};
        }

        nlohmann::json PortfolioProjection::to_json() const
        {
            nlohmann::json strategies = nlohmann::json::object();
            for (const auto &entry : by_strategy)
            {
                strategies[entry.first] = entry.second.to_json();
            }

            nlohmann::json funds = nlohmann::json::array();
            for (const auto &fp : by_fund)
            {
                funds.push_back(fp.to_json());
            }

            return nlohmann::json{
                {"num_periods", num_periods},
                {"dates", dates},
                {"total_calls", series_to_json(total_calls)},
                {"total_distributions", series_to_json(total_distributions)},
                {"total_fees", series_to_json(total_fees)},
                {"total_nav", series_to_json(total_nav)},
                {"by_strategy", strategies},
                {"by_fund", funds}};
        }

        // ============================================================================
        // ProjectionEngine Implementation
        // ============================================================================

        ProjectionEngine::ProjectionEngine(const ProjectionConfig &config, const StrategyProfileTable &profiles)
            : config_(config),
              profiles_(profiles)
        {
            config_.validate();
        }

        double ProjectionEngine::quarterly_fee_rate(int vintage_year, int period) const
        {
            const int as_of_year = model::extract_year(config_.as_of_date);
            const int vintage = vintage_year > 0 ? vintage_year : as_of_year;
            const int years_since_vintage = (as_of_year + period / 4) - vintage;

            double rate = config_.management_fee_rate / 4.0;
            if (years_since_vintage > config_.fee_step_down_years)
            {
                rate *= config_.fee_step_down_factor;
            }
            return rate;
        }

        std::string ProjectionEngine::resolve_strategy(const model::Fund &fund, std::vector<std::string> &notes) const
        {
            if (!fund.primary_strategy.empty())
            {
                return fund.primary_strategy;
            }
            notes.push_back("strategy: fund has no primary strategy, using '" +
                            profiles_.fallback_strategy() + "'");
            return profiles_.fallback_strategy();
        }

        FundProjection ProjectionEngine::project_fund(const FundState &state,
                                                      const model::ModelingAssumption &assumption) const
        {
            return project_fund(state, assumption, config_.num_periods);
        }

        FundProjection ProjectionEngine::project_fund(const FundState &state,
                                                      const model::ModelingAssumption &assumption,
                                                      int num_periods) const
        {
            require_non_negative_periods(num_periods);

            FundProjection result;
            result.fund_id = state.fund.fund_id;
            result.fund_name = state.fund.fund_name;
            result.strategy = resolve_strategy(state.fund, result.notes);
            result.resolved_profile = profiles_.lookup(result.strategy, num_periods);
            result.used_fallback_profile = result.resolved_profile.used_fallback;

            if (result.used_fallback_profile)
            {
                result.notes.push_back("profile: no shape profile for '" + result.strategy +
                                       "', using '" + result.resolved_profile.profile_name + "'");
                if (config_.verbose)
                {
                    std::cerr << "Warning: fund " << result.fund_id << " strategy '" << result.strategy
                              << "' has no shape profile, using '" << result.resolved_profile.profile_name
                              << "'\n";
                }
            }

            if (num_periods == 0)
            {
                return result;
            }

            const ResolvedShapeParams &shape = result.resolved_profile;
            const Eigen::VectorXd call_shape = generate_s_curve(num_periods, shape.call_peak, shape.call_steepness);
            const Eigen::VectorXd dist_shape = generate_j_curve(num_periods, shape.dist_trough, shape.dist_steepness);
            const std::vector<std::string> dates = model::quarter_end_dates(config_.as_of_date, num_periods);

            const double unfunded = state.unfunded_commitment;
            const double fee_base = state.unfunded_commitment + state.current_nav;
            const double quarterly_growth = std::pow(1.0 + assumption.target_irr, 0.25) - 1.0;

            double remaining_commitment = unfunded;
            double remaining_distributions = std::max(0.0, unfunded * assumption.expected_moic - state.current_nav);
            double nav = state.current_nav;

            result.periods.reserve(static_cast<size_t>(num_periods));

            for (int q = 0; q < num_periods; ++q)
            {
                const double call = remaining_commitment * call_shape(q);
                remaining_commitment -= call;

                const double fee = fee_base * quarterly_fee_rate(state.fund.vintage_year, q);

                const double distribution = remaining_distributions * dist_shape(q);
                remaining_distributions -= distribution;

                double nav_return = quarterly_growth;
                if (config_.nav_curve_mode == NavCurveMode::PROFILE_J_CURVE)
                {
                    if (q < shape.dist_trough)
                        nav_return = -shape.j_curve_depth / 4.0;
                }
                else if (q < assumption.nav_initial_depreciation_qtrs)
                {
                    nav_return = assumption.nav_initial_qtr_depreciation;
                }

                const double nav_change = nav * nav_return;
                nav = std::max(0.0, nav + call - fee - distribution + nav_change);

                ProjectionPeriod period;
                period.period_index = q + 1;
                period.date = dates[static_cast<size_t>(q)];
                period.call_investment = -call;
                period.management_fees = -fee;
                period.distribution = distribution;
                period.nav = nav;
                period.nav_change = nav_change;
                result.periods.push_back(period);
            }

            return result;
        }

        PortfolioProjection ProjectionEngine::project_portfolio_cash_flows(const std::vector<FundState> &funds,
                                                                           const model::AssumptionMap &assumptions) const
        {
            return project_portfolio_cash_flows(funds, assumptions, config_.num_periods);
        }

        PortfolioProjection ProjectionEngine::project_portfolio_cash_flows(const std::vector<FundState> &funds,
                                                                           const model::AssumptionMap &assumptions,
                                                                           int num_periods) const
        {
            require_non_negative_periods(num_periods);

            PortfolioProjection portfolio;
            portfolio.num_periods = num_periods;
            portfolio.dates = model::quarter_end_dates(config_.as_of_date, num_periods);
            portfolio.total_calls = Eigen::VectorXd::Zero(num_periods);
            portfolio.total_distributions = Eigen::VectorXd::Zero(num_periods);
            portfolio.total_fees = Eigen::VectorXd::Zero(num_periods);
            portfolio.total_nav = Eigen::VectorXd::Zero(num_periods);

            for (const auto &state : funds)
            {
                std::vector<std::string> notes;
                const std::string strategy = state.fund.primary_strategy.empty()
                                                 ? profiles_.fallback_strategy()
                                                 : state.fund.primary_strategy;

                model::ModelingAssumption assumption;
                assumption.strategy = strategy;
                auto it = assumptions.find(strategy);
                if (it != assumptions.end())
                {
                    assumption = it->second;
                }
                else
                {
                    notes.push_back("assumption: no modeling assumption for '" + strategy +
                                    "', using expected_moic 2.0 and target_irr 0.15");
                    if (config_.verbose)
                    {
                        std::cerr << "Warning: no modeling assumption for strategy '" << strategy
                                  << "', using defaults\n";
                    }
                }

                FundProjection fp = project_fund(state, assumption, num_periods);
                fp.notes.insert(fp.notes.end(), notes.begin(), notes.end());

                auto series_it = portfolio.by_strategy.find(fp.strategy);
                if (series_it == portfolio.by_strategy.end())
                {
                    series_it = portfolio.by_strategy.emplace(fp.strategy, StrategySeries(num_periods)).first;
                }
                StrategySeries &series = series_it->second;

                for (const auto &p : fp.periods)
                {
                    const int i = p.period_index - 1;
                    const double call = std::abs(p.call_investment);
                    const double fee = std::abs(p.management_fees);

                    portfolio.total_calls(i) += call;
                    portfolio.total_distributions(i) += p.distribution;
                    portfolio.total_fees(i) += fee;
                    portfolio.total_nav(i) += p.nav;

                    series.calls(i) += call;
                    series.distributions(i) += p.distribution;
                    series.fees(i) += fee;
                    series.nav(i) += p.nav;
                }

                portfolio.by_fund.push_back(std::move(fp));
            }

            if (config_.verbose)
            {
                std::cerr << "Projected " << funds.size() << " funds over " << num_periods << " quarters\n";
            }

            return portfolio;
        }

        std::map<std::string, double> ProjectionEngine::projected_distributions_by_strategy(
            const PortfolioProjection &projection,
            int horizon_quarters)
        {
            if (horizon_quarters < 0)
            {
                throw std::invalid_argument(
                    "Horizon must be non-negative, got: " + std::to_string(horizon_quarters));
            }

            std::map<std::string, double> totals;
            for (const auto &entry : projection.by_strategy)
            {
                const Eigen::Index n = std::min<Eigen::Index>(horizon_quarters, entry.second.distributions.size());
                totals[entry.first] = entry.second.distributions.head(n).sum();
            }
            return totals;
        }

    } // namespace projection
} // namespace privcap
