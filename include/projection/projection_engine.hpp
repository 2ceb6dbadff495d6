/**
 * @file projection_engine.hpp
 * @brief Takahashi/Alexander-style quarterly cash-flow and NAV projection.
 *
 * For each fund the engine paces the remaining commitment with an S-curve,
 * paces the distribution pool implied by the expected multiple with a
 * J-curve, charges a tiered management fee and rolls NAV forward with an
 * early write-down followed by target-IRR growth. Portfolio totals are the
 * per-quarter sums over funds.
 *
 * Usage:
 * @code
 *   ProjectionConfig config;
 *   config.as_of_date = "2025-12-31";
 *   ProjectionEngine engine(config);
 *   auto portfolio = engine.project_portfolio_cash_flows(states, assumptions);
 *   auto next_year = ProjectionEngine::projected_distributions_by_strategy(portfolio, 4);
 * @endcode
 *
 * Sign convention: ProjectionPeriod reports calls and fees as negative
 * amounts; PortfolioProjection series are positive magnitudes.
 */

#ifndef PRIVCAP_PROJECTION_PROJECTION_ENGINE_HPP
#define PRIVCAP_PROJECTION_PROJECTION_ENGINE_HPP

#include "metrics/pe_metrics.hpp"
#include "model/fund.hpp"
#include "projection/strategy_profile.hpp"

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace privcap
{
    namespace projection
    {

        /**
         * @enum NavCurveMode
         * @brief How NAV moves before growth kicks in.
         */
        enum class NavCurveMode
        {
            PROFILE_J_CURVE,    ///< Write down by j_curve_depth/4 until the distribution trough
            ASSUMPTION_SCHEDULE ///< Apply nav_initial_qtr_depreciation for nav_initial_depreciation_qtrs quarters
        };

        std::string to_string(NavCurveMode mode);

        /**
         * @throws std::invalid_argument for unknown names.
         */
        NavCurveMode parse_nav_curve_mode(const std::string &name);

        /**
         * @struct ProjectionConfig
         * @brief Engine-wide projection settings.
         */
        struct ProjectionConfig
        {
            double management_fee_rate = 0.02;   ///< Annual rate on (unfunded + NAV)
            int fee_step_down_years = 5;         ///< Full rate while years since vintage <= this
            double fee_step_down_factor = 0.5;   ///< Multiplier applied after the step-down
            int num_periods = 20;                ///< Default horizon in quarters
            std::string as_of_date = "2025-12-31"; ///< Valuation date; period dates are the quarter-ends after it
            NavCurveMode nav_curve_mode = NavCurveMode::PROFILE_J_CURVE;
            bool verbose = false;                ///< Report fallbacks and defaults on stderr

            /**
             * @throws std::invalid_argument if a value is out of range.
             */
            void validate() const;

            nlohmann::json to_json() const;
            static ProjectionConfig from_json(const nlohmann::json &j);
        };

        /**
         * @struct FundState
         * @brief Starting point of one fund's projection.
         */
        struct FundState
        {
            model::Fund fund;
            double unfunded_commitment = 0.0;
            double current_nav = 0.0;

            /**
             * @brief Build from historical metrics (unfunded floored at 0).
             */
            static FundState from_metrics(const model::Fund &fund, const metrics::MetricsResult &metrics);

            nlohmann::json to_json() const;

            /**
             * @brief Fund fields plus "unfunded_commitment" and "current_nav".
             */
            static FundState from_json(const nlohmann::json &j);
        };

        /**
         * @struct ProjectionPeriod
         * @brief One projected quarter.
         */
        struct ProjectionPeriod
        {
            int period_index = 0;        ///< 1-based
            std::string date;            ///< Quarter-end
            double call_investment = 0.0; ///< <= 0
            double management_fees = 0.0; ///< <= 0
            double distribution = 0.0;   ///< >= 0
            double nav = 0.0;            ///< End-of-quarter NAV, >= 0
            double nav_change = 0.0;     ///< Valuation change before cash flows

            nlohmann::json to_json() const;
        };

        /**
         * @struct FundProjection
         * @brief Projection of one fund with the profile that drove it.
         */
        struct FundProjection
        {
            int fund_id = 0;
            std::string fund_name;
            std::string strategy;
            ResolvedShapeParams resolved_profile;
            bool used_fallback_profile = false;
            std::vector<ProjectionPeriod> periods;
            std::vector<std::string> notes;

            nlohmann::json to_json() const;
        };

        /**
         * @struct StrategySeries
         * @brief Per-quarter sums for one strategy (positive magnitudes).
         */
        struct StrategySeries
        {
            Eigen::VectorXd calls;
            Eigen::VectorXd distributions;
            Eigen::VectorXd fees;
            Eigen::VectorXd nav;

            explicit StrategySeries(int num_periods = 0);

            nlohmann::json to_json() const;
        };

        /**
         * @struct PortfolioProjection
         * @brief Portfolio totals, strategy breakdown and fund detail.
         */
        struct PortfolioProjection
        {
            int num_periods = 0;
            std::vector<std::string> dates;
            Eigen::VectorXd total_calls;
            Eigen::VectorXd total_distributions;
            Eigen::VectorXd total_fees;
            Eigen::VectorXd total_nav;
            std::map<std::string, StrategySeries> by_strategy;
            std::vector<FundProjection> by_fund;

            nlohmann::json to_json() const;
        };

        /**
         * @class ProjectionEngine
         * @brief Deterministic forward simulation of fund cash flows.
         *
         * The engine holds only its configuration; every call is independent.
         */
        class ProjectionEngine
        {
        public:
            /**
             * @throws std::invalid_argument if the configuration is invalid.
             */
            explicit ProjectionEngine(const ProjectionConfig &config = ProjectionConfig(),
                                      const StrategyProfileTable &profiles = StrategyProfileTable());

            /**
             * @brief Project one fund over the configured horizon.
             */
            FundProjection project_fund(const FundState &state,
                                        const model::ModelingAssumption &assumption) const;

            /**
             * @brief Project one fund over @p num_periods quarters.
             * @throws std::invalid_argument if num_periods < 0.
             */
            FundProjection project_fund(const FundState &state,
                                        const model::ModelingAssumption &assumption,
                                        int num_periods) const;

            /**
             * @brief Project every fund and sum per quarter.
             *
             * Each fund uses the assumption row of its primary strategy; a
             * missing row falls back to 2.0x / 15% and is noted on that fund.
             */
            PortfolioProjection project_portfolio_cash_flows(const std::vector<FundState> &funds,
                                                             const model::AssumptionMap &assumptions) const;

            /**
             * @throws std::invalid_argument if num_periods < 0.
             */
            PortfolioProjection project_portfolio_cash_flows(const std::vector<FundState> &funds,
                                                             const model::AssumptionMap &assumptions,
                                                             int num_periods) const;

            /**
             * @brief Sum of each strategy's distributions over the first quarters.
             * @param horizon_quarters Quarters to include (clamped to the projection length)
             * @throws std::invalid_argument if horizon_quarters < 0.
             */
            static std::map<std::string, double> projected_distributions_by_strategy(
                const PortfolioProjection &projection,
                int horizon_quarters);

            const ProjectionConfig &config() const { return config_; }
            const StrategyProfileTable &profiles() const { return profiles_; }

        private:
            ProjectionConfig config_;
            StrategyProfileTable profiles_;

            double quarterly_fee_rate(int vintage_year, int period) const;
            std::string resolve_strategy(const model::Fund &fund, std::vector<std::string> &notes) const;
        };

    } // namespace projection
} // namespace privcap

#endif // PRIVCAP_PROJECTION_PROJECTION_ENGINE_HPP
