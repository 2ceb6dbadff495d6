/**
 * @file strategy_profile.cpp
 * @brief Implementation of the strategy profile table.
 */

#include "projection/strategy_profile.hpp"

#include <cmath>
#include <stdexcept>

namespace privcap
{
    namespace projection
    {

        namespace
        {

            StrategyShapeParams make_params(double call_peak, double call_steep,
                                            double dist_trough, double dist_steep,
                                            double depth)
            {
                StrategyShapeParams p;
                p.call_peak_fraction = call_peak;
                p.call_steepness = call_steep;
                p.dist_trough_fraction = dist_trough;
                p.dist_steepness = dist_steep;
                p.j_curve_depth = depth;
                return p;
            }

            bool is_fraction(double x)
            {
                return x >= 0.0 && x <= 1.0;
            }

        } // anonymous namespace

        // ===================================================================
        // StrategyShapeParams
        // ===================================================================

        void StrategyShapeParams::validate() const
        {
            if (!is_fraction(call_peak_fraction) || !is_fraction(dist_trough_fraction))
            {
                throw std::invalid_argument(
                    "Peak and trough fractions must lie in [0, 1], got: " +
                    std::to_string(call_peak_fraction) + ", " + std::to_string(dist_trough_fraction));
            }
            if (!(call_steepness > 0.0) || !(dist_steepness > 0.0))
            {
                throw std::invalid_argument("Shape steepness must be positive");
            }
            if (j_curve_depth < 0.0)
            {
                throw std::invalid_argument(
                    "j_curve_depth must be non-negative, got: " + std::to_string(j_curve_depth));
            }
        }

        nlohmann::json StrategyShapeParams::to_json() const
        {
            return nlohmann::json{
                {"call_peak_fraction", call_peak_fraction},
                {"call_steepness", call_steepness},
                {"dist_trough_fraction", dist_trough_fraction},
                {"dist_steepness", dist_steepness},
                {"j_curve_depth", j_curve_depth}};
        }

        StrategyShapeParams StrategyShapeParams::from_json(const nlohmann::json &j)
        {
            StrategyShapeParams p;
            p.call_peak_fraction = j.value("call_peak_fraction", p.call_peak_fraction);
            p.call_steepness = j.value("call_steepness", p.call_steepness);
            p.dist_trough_fraction = j.value("dist_trough_fraction", p.dist_trough_fraction);
            p.dist_steepness = j.value("dist_steepness", p.dist_steepness);
            p.j_curve_depth = j.value("j_curve_depth", p.j_curve_depth);
            p.validate();
            return p;
        }

        nlohmann::json ResolvedShapeParams::to_json() const
        {
            return nlohmann::json{
                {"profile_name", profile_name},
                {"used_fallback", used_fallback},
                {"call_peak", call_peak},
                {"call_steepness", call_steepness},
                {"dist_trough", dist_trough},
                {"dist_steepness", dist_steepness},
                {"j_curve_depth", j_curve_depth}};
        }

        // ===================================================================
        // StrategyProfileTable
        // ===================================================================

        StrategyProfileTable::StrategyProfileTable()
            : fallback_strategy_("Private Equity")
        {
            profiles_["Venture Capital"] = make_params(0.3, 2.5, 0.5, 1.2, 0.15);
            profiles_["Private Equity"] = make_params(0.4, 2.0, 0.4, 1.5, 0.08);
            profiles_["Real Estate"] = make_params(0.2, 3.0, 0.1, 2.0, 0.02);
            profiles_["Infrastructure"] = make_params(0.5, 1.5, 0.2, 3.0, 0.01);
        }

        void StrategyProfileTable::set_profile(const std::string &strategy, const StrategyShapeParams &params)
        {
            if (strategy.empty())
            {
                throw std::invalid_argument("Strategy profile name must not be empty");
            }
            params.validate();
            profiles_[strategy] = params;
        }

        bool StrategyProfileTable::has_profile(const std::string &strategy) const
        {
            return profiles_.count(strategy) > 0;
        }

        void StrategyProfileTable::set_fallback_strategy(const std::string &strategy)
        {
            if (!has_profile(strategy))
            {
                throw std::invalid_argument("Fallback strategy '" + strategy + "' has no profile");
            }
            fallback_strategy_ = strategy;
        }

        ResolvedShapeParams StrategyProfileTable::lookup(const std::string &strategy, int num_periods) const
        {
            ResolvedShapeParams resolved;

            auto it = profiles_.find(strategy);
            if (it == profiles_.end())
            {
                it = profiles_.find(fallback_strategy_);
                resolved.used_fallback = true;
            }

            const StrategyShapeParams &p = it->second;
            resolved.profile_name = it->first;
            resolved.call_peak = static_cast<int>(std::floor(num_periods * p.call_peak_fraction));
            resolved.call_steepness = p.call_steepness;
            resolved.dist_trough = static_cast<int>(std::floor(num_periods * p.dist_trough_fraction));
            resolved.dist_steepness = p.dist_steepness;
            resolved.j_curve_depth = p.j_curve_depth;
            return resolved;
        }

        nlohmann::json StrategyProfileTable::to_json() const
        {
            nlohmann::json rows = nlohmann::json::object();
            for (const auto &entry : profiles_)
            {
                rows[entry.first] = entry.second.to_json();
            }
            return nlohmann::json{
                {"fallback_strategy", fallback_strategy_},
                {"profiles", rows}};
        }

        StrategyProfileTable StrategyProfileTable::from_json(const nlohmann::json &j)
        {
            StrategyProfileTable table;

            if (j.contains("profiles"))
            {
                const auto &rows = j["profiles"];
                if (!rows.is_object())
                {
                    throw std::invalid_argument("'profiles' must be an object keyed by strategy name");
                }
                for (auto it = rows.begin(); it != rows.end(); ++it)
                {
                    table.set_profile(it.key(), StrategyShapeParams::from_json(it.value()));
                }
            }

            if (j.contains("fallback_strategy"))
            {
                table.set_fallback_strategy(j["fallback_strategy"].get<std::string>());
            }

            return table;
        }

    } // namespace projection
} // namespace privcap
