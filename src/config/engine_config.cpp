/**
 * @file engine_config.cpp
 * @brief Implementation of EngineConfig and JSON loading.
 */

#include "config/engine_config.hpp"

#include <fstream>
#include <stdexcept>

namespace privcap
{
    namespace config
    {

        namespace
        {

            model::AssumptionMap parse_assumptions(const nlohmann::json &j)
            {
                model::AssumptionMap assumptions;

                if (j.is_object())
                {
                    for (auto it = j.begin(); it != j.end(); ++it)
                    {
                        auto row = model::ModelingAssumption::from_json(it.value());
                        row.strategy = it.key();
                        assumptions[it.key()] = row;
                    }
                }
                else if (j.is_array())
                {
                    for (const auto &item : j)
                    {
                        auto row = model::ModelingAssumption::from_json(item);
                        if (row.strategy.empty())
                        {
                            throw std::invalid_argument("Modeling assumption row must specify 'strategy'");
                        }
                        assumptions[row.strategy] = row;
                    }
                }
                else
                {
                    throw std::invalid_argument("'modeling_assumptions' must be an object or an array");
                }

                return assumptions;
            }

        } // anonymous namespace

        projection::ProjectionEngine EngineConfig::make_projection_engine() const
        {
            return projection::ProjectionEngine(projection, strategy_profiles);
        }

        nlohmann::json EngineConfig::to_json() const
        {
            nlohmann::json assumptions = nlohmann::json::object();
            for (const auto &entry : modeling_assumptions)
            {
                assumptions[entry.first] = entry.second.to_json();
            }

            return nlohmann::json{
                {"irr", irr.to_json()},
                {"projection", projection.to_json()},
                {"strategy_profiles", strategy_profiles.to_json()},
                {"modeling_assumptions", assumptions},
                {"allocation", allocation.to_json()}};
        }

        EngineConfig EngineConfig::from_json(const nlohmann::json &j)
        {
            EngineConfig config;

            try
            {
                if (j.contains("irr"))
                {
                    config.irr = metrics::XirrOptions::from_json(j["irr"]);
                }

                if (j.contains("projection"))
                {
                    config.projection = projection::ProjectionConfig::from_json(j["projection"]);
                }

                if (j.contains("strategy_profiles"))
                {
                    config.strategy_profiles = projection::StrategyProfileTable::from_json(j["strategy_profiles"]);
                }

                if (j.contains("modeling_assumptions"))
                {
                    config.modeling_assumptions = parse_assumptions(j["modeling_assumptions"]);
                }

                if (j.contains("allocation"))
                {
                    config.allocation = allocation::AllocationConstraints::from_json(j["allocation"]);
                }
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::invalid_argument("Invalid configuration value: " + std::string(e.what()));
            }

            return config;
        }

        nlohmann::json load_json(const std::string &filepath)
        {
            std::ifstream file(filepath);
            if (!file.is_open())
            {
                throw std::runtime_error("Could not open JSON file: " + filepath);
            }

            nlohmann::json j;
            try
            {
                file >> j;
            }
            catch (const nlohmann::json::exception &e)
            {
                throw std::runtime_error("JSON parsing error: " + std::string(e.what()));
            }

            return j;
        }

        EngineConfig load_config(const std::string &filepath)
        {
            auto j = load_json(filepath);
            if (!j.is_object())
            {
                throw std::runtime_error("Configuration root must be a JSON object: " + filepath);
            }
            return EngineConfig::from_json(j);
        }

    } // namespace config
} // namespace privcap
