#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "allocation/allocation_optimizer.hpp"

#include <iostream>
#include <random>
#include <sstream>
#include <stdexcept>

using namespace privcap::allocation;
using Catch::Approx;

TEST_CASE("Budget-bound allocation", "[AllocationOptimizer]") {
    std::map<std::string, double> current = {
        {"Venture Capital", 1000.0}, {"Private Equity", 2000.0}, {"Real Estate", 1000.0}};
    std::map<std::string, double> targets = {
        {"Venture Capital", 0.3}, {"Private Equity", 0.5}, {"Real Estate", 0.2}};
    std::map<std::string, double> distributions = {
        {"Venture Capital", 100.0}, {"Private Equity", 200.0}, {"Real Estate", 150.0}};

    auto result = calculate_optimal_allocation(current, targets, 500.0, distributions);

    REQUIRE(result.projected_total == Approx(4050.0));
    REQUIRE(result.gaps.at("Venture Capital") == Approx(315.0));
    REQUIRE(result.gaps.at("Private Equity") == Approx(225.0));
    REQUIRE(result.gaps.at("Real Estate") == Approx(-40.0));

    REQUIRE(result.scale_factor == Approx(500.0 / 540.0));
    REQUIRE(result.allocations.at("Venture Capital") == Approx(315.0 * 500.0 / 540.0));
    REQUIRE(result.allocations.at("Private Equity") == Approx(225.0 * 500.0 / 540.0));
    REQUIRE(result.allocations.at("Real Estate") == 0.0);
    REQUIRE(result.total_allocated == Approx(500.0));

    auto j = result.to_json();
    REQUIRE(j["allocations"]["Venture Capital"].get<double>() == Approx(291.6666667));
    REQUIRE(j["scale_factor"].get<double>() < 1.0);
}

TEST_CASE("Non-binding allocation", "[AllocationOptimizer]") {
    std::map<std::string, double> current = {{"A", 1000.0}, {"B", 1000.0}};
    std::map<std::string, double> targets = {{"A", 0.5}, {"B", 0.5}};

    SECTION("Gaps exactly fill the budget") {
        auto result = calculate_optimal_allocation(current, targets, 100.0, {});
        REQUIRE(result.scale_factor == 1.0);
        REQUIRE(result.allocations.at("A") == Approx(50.0));
        REQUIRE(result.allocations.at("B") == Approx(50.0));
        REQUIRE(result.total_allocated == Approx(100.0));
    }

    SECTION("Cap leaves budget unspent") {
        AllocationConstraints constraints;
        constraints.max_allocation["B"] = 20.0;

        auto result = calculate_optimal_allocation(current, targets, 100.0, {}, constraints);
        REQUIRE(result.scale_factor == 1.0);
        REQUIRE(result.allocations.at("A") == Approx(50.0));
        REQUIRE(result.allocations.at("B") == Approx(20.0));
        REQUIRE(result.total_allocated == Approx(70.0));
    }

    SECTION("Strategies without current exposure") {
        auto result = calculate_optimal_allocation({{"A", 1000.0}}, targets, 1000.0, {});
        REQUIRE(result.projected_total == Approx(2000.0));
        REQUIRE(result.allocations.at("A") == 0.0);
        REQUIRE(result.allocations.at("B") == Approx(1000.0));
    }
}

TEST_CASE("Allocation floors", "[AllocationOptimizer]") {
    AllocationConstraints constraints;
    constraints.min_allocation["A"] = 50.0;

    auto result = calculate_optimal_allocation({{"A", 1000.0}, {"B", 0.0}},
                                               {{"A", 0.5}, {"B", 0.5}},
                                               100.0, {}, constraints);

    // A is over target but held at its floor; B is capped at the budget; both scaled
    REQUIRE(result.gaps.at("A") == Approx(-450.0));
    REQUIRE(result.scale_factor == Approx(100.0 / 150.0));
    REQUIRE(result.allocations.at("A") == Approx(100.0 / 3.0));
    REQUIRE(result.allocations.at("B") == Approx(200.0 / 3.0));
    REQUIRE(result.total_allocated == Approx(100.0));
}

TEST_CASE("Allocation input validation", "[AllocationOptimizer]") {
    std::map<std::string, double> current = {{"A", 100.0}, {"B", 0.0}};
    std::map<std::string, double> targets = {{"A", 0.5}, {"B", 0.5}};

    SECTION("Negative budget") {
        REQUIRE_THROWS_AS(calculate_optimal_allocation(current, targets, -1.0, {}), std::invalid_argument);
    }

    SECTION("Floor above cap") {
        AllocationConstraints constraints;
        constraints.min_allocation["A"] = 100.0;
        constraints.max_allocation["A"] = 50.0;
        REQUIRE_THROWS_AS(constraints.validate(), std::invalid_argument);
        REQUIRE_THROWS_AS(calculate_optimal_allocation(current, targets, 10.0, {}, constraints),
                          std::invalid_argument);
    }

    SECTION("Negative bounds") {
        AllocationConstraints constraints;
        constraints.min_allocation["A"] = -1.0;
        REQUIRE_THROWS_AS(constraints.validate(), std::invalid_argument);

        constraints = AllocationConstraints();
        constraints.max_allocation["B"] = -1.0;
        REQUIRE_THROWS_AS(constraints.validate(), std::invalid_argument);
    }

    SECTION("Zero budget") {
        auto result = calculate_optimal_allocation(current, targets, 0.0, {});
        REQUIRE(result.allocations.at("A") == 0.0);
        REQUIRE(result.allocations.at("B") == 0.0);
        REQUIRE(result.total_allocated == 0.0);
    }

    SECTION("No targets") {
        auto result = calculate_optimal_allocation(current, {}, 100.0, {});
        REQUIRE(result.allocations.empty());
        REQUIRE(result.total_allocated == 0.0);
    }
}

TEST_CASE("Allocations never exceed the budget", "[AllocationOptimizer]") {
    std::mt19937 rng(42);
    std::uniform_real_distribution<double> exposure(0.0, 1000000.0);
    std::uniform_real_distribution<double> weight(0.0, 1.0);
    std::uniform_real_distribution<double> budget(0.0, 500000.0);

    const std::vector<std::string> strategies = {
        "Private Equity", "Venture Capital", "Real Estate", "Infrastructure"};

    for (int trial = 0; trial < 200; ++trial) {
        std::map<std::string, double> current, targets, distributions;
        double weight_sum = 0.0;
        for (const auto& s : strategies) {
            current[s] = exposure(rng);
            distributions[s] = 0.2 * exposure(rng);
            targets[s] = weight(rng);
            weight_sum += targets[s];
        }
        for (auto& t : targets) {
            t.second /= weight_sum;
        }

        AllocationConstraints constraints;
        constraints.min_allocation["Infrastructure"] = 0.1 * budget(rng);

        double available = budget(rng);
        auto result = calculate_optimal_allocation(current, targets, available, distributions, constraints);

        double total = 0.0;
        for (const auto& a : result.allocations) {
            REQUIRE(a.second >= 0.0);
            total += a.second;
        }
        REQUIRE(total <= available);
        REQUIRE(result.total_allocated == total);
        REQUIRE(result.scale_factor <= 1.0);
    }
}

TEST_CASE("Scaled allocations land exactly on the budget", "[AllocationOptimizer]") {
    std::mt19937 rng(7);
    std::uniform_real_distribution<double> exposure(0.0, 1000000.0);
    std::uniform_real_distribution<double> weight(0.01, 1.0);
    std::uniform_real_distribution<double> budget(1.0, 2000000.0);

    const std::vector<std::string> strategies = {
        "Buyout", "Growth", "Venture", "Real Estate", "Infrastructure", "Private Credit", "Secondaries"};

    int binding = 0;
    for (int trial = 0; trial < 5000; ++trial) {
        std::map<std::string, double> current, targets;
        double weight_sum = 0.0;
        for (const auto& s : strategies) {
            current[s] = exposure(rng);
            targets[s] = weight(rng);
            weight_sum += targets[s];
        }
        for (auto& t : targets) {
            t.second /= weight_sum;
        }

        double available = budget(rng);
        auto result = calculate_optimal_allocation(current, targets, available, {});

        double total = 0.0;
        for (const auto& a : result.allocations) {
            REQUIRE(a.second >= 0.0);
            total += a.second;
        }
        REQUIRE(total <= available);
        REQUIRE(result.total_allocated == total);

        if (result.scale_factor < 1.0) {
            ++binding;
            REQUIRE(total == Approx(available));
        }
    }
    REQUIRE(binding > 0);
}

TEST_CASE("Allocation constraints from configuration", "[AllocationOptimizer]") {
    auto constraints = AllocationConstraints::from_json(nlohmann::json{
        {"min_allocation", {{"Real Estate", 10000.0}}},
        {"max_allocation", {{"Venture Capital", 250000.0}}},
        {"verbose", true}});

    REQUIRE(constraints.verbose);
    REQUIRE(constraints.min_for("Real Estate") == Approx(10000.0));
    REQUIRE(constraints.min_for("Venture Capital") == 0.0);
    REQUIRE(constraints.max_for("Venture Capital", 1e6) == Approx(250000.0));
    REQUIRE(constraints.max_for("Real Estate", 1e6) == Approx(1e6));

    auto round_trip = AllocationConstraints::from_json(constraints.to_json());
    REQUIRE(round_trip.max_allocation == constraints.max_allocation);

    REQUIRE_THROWS_AS(AllocationConstraints::from_json(nlohmann::json{
                          {"min_allocation", {{"A", 10.0}}}, {"max_allocation", {{"A", 5.0}}}}),
                      std::invalid_argument);

    SECTION("Verbose mode reports unnormalized targets") {
        std::ostringstream captured;
        std::streambuf* old = std::cerr.rdbuf(captured.rdbuf());
        auto result = calculate_optimal_allocation({{"A", 100.0}}, {{"A", 0.6}, {"B", 0.2}}, 50.0, {}, constraints);
        std::cerr.rdbuf(old);

        REQUIRE(captured.str().find("Warning") != std::string::npos);
        REQUIRE(result.allocations.size() == 2);
    }
}
