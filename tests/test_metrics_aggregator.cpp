#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "metrics/metrics_aggregator.hpp"

#include <cmath>
#include <stdexcept>

using namespace privcap::metrics;
using privcap::model::CashFlow;
using privcap::model::CashFlowType;
using privcap::model::Fund;
using Catch::Approx;
using Catch::Matchers::WithinAbs;

namespace {

CashFlow make_flow(int fund_id, const std::string& date, CashFlowType type, double amount) {
    CashFlow cf;
    cf.fund_id = fund_id;
    cf.date = date;
    cf.type = type;
    cf.amount = amount;
    return cf;
}

Fund make_fund(int id, const std::string& strategy, const std::string& sub_strategy, double commitment) {
    Fund f;
    f.fund_id = id;
    f.fund_name = "Fund " + std::to_string(id);
    f.primary_strategy = strategy;
    f.sub_strategy = sub_strategy;
    f.total_commitment = commitment;
    return f;
}

MetricsResult totals(double paid_in, double distributions, double nav, double commitment) {
    MetricsResult m;
    m.paid_in = paid_in;
    m.distributions = distributions;
    m.current_nav = nav;
    m.total_commitment = commitment;
    return m;
}

bool has_note(const std::vector<std::string>& notes, const std::string& fragment) {
    for (const auto& n : notes) {
        if (n.find(fragment) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST_CASE("Pooled metrics", "[MetricsAggregator]") {
    SECTION("Two-entity pool is paid-in weighted") {
        auto pooled = aggregate_metrics({totals(100000.0, 50000.0, 60000.0, 150000.0),
                                         totals(200000.0, 100000.0, 120000.0, 250000.0)});

        REQUIRE(pooled.entity_count == 2);
        REQUIRE(pooled.paid_in == Approx(300000.0));
        REQUIRE(pooled.distributions == Approx(150000.0));
        REQUIRE(pooled.current_nav == Approx(180000.0));
        REQUIRE(pooled.total_value == Approx(330000.0));
        REQUIRE(pooled.total_commitment == Approx(400000.0));
        REQUIRE(pooled.unfunded_commitment == Approx(100000.0));
        REQUIRE(pooled.tvpi.value() == Approx(1.1));
        REQUIRE(pooled.dpi.value() == Approx(0.5));
        REQUIRE(pooled.rvpi.value() == Approx(0.6));
        REQUIRE(pooled.called_percent.value() == Approx(75.0));

        REQUIRE_FALSE(pooled.irr.has_value());
        REQUIRE(pooled.irr_status == XirrStatus::NOT_COMPUTED);
        REQUIRE(has_note(pooled.notes, "aggregate_irr"));
    }

    SECTION("Empty input") {
        auto pooled = aggregate_metrics({});
        REQUIRE(pooled.entity_count == 0);
        REQUIRE(pooled.paid_in == 0.0);
        REQUIRE_FALSE(pooled.tvpi.has_value());
        REQUIRE_FALSE(pooled.called_percent.has_value());
        REQUIRE_FALSE(pooled.irr.has_value());
    }
}

TEST_CASE("Aggregate IRR over combined flows", "[MetricsAggregator]") {
    const double exact_irr = std::pow(1.21, 365.25 / 731.0) - 1.0;

    std::vector<CashFlow> flows = {
        make_flow(1, "2020-01-01", CashFlowType::CALL_INVESTMENT, -100000.0),
        make_flow(2, "2020-01-01", CashFlowType::CALL_INVESTMENT, -100000.0),
        make_flow(2, "2022-01-01", CashFlowType::DISTRIBUTION_PROFIT, 121000.0),
        make_flow(1, "2021-01-01", CashFlowType::NAV_UPDATE, 105000.0),
        make_flow(1, "2021-12-31", CashFlowType::NAV_UPDATE, 121000.0)};

    SECTION("Terminal value from latest NAV marks") {
        auto irr = aggregate_irr(flows);
        REQUIRE(irr.success());
        REQUIRE_THAT(*irr.rate, WithinAbs(exact_irr, 1e-6));
    }

    SECTION("Explicit terminal value") {
        auto irr = aggregate_irr(flows, 121000.0);
        REQUIRE(irr.success());
        REQUIRE_THAT(*irr.rate, WithinAbs(exact_irr, 1e-6));
    }

    SECTION("Pooled result carries the IRR") {
        auto pooled = aggregate_metrics({totals(100000.0, 0.0, 121000.0, 100000.0),
                                         totals(100000.0, 121000.0, 0.0, 100000.0)},
                                        flows);
        REQUIRE(pooled.irr_status == XirrStatus::CONVERGED);
        REQUIRE_THAT(pooled.irr.value(), WithinAbs(exact_irr, 1e-6));
        REQUIRE(pooled.tvpi.value() == Approx(1.21));
        REQUIRE_FALSE(has_note(pooled.notes, "aggregate_irr"));
    }

    SECTION("No cash movements") {
        std::vector<CashFlow> marks = {make_flow(1, "2021-12-31", CashFlowType::NAV_UPDATE, 10.0)};
        auto irr = aggregate_irr(marks);
        REQUIRE_FALSE(irr.rate.has_value());
        REQUIRE(irr.status == XirrStatus::INSUFFICIENT_DATA);
    }
}

TEST_CASE("Hierarchy levels", "[MetricsAggregator]") {
    REQUIRE(parse_hierarchy_level("Portfolio") == HierarchyLevel::PORTFOLIO);
    REQUIRE(parse_hierarchy_level("primary_strategy") == HierarchyLevel::STRATEGY);
    REQUIRE(parse_hierarchy_level("Sub-Strategy") == HierarchyLevel::SUB_STRATEGY);
    REQUIRE(parse_hierarchy_level("FUND") == HierarchyLevel::FUND);
    REQUIRE_THROWS_AS(parse_hierarchy_level("vintage"), std::invalid_argument);

    auto fund = make_fund(9, "", "Seed", 1.0);
    REQUIRE(hierarchy_key(fund, HierarchyLevel::STRATEGY) == "Unclassified");
    REQUIRE(hierarchy_key(fund, HierarchyLevel::SUB_STRATEGY) == "Seed");
    REQUIRE(hierarchy_key(fund, HierarchyLevel::FUND) == "9");
    REQUIRE(hierarchy_key(fund, HierarchyLevel::PORTFOLIO) == "Portfolio");
}

TEST_CASE("Hierarchy rollups", "[MetricsAggregator]") {
    std::vector<Fund> funds = {
        make_fund(1, "Private Equity", "Buyout", 300000.0),
        make_fund(2, "Private Equity", "Growth", 200000.0),
        make_fund(3, "Venture Capital", "Early Stage", 100000.0)};

    std::vector<CashFlow> records = {
        make_flow(1, "2019-03-31", CashFlowType::CALL_INVESTMENT, -150000.0),
        make_flow(1, "2021-09-30", CashFlowType::DISTRIBUTION_PROFIT, 60000.0),
        make_flow(1, "2022-12-31", CashFlowType::NAV_UPDATE, 140000.0),
        make_flow(2, "2020-06-30", CashFlowType::CALL_INVESTMENT, -100000.0),
        make_flow(2, "2022-12-31", CashFlowType::NAV_UPDATE, 115000.0),
        make_flow(3, "2021-01-15", CashFlowType::CALL_INVESTMENT, -40000.0),
        make_flow(3, "2022-06-30", CashFlowType::DISTRIBUTION_RETURN_OF_CAPITAL, 5000.0),
        make_flow(3, "2022-12-31", CashFlowType::NAV_UPDATE, 30000.0)};

    SECTION("Strategy level") {
        auto groups = compute_hierarchy_metrics(funds, records, HierarchyLevel::STRATEGY);
        REQUIRE(groups.size() == 2);

        const auto& pe = groups[0];
        REQUIRE(pe.key == "Private Equity");
        REQUIRE(pe.fund_ids == std::vector<int>{1, 2});
        REQUIRE(pe.metrics.entity_count == 2);
        REQUIRE(pe.metrics.paid_in == Approx(250000.0));
        REQUIRE(pe.metrics.current_nav == Approx(255000.0));
        REQUIRE(pe.metrics.tvpi.value() == Approx(315000.0 / 250000.0));
        REQUIRE(pe.metrics.irr.has_value());

        const auto& vc = groups[1];
        REQUIRE(vc.key == "Venture Capital");
        REQUIRE(vc.metrics.entity_count == 1);
        REQUIRE(vc.metrics.tvpi.value() == Approx(0.875));
        REQUIRE(vc.metrics.irr.has_value());
        REQUIRE(vc.metrics.irr.value() < 0.0);

        REQUIRE(pe.to_json()["level"] == "strategy");
    }

    SECTION("Portfolio and fund levels") {
        auto portfolio = compute_hierarchy_metrics(funds, records, HierarchyLevel::PORTFOLIO);
        REQUIRE(portfolio.size() == 1);
        REQUIRE(portfolio[0].metrics.entity_count == 3);
        REQUIRE(portfolio[0].metrics.paid_in == Approx(290000.0));

        auto by_fund = compute_hierarchy_metrics(funds, records, HierarchyLevel::FUND);
        REQUIRE(by_fund.size() == 3);
        REQUIRE(by_fund[0].key == "1");
        REQUIRE(by_fund[0].metrics.paid_in == Approx(150000.0));
    }

    SECTION("A malformed record date only loses the IRR") {
        auto more_funds = funds;
        more_funds.push_back(make_fund(4, "Venture Capital", "Late Stage", 150000.0));

        auto more_records = records;
        more_records.push_back(make_flow(4, "2020-01-01", CashFlowType::CALL_INVESTMENT, -100000.0));
        more_records.push_back(make_flow(4, "2021-06-30", CashFlowType::DISTRIBUTION_PROFIT, 30000.0));
        more_records.push_back(make_flow(4, "2021-13-01", CashFlowType::CALL_FEES, -2000.0));
        more_records.push_back(make_flow(4, "2022-12-31", CashFlowType::NAV_UPDATE, 110000.0));

        auto by_fund = compute_hierarchy_metrics(more_funds, more_records, HierarchyLevel::FUND);
        REQUIRE(by_fund.size() == 4);
        const auto& fund4 = by_fund[3];
        REQUIRE(fund4.key == "4");
        REQUIRE(fund4.fund_ids == std::vector<int>{4});
        REQUIRE(fund4.metrics.entity_count == 1);
        REQUIRE(fund4.metrics.paid_in == Approx(102000.0));
        REQUIRE(fund4.metrics.distributions == Approx(30000.0));
        REQUIRE(fund4.metrics.current_nav == Approx(110000.0));
        REQUIRE(fund4.metrics.tvpi.value() == Approx(140000.0 / 102000.0));
        REQUIRE_FALSE(fund4.metrics.irr.has_value());
        REQUIRE(has_note(fund4.metrics.notes, "fund 4: irr"));

        auto groups = compute_hierarchy_metrics(more_funds, more_records, HierarchyLevel::STRATEGY);
        REQUIRE(groups.size() == 2);

        const auto& pe = groups[0];
        REQUIRE(pe.metrics.entity_count == 2);
        REQUIRE(pe.metrics.paid_in == Approx(250000.0));
        REQUIRE(pe.metrics.irr.has_value());

        const auto& vc = groups[1];
        REQUIRE(vc.fund_ids == std::vector<int>{3, 4});
        REQUIRE(vc.metrics.entity_count == 2);
        REQUIRE(vc.metrics.paid_in == Approx(142000.0));
        REQUIRE(vc.metrics.current_nav == Approx(140000.0));
        REQUIRE_FALSE(vc.metrics.irr.has_value());
        REQUIRE(vc.metrics.irr_status == XirrStatus::INVALID_DATE);
        REQUIRE(has_note(vc.metrics.notes, "fund 4"));
    }

    SECTION("A fund that throws is left out of the batch") {
        auto bad_funds = funds;
        bad_funds.push_back(make_fund(5, "Venture Capital", "Late Stage", -50000.0));

        auto bad_records = records;
        bad_records.push_back(make_flow(5, "2021-03-31", CashFlowType::CALL_INVESTMENT, -10000.0));

        auto groups = compute_hierarchy_metrics(bad_funds, bad_records, HierarchyLevel::STRATEGY);
        REQUIRE(groups.size() == 2);
        REQUIRE(groups[0].metrics.paid_in == Approx(250000.0));

        const auto& vc = groups[1];
        REQUIRE(vc.fund_ids == std::vector<int>{3});
        REQUIRE(vc.metrics.entity_count == 1);
        REQUIRE(vc.metrics.paid_in == Approx(40000.0));
        REQUIRE(vc.metrics.irr.has_value());
        REQUIRE(has_note(vc.metrics.notes, "fund 5: negative total_commitment"));
    }

    SECTION("No funds") {
        REQUIRE(compute_hierarchy_metrics({}, records, HierarchyLevel::STRATEGY).empty());
    }
}
