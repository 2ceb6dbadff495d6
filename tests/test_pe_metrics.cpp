#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "metrics/pe_metrics.hpp"

#include <cmath>

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

bool has_note(const std::vector<std::string>& notes, const std::string& fragment) {
    for (const auto& n : notes) {
        if (n.find(fragment) != std::string::npos) return true;
    }
    return false;
}

} // namespace

TEST_CASE("Ratio metrics", "[PeMetrics]") {
    SECTION("Reference values") {
        REQUIRE(calculate_tvpi(150000.0, 100000.0).value() == Approx(1.5));
        REQUIRE(calculate_dpi(80000.0, 100000.0).value() == Approx(0.8));
        REQUIRE(calculate_rvpi(70000.0, 100000.0).value() == Approx(0.7));
        REQUIRE(calculate_moic(240000.0, 120000.0).value() == Approx(2.0));
        REQUIRE(calculate_called_percent(50000.0, 200000.0).value() == Approx(25.0));
        REQUIRE(calculate_distributed_percent(30000.0, 200000.0).value() == Approx(15.0));
    }

    SECTION("Non-positive denominators are absent") {
        REQUIRE_FALSE(calculate_tvpi(150000.0, 0.0).has_value());
        REQUIRE_FALSE(calculate_dpi(80000.0, -1.0).has_value());
        REQUIRE_FALSE(calculate_rvpi(70000.0, 0.0).has_value());
        REQUIRE_FALSE(calculate_moic(1.0, 0.0).has_value());
        REQUIRE_FALSE(calculate_called_percent(50000.0, 0.0).has_value());
        REQUIRE_FALSE(calculate_distributed_percent(1.0, -5.0).has_value());
    }
}

TEST_CASE("Complete metric set", "[PeMetrics]") {
    const double exact_irr = std::pow(1.21, 365.25 / 731.0) - 1.0;

    SECTION("Terminal NAV mark") {
        auto m = calculate_all_metrics({-100000.0, 50000.0}, {"2020-01-01", "2022-01-01"}, 200000.0, 71000.0);

        REQUIRE(m.paid_in == Approx(100000.0));
        REQUIRE(m.distributions == Approx(50000.0));
        REQUIRE(m.current_nav == Approx(71000.0));
        REQUIRE(m.total_value == Approx(121000.0));
        REQUIRE(m.unfunded_commitment == Approx(100000.0));
        REQUIRE(m.tvpi.value() == Approx(1.21));
        REQUIRE(m.dpi.value() == Approx(0.5));
        REQUIRE(m.rvpi.value() == Approx(0.71));
        REQUIRE(m.moic.value() == Approx(1.21));
        REQUIRE(m.called_percent.value() == Approx(50.0));
        REQUIRE(m.distributed_percent.value() == Approx(25.0));
        REQUIRE(m.entity_count == 1);

        REQUIRE(m.irr_status == XirrStatus::CONVERGED);
        REQUIRE_THAT(m.irr.value(), WithinAbs(exact_irr, 1e-6));
        REQUIRE(m.notes.empty());
    }

    SECTION("Flows are ordered before solving") {
        auto m = calculate_all_metrics({50000.0, -100000.0}, {"2022-01-01", "2020-01-01"}, 200000.0, 71000.0);
        REQUIRE_THAT(m.irr.value(), WithinAbs(exact_irr, 1e-6));
    }

    SECTION("No flows") {
        auto m = calculate_all_metrics({}, {}, 100000.0, 0.0);
        REQUIRE(m.paid_in == 0.0);
        REQUIRE_FALSE(m.irr.has_value());
        REQUIRE(m.irr_status == XirrStatus::INSUFFICIENT_DATA);
        REQUIRE_FALSE(m.tvpi.has_value());
        REQUIRE(m.called_percent.value() == Approx(0.0));
        REQUIRE(has_note(m.notes, "irr"));
        REQUIRE(has_note(m.notes, "paid-in"));
    }

    SECTION("IRR failure leaves other metrics intact") {
        auto m = calculate_all_metrics({-100000.0, -50000.0}, {"2020-01-01", "2021-01-01"}, 200000.0, 0.0);
        REQUIRE_FALSE(m.irr.has_value());
        REQUIRE(m.irr_status != XirrStatus::CONVERGED);
        REQUIRE(m.paid_in == Approx(150000.0));
        REQUIRE(m.tvpi.value() == Approx(0.0));
        REQUIRE(has_note(m.notes, "irr"));
    }
}

TEST_CASE("Fund metrics from the ledger", "[PeMetrics]") {
    Fund fund;
    fund.fund_id = 1;
    fund.fund_name = "Northwind Capital II";
    fund.primary_strategy = "Private Equity";
    fund.total_commitment = 250000.0;

    std::vector<CashFlow> records = {
        make_flow(1, "2020-01-01", CashFlowType::CALL_INVESTMENT, -100000.0),
        make_flow(2, "2020-01-01", CashFlowType::CALL_INVESTMENT, -500000.0),
        make_flow(1, "2021-06-30", CashFlowType::DISTRIBUTION_RETURN_OF_CAPITAL, 30000.0),
        make_flow(1, "2022-06-30", CashFlowType::NAV_UPDATE, 80000.0),
        make_flow(1, "2022-12-31", CashFlowType::NAV_UPDATE, 90000.0),
        make_flow(1, "2022-12-31", CashFlowType::NAV_UPDATE, 95000.0),
        make_flow(1, "2021-12-31", CashFlowType::NAV_UPDATE, 70000.0)};

    SECTION("Latest NAV mark") {
        REQUIRE(latest_nav_mark(records, 1).value() == Approx(95000.0));
        REQUIRE_FALSE(latest_nav_mark(records, 2).has_value());
    }

    SECTION("Metrics use only this fund's cash movements") {
        auto m = compute_fund_metrics(fund, records);
        REQUIRE(m.paid_in == Approx(100000.0));
        REQUIRE(m.distributions == Approx(30000.0));
        REQUIRE(m.current_nav == Approx(95000.0));
        REQUIRE(m.total_value == Approx(125000.0));
        REQUIRE(m.tvpi.value() == Approx(1.25));
        REQUIRE(m.called_percent.value() == Approx(40.0));
        REQUIRE(m.irr.has_value());
        REQUIRE(m.irr.value() > 0.0);
    }

    SECTION("Missing NAV is noted") {
        Fund other = fund;
        other.fund_id = 2;
        other.total_commitment = 1000000.0;
        auto m = compute_fund_metrics(other, records);
        REQUIRE(m.current_nav == 0.0);
        REQUIRE(m.paid_in == Approx(500000.0));
        REQUIRE(has_note(m.notes, "current_nav"));
    }
}

TEST_CASE("MetricsResult serialization", "[PeMetrics]") {
    auto m = calculate_all_metrics({-100.0}, {"2020-01-01"}, 0.0, 50.0);
    auto j = m.to_json();
    REQUIRE(j["irr"].is_null());
    REQUIRE(j["called_percent"].is_null());
    REQUIRE(j["tvpi"].get<double>() == Approx(0.5));
    REQUIRE(j["irr_status"] == "derivative_too_small");
    REQUIRE(j["entity_count"] == 1);
    REQUIRE(j["notes"].is_array());
}
