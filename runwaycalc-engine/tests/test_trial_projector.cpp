#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <cmath>
#include <limits>
#include <memory>
#include "../src/trial_projector.hpp"

using namespace runwaycalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;

namespace {

// Fixed flows regardless of inputs
class ConstantFormula : public ProjectionFormula {
public:
    ConstantFormula(double revenue, double expenses) : revenue_(revenue), expenses_(expenses) {}

    MonthlyFlows project_month(const TrialAssumptions&, int, const MonthRecord*) const override {
        return MonthlyFlows{revenue_, expenses_};
    }

    std::string name() const override { return "constant"; }

private:
    double revenue_;
    double expenses_;
};

// Produces NaN revenue from `bad_month` onwards
class BrokenFormula : public ProjectionFormula {
public:
    explicit BrokenFormula(int bad_month) : bad_month_(bad_month) {}

    MonthlyFlows project_month(const TrialAssumptions&, int month, const MonthRecord*) const override {
        double revenue = month >= bad_month_ ? std::numeric_limits<double>::quiet_NaN() : 100.0;
        return MonthlyFlows{revenue, 50.0};
    }

    std::string name() const override { return "broken"; }

private:
    int bad_month_;
};

} // anonymous namespace

// ============================================================================
// TrialAssumptions
// ============================================================================

TEST_CASE("Sampled drivers override baseline values", "[projector]") {
    BaselineAssumptions baseline;
    baseline.set("revenue_growth", 5.0);
    baseline.set("initial_cash", 1000.0);

    DriverValues drivers;
    drivers["revenue_growth"] = 9.0;

    TrialAssumptions assumptions(baseline, drivers);
    REQUIRE(assumptions.value("revenue_growth") == 9.0);
    REQUIRE(assumptions.value("initial_cash") == 1000.0);
    REQUIRE(assumptions.value("missing", -1.0) == -1.0);
    REQUIRE(assumptions.has("revenue_growth"));
    REQUIRE_FALSE(assumptions.has("missing"));
}

// ============================================================================
// Cash carry-forward
// ============================================================================

TEST_CASE("Cash balance is carried forward month to month", "[projector]") {
    BaselineAssumptions baseline;
    baseline.set("initial_cash", 1000.0);

    TrialProjector projector(std::make_shared<ConstantFormula>(300.0, 500.0), baseline, 6);
    Trajectory trajectory = projector.project({});

    REQUIRE(trajectory.size() == 6);
    REQUIRE_THAT(trajectory[0].cash_balance, WithinAbs(800.0, 1e-9));
    for (size_t m = 1; m < trajectory.size(); ++m) {
        double expected = trajectory[m - 1].cash_balance + trajectory[m].revenue - trajectory[m].expenses;
        REQUIRE_THAT(trajectory[m].cash_balance, WithinAbs(expected, 1e-9));
    }
    REQUIRE_THAT(trajectory.back().cash_balance, WithinAbs(-200.0, 1e-9));
}

TEST_CASE("Projector rejects bad construction arguments", "[projector]") {
    BaselineAssumptions baseline;
    REQUIRE_THROWS_AS(TrialProjector(nullptr, baseline, 12), std::invalid_argument);
    REQUIRE_THROWS_AS(TrialProjector(std::make_shared<SaasCashFlowFormula>(), baseline, 0),
                      std::invalid_argument);
}

TEST_CASE("Non-finite output is reported", "[projector]") {
    BaselineAssumptions baseline;
    TrialProjector projector(std::make_shared<BrokenFormula>(3), baseline, 5);

    Trajectory trajectory;
    REQUIRE_FALSE(projector.project_into({}, trajectory));
    REQUIRE(trajectory.size() == 5);
    REQUIRE_FALSE(is_finite_trajectory(trajectory));

    TrialProjector healthy(std::make_shared<BrokenFormula>(99), baseline, 5);
    REQUIRE(healthy.project_into({}, trajectory));
    REQUIRE(is_finite_trajectory(trajectory));
}

// ============================================================================
// SaasCashFlowFormula
// ============================================================================

TEST_CASE("SaaS formula compounds revenue without churn or marketing", "[projector][saas]") {
    BaselineAssumptions baseline;
    baseline.set("starting_revenue", 45000.0);
    baseline.set("initial_cash", 500000.0);

    DriverValues drivers;
    drivers["revenue_growth"] = 8.0;

    TrialProjector projector(std::make_shared<SaasCashFlowFormula>(), baseline, 12);
    Trajectory trajectory = projector.project(drivers);

    REQUIRE_THAT(trajectory[0].revenue, WithinRel(45000.0 * 1.08, 1e-12));
    REQUIRE_THAT(trajectory[11].revenue, WithinRel(45000.0 * std::pow(1.08, 12), 1e-12));
}

TEST_CASE("SaaS formula expenses", "[projector][saas]") {
    BaselineAssumptions baseline;
    baseline.set("starting_revenue", 10000.0);
    baseline.set("monthly_expenses", 20000.0);
    baseline.set("expense_growth", 10.0);
    baseline.set("cogs_percentage", 20.0);
    baseline.set("marketing_spend", 1000.0);
    baseline.set("cac", 500.0);
    baseline.set("deal_size", 100.0);
    baseline.set("churn_rate", 0.0);

    TrialProjector projector(std::make_shared<SaasCashFlowFormula>(), baseline, 2);
    Trajectory trajectory = projector.project({});

    // Two customers acquired per month at 100 MRR each
    REQUIRE_THAT(trajectory[0].revenue, WithinAbs(10200.0, 1e-9));
    REQUIRE_THAT(trajectory[0].expenses, WithinAbs(20000.0 + 0.2 * 10200.0 + 1000.0, 1e-9));

    REQUIRE_THAT(trajectory[1].revenue, WithinAbs(10400.0, 1e-9));
    REQUIRE_THAT(trajectory[1].expenses, WithinAbs(22000.0 + 0.2 * 10400.0 + 1000.0, 1e-9));
}

TEST_CASE("SaaS formula applies churn", "[projector][saas]") {
    BaselineAssumptions baseline;
    baseline.set("starting_revenue", 1000.0);

    DriverValues drivers;
    drivers["churn_rate"] = 10.0;

    TrialProjector projector(std::make_shared<SaasCashFlowFormula>(), baseline, 2);
    Trajectory trajectory = projector.project(drivers);

    REQUIRE_THAT(trajectory[0].revenue, WithinAbs(900.0, 1e-9));
    REQUIRE_THAT(trajectory[1].revenue, WithinAbs(810.0, 1e-9));
    REQUIRE(projector.formula().name() == "saas_cash_flow");
}
