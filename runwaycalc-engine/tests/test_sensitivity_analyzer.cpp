#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <limits>
#include <memory>
#include "../src/sensitivity_analyzer.hpp"

using namespace runwaycalc;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::ContainsSubstring;

namespace {

BaselineAssumptions saas_baseline() {
    BaselineAssumptions baseline;
    baseline.set("initial_cash", 500000.0);
    baseline.set("starting_revenue", 45000.0);
    baseline.set("monthly_expenses", 60000.0);
    baseline.set("expense_growth", 1.0);
    return baseline;
}

std::map<std::string, DriverSpec> saas_drivers() {
    std::map<std::string, DriverSpec> drivers;
    drivers["revenue_growth"] = DriverSpec("revenue_growth", Distribution::Normal, 8.0, 3.0, 2.0, 15.0, "%");
    drivers["expense_growth"] = DriverSpec("expense_growth", Distribution::Normal, 1.0, 0.1, 0.8, 1.2, "%");
    drivers["churn_rate"] = DriverSpec("churn_rate", Distribution::Triangular, 3.0, 0.0, 1.0, 6.0, "%");
    drivers["cogs_percentage"] = DriverSpec("cogs_percentage", Distribution::Uniform, 20.0, 0.0, 19.0, 21.0, "%");
    return drivers;
}

class NaNFormula : public ProjectionFormula {
public:
    MonthlyFlows project_month(const TrialAssumptions&, int, const MonthRecord*) const override {
        return MonthlyFlows{std::numeric_limits<double>::quiet_NaN(), 0.0};
    }
    std::string name() const override { return "nan"; }
};

} // anonymous namespace

TEST_CASE("Tornado is sorted by total impact", "[sensitivity]") {
    BaselineAssumptions baseline = saas_baseline();
    auto drivers = saas_drivers();
    TrialProjector projector(std::make_shared<SaasCashFlowFormula>(), baseline, 12);

    SensitivityAnalyzer analyzer(drivers, projector, 50);
    SensitivityResult result = analyzer.analyze(42);

    REQUIRE(result.tornado.size() == drivers.size());
    for (size_t i = 1; i < result.tornado.size(); ++i) {
        REQUIRE(result.tornado[i - 1].total_impact >= result.tornado[i].total_impact);
    }
    REQUIRE(result.tornado.front().driver_id == "revenue_growth");
    REQUIRE(result.tornado.front().driver_name == "Revenue Growth");

    for (const auto& entry : result.tornado) {
        REQUIRE(entry.upside_impact >= 0.0);
        REQUIRE(entry.downside_impact <= 0.0);
        REQUIRE_THAT(entry.total_impact,
                     WithinAbs(entry.upside_impact - entry.downside_impact, 1e-6));
        REQUIRE(entry.samples == 52);
        REQUIRE(entry.baseline_outcome == result.baseline_outcome);
    }
}

TEST_CASE("Monotone driver hits its range endpoints", "[sensitivity]") {
    BaselineAssumptions baseline = saas_baseline();
    auto drivers = saas_drivers();
    TrialProjector projector(std::make_shared<SaasCashFlowFormula>(), baseline, 12);

    SensitivityResult result = SensitivityAnalyzer(drivers, projector, 20).analyze(7);

    const SensitivityEntry& growth = result.tornado.front();
    REQUIRE(growth.high_value == 15.0);
    REQUIRE(growth.low_value == 2.0);
    REQUIRE(growth.baseline_value == 8.0);
}

TEST_CASE("Top drivers and contribution shares", "[sensitivity]") {
    BaselineAssumptions baseline = saas_baseline();
    auto drivers = saas_drivers();
    TrialProjector projector(std::make_shared<SaasCashFlowFormula>(), baseline, 12);

    SensitivityResult result = SensitivityAnalyzer(drivers, projector, 20).analyze(7);

    REQUIRE(result.top_drivers.size() == SensitivityAnalyzer::TOP_DRIVER_COUNT);
    for (size_t i = 0; i < result.top_drivers.size(); ++i) {
        REQUIRE(result.top_drivers[i].driver_id == result.tornado[i].driver_id);
        REQUIRE(result.top_drivers[i].contribution_percentage > 0.0);
        REQUIRE(result.top_drivers[i].contribution_percentage <= 100.0);
    }
    REQUIRE_THAT(result.top_drivers.front().description,
                 ContainsSubstring("Revenue Growth accounts for"));
    REQUIRE_THAT(result.top_drivers.front().description, ContainsSubstring("in the worst case"));
}

TEST_CASE("Same seed gives the same tornado", "[sensitivity]") {
    BaselineAssumptions baseline = saas_baseline();
    auto drivers = saas_drivers();
    TrialProjector projector(std::make_shared<SaasCashFlowFormula>(), baseline, 12);
    SensitivityAnalyzer analyzer(drivers, projector, 30);

    SensitivityResult a = analyzer.analyze(99);
    SensitivityResult b = analyzer.analyze(99);
    REQUIRE(a.tornado.size() == b.tornado.size());
    for (size_t i = 0; i < a.tornado.size(); ++i) {
        REQUIRE(a.tornado[i].driver_id == b.tornado[i].driver_id);
        REQUIRE(a.tornado[i].total_impact == b.tornado[i].total_impact);
    }
}

TEST_CASE("Correlations against the main run", "[sensitivity]") {
    BaselineAssumptions baseline = saas_baseline();
    std::map<std::string, DriverSpec> drivers;
    drivers["revenue_growth"] = DriverSpec("revenue_growth", Distribution::Normal, 8.0, 3.0, 2.0, 15.0, "%");
    TrialProjector projector(std::make_shared<SaasCashFlowFormula>(), baseline, 12);

    MainRunSamples main_run;
    for (int i = 0; i < 10; ++i) {
        main_run.driver_values["revenue_growth"].push_back(static_cast<double>(i));
        // Monotone but not linear
        main_run.terminal_cash.push_back(static_cast<double>(i * i * i));
    }

    SensitivityResult result = SensitivityAnalyzer(drivers, projector, 5).analyze(1, &main_run);
    REQUIRE(result.tornado.front().pearson_correlation > 0.9);
    REQUIRE(result.tornado.front().pearson_correlation < 1.0);
    REQUIRE_THAT(result.tornado.front().spearman_correlation, WithinAbs(1.0, 1e-12));

    SensitivityResult without = SensitivityAnalyzer(drivers, projector, 5).analyze(1);
    REQUIRE(without.tornado.front().pearson_correlation == 0.0);
}

TEST_CASE("Non-finite baseline is an error", "[sensitivity]") {
    BaselineAssumptions baseline;
    auto drivers = saas_drivers();
    TrialProjector projector(std::make_shared<NaNFormula>(), baseline, 3);
    SensitivityAnalyzer analyzer(drivers, projector, 5);

    REQUIRE_THROWS_AS(analyzer.baseline_outcome(), SimulationError);
    REQUIRE_THROWS_AS(analyzer.analyze(1), SimulationError);
}

TEST_CASE("Impact description format", "[sensitivity]") {
    SensitivityEntry entry;
    entry.driver_name = "Churn Rate";
    entry.downside_impact = -1500.0;
    entry.upside_impact = 800.0;

    REQUIRE(describe_driver_impact(entry, 42.0) ==
            "Churn Rate accounts for 42.0% of the spread in ending cash: "
            "-$1500 in the worst case, +$800 in the best case");
}
