#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "../src/simulation_runner.hpp"
#include "../src/io/json_writer.hpp"

using namespace runwaycalc;
using json = nlohmann::json;
using Catch::Matchers::WithinAbs;

namespace {

SimulationConfig small_config() {
    SimulationConfig config;
    config.num_simulations = 200;
    config.horizon_months = 12;
    config.seed = 2024;
    config.sensitivity_samples = 10;
    config.add_driver(DriverSpec("revenue_growth", Distribution::Normal, 8.0, 3.0, 2.0, 15.0, "%"));
    config.add_driver(DriverSpec("churn_rate", Distribution::Triangular, 3.0, 0.0, 1.0, 6.0, "%"));
    config.baseline.set("initial_cash", 200000.0);
    config.baseline.set("starting_revenue", 30000.0);
    config.baseline.set("monthly_expenses", 50000.0);
    return config;
}

SimulationResult run_small() {
    SimulationRunner runner(small_config());
    SimulationOutcome outcome = runner.run();
    REQUIRE(outcome.status == SimulationStatus::Done);
    REQUIRE(outcome.result.has_value());
    return *outcome.result;
}

} // anonymous namespace

TEST_CASE("Result bundle carries every section", "[json][io]") {
    SimulationResult result = run_small();
    json bundle = io::to_json(result);

    for (const char* key : {"meta", "percentiles_table", "revenue_percentiles_table",
                            "expenses_percentiles_table", "fan_chart", "confidence_intervals",
                            "risk_metrics", "survival_probability", "tornadoData", "topDrivers",
                            "adjustments"}) {
        INFO("missing key " << key);
        REQUIRE(bundle.contains(key));
    }

    REQUIRE(bundle["meta"]["numSimulations"] == 200);
    REQUIRE(bundle["meta"]["horizonMonths"] == 12);
    REQUIRE(bundle["meta"]["seed"].get<uint64_t>() == 2024);
    REQUIRE(bundle["meta"]["formula"] == "saas_cash_flow");
}

TEST_CASE("Percentile table shape", "[json][io]") {
    SimulationResult result = run_small();
    json table = io::to_json(result).at("percentiles_table");

    REQUIRE(table["months"].size() == 12);
    REQUIRE(table["months"][0] == "Month_1");
    for (const auto& label : percentile_labels()) {
        REQUIRE(table.contains(label));
        REQUIRE(table[label].size() == 12);
    }
    REQUIRE_THAT(table["p50"][11].get<double>(), WithinAbs(result.cash_balance.at("p50")[11], 1e-9));
}

TEST_CASE("Survival section", "[json][io]") {
    SimulationResult result = run_small();
    json survival = io::to_json(result).at("survival_probability");

    REQUIRE(survival["overall"]["totalSimulations"] == 200);
    REQUIRE(survival["runwayThresholds"].contains("12_months"));
    REQUIRE_FALSE(survival["runwayThresholds"].contains("18_months"));
    REQUIRE(survival["runwayThresholds"]["6_months"]["thresholdMonths"] == 6);
    REQUIRE(survival["byMonth"].size() == 12);
    REQUIRE(survival["summary"].contains("keyMessage"));
    REQUIRE(survival["summary"].contains("riskLevel"));
}

TEST_CASE("Tornado section", "[json][io]") {
    SimulationResult result = run_small();
    json bundle = io::to_json(result);

    REQUIRE(bundle["tornadoData"].size() == 2);
    const json& first = bundle["tornadoData"][0];
    for (const char* key : {"driverId", "driverName", "upsideImpact", "downsideImpact",
                            "totalImpact", "correlation"}) {
        REQUIRE(first.contains(key));
    }
    REQUIRE(bundle["tornadoData"][0]["totalImpact"].get<double>() >=
            bundle["tornadoData"][1]["totalImpact"].get<double>());
    REQUIRE(bundle["topDrivers"].size() == 2);
}

TEST_CASE("Status contract", "[json][io]") {
    SimulationOutcome outcome;
    outcome.status = SimulationStatus::Failed;
    outcome.error_type = "SimulationIntegrityError";
    outcome.error_message = "too many discarded trials";
    outcome.logs = {"WARN trials_discarded: 60 of 1000 trials discarded"};
    outcome.failing_samples.push_back({{"revenue_growth", 3.5}});

    json status = io::status_to_json(outcome, 0.4);
    REQUIRE(status["status"] == "failed");
    REQUIRE_THAT(status["progress"].get<double>(), WithinAbs(0.4, 1e-12));
    REQUIRE(status["logs"].size() == 1);
    REQUIRE(status["error"]["type"] == "SimulationIntegrityError");
    REQUIRE(status["error"]["failingSamples"][0]["revenue_growth"] == 3.5);

    outcome.status = SimulationStatus::Cancelled;
    REQUIRE_FALSE(io::status_to_json(outcome, 0.4).contains("error"));
}

TEST_CASE("Bundle written to file parses back", "[json][io]") {
    SimulationResult result = run_small();
    const std::string path = "test_result_bundle.json";

    io::write_simulation_result_json(path, result);

    std::ifstream file(path);
    REQUIRE(file.is_open());
    json parsed = json::parse(file);
    file.close();
    REQUIRE(parsed["meta"]["horizonMonths"] == 12);
    REQUIRE(parsed["adjustments"]["effectiveTrials"] == 200);

    std::ostringstream compact;
    io::write_simulation_result_json(compact, result, false);
    REQUIRE(compact.str().find('\n') == compact.str().size() - 1);

    std::filesystem::remove(path);
}

TEST_CASE("Unwritable output path throws", "[json][io]") {
    SimulationResult result;
    REQUIRE_THROWS_AS(
        io::write_simulation_result_json("/nonexistent-dir/result.json", result),
        std::runtime_error);
}
