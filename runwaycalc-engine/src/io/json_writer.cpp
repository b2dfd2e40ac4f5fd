#include "json_writer.hpp"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace runwaycalc {
namespace io {

namespace {

json bands_to_json(const std::vector<ConfidenceBand>& bands) {
    json lower = json::array();
    json upper = json::array();
    json width = json::array();
    for (const auto& band : bands) {
        lower.push_back(band.lower);
        upper.push_back(band.upper);
        width.push_back(band.width);
    }
    return json{{"lower", lower}, {"upper", upper}, {"width", width}};
}

json moments_to_json(const PercentileTable& table) {
    return json{{"mean", table.mean}, {"stdDev", table.std_dev}};
}

json driver_values_to_json(const DriverValues& values) {
    json obj = json::object();
    for (const auto& entry : values) {
        obj[entry.first] = entry.second;
    }
    return obj;
}

} // anonymous namespace

json to_json(const PercentileTable& table, const std::vector<std::string>& months) {
    json obj;
    obj["months"] = months;
    const auto& labels = percentile_labels();
    for (size_t i = 0; i < NUM_PERCENTILES; ++i) {
        obj[labels[i]] = table.values[i];
    }
    return obj;
}

json to_json(const SurvivalProbability& survival) {
    const SurvivalOverall& overall = survival.overall;

    json thresholds = json::object();
    for (const auto& t : survival.runway_thresholds) {
        thresholds[t.key()] = {
            {"thresholdMonths", t.months},
            {"probability", t.probability},
            {"percentage", t.percentage},
            {"simulationsSurvived", t.survived},
            {"simulationsFailed", t.failed}
        };
    }

    return json{
        {"overall", {
            {"probabilitySurvivingFullPeriod", overall.probability_surviving_full_period},
            {"percentageSurvivingFullPeriod", overall.percentage_surviving_full_period},
            {"averageMonthsToFailure", overall.average_months_to_failure},
            {"medianMonthsToFailure", overall.median_months_to_failure},
            {"totalSimulations", overall.total_simulations},
            {"simulationsSurvived", overall.simulations_survived},
            {"simulationsFailed", overall.simulations_failed}
        }},
        {"runwayThresholds", thresholds},
        {"byMonth", survival.by_month},
        {"summary", {
            {"keyMessage", survival.summary.key_message},
            {"riskLevel", survival.summary.risk_level}
        }}
    };
}

json to_json(const SensitivityResult& sensitivity) {
    json tornado = json::array();
    for (const auto& entry : sensitivity.tornado) {
        tornado.push_back({
            {"driverId", entry.driver_id},
            {"driverName", entry.driver_name},
            {"unit", entry.unit},
            {"upsideImpact", entry.upside_impact},
            {"downsideImpact", entry.downside_impact},
            {"totalImpact", entry.total_impact},
            {"lowValue", entry.low_value},
            {"highValue", entry.high_value},
            {"baselineValue", entry.baseline_value},
            {"baselineOutcome", entry.baseline_outcome},
            {"correlation", entry.pearson_correlation},
            {"spearmanCorrelation", entry.spearman_correlation},
            {"samples", entry.samples}
        });
    }

    json top = json::array();
    for (const auto& driver : sensitivity.top_drivers) {
        top.push_back({
            {"driverId", driver.driver_id},
            {"driverName", driver.driver_name},
            {"totalImpact", driver.total_impact},
            {"contributionPercentage", driver.contribution_percentage},
            {"description", driver.description}
        });
    }

    return json{{"tornadoData", tornado}, {"topDrivers", top}};
}

json to_json(const SimulationResult& result) {
    json bundle;

    bundle["meta"] = {
        {"numSimulations", result.num_simulations},
        {"horizonMonths", result.horizon_months},
        {"months", result.month_labels},
        {"seed", result.seed},
        {"formula", result.formula_name},
        {"executionTimeMs", result.execution_time_ms}
    };

    bundle["percentiles_table"] = to_json(result.cash_balance, result.month_labels);
    bundle["revenue_percentiles_table"] = to_json(result.revenue, result.month_labels);
    bundle["expenses_percentiles_table"] = to_json(result.expenses, result.month_labels);

    bundle["fan_chart"] = {
        {"months", result.month_labels},
        {"cash_balance", moments_to_json(result.cash_balance)},
        {"revenue", moments_to_json(result.revenue)},
        {"expenses", moments_to_json(result.expenses)}
    };

    bundle["confidence_intervals"] = {
        {"ci_80", bands_to_json(result.confidence_intervals.ci_80)},
        {"ci_90", bands_to_json(result.confidence_intervals.ci_90)},
        {"ci_95", bands_to_json(result.confidence_intervals.ci_95)}
    };

    bundle["risk_metrics"] = {
        {"valueAtRisk95", result.risk.value_at_risk_95},
        {"expectedShortfall95", result.risk.expected_shortfall_95},
        {"meanEndingCash", result.risk.mean},
        {"stdDevEndingCash", result.risk.std_dev},
        {"worstEndingCash", result.risk.worst},
        {"bestEndingCash", result.risk.best}
    };

    bundle["survival_probability"] = to_json(result.survival);

    json sensitivity = to_json(result.sensitivity);
    bundle["tornadoData"] = sensitivity["tornadoData"];
    bundle["topDrivers"] = sensitivity["topDrivers"];
    bundle["sensitivityBaselineOutcome"] = result.sensitivity.baseline_outcome;

    bundle["adjustments"] = {
        {"requestedTrials", result.adjustments.requested_trials},
        {"discardedTrials", result.adjustments.discarded_trials},
        {"effectiveTrials", result.adjustments.effective_trials},
        {"discardRatio", result.adjustments.discard_ratio},
        {"discardThreshold", result.adjustments.discard_threshold}
    };

    return bundle;
}

json status_to_json(const SimulationOutcome& outcome, double progress) {
    json status = {
        {"status", status_to_string(outcome.status)},
        {"progress", progress},
        {"completedTrials", outcome.completed_trials},
        {"discardedTrials", outcome.discarded_trials},
        {"logs", outcome.logs}
    };

    if (outcome.status == SimulationStatus::Failed) {
        json failing = json::array();
        for (const auto& sample : outcome.failing_samples) {
            failing.push_back(driver_values_to_json(sample));
        }
        status["error"] = {
            {"type", outcome.error_type},
            {"message", outcome.error_message},
            {"failingSamples", failing}
        };
    }
    return status;
}

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print) {
    os << to_json(result).dump(pretty_print ? 2 : -1) << "\n";
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_simulation_result_json(file, result, pretty_print);
}

} // namespace io
} // namespace runwaycalc
