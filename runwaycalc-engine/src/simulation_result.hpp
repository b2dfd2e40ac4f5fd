#ifndef RUNWAYCALC_SIMULATION_RESULT_HPP
#define RUNWAYCALC_SIMULATION_RESULT_HPP

#include "driver_spec.hpp"
#include "percentile_aggregator.hpp"
#include "sensitivity_analyzer.hpp"
#include "survival_analyzer.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace runwaycalc {

// Trial accounting after discards
struct TrialAdjustments {
    size_t requested_trials;
    size_t discarded_trials;
    size_t effective_trials;
    double discard_ratio;
    double discard_threshold;

    TrialAdjustments();
};

// SimulationResult: the immutable bundle handed to the job/storage layer
struct SimulationResult {
    // Run metadata
    int num_simulations;
    int horizon_months;
    uint64_t seed;
    std::string formula_name;
    std::vector<std::string> month_labels;
    double execution_time_ms;

    // Percentile tables per tracked series
    PercentileTable cash_balance;
    PercentileTable revenue;
    PercentileTable expenses;

    ConfidenceIntervals confidence_intervals;   // Cash balance
    RiskMetrics risk;                           // Terminal cash balance

    SurvivalProbability survival;
    SensitivityResult sensitivity;
    TrialAdjustments adjustments;

    SimulationResult();
};

// ResultAssembler: packages finalized aggregators into a SimulationResult
class ResultAssembler {
public:
    static SimulationResult assemble(const SimulationConfig& config,
                                     uint64_t seed,
                                     const std::string& formula_name,
                                     PercentileAggregator& cash_balance,
                                     PercentileAggregator& revenue,
                                     PercentileAggregator& expenses,
                                     const SurvivalAnalyzer& survival,
                                     SensitivityResult sensitivity,
                                     const TrialAdjustments& adjustments);
};

} // namespace runwaycalc

#endif // RUNWAYCALC_SIMULATION_RESULT_HPP
