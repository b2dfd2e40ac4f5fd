#include "simulation_result.hpp"
#include <utility>

namespace runwaycalc {

TrialAdjustments::TrialAdjustments()
    : requested_trials(0), discarded_trials(0), effective_trials(0),
      discard_ratio(0.0), discard_threshold(0.0) {}

SimulationResult::SimulationResult()
    : num_simulations(0), horizon_months(0), seed(0), execution_time_ms(0.0) {}

SimulationResult ResultAssembler::assemble(const SimulationConfig& config,
                                           uint64_t seed,
                                           const std::string& formula_name,
                                           PercentileAggregator& cash_balance,
                                           PercentileAggregator& revenue,
                                           PercentileAggregator& expenses,
                                           const SurvivalAnalyzer& survival,
                                           SensitivityResult sensitivity,
                                           const TrialAdjustments& adjustments)
{
    SimulationResult result;
    result.num_simulations = config.num_simulations;
    result.horizon_months = config.horizon_months;
    result.seed = seed;
    result.formula_name = formula_name;
    result.month_labels = config.resolved_month_labels();

    result.cash_balance = cash_balance.finalize();
    result.revenue = revenue.finalize();
    result.expenses = expenses.finalize();

    // Both need the cash buffers sorted by finalize() above
    result.confidence_intervals = cash_balance.confidence_intervals();
    result.risk = cash_balance.terminal_risk();

    result.survival = survival.finalize();
    result.sensitivity = std::move(sensitivity);
    result.adjustments = adjustments;
    return result;
}

} // namespace runwaycalc
