#ifndef RUNWAYCALC_IO_JSON_WRITER_HPP
#define RUNWAYCALC_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "../simulation_result.hpp"
#include "../simulation_runner.hpp"

namespace runwaycalc {
namespace io {

// Result bundle as consumed by the presentation layer:
// meta, percentiles_table, revenue_percentiles_table, expenses_percentiles_table,
// fan_chart, confidence_intervals, risk_metrics, survival_probability,
// tornadoData, topDrivers, adjustments
nlohmann::json to_json(const SimulationResult& result);

// Percentile table with its "months" labels
nlohmann::json to_json(const PercentileTable& table, const std::vector<std::string>& months);

nlohmann::json to_json(const SurvivalProbability& survival);
nlohmann::json to_json(const SensitivityResult& sensitivity);

// Job status contract: status, progress, logs, and error details when failed
nlohmann::json status_to_json(const SimulationOutcome& outcome, double progress);

// Write the result bundle as JSON
void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print = true);

// Write the result bundle to a JSON file
void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  bool pretty_print = true);

} // namespace io
} // namespace runwaycalc

#endif // RUNWAYCALC_IO_JSON_WRITER_HPP
