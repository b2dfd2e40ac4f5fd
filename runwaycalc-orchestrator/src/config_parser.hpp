#ifndef RUNWAYCALC_ORCHESTRATOR_CONFIG_PARSER_HPP
#define RUNWAYCALC_ORCHESTRATOR_CONFIG_PARSER_HPP

#include "../../runwaycalc-engine/src/driver_spec.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace runwaycalc {
namespace orchestrator {

/**
 * @brief Exception thrown when a simulation payload cannot be parsed
 *
 * Raised for malformed JSON and for members of the wrong JSON type.
 * Semantic problems (ranges, min > max, unknown distributions) are
 * reported as a single ValidationError instead.
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Parses a simulation payload from a JSON file
 *
 * @param file_path Path to the JSON payload
 * @return Validated simulation configuration
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 * @throws ValidationError listing every semantic problem
 */
SimulationConfig parse_simulation_config_from_file(const std::string& file_path);

/**
 * @brief Parses a simulation payload from a JSON string
 *
 * @param json_string Payload as string
 * @return Validated simulation configuration
 * @throws ConfigParseError if JSON is invalid
 * @throws ValidationError listing every semantic problem
 */
SimulationConfig parse_simulation_config_from_string(const std::string& json_string);

/**
 * @brief Parses an already-decoded simulation payload
 *
 * Accepted members: numSimulations, horizonMonths, drivers (object keyed
 * by id, or array of driver objects), baselineAssumptions, seed (or
 * randomSeed), sensitivitySamples, startMonth ("YYYY-MM"), batchSize.
 */
SimulationConfig parse_simulation_config(const nlohmann::json& payload);

/**
 * @brief Parses one driver object
 *
 * Missing min/max are filled with mean -/+ 3 stdDev for normal and
 * lognormal drivers (the lognormal lower bound is floored at 0).
 * Beta drivers take alpha/beta (default 2, 2) over the required [min, max];
 * gamma drivers take shape/scale (default 2, 1), or derive them from
 * mean and stdDev. Their missing moments and bounds are filled in from
 * the distribution. Problems are appended to `issues` rather than thrown.
 */
DriverSpec parse_driver(const std::string& id, const nlohmann::json& driver_json,
                        std::vector<ValidationIssue>& issues);

/**
 * @brief Month labels "YYYY-MM" starting at start_month
 *
 * @throws std::invalid_argument if start_month is not "YYYY-MM" or
 *         horizon_months is outside [0, SimulationConfig::MAX_HORIZON_MONTHS]
 */
std::vector<std::string> month_labels_from(const std::string& start_month, int horizon_months);

/**
 * @brief Canonical JSON form of a configuration (keys sorted)
 *
 * The seed and batch size are left out: neither changes what is simulated
 * beyond the random stream.
 */
nlohmann::json config_to_canonical_json(const SimulationConfig& config);

/**
 * @brief FNV-1a 64-bit hash of the canonical JSON of a configuration
 *
 * Identical payloads hash identically; used as the default seed.
 */
uint64_t fingerprint(const SimulationConfig& config);

/**
 * @brief FNV-1a 64-bit hash of a byte string
 */
uint64_t fnv1a_64(const std::string& data);

} // namespace orchestrator
} // namespace runwaycalc

#endif // RUNWAYCALC_ORCHESTRATOR_CONFIG_PARSER_HPP
