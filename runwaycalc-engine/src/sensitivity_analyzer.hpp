#ifndef RUNWAYCALC_SENSITIVITY_ANALYZER_HPP
#define RUNWAYCALC_SENSITIVITY_ANALYZER_HPP

#include "driver_spec.hpp"
#include "trial_projector.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace runwaycalc {

// One tornado bar
struct SensitivityEntry {
    std::string driver_id;
    std::string driver_name;
    std::string unit;
    double upside_impact;       // >= 0, best terminal cash minus baseline
    double downside_impact;     // <= 0, worst terminal cash minus baseline
    double total_impact;        // upside + |downside|
    double low_value;           // Driver value that produced the worst outcome
    double high_value;          // Driver value that produced the best outcome
    double baseline_value;      // Driver mean
    double baseline_outcome;    // Terminal cash with every driver at its mean
    double pearson_correlation; // Against terminal cash in the main run
    double spearman_correlation;
    int samples;                // Finite evaluations used

    SensitivityEntry();
};

struct TopDriver {
    std::string driver_id;
    std::string driver_name;
    double total_impact;
    double contribution_percentage;     // Share of the summed total impact
    std::string description;

    TopDriver();
};

// SensitivityResult: tornado entries sorted descending by total impact
struct SensitivityResult {
    std::vector<SensitivityEntry> tornado;
    std::vector<TopDriver> top_drivers;      // First three tornado entries
    double baseline_outcome;

    SensitivityResult();
};

// Per-trial driver values and terminal cash from the main run, in trial order
struct MainRunSamples {
    std::map<std::string, std::vector<double>> driver_values;
    std::vector<double> terminal_cash;
};

// SensitivityAnalyzer: one-at-a-time perturbation ranking.
//
// For every driver, the other drivers are pinned at their means while this
// one is evaluated at its min, its max and `samples_per_driver` draws from
// its own distribution. The spread of terminal cash around the all-means
// baseline gives the upside/downside impact.
//
// This is a local sensitivity measure. It ignores interactions between
// drivers and is not a Sobol or ANOVA variance decomposition.
class SensitivityAnalyzer {
public:
    static constexpr size_t TOP_DRIVER_COUNT = 3;

    // Streams for sensitivity draws start here so they never overlap trial streams
    static constexpr uint64_t STREAM_OFFSET = uint64_t(1) << 40;

    SensitivityAnalyzer(const std::map<std::string, DriverSpec>& drivers,
                        const TrialProjector& projector,
                        int samples_per_driver);

    // main_run may be null; correlations are then reported as 0
    SensitivityResult analyze(uint64_t seed, const MainRunSamples* main_run = nullptr) const;

    // Terminal cash with every driver at its mean
    double baseline_outcome() const;

private:
    DriverValues baseline_values() const;
    double terminal_cash(const DriverValues& values, Trajectory& scratch, bool& ok) const;

    const std::map<std::string, DriverSpec>& drivers_;
    const TrialProjector& projector_;
    int samples_per_driver_;
};

// Contribution text for a top driver
std::string describe_driver_impact(const SensitivityEntry& entry, double contribution_percentage);

} // namespace runwaycalc

#endif // RUNWAYCALC_SENSITIVITY_ANALYZER_HPP
