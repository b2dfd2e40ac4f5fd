#include "sensitivity_analyzer.hpp"
#include "distribution_sampler.hpp"
#include "percentile_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace runwaycalc {

// ============================================================================
// Result types
// ============================================================================

SensitivityEntry::SensitivityEntry()
    : upside_impact(0.0), downside_impact(0.0), total_impact(0.0),
      low_value(0.0), high_value(0.0), baseline_value(0.0), baseline_outcome(0.0),
      pearson_correlation(0.0), spearman_correlation(0.0), samples(0) {}

TopDriver::TopDriver() : total_impact(0.0), contribution_percentage(0.0) {}

SensitivityResult::SensitivityResult() : baseline_outcome(0.0) {}

namespace {

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0);
    if (value < 0.0) {
        oss << "-$" << -value;
    } else {
        oss << "$" << value;
    }
    return oss.str();
}

// Average ranks, ties share the mean of their positions
std::vector<double> ranks(const std::vector<double>& values) {
    std::vector<size_t> order(values.size());
    for (size_t i = 0; i < order.size(); ++i) {
        order[i] = i;
    }
    std::stable_sort(order.begin(), order.end(),
                     [&values](size_t a, size_t b) { return values[a] < values[b]; });

    std::vector<double> result(values.size(), 0.0);
    size_t i = 0;
    while (i < order.size()) {
        size_t j = i;
        while (j + 1 < order.size() && values[order[j + 1]] == values[order[i]]) {
            ++j;
        }
        double rank = 0.5 * static_cast<double>(i + j) + 1.0;
        for (size_t k = i; k <= j; ++k) {
            result[order[k]] = rank;
        }
        i = j + 1;
    }
    return result;
}

} // anonymous namespace

std::string describe_driver_impact(const SensitivityEntry& entry, double contribution_percentage) {
    std::ostringstream oss;
    oss << entry.driver_name << " accounts for "
        << std::fixed << std::setprecision(1) << contribution_percentage
        << "% of the spread in ending cash: "
        << format_amount(entry.downside_impact) << " in the worst case, +"
        << format_amount(entry.upside_impact) << " in the best case";
    return oss.str();
}

// ============================================================================
// SensitivityAnalyzer Implementation
// ============================================================================

SensitivityAnalyzer::SensitivityAnalyzer(const std::map<std::string, DriverSpec>& drivers,
                                         const TrialProjector& projector,
                                         int samples_per_driver)
    : drivers_(drivers), projector_(projector), samples_per_driver_(samples_per_driver)
{
    if (samples_per_driver_ < 0) {
        throw std::invalid_argument("samples_per_driver must be non-negative");
    }
}

DriverValues SensitivityAnalyzer::baseline_values() const {
    DriverValues values;
    for (const auto& [id, driver] : drivers_) {
        values.emplace(id, driver.mean);
    }
    return values;
}

double SensitivityAnalyzer::terminal_cash(const DriverValues& values,
                                          Trajectory& scratch, bool& ok) const {
    // A throwing formula counts as a non-finite evaluation, as for main-run trials
    try {
        ok = projector_.project_into(values, scratch);
    } catch (const std::exception&) {
        ok = false;
        return std::numeric_limits<double>::quiet_NaN();
    }
    return scratch.back().cash_balance;
}

double SensitivityAnalyzer::baseline_outcome() const {
    Trajectory scratch;
    bool ok = false;
    double outcome = terminal_cash(baseline_values(), scratch, ok);
    if (!ok) {
        throw SimulationError("Baseline projection produced non-finite values");
    }
    return outcome;
}

SensitivityResult SensitivityAnalyzer::analyze(uint64_t seed, const MainRunSamples* main_run) const {
    SensitivityResult result;
    result.baseline_outcome = baseline_outcome();

    Trajectory scratch;
    DriverValues values = baseline_values();
    uint64_t driver_index = 0;

    for (const auto& [id, driver] : drivers_) {
        SensitivityEntry entry;
        entry.driver_id = id;
        entry.driver_name = driver.display_name();
        entry.unit = driver.unit;
        entry.baseline_value = driver.mean;
        entry.baseline_outcome = result.baseline_outcome;

        // Range endpoints first, then draws from the driver's own distribution
        std::vector<double> inputs;
        inputs.reserve(static_cast<size_t>(samples_per_driver_) + 2);
        inputs.push_back(driver.min);
        inputs.push_back(driver.max);
        RandomEngine rng = DistributionSampler::trial_engine(seed, STREAM_OFFSET + driver_index);
        for (int s = 0; s < samples_per_driver_; ++s) {
            inputs.push_back(DistributionSampler::sample(driver, rng));
        }

        double best = result.baseline_outcome;
        double worst = result.baseline_outcome;
        entry.low_value = driver.mean;
        entry.high_value = driver.mean;

        for (double input : inputs) {
            values[id] = input;
            bool ok = false;
            double outcome = terminal_cash(values, scratch, ok);
            if (!ok) {
                continue;
            }
            ++entry.samples;
            if (outcome > best) {
                best = outcome;
                entry.high_value = input;
            }
            if (outcome < worst) {
                worst = outcome;
                entry.low_value = input;
            }
        }
        values[id] = driver.mean;

        entry.upside_impact = std::max(0.0, best - result.baseline_outcome);
        entry.downside_impact = std::min(0.0, worst - result.baseline_outcome);
        entry.total_impact = entry.upside_impact + std::fabs(entry.downside_impact);

        if (main_run) {
            auto it = main_run->driver_values.find(id);
            if (it != main_run->driver_values.end()) {
                entry.pearson_correlation =
                    stats::pearson_correlation(it->second, main_run->terminal_cash);
                entry.spearman_correlation =
                    stats::pearson_correlation(ranks(it->second), ranks(main_run->terminal_cash));
            }
        }

        result.tornado.push_back(entry);
        ++driver_index;
    }

    // Ties keep driver id order
    std::stable_sort(result.tornado.begin(), result.tornado.end(),
                     [](const SensitivityEntry& a, const SensitivityEntry& b) {
                         return a.total_impact > b.total_impact;
                     });

    double impact_sum = 0.0;
    for (const auto& entry : result.tornado) {
        impact_sum += entry.total_impact;
    }

    const size_t top_count = std::min(TOP_DRIVER_COUNT, result.tornado.size());
    for (size_t i = 0; i < top_count; ++i) {
        const SensitivityEntry& entry = result.tornado[i];
        TopDriver top;
        top.driver_id = entry.driver_id;
        top.driver_name = entry.driver_name;
        top.total_impact = entry.total_impact;
        top.contribution_percentage = impact_sum > 0.0 ? entry.total_impact / impact_sum * 100.0 : 0.0;
        top.description = describe_driver_impact(entry, top.contribution_percentage);
        result.top_drivers.push_back(top);
    }

    return result;
}

} // namespace runwaycalc
