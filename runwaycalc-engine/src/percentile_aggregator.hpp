#ifndef RUNWAYCALC_PERCENTILE_AGGREGATOR_HPP
#define RUNWAYCALC_PERCENTILE_AGGREGATOR_HPP

#include "trial_projector.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace runwaycalc {

// ============================================================================
// Statistics helpers
// ============================================================================

namespace stats {

double calculate_mean(const std::vector<double>& values);

// Population standard deviation
double calculate_std_dev(const std::vector<double>& values, double mean);

// Linear interpolation between order statistics, pos = p/100 * (n - 1).
// sorted_values must be ascending; p is 0-100.
double calculate_percentile(const std::vector<double>& sorted_values, double p);

// Conditional tail expectation: mean of the lowest (100 - p)% of values.
// sorted_values must be ascending.
double calculate_cte(const std::vector<double>& sorted_values, double p);

// Pearson correlation; 0 when either side has no variance
double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y);

} // namespace stats

// ============================================================================
// Percentile table
// ============================================================================

// Percentile levels reported for every series, ascending
constexpr size_t NUM_PERCENTILES = 7;
constexpr std::array<double, NUM_PERCENTILES> PERCENTILE_LEVELS = {
    5.0, 10.0, 25.0, 50.0, 75.0, 90.0, 95.0
};

// "p5", "p10", ..., "p95" in PERCENTILE_LEVELS order
const std::array<std::string, NUM_PERCENTILES>& percentile_labels();

// Which trajectory field an aggregator tracks
enum class Series : uint8_t {
    CashBalance = 0,
    Revenue = 1,
    Expenses = 2
};

std::string series_to_string(Series series);

// PercentileTable: per-month percentile values plus fan-chart moments
struct PercentileTable {
    Series series;
    // values[i][m] is PERCENTILE_LEVELS[i] at month index m
    std::array<std::vector<double>, NUM_PERCENTILES> values;
    std::vector<double> mean;
    std::vector<double> std_dev;

    PercentileTable();

    // Lookup by label ("p50"); throws std::out_of_range for unknown labels
    const std::vector<double>& at(const std::string& label) const;

    size_t months() const { return mean.size(); }
};

// Two-sided band around the median
struct ConfidenceBand {
    double lower;
    double upper;
    double width;

    ConfidenceBand();
    ConfidenceBand(double lo, double hi);
};

// Per-month bands: ci_80 = p10..p90, ci_90 = p5..p95, ci_95 = p2.5..p97.5
struct ConfidenceIntervals {
    std::vector<ConfidenceBand> ci_80;
    std::vector<ConfidenceBand> ci_90;
    std::vector<ConfidenceBand> ci_95;
};

// Risk measures on the final month's values
struct RiskMetrics {
    double value_at_risk_95;        // 5th percentile
    double expected_shortfall_95;   // Mean of the worst 5% (CTE)
    double mean;
    double std_dev;
    double worst;
    double best;

    RiskMetrics();
};

// ============================================================================
// PercentileAggregator
// ============================================================================

// PercentileAggregator: keeps one value buffer per month for a single series.
// Trials are folded in one at a time; per-worker aggregators are combined
// with merge(). finalize() sorts the buffers and computes the table.
class PercentileAggregator {
public:
    PercentileAggregator(Series series, int horizon_months);

    void reserve(size_t trials);

    // Append one trial; trajectory length must equal the horizon
    void add(const Trajectory& trajectory);

    // Append another aggregator's values (same series and horizon)
    void merge(const PercentileAggregator& other);

    size_t count() const;
    int horizon_months() const { return static_cast<int>(buffers_.size()); }
    Series series() const { return series_; }

    // Sorts the buffers in place; further add()/merge() calls reopen them
    PercentileTable finalize();

    // Require finalize() first; throw std::logic_error otherwise
    ConfidenceIntervals confidence_intervals() const;
    RiskMetrics terminal_risk() const;

    // Raw values for month index m (sorted once finalized)
    const std::vector<double>& month_values(int m) const;

private:
    static double field(const MonthRecord& record, Series series);
    void require_sorted(const char* caller) const;

    Series series_;
    std::vector<std::vector<double>> buffers_;
    bool sorted_;
};

} // namespace runwaycalc

#endif // RUNWAYCALC_PERCENTILE_AGGREGATOR_HPP
