#include "percentile_aggregator.hpp"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace runwaycalc {

// ============================================================================
// Statistics helpers
// ============================================================================

namespace stats {

double calculate_mean(const std::vector<double>& values) {
    if (values.empty()) {
        return 0.0;
    }
    double sum = std::accumulate(values.begin(), values.end(), 0.0);
    return sum / static_cast<double>(values.size());
}

double calculate_std_dev(const std::vector<double>& values, double mean) {
    if (values.size() < 2) {
        return 0.0;
    }
    double sum_sq_diff = 0.0;
    for (double v : values) {
        double diff = v - mean;
        sum_sq_diff += diff * diff;
    }
    return std::sqrt(sum_sq_diff / static_cast<double>(values.size()));
}

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size()) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

double calculate_cte(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        return 0.0;
    }

    double tail_proportion = (100.0 - p) / 100.0;
    size_t tail_count = static_cast<size_t>(std::ceil(sorted_values.size() * tail_proportion));
    if (tail_count == 0) {
        tail_count = 1;
    }

    double sum = 0.0;
    for (size_t i = 0; i < tail_count; ++i) {
        sum += sorted_values[i];
    }
    return sum / static_cast<double>(tail_count);
}

double pearson_correlation(const std::vector<double>& x, const std::vector<double>& y) {
    const size_t n = std::min(x.size(), y.size());
    if (n < 2) {
        return 0.0;
    }

    double mean_x = 0.0;
    double mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double cov = 0.0;
    double var_x = 0.0;
    double var_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = x[i] - mean_x;
        double dy = y[i] - mean_y;
        cov += dx * dy;
        var_x += dx * dx;
        var_y += dy * dy;
    }

    if (var_x <= 0.0 || var_y <= 0.0) {
        return 0.0;
    }
    return cov / std::sqrt(var_x * var_y);
}

} // namespace stats

// ============================================================================
// Labels and table types
// ============================================================================

const std::array<std::string, NUM_PERCENTILES>& percentile_labels() {
    static const std::array<std::string, NUM_PERCENTILES> labels = {
        "p5", "p10", "p25", "p50", "p75", "p90", "p95"
    };
    return labels;
}

std::string series_to_string(Series series) {
    switch (series) {
        case Series::CashBalance: return "cash_balance";
        case Series::Revenue: return "revenue";
        case Series::Expenses: return "expenses";
        default: return "unknown";
    }
}

PercentileTable::PercentileTable() : series(Series::CashBalance) {}

const std::vector<double>& PercentileTable::at(const std::string& label) const {
    const auto& labels = percentile_labels();
    for (size_t i = 0; i < NUM_PERCENTILES; ++i) {
        if (labels[i] == label) {
            return values[i];
        }
    }
    throw std::out_of_range("Unknown percentile label: " + label);
}

ConfidenceBand::ConfidenceBand() : lower(0.0), upper(0.0), width(0.0) {}

ConfidenceBand::ConfidenceBand(double lo, double hi)
    : lower(lo), upper(hi), width(hi - lo) {}

RiskMetrics::RiskMetrics()
    : value_at_risk_95(0.0), expected_shortfall_95(0.0),
      mean(0.0), std_dev(0.0), worst(0.0), best(0.0) {}

// ============================================================================
// PercentileAggregator Implementation
// ============================================================================

PercentileAggregator::PercentileAggregator(Series series, int horizon_months)
    : series_(series), sorted_(false)
{
    if (horizon_months < 1) {
        throw std::invalid_argument("PercentileAggregator horizon must be at least one month");
    }
    buffers_.resize(static_cast<size_t>(horizon_months));
}

void PercentileAggregator::reserve(size_t trials) {
    for (auto& buffer : buffers_) {
        buffer.reserve(trials);
    }
}

double PercentileAggregator::field(const MonthRecord& record, Series series) {
    switch (series) {
        case Series::CashBalance: return record.cash_balance;
        case Series::Revenue: return record.revenue;
        case Series::Expenses: return record.expenses;
        default: return record.cash_balance;
    }
}

void PercentileAggregator::add(const Trajectory& trajectory) {
    if (trajectory.size() != buffers_.size()) {
        throw std::invalid_argument(
            "Trajectory length " + std::to_string(trajectory.size()) +
            " does not match horizon " + std::to_string(buffers_.size()));
    }
    for (size_t m = 0; m < buffers_.size(); ++m) {
        buffers_[m].push_back(field(trajectory[m], series_));
    }
    sorted_ = false;
}

void PercentileAggregator::merge(const PercentileAggregator& other) {
    if (other.series_ != series_ || other.buffers_.size() != buffers_.size()) {
        throw std::invalid_argument("Cannot merge aggregators of different series or horizon");
    }
    for (size_t m = 0; m < buffers_.size(); ++m) {
        buffers_[m].insert(buffers_[m].end(),
                           other.buffers_[m].begin(), other.buffers_[m].end());
    }
    sorted_ = false;
}

size_t PercentileAggregator::count() const {
    return buffers_.front().size();
}

PercentileTable PercentileAggregator::finalize() {
    const size_t months = buffers_.size();

    PercentileTable table;
    table.series = series_;
    for (auto& row : table.values) {
        row.resize(months, 0.0);
    }
    table.mean.resize(months, 0.0);
    table.std_dev.resize(months, 0.0);

    for (size_t m = 0; m < months; ++m) {
        std::vector<double>& values = buffers_[m];
        std::sort(values.begin(), values.end());

        for (size_t i = 0; i < NUM_PERCENTILES; ++i) {
            table.values[i][m] = stats::calculate_percentile(values, PERCENTILE_LEVELS[i]);
        }

        double mean = stats::calculate_mean(values);
        table.mean[m] = mean;
        table.std_dev[m] = stats::calculate_std_dev(values, mean);
    }

    sorted_ = true;
    return table;
}

void PercentileAggregator::require_sorted(const char* caller) const {
    if (!sorted_) {
        throw std::logic_error(std::string(caller) + " called before finalize()");
    }
}

ConfidenceIntervals PercentileAggregator::confidence_intervals() const {
    require_sorted("confidence_intervals");

    ConfidenceIntervals ci;
    ci.ci_80.reserve(buffers_.size());
    ci.ci_90.reserve(buffers_.size());
    ci.ci_95.reserve(buffers_.size());

    for (const auto& values : buffers_) {
        ci.ci_80.emplace_back(stats::calculate_percentile(values, 10.0),
                              stats::calculate_percentile(values, 90.0));
        ci.ci_90.emplace_back(stats::calculate_percentile(values, 5.0),
                              stats::calculate_percentile(values, 95.0));
        ci.ci_95.emplace_back(stats::calculate_percentile(values, 2.5),
                              stats::calculate_percentile(values, 97.5));
    }
    return ci;
}

RiskMetrics PercentileAggregator::terminal_risk() const {
    require_sorted("terminal_risk");

    RiskMetrics risk;
    const std::vector<double>& terminal = buffers_.back();
    if (terminal.empty()) {
        return risk;
    }

    risk.value_at_risk_95 = stats::calculate_percentile(terminal, 5.0);
    risk.expected_shortfall_95 = stats::calculate_cte(terminal, 95.0);
    risk.mean = stats::calculate_mean(terminal);
    risk.std_dev = stats::calculate_std_dev(terminal, risk.mean);
    risk.worst = terminal.front();
    risk.best = terminal.back();
    return risk;
}

const std::vector<double>& PercentileAggregator::month_values(int m) const {
    if (m < 0 || static_cast<size_t>(m) >= buffers_.size()) {
        throw std::out_of_range("Month index out of range: " + std::to_string(m));
    }
    return buffers_[static_cast<size_t>(m)];
}

} // namespace runwaycalc
