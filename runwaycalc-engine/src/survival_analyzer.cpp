#include "survival_analyzer.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace runwaycalc {

// ============================================================================
// Result types
// ============================================================================

RunwayThreshold::RunwayThreshold()
    : months(0), probability(0.0), percentage(0.0), survived(0), failed(0) {}

std::string RunwayThreshold::key() const {
    return std::to_string(months) + "_months";
}

SurvivalOverall::SurvivalOverall()
    : probability_surviving_full_period(0.0),
      percentage_surviving_full_period(0.0),
      average_months_to_failure(0.0),
      median_months_to_failure(0.0),
      total_simulations(0),
      simulations_survived(0),
      simulations_failed(0) {}

const RunwayThreshold* SurvivalProbability::threshold(int months) const {
    for (const auto& t : runway_thresholds) {
        if (t.months == months) {
            return &t;
        }
    }
    return nullptr;
}

std::string risk_level_for(double survival_probability) {
    if (survival_probability < 0.5) return "high";
    if (survival_probability < 0.8) return "medium";
    return "low";
}

// ============================================================================
// SurvivalAnalyzer Implementation
// ============================================================================

const std::vector<int>& SurvivalAnalyzer::default_thresholds() {
    static const std::vector<int> thresholds = {3, 6, 9, 12, 18, 24};
    return thresholds;
}

SurvivalAnalyzer::SurvivalAnalyzer(int horizon_months)
    : SurvivalAnalyzer(horizon_months, default_thresholds()) {}

SurvivalAnalyzer::SurvivalAnalyzer(int horizon_months, std::vector<int> thresholds)
    : horizon_months_(horizon_months),
      thresholds_(std::move(thresholds)),
      survivors_(0),
      total_(0)
{
    if (horizon_months_ < 1) {
        throw std::invalid_argument("SurvivalAnalyzer horizon must be at least one month");
    }
    std::sort(thresholds_.begin(), thresholds_.end());
    thresholds_.erase(std::unique(thresholds_.begin(), thresholds_.end()), thresholds_.end());
    failures_by_month_.assign(static_cast<size_t>(horizon_months_), 0);
}

int SurvivalAnalyzer::exhaustion_month(const Trajectory& trajectory) {
    for (size_t m = 0; m < trajectory.size(); ++m) {
        if (trajectory[m].cash_balance < 0.0) {
            return static_cast<int>(m);
        }
    }
    return -1;
}

void SurvivalAnalyzer::add(const Trajectory& trajectory) {
    add_exhaustion(exhaustion_month(trajectory));
}

void SurvivalAnalyzer::add_exhaustion(int month_index) {
    if (month_index >= horizon_months_) {
        throw std::out_of_range("Exhaustion month beyond horizon: " + std::to_string(month_index));
    }
    if (month_index < 0) {
        ++survivors_;
    } else {
        ++failures_by_month_[static_cast<size_t>(month_index)];
    }
    ++total_;
}

void SurvivalAnalyzer::merge(const SurvivalAnalyzer& other) {
    if (other.horizon_months_ != horizon_months_) {
        throw std::invalid_argument("Cannot merge survival analyzers with different horizons");
    }
    for (size_t m = 0; m < failures_by_month_.size(); ++m) {
        failures_by_month_[m] += other.failures_by_month_[m];
    }
    survivors_ += other.survivors_;
    total_ += other.total_;
}

double SurvivalAnalyzer::failure_month_at(size_t index) const {
    size_t seen = 0;
    for (size_t m = 0; m < failures_by_month_.size(); ++m) {
        seen += failures_by_month_[m];
        if (index < seen) {
            return static_cast<double>(m + 1);
        }
    }
    return static_cast<double>(horizon_months_);
}

SurvivalProbability SurvivalAnalyzer::finalize() const {
    SurvivalProbability result;
    const double total = static_cast<double>(total_);
    const size_t failed = total_ - survivors_;

    // Survival through month m+1: trials not yet exhausted at index m
    std::vector<size_t> alive_by_month;
    alive_by_month.reserve(failures_by_month_.size());
    result.by_month.reserve(failures_by_month_.size());
    size_t alive = total_;
    for (size_t m = 0; m < failures_by_month_.size(); ++m) {
        alive -= failures_by_month_[m];
        alive_by_month.push_back(alive);
        result.by_month.push_back(total_ > 0 ? static_cast<double>(alive) / total : 0.0);
    }

    for (int k : thresholds_) {
        if (k < 1 || k > horizon_months_) {
            continue;
        }
        RunwayThreshold t;
        t.months = k;
        t.probability = result.by_month[static_cast<size_t>(k - 1)];
        t.percentage = t.probability * 100.0;
        t.survived = alive_by_month[static_cast<size_t>(k - 1)];
        t.failed = total_ - t.survived;
        result.runway_thresholds.push_back(t);
    }

    SurvivalOverall& overall = result.overall;
    overall.total_simulations = total_;
    overall.simulations_survived = survivors_;
    overall.simulations_failed = failed;
    overall.probability_surviving_full_period =
        total_ > 0 ? static_cast<double>(survivors_) / total : 0.0;
    overall.percentage_surviving_full_period = overall.probability_surviving_full_period * 100.0;

    if (failed == 0) {
        overall.average_months_to_failure = static_cast<double>(horizon_months_);
        overall.median_months_to_failure = static_cast<double>(horizon_months_);
    } else {
        double sum = 0.0;
        for (size_t m = 0; m < failures_by_month_.size(); ++m) {
            sum += static_cast<double>(failures_by_month_[m]) * static_cast<double>(m + 1);
        }
        overall.average_months_to_failure = sum / static_cast<double>(failed);

        if (failed % 2 == 1) {
            overall.median_months_to_failure = failure_month_at(failed / 2);
        } else {
            overall.median_months_to_failure =
                0.5 * (failure_month_at(failed / 2 - 1) + failure_month_at(failed / 2));
        }
    }

    std::ostringstream msg;
    msg << std::fixed << std::setprecision(1)
        << "Probability of survival: " << overall.percentage_surviving_full_period
        << "% chance of surviving the full " << horizon_months_ << "-month forecast period";
    result.summary.key_message = msg.str();
    result.summary.risk_level = risk_level_for(overall.probability_surviving_full_period);

    return result;
}

} // namespace runwaycalc
