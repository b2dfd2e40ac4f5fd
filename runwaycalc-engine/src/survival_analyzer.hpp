#ifndef RUNWAYCALC_SURVIVAL_ANALYZER_HPP
#define RUNWAYCALC_SURVIVAL_ANALYZER_HPP

#include "trial_projector.hpp"
#include <string>
#include <vector>

namespace runwaycalc {

// Survival through the first `months` months
struct RunwayThreshold {
    int months;
    double probability;         // 0-1
    double percentage;          // probability * 100
    size_t survived;
    size_t failed;

    RunwayThreshold();

    // "{n}_months"
    std::string key() const;
};

struct SurvivalOverall {
    double probability_surviving_full_period;
    double percentage_surviving_full_period;
    double average_months_to_failure;   // Over failing trials; horizon if none failed
    double median_months_to_failure;    // Over failing trials; horizon if none failed
    size_t total_simulations;
    size_t simulations_survived;
    size_t simulations_failed;

    SurvivalOverall();
};

struct SurvivalSummary {
    std::string key_message;
    std::string risk_level;             // "high" | "medium" | "low"
};

// SurvivalProbability: cash-exhaustion statistics across all kept trials
struct SurvivalProbability {
    SurvivalOverall overall;
    std::vector<RunwayThreshold> runway_thresholds;   // Ascending by months
    std::vector<double> by_month;                     // Survival through month m+1
    SurvivalSummary summary;

    // nullptr if the threshold was not reported
    const RunwayThreshold* threshold(int months) const;
};

// "high" below 0.5, "medium" below 0.8, otherwise "low"
std::string risk_level_for(double survival_probability);

// SurvivalAnalyzer: streaming reduction of trajectories into exhaustion counts.
// A trial is exhausted at the first month whose cash balance is negative.
class SurvivalAnalyzer {
public:
    // 3, 6, 9, 12, 18, 24
    static const std::vector<int>& default_thresholds();

    explicit SurvivalAnalyzer(int horizon_months);
    SurvivalAnalyzer(int horizon_months, std::vector<int> thresholds);

    // 0-based index of the first month with cash < 0, or -1 if none
    static int exhaustion_month(const Trajectory& trajectory);

    void add(const Trajectory& trajectory);

    // Fold in a precomputed exhaustion index (-1 for a surviving trial)
    void add_exhaustion(int month_index);

    void merge(const SurvivalAnalyzer& other);

    size_t total() const { return total_; }
    size_t survivors() const { return survivors_; }
    int horizon_months() const { return horizon_months_; }

    // Thresholds beyond the horizon are not reported
    SurvivalProbability finalize() const;

private:
    // Value at rank `index` among failing trials' 1-based failure months
    double failure_month_at(size_t index) const;

    int horizon_months_;
    std::vector<int> thresholds_;
    std::vector<size_t> failures_by_month_;   // Trials first exhausted at index m
    size_t survivors_;
    size_t total_;
};

} // namespace runwaycalc

#endif // RUNWAYCALC_SURVIVAL_ANALYZER_HPP
