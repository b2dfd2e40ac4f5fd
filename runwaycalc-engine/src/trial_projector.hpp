#ifndef RUNWAYCALC_TRIAL_PROJECTOR_HPP
#define RUNWAYCALC_TRIAL_PROJECTOR_HPP

#include "baseline_assumptions.hpp"
#include "distribution_sampler.hpp"
#include <memory>
#include <string>
#include <vector>

namespace runwaycalc {

// One month of a simulated trial
struct MonthRecord {
    double revenue;
    double expenses;
    double cash_balance;

    MonthRecord();
    MonthRecord(double rev, double exp, double cash);
};

// Ordered monthly records of one trial (length = horizon months)
using Trajectory = std::vector<MonthRecord>;

// Baseline values with a trial's sampled driver values layered on top.
// Holds references only; it must not outlive either source.
class TrialAssumptions {
public:
    TrialAssumptions(const BaselineAssumptions& baseline, const DriverValues& drivers);

    // Driver value if sampled, otherwise the baseline value, otherwise fallback
    double value(const std::string& name, double fallback = 0.0) const;
    bool has(const std::string& name) const;

    const BaselineAssumptions& baseline() const { return baseline_; }
    const DriverValues& drivers() const { return drivers_; }

private:
    const BaselineAssumptions& baseline_;
    const DriverValues& drivers_;
};

// Revenue and expenses the model layer computes for one month.
// Cash carry-forward is owned by TrialProjector.
struct MonthlyFlows {
    double revenue;
    double expenses;
};

// ProjectionFormula: the model layer's deterministic monthly formula.
// Implementations must be safe to call concurrently from several threads.
class ProjectionFormula {
public:
    virtual ~ProjectionFormula() = default;

    // month is 1-based; previous is nullptr for month 1
    virtual MonthlyFlows project_month(const TrialAssumptions& assumptions,
                                       int month,
                                       const MonthRecord* previous) const = 0;

    // Cash balance before month 1; defaults to the "initial_cash" value
    virtual double initial_cash(const TrialAssumptions& assumptions) const;

    virtual std::string name() const = 0;
};

// Default SaaS cash model used by the CLI.
//
// revenue[m]  = revenue[m-1] * (1 + revenue_growth%) * (1 - churn_rate%)
//               + (marketing_spend / cac) * deal_size
// expenses[m] = monthly_expenses * (1 + expense_growth%)^(m-1)
//               + cogs_percentage% * revenue[m] + marketing_spend
//
// revenue[0] is starting_revenue. Percentages are expressed in percent
// (8 means 8%). Missing values default to 0 except cac (no acquisition).
class SaasCashFlowFormula : public ProjectionFormula {
public:
    MonthlyFlows project_month(const TrialAssumptions& assumptions,
                               int month,
                               const MonthRecord* previous) const override;

    std::string name() const override { return "saas_cash_flow"; }
};

// TrialProjector: turns one sampled driver set into a Trajectory by
// stepping the formula month by month and carrying cash forward:
//   cash[m] = cash[m-1] + revenue[m] - expenses[m]
class TrialProjector {
public:
    TrialProjector(std::shared_ptr<const ProjectionFormula> formula,
                   const BaselineAssumptions& baseline,
                   int horizon_months);

    Trajectory project(const DriverValues& drivers) const;

    // Writes into `out` (resized to horizon) to avoid reallocating per trial.
    // Returns false if any produced value is NaN or infinite.
    bool project_into(const DriverValues& drivers, Trajectory& out) const;

    int horizon_months() const { return horizon_months_; }
    const ProjectionFormula& formula() const { return *formula_; }

private:
    std::shared_ptr<const ProjectionFormula> formula_;
    const BaselineAssumptions& baseline_;
    int horizon_months_;
};

// True if every value in the trajectory is finite
bool is_finite_trajectory(const Trajectory& trajectory);

} // namespace runwaycalc

#endif // RUNWAYCALC_TRIAL_PROJECTOR_HPP
