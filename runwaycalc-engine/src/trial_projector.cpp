#include "trial_projector.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace runwaycalc {

// ============================================================================
// MonthRecord Implementation
// ============================================================================

MonthRecord::MonthRecord() : revenue(0.0), expenses(0.0), cash_balance(0.0) {}

MonthRecord::MonthRecord(double rev, double exp, double cash)
    : revenue(rev), expenses(exp), cash_balance(cash) {}

// ============================================================================
// TrialAssumptions Implementation
// ============================================================================

TrialAssumptions::TrialAssumptions(const BaselineAssumptions& baseline,
                                   const DriverValues& drivers)
    : baseline_(baseline), drivers_(drivers) {}

double TrialAssumptions::value(const std::string& name, double fallback) const {
    auto it = drivers_.find(name);
    if (it != drivers_.end()) {
        return it->second;
    }
    return baseline_.get(name, fallback);
}

bool TrialAssumptions::has(const std::string& name) const {
    return drivers_.count(name) > 0 || baseline_.has(name);
}

// ============================================================================
// ProjectionFormula / SaasCashFlowFormula
// ============================================================================

double ProjectionFormula::initial_cash(const TrialAssumptions& assumptions) const {
    return assumptions.value("initial_cash", 0.0);
}

MonthlyFlows SaasCashFlowFormula::project_month(const TrialAssumptions& assumptions,
                                                int month,
                                                const MonthRecord* previous) const
{
    const double growth = assumptions.value("revenue_growth", 0.0) / 100.0;
    const double churn = assumptions.value("churn_rate", 0.0) / 100.0;
    const double marketing = assumptions.value("marketing_spend", 0.0);
    const double cac = assumptions.value("cac", 0.0);
    const double deal_size = assumptions.value("deal_size", 0.0);

    const double prior_revenue = previous
        ? previous->revenue
        : assumptions.value("starting_revenue", 0.0);

    // Existing book grows and churns; new customers add MRR on top
    double revenue = prior_revenue * (1.0 + growth) * (1.0 - churn);
    if (cac > 0.0) {
        revenue += (marketing / cac) * deal_size;
    }

    const double base_expenses = assumptions.value("monthly_expenses", 0.0);
    const double expense_growth = assumptions.value("expense_growth", 0.0) / 100.0;
    const double cogs = assumptions.value("cogs_percentage", 0.0) / 100.0;

    double expenses = base_expenses * std::pow(1.0 + expense_growth, month - 1);
    expenses += cogs * revenue;
    expenses += marketing;

    return MonthlyFlows{revenue, expenses};
}

// ============================================================================
// TrialProjector Implementation
// ============================================================================

TrialProjector::TrialProjector(std::shared_ptr<const ProjectionFormula> formula,
                               const BaselineAssumptions& baseline,
                               int horizon_months)
    : formula_(std::move(formula)), baseline_(baseline), horizon_months_(horizon_months)
{
    if (!formula_) {
        throw std::invalid_argument("TrialProjector requires a projection formula");
    }
    if (horizon_months_ < 1) {
        throw std::invalid_argument("TrialProjector horizon must be at least one month");
    }
}

Trajectory TrialProjector::project(const DriverValues& drivers) const {
    Trajectory trajectory;
    project_into(drivers, trajectory);
    return trajectory;
}

bool TrialProjector::project_into(const DriverValues& drivers, Trajectory& out) const {
    out.resize(static_cast<size_t>(horizon_months_));

    TrialAssumptions assumptions(baseline_, drivers);
    double cash = formula_->initial_cash(assumptions);
    bool finite = std::isfinite(cash);

    const MonthRecord* previous = nullptr;
    for (int m = 0; m < horizon_months_; ++m) {
        MonthlyFlows flows = formula_->project_month(assumptions, m + 1, previous);

        // Carry cash forward from the previous month
        cash = cash + flows.revenue - flows.expenses;

        MonthRecord& record = out[static_cast<size_t>(m)];
        record.revenue = flows.revenue;
        record.expenses = flows.expenses;
        record.cash_balance = cash;

        if (!std::isfinite(flows.revenue) || !std::isfinite(flows.expenses) ||
            !std::isfinite(cash)) {
            finite = false;
        }
        previous = &record;
    }

    return finite;
}

bool is_finite_trajectory(const Trajectory& trajectory) {
    for (const auto& record : trajectory) {
        if (!std::isfinite(record.revenue) || !std::isfinite(record.expenses) ||
            !std::isfinite(record.cash_balance)) {
            return false;
        }
    }
    return true;
}

} // namespace runwaycalc
