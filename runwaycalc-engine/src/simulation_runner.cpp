#include "simulation_runner.hpp"
#include "distribution_sampler.hpp"
#include "percentile_aggregator.hpp"
#include "sensitivity_analyzer.hpp"
#include "survival_analyzer.hpp"
#include <algorithm>
#include <chrono>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <utility>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace runwaycalc {

// ============================================================================
// Status and diagnostics
// ============================================================================

std::string status_to_string(SimulationStatus status) {
    switch (status) {
        case SimulationStatus::Queued: return "queued";
        case SimulationStatus::Running: return "running";
        case SimulationStatus::Done: return "done";
        case SimulationStatus::Failed: return "failed";
        case SimulationStatus::Cancelled: return "cancelled";
        default: return "unknown";
    }
}

bool is_terminal(SimulationStatus status) {
    return status == SimulationStatus::Done ||
           status == SimulationStatus::Failed ||
           status == SimulationStatus::Cancelled;
}

std::string diagnostic_level_to_string(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::Debug: return "DEBUG";
        case DiagnosticLevel::Info: return "INFO";
        case DiagnosticLevel::Warning: return "WARN";
        case DiagnosticLevel::Error: return "ERROR";
        default: return "UNKNOWN";
    }
}

std::string DiagnosticEvent::to_log_line() const {
    return diagnostic_level_to_string(level) + " " + event + ": " + message;
}

SimulationOutcome::SimulationOutcome()
    : status(SimulationStatus::Queued), completed_trials(0), discarded_trials(0) {}

namespace {

std::string format_percent(double ratio) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
    return oss.str();
}

uint64_t random_seed() {
    std::random_device rd;
    return (static_cast<uint64_t>(rd()) << 32) | static_cast<uint64_t>(rd());
}

// Per-trial output written by worker threads; one slot per trial in a batch
struct TrialSlot {
    DriverValues values;
    Trajectory trajectory;
    bool ok;
    bool ran;
    std::string error;

    TrialSlot() : ok(false), ran(false) {}
};

} // anonymous namespace

// ============================================================================
// SimulationRunner Implementation
// ============================================================================

SimulationRunner::SimulationRunner(SimulationConfig config,
                                   std::shared_ptr<const ProjectionFormula> formula)
    : config_(std::move(config)),
      formula_(std::move(formula)),
      seed_(0),
      discard_threshold_(DEFAULT_DISCARD_THRESHOLD),
      status_(SimulationStatus::Queued),
      completed_(0),
      cancel_requested_(false)
{
    validate_config(config_);
    if (!formula_) {
        throw ValidationError({ValidationIssue("formula", "a projection formula is required")});
    }
    seed_ = config_.seed ? *config_.seed : random_seed();
}

void SimulationRunner::set_diagnostic_sink(DiagnosticSink sink) {
    sink_ = std::move(sink);
}

void SimulationRunner::set_progress_callback(ProgressCallback callback) {
    progress_callback_ = std::move(callback);
}

void SimulationRunner::set_discard_threshold(double threshold) {
    if (!(threshold >= 0.0 && threshold <= 1.0)) {
        throw std::invalid_argument("discard threshold must be within [0, 1]");
    }
    discard_threshold_ = threshold;
}

void SimulationRunner::cancel() {
    cancel_requested_.store(true);
}

bool SimulationRunner::cancel_requested() const {
    return cancel_requested_.load();
}

SimulationStatus SimulationRunner::status() const {
    return status_.load();
}

double SimulationRunner::progress() const {
    const size_t total = static_cast<size_t>(config_.num_simulations);
    if (total == 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(completed_.load()) / static_cast<double>(total));
}

size_t SimulationRunner::completed_trials() const {
    return completed_.load();
}

std::vector<std::string> SimulationRunner::logs() const {
    std::lock_guard<std::mutex> lock(logs_mutex_);
    return logs_;
}

void SimulationRunner::emit(DiagnosticLevel level, const std::string& event,
                            const std::string& message,
                            std::map<std::string, std::string> fields) {
    DiagnosticEvent diagnostic{level, event, message, std::move(fields)};

    // Debug chatter (per-batch progress) stays out of the job's log list
    if (level != DiagnosticLevel::Debug) {
        std::lock_guard<std::mutex> lock(logs_mutex_);
        logs_.push_back(diagnostic.to_log_line());
    }
    if (sink_) {
        sink_(diagnostic);
    }
}

void SimulationRunner::set_status(SimulationStatus status) {
    status_.store(status);
}

SimulationOutcome SimulationRunner::finish(SimulationOutcome outcome, SimulationStatus status) {
    set_status(status);
    outcome.status = status;
    outcome.completed_trials = completed_.load();
    outcome.logs = logs();
    return outcome;
}

SimulationOutcome SimulationRunner::run() {
    SimulationStatus expected = SimulationStatus::Queued;
    if (!status_.compare_exchange_strong(expected, SimulationStatus::Running)) {
        SimulationOutcome outcome;
        outcome.status = SimulationStatus::Failed;
        outcome.error_type = "SimulationError";
        outcome.error_message = "Simulation was already started (status: " +
                                status_to_string(expected) + ")";
        outcome.logs = logs();
        return outcome;
    }

    SimulationOutcome outcome;
    try {
        std::optional<SimulationResult> result = execute(outcome);
        if (!result) {
            emit(DiagnosticLevel::Info, "simulation_cancelled",
                 "Simulation cancelled after " + std::to_string(completed_.load()) + " of " +
                 std::to_string(config_.num_simulations) + " trials; partial results discarded",
                 {{"completed_trials", std::to_string(completed_.load())}});
            return finish(std::move(outcome), SimulationStatus::Cancelled);
        }
        outcome.result = std::move(result);
        return finish(std::move(outcome), SimulationStatus::Done);

    } catch (const SimulationIntegrityError& e) {
        outcome.error_type = "SimulationIntegrityError";
        outcome.error_message = e.what();
        outcome.discarded_trials = e.discarded_trials();
        outcome.failing_samples = e.failing_samples();
        emit(DiagnosticLevel::Error, "error", e.what(), {{"error_type", outcome.error_type}});
    } catch (const SimulationError& e) {
        outcome.error_type = "SimulationError";
        outcome.error_message = e.what();
        emit(DiagnosticLevel::Error, "error", e.what(), {{"error_type", outcome.error_type}});
    } catch (const std::exception& e) {
        outcome.error_type = "InternalError";
        outcome.error_message = e.what();
        emit(DiagnosticLevel::Error, "error", e.what(), {{"error_type", outcome.error_type}});
    }
    return finish(std::move(outcome), SimulationStatus::Failed);
}

std::optional<SimulationResult> SimulationRunner::execute(SimulationOutcome& outcome) {
    auto start_time = std::chrono::high_resolution_clock::now();

    const size_t total = static_cast<size_t>(config_.num_simulations);
    const size_t batch_size = static_cast<size_t>(config_.batch_size);
    const int horizon = config_.horizon_months;

    emit(DiagnosticLevel::Info, "simulation_start",
         "Running " + std::to_string(total) + " trials over " + std::to_string(horizon) +
         " months with " + std::to_string(config_.drivers.size()) + " drivers",
         {{"num_simulations", std::to_string(total)},
          {"horizon_months", std::to_string(horizon)},
          {"drivers", std::to_string(config_.drivers.size())},
          {"seed", std::to_string(seed_)},
          {"formula", formula_->name()}});

    TrialProjector projector(formula_, config_.baseline, horizon);

    PercentileAggregator cash_agg(Series::CashBalance, horizon);
    PercentileAggregator revenue_agg(Series::Revenue, horizon);
    PercentileAggregator expenses_agg(Series::Expenses, horizon);
    cash_agg.reserve(total);
    revenue_agg.reserve(total);
    expenses_agg.reserve(total);
    SurvivalAnalyzer survival(horizon);

    MainRunSamples main_run;
    for (const auto& entry : config_.drivers) {
        main_run.driver_values[entry.first].reserve(total);
    }
    main_run.terminal_cash.reserve(total);

    size_t discarded = 0;
    std::vector<DriverValues> failing_samples;
    std::string first_error;

    std::vector<TrialSlot> slots(std::min(batch_size, total));

    for (size_t batch_start = 0; batch_start < total; batch_start += batch_size) {
        if (cancel_requested_.load()) {
            return std::nullopt;
        }

        const size_t count = std::min(batch_size, total - batch_start);

        // Trials in a batch are independent; each writes only its own slot
#ifdef HAVE_OPENMP
        #pragma omp parallel for schedule(dynamic, 16)
#endif
        for (long long i = 0; i < static_cast<long long>(count); ++i) {
            TrialSlot& slot = slots[static_cast<size_t>(i)];
            slot.ran = false;
            slot.ok = false;
            slot.error.clear();
            if (cancel_requested_.load(std::memory_order_relaxed)) {
                continue;
            }
            try {
                RandomEngine rng = DistributionSampler::trial_engine(
                    seed_, static_cast<uint64_t>(batch_start) + static_cast<uint64_t>(i));
                slot.values = DistributionSampler::sample_all(config_.drivers, rng);
                slot.ok = projector.project_into(slot.values, slot.trajectory);
            } catch (const std::exception& e) {
                // Exceptions must not leave the parallel region; the trial is discarded
                slot.ok = false;
                slot.error = e.what();
            }
            slot.ran = true;
            completed_.fetch_add(1);
        }

        // Fold in trial order so results do not depend on thread scheduling
        bool interrupted = false;
        for (size_t i = 0; i < count; ++i) {
            TrialSlot& slot = slots[i];
            if (!slot.ran) {
                interrupted = true;
                continue;
            }
            if (!slot.ok) {
                ++discarded;
                if (failing_samples.size() < MAX_FAILING_SAMPLES) {
                    failing_samples.push_back(slot.values);
                }
                if (first_error.empty() && !slot.error.empty()) {
                    first_error = "trial " + std::to_string(batch_start + i) + ": " + slot.error;
                }
                continue;
            }
            cash_agg.add(slot.trajectory);
            revenue_agg.add(slot.trajectory);
            expenses_agg.add(slot.trajectory);
            survival.add(slot.trajectory);
            for (const auto& value : slot.values) {
                main_run.driver_values[value.first].push_back(value.second);
            }
            main_run.terminal_cash.push_back(slot.trajectory.back().cash_balance);
        }

        if (interrupted || cancel_requested_.load()) {
            return std::nullopt;
        }

        const size_t done = batch_start + count;
        emit(DiagnosticLevel::Debug, "batch_complete",
             std::to_string(done) + "/" + std::to_string(total) + " trials complete",
             {{"completed", std::to_string(done)},
              {"total", std::to_string(total)},
              {"discarded", std::to_string(discarded)}});
        if (progress_callback_) {
            progress_callback_(done, total);
        }

        // The final ratio can only grow, so stop as soon as it is exceeded
        if (static_cast<double>(discarded) > discard_threshold_ * static_cast<double>(total)) {
            outcome.discarded_trials = discarded;
            throw SimulationIntegrityError(discarded, total, discard_threshold_,
                                           std::move(failing_samples));
        }
    }

    outcome.discarded_trials = discarded;
    outcome.failing_samples = failing_samples;

    TrialAdjustments adjustments;
    adjustments.requested_trials = total;
    adjustments.discarded_trials = discarded;
    adjustments.effective_trials = total - discarded;
    adjustments.discard_ratio = static_cast<double>(discarded) / static_cast<double>(total);
    adjustments.discard_threshold = discard_threshold_;

    if (adjustments.effective_trials == 0) {
        throw SimulationIntegrityError(discarded, total, discard_threshold_,
                                       std::move(failing_samples));
    }

    if (discarded > 0) {
        std::string message = std::to_string(discarded) + " of " + std::to_string(total) +
                              " trials discarded (" + format_percent(adjustments.discard_ratio) +
                              ", threshold " + format_percent(discard_threshold_) +
                              "); results use " + std::to_string(adjustments.effective_trials) +
                              " trials";
        if (!first_error.empty()) {
            message += "; first error: " + first_error;
        }
        emit(DiagnosticLevel::Warning, "trials_discarded", message,
             {{"discarded", std::to_string(discarded)},
              {"attempted", std::to_string(total)},
              {"ratio", std::to_string(adjustments.discard_ratio)}});
    }

    if (cancel_requested_.load()) {
        return std::nullopt;
    }

    SensitivityResult sensitivity;
    try {
        SensitivityAnalyzer analyzer(config_.drivers, projector, config_.sensitivity_samples);
        sensitivity = analyzer.analyze(seed_, &main_run);
    } catch (const SimulationError& e) {
        emit(DiagnosticLevel::Warning, "warning",
             std::string("Sensitivity analysis skipped: ") + e.what(),
             {{"stage", "sensitivity"}});
    }

    SimulationResult result = ResultAssembler::assemble(
        config_, seed_, formula_->name(),
        cash_agg, revenue_agg, expenses_agg, survival,
        std::move(sensitivity), adjustments);

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms =
        std::chrono::duration<double, std::milli>(end_time - start_time).count();

    emit(DiagnosticLevel::Info, "simulation_complete",
         "Completed " + std::to_string(adjustments.effective_trials) + " trials; " +
         format_percent(result.survival.overall.probability_surviving_full_period) +
         " survive the full period",
         {{"effective_trials", std::to_string(adjustments.effective_trials)},
          {"discarded", std::to_string(discarded)},
          {"execution_time_ms", std::to_string(result.execution_time_ms)}});

    return result;
}

} // namespace runwaycalc
