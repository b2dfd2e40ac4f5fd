/**
 * @file simulation_job.cpp
 * @brief Implementation of SimulationJob
 */

#include "simulation_job.hpp"
#include "config_parser.hpp"
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace runwaycalc {
namespace orchestrator {

namespace {

SimulationConfig with_default_seed(SimulationConfig config) {
    if (!config.seed) {
        config.seed = fingerprint(config);
    }
    return config;
}

} // anonymous namespace

SimulationJob::SimulationJob(std::string job_id,
                             SimulationConfig config,
                             const JobConfig& job_config,
                             std::shared_ptr<const ProjectionFormula> formula)
    : context_(job_id),
      job_config_(job_config),
      runner_(std::make_unique<SimulationRunner>(with_default_seed(std::move(config)),
                                                 std::move(formula))),
      started_(false),
      timed_out_(false) {
    JobContext ctx = context_;
    runner_->set_diagnostic_sink([ctx](const DiagnosticEvent& event) {
        Logger::get_instance().log_diagnostic(ctx, event);
    });
}

SimulationJob::~SimulationJob() {
    if (future_.valid()) {
        runner_->cancel();
        future_.wait();
    }
}

void SimulationJob::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        throw std::logic_error("Simulation job " + context_.job_id + " was already started");
    }
    started_ = true;
    start_time_ = std::chrono::steady_clock::now();

    Logger::get_instance().log_state_transition(context_, SimulationStatus::Queued,
                                                SimulationStatus::Running);

    SimulationRunner* runner = runner_.get();
    future_ = std::async(std::launch::async, [runner]() {
        return runner->run();
    });
}

const SimulationOutcome& SimulationJob::wait() {
    std::lock_guard<std::mutex> wait_lock(wait_mutex_);

    bool needs_start = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome_) {
            return *outcome_;
        }
        needs_start = !started_;
    }
    if (needs_start) {
        start();
    }

    bool timeout_occurred = false;
    if (job_config_.timeout_seconds > 0.0) {
        auto timeout_duration = std::chrono::duration<double>(job_config_.timeout_seconds);
        if (future_.wait_for(timeout_duration) == std::future_status::timeout) {
            timeout_occurred = true;
            runner_->cancel();
        }
    }

    // Always join the worker; after a timeout this waits for in-flight trials only
    SimulationOutcome outcome = future_.get();

    if (timeout_occurred && outcome.status == SimulationStatus::Cancelled) {
        timed_out_ = true;
        std::ostringstream msg;
        msg << "Simulation exceeded the " << std::fixed << std::setprecision(1)
            << job_config_.timeout_seconds << " s timeout and was cancelled";
        outcome.logs.push_back(DiagnosticEvent{DiagnosticLevel::Warning, "timeout",
                                               msg.str(), {}}.to_log_line());
        Logger::get_instance().log_warning(context_, msg.str());
    }

    finish(std::move(outcome));
    std::lock_guard<std::mutex> lock(mutex_);
    return *outcome_;
}

void SimulationJob::cancel() {
    runner_->cancel();
}

JobSnapshot SimulationJob::snapshot() const {
    JobSnapshot snap;
    snap.job_id = context_.job_id;

    std::lock_guard<std::mutex> lock(mutex_);
    if (outcome_) {
        snap.status = outcome_->status;
        snap.progress = outcome_->status == SimulationStatus::Done ? 1.0 : runner_->progress();
        snap.logs = outcome_->logs;
    } else {
        snap.status = runner_->status();
        snap.progress = runner_->progress();
        snap.logs = runner_->logs();
    }
    return snap;
}

void SimulationJob::finish(SimulationOutcome outcome) {
    auto elapsed = std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - start_time_).count();

    Logger& logger = Logger::get_instance();
    logger.log_state_transition(context_, SimulationStatus::Running, outcome.status);
    logger.log_job_complete(context_, outcome.status, outcome.completed_trials,
                            outcome.discarded_trials, elapsed);

    std::lock_guard<std::mutex> lock(mutex_);
    outcome_ = std::move(outcome);
}

} // namespace orchestrator
} // namespace runwaycalc
