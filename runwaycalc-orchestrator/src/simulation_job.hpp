/**
 * @file simulation_job.hpp
 * @brief Asynchronous simulation job with timeout and cancellation
 *
 * A SimulationJob wraps one SimulationRunner for the job layer:
 * - Runs the simulation on a worker thread (std::async)
 * - Enforces a wall-clock timeout by cancelling the runner
 * - Exposes status/progress/logs snapshots while running
 * - Forwards engine diagnostics to the structured Logger
 *
 * Design Pattern: Lifecycle wrapper around a single-use runner
 */

#ifndef RUNWAYCALC_ORCHESTRATOR_SIMULATION_JOB_HPP
#define RUNWAYCALC_ORCHESTRATOR_SIMULATION_JOB_HPP

#include "../../runwaycalc-engine/src/simulation_runner.hpp"
#include "logger.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace runwaycalc {
namespace orchestrator {

/**
 * @brief Job-level settings
 */
struct JobConfig {
    double timeout_seconds;          ///< Wall-clock limit for the run (<= 0 disables)

    JobConfig() : timeout_seconds(300.0) {}
    explicit JobConfig(double timeout) : timeout_seconds(timeout) {}
};

/**
 * @brief Point-in-time view of a job
 */
struct JobSnapshot {
    std::string job_id;
    SimulationStatus status;
    double progress;                 ///< Completed trials / total, in [0, 1]
    std::vector<std::string> logs;

    JobSnapshot() : status(SimulationStatus::Queued), progress(0.0) {}
};

/**
 * @brief One simulation run owned by the job layer
 *
 * Usage Example:
 *   @code
 *   SimulationJob job("job-1", parse_simulation_config_from_file("payload.json"));
 *   job.start();
 *   const SimulationOutcome& outcome = job.wait();
 *   if (outcome.status == SimulationStatus::Done) {
 *       write_simulation_result_json("result.json", *outcome.result);
 *   }
 *   @endcode
 *
 * A timeout is reported exactly like a cancellation: status "cancelled",
 * no result, plus a "timeout" log line. The worker is always joined
 * before wait() returns.
 */
class SimulationJob {
public:
    /**
     * @brief Create a job
     *
     * When the configuration carries no seed, the configuration fingerprint
     * is used so that identical payloads reproduce identical results.
     *
     * @throws ValidationError if the configuration is invalid
     */
    SimulationJob(std::string job_id,
                  SimulationConfig config,
                  const JobConfig& job_config = JobConfig(),
                  std::shared_ptr<const ProjectionFormula> formula =
                      std::make_shared<SaasCashFlowFormula>());

    /**
     * @brief Cancels and joins a still-running worker
     */
    ~SimulationJob();

    SimulationJob(const SimulationJob&) = delete;
    SimulationJob& operator=(const SimulationJob&) = delete;

    /**
     * @brief Launch the run on a worker thread
     *
     * @throws std::logic_error if the job was already started
     */
    void start();

    /**
     * @brief Block until the run finishes or the timeout expires
     *
     * Starts the job if start() was not called. Safe to call from several
     * threads; later callers block until the first one has the outcome.
     *
     * @return Terminal outcome (stable for the lifetime of the job)
     */
    const SimulationOutcome& wait();

    /**
     * @brief Request cooperative cancellation
     */
    void cancel();

    /**
     * @brief Current status, progress and log lines
     */
    JobSnapshot snapshot() const;

    bool timed_out() const { return timed_out_; }

    const std::string& job_id() const { return context_.job_id; }

    uint64_t seed() const { return runner_->seed(); }

    const JobConfig& job_config() const { return job_config_; }

private:
    void finish(SimulationOutcome outcome);

    JobContext context_;
    JobConfig job_config_;
    std::unique_ptr<SimulationRunner> runner_;

    std::future<SimulationOutcome> future_;
    std::optional<SimulationOutcome> outcome_;
    bool started_;
    bool timed_out_;
    std::chrono::steady_clock::time_point start_time_;

    mutable std::mutex mutex_;
    std::mutex wait_mutex_;          ///< Serializes future_.get() and finish()
};

} // namespace orchestrator
} // namespace runwaycalc

#endif // RUNWAYCALC_ORCHESTRATOR_SIMULATION_JOB_HPP
