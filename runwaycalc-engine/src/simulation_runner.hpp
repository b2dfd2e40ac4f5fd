#ifndef RUNWAYCALC_SIMULATION_RUNNER_HPP
#define RUNWAYCALC_SIMULATION_RUNNER_HPP

#include "driver_spec.hpp"
#include "simulation_result.hpp"
#include "trial_projector.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace runwaycalc {

// Job status as seen by the external job layer
enum class SimulationStatus : uint8_t {
    Queued = 0,
    Running = 1,
    Done = 2,
    Failed = 3,
    Cancelled = 4
};

// "queued", "running", "done", "failed", "cancelled"
std::string status_to_string(SimulationStatus status);

bool is_terminal(SimulationStatus status);

// ============================================================================
// Diagnostics
// ============================================================================

enum class DiagnosticLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3
};

std::string diagnostic_level_to_string(DiagnosticLevel level);

// Structured diagnostic emitted while a run progresses
struct DiagnosticEvent {
    DiagnosticLevel level;
    std::string event;                              // e.g. "trials_discarded"
    std::string message;
    std::map<std::string, std::string> fields;

    // "WARN trials_discarded: <message>"
    std::string to_log_line() const;
};

// Receives every diagnostic; called from the thread running the simulation
using DiagnosticSink = std::function<void(const DiagnosticEvent&)>;

// Called at batch boundaries with (completed, total)
using ProgressCallback = std::function<void(size_t completed, size_t total)>;

// ============================================================================
// SimulationOutcome
// ============================================================================

// Terminal state of one run. `result` is set only when status is Done.
struct SimulationOutcome {
    SimulationStatus status;
    std::optional<SimulationResult> result;
    std::string error_type;                 // e.g. "SimulationIntegrityError"
    std::string error_message;
    std::vector<std::string> logs;
    size_t completed_trials;
    size_t discarded_trials;
    std::vector<DriverValues> failing_samples;

    SimulationOutcome();
};

// ============================================================================
// SimulationRunner
// ============================================================================

// SimulationRunner: executes num_simulations trials and reduces them.
//
// State machine: queued -> running -> done | failed | cancelled.
// Trials run in batches; within a batch they run in parallel (OpenMP) and
// are then folded into the aggregators in trial order, so a fixed seed
// gives bit-identical results for any thread count.
class SimulationRunner {
public:
    static constexpr double DEFAULT_DISCARD_THRESHOLD = 0.05;
    static constexpr size_t MAX_FAILING_SAMPLES = 5;

    // Validates the config; throws ValidationError listing every issue
    explicit SimulationRunner(SimulationConfig config,
                              std::shared_ptr<const ProjectionFormula> formula =
                                  std::make_shared<SaasCashFlowFormula>());

    SimulationRunner(const SimulationRunner&) = delete;
    SimulationRunner& operator=(const SimulationRunner&) = delete;

    void set_diagnostic_sink(DiagnosticSink sink);
    void set_progress_callback(ProgressCallback callback);

    // Fraction of trials that may be discarded before the run fails
    void set_discard_threshold(double threshold);
    double discard_threshold() const { return discard_threshold_; }

    // Runs to completion on the calling thread. Never throws; failures and
    // cancellation are reported through the outcome. A runner runs once.
    SimulationOutcome run();

    // Cooperative: trials already in flight finish, no new trials start
    void cancel();
    bool cancel_requested() const;

    SimulationStatus status() const;

    // completed trials / total, in [0, 1]
    double progress() const;
    size_t completed_trials() const;

    // Snapshot of the diagnostic log lines so far
    std::vector<std::string> logs() const;

    // Seed in effect (config seed, or one drawn at construction)
    uint64_t seed() const { return seed_; }

    const SimulationConfig& config() const { return config_; }

private:
    // Empty when the run was cancelled
    std::optional<SimulationResult> execute(SimulationOutcome& outcome);
    void emit(DiagnosticLevel level, const std::string& event, const std::string& message,
              std::map<std::string, std::string> fields = {});
    void set_status(SimulationStatus status);
    SimulationOutcome finish(SimulationOutcome outcome, SimulationStatus status);

    SimulationConfig config_;
    std::shared_ptr<const ProjectionFormula> formula_;
    uint64_t seed_;
    double discard_threshold_;

    DiagnosticSink sink_;
    ProgressCallback progress_callback_;

    std::atomic<SimulationStatus> status_;
    std::atomic<size_t> completed_;
    std::atomic<bool> cancel_requested_;

    mutable std::mutex logs_mutex_;
    std::vector<std::string> logs_;
};

} // namespace runwaycalc

#endif // RUNWAYCALC_SIMULATION_RUNNER_HPP
