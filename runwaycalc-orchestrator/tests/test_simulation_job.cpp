/**
 * @file test_simulation_job.cpp
 * @brief Unit tests for SimulationJob (async run, timeout, cancellation)
 */

#include <catch2/catch_test_macros.hpp>
#include "../src/simulation_job.hpp"
#include "../src/config_parser.hpp"
#include <algorithm>
#include <chrono>
#include <limits>
#include <thread>
#include <vector>

using namespace runwaycalc;
using namespace runwaycalc::orchestrator;

namespace {

SimulationConfig job_config(int num_simulations = 1000) {
    SimulationConfig config;
    config.num_simulations = num_simulations;
    config.horizon_months = 12;
    config.sensitivity_samples = 10;
    config.batch_size = 100;
    config.add_driver(DriverSpec("revenue_growth", Distribution::Normal, 8.0, 3.0, 2.0, 15.0, "%"));
    config.baseline.set("starting_revenue", 45000.0);
    config.baseline.set("initial_cash", 500000.0);
    config.baseline.set("monthly_expenses", 60000.0);
    return config;
}

// Sleeps once per trial so runs take long enough to time out
class SlowFormula : public SaasCashFlowFormula {
public:
    MonthlyFlows project_month(const TrialAssumptions& assumptions, int month,
                               const MonthRecord* previous) const override {
        if (month == 1) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
        return SaasCashFlowFormula::project_month(assumptions, month, previous);
    }
};

bool any_log_contains(const std::vector<std::string>& logs, const std::string& needle) {
    return std::any_of(logs.begin(), logs.end(), [&needle](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

} // anonymous namespace

TEST_CASE("Job runs to completion", "[job]") {
    quiet_logger();
    SimulationJob job("job-done", job_config());
    REQUIRE(job.snapshot().status == SimulationStatus::Queued);

    job.start();
    const SimulationOutcome& outcome = job.wait();

    REQUIRE(outcome.status == SimulationStatus::Done);
    REQUIRE(outcome.result.has_value());
    REQUIRE_FALSE(job.timed_out());

    JobSnapshot snapshot = job.snapshot();
    REQUIRE(snapshot.job_id == "job-done");
    REQUIRE(snapshot.status == SimulationStatus::Done);
    REQUIRE(snapshot.progress == 1.0);
    REQUIRE(any_log_contains(snapshot.logs, "simulation_complete"));

    // wait() is idempotent
    REQUIRE(&job.wait() == &outcome);
}

TEST_CASE("Job seeds from the config fingerprint", "[job]") {
    quiet_logger();
    SimulationConfig config = job_config();
    const uint64_t expected = fingerprint(config);

    SimulationJob a("job-a", config);
    SimulationJob b("job-b", config);
    REQUIRE(a.seed() == expected);

    const SimulationOutcome& first = a.wait();
    const SimulationOutcome& second = b.wait();
    REQUIRE(first.status == SimulationStatus::Done);
    REQUIRE(second.status == SimulationStatus::Done);
    REQUIRE(first.result->seed == expected);
    REQUIRE(first.result->cash_balance.at("p50") == second.result->cash_balance.at("p50"));

    config.seed = 17;
    SimulationJob explicit_seed("job-c", config);
    REQUIRE(explicit_seed.seed() == 17);
}

TEST_CASE("Job timeout cancels the run", "[job][timeout]") {
    quiet_logger();
    SimulationJob job("job-timeout", job_config(10000), JobConfig(0.2),
                      std::make_shared<SlowFormula>());

    auto start = std::chrono::steady_clock::now();
    const SimulationOutcome& outcome = job.wait();
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(outcome.status == SimulationStatus::Cancelled);
    REQUIRE_FALSE(outcome.result.has_value());
    REQUIRE(job.timed_out());
    REQUIRE(outcome.completed_trials < 10000);
    REQUIRE(any_log_contains(outcome.logs, "WARN timeout"));
    REQUIRE(job.snapshot().status == SimulationStatus::Cancelled);
    REQUIRE(elapsed < std::chrono::seconds(10));
}

TEST_CASE("Job cancel from another thread", "[job][cancel]") {
    quiet_logger();
    SimulationJob job("job-cancel", job_config(10000), JobConfig(60.0),
                      std::make_shared<SlowFormula>());
    job.start();

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    JobSnapshot running = job.snapshot();
    REQUIRE(running.progress >= 0.0);
    REQUIRE(running.progress <= 1.0);

    job.cancel();
    const SimulationOutcome& outcome = job.wait();

    REQUIRE(outcome.status == SimulationStatus::Cancelled);
    REQUIRE_FALSE(job.timed_out());
    REQUIRE_FALSE(any_log_contains(outcome.logs, "timeout"));
}

TEST_CASE("Concurrent waiters share one outcome", "[job]") {
    quiet_logger();
    SimulationJob job("job-waiters", job_config(2000));
    job.start();

    const SimulationOutcome* seen[4] = {nullptr, nullptr, nullptr, nullptr};
    std::vector<std::thread> waiters;
    for (int i = 0; i < 4; ++i) {
        waiters.emplace_back([&job, &seen, i]() { seen[i] = &job.wait(); });
    }
    for (auto& waiter : waiters) {
        waiter.join();
    }

    for (const SimulationOutcome* outcome : seen) {
        REQUIRE(outcome == seen[0]);
    }
    REQUIRE(seen[0]->status == SimulationStatus::Done);
}

TEST_CASE("Job can only be started once", "[job]") {
    quiet_logger();
    SimulationJob job("job-twice", job_config());
    job.start();
    REQUIRE_THROWS_AS(job.start(), std::logic_error);
    REQUIRE(job.wait().status == SimulationStatus::Done);
}

TEST_CASE("Destroying a running job joins the worker", "[job]") {
    quiet_logger();
    {
        SimulationJob job("job-scope", job_config(10000), JobConfig(60.0),
                          std::make_shared<SlowFormula>());
        job.start();
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    SUCCEED("destructor returned");
}

TEST_CASE("Invalid config is rejected at construction", "[job][validation]") {
    SimulationConfig config = job_config();
    config.horizon_months = 0;
    REQUIRE_THROWS_AS(SimulationJob("job-invalid", config), ValidationError);
}

TEST_CASE("Failed runs are reported through the outcome", "[job]") {
    quiet_logger();
    SimulationConfig config = job_config();
    config.baseline.set("starting_revenue", std::numeric_limits<double>::infinity());

    SimulationJob job("job-failed", config);
    const SimulationOutcome& outcome = job.wait();
    REQUIRE(outcome.status == SimulationStatus::Failed);
    REQUIRE(outcome.error_type == "SimulationIntegrityError");
    REQUIRE(job.snapshot().status == SimulationStatus::Failed);
}
