#include <iostream>
#include <fstream>
#include <string>
#include <cstdlib>
#include "config_parser.hpp"
#include "logger.hpp"
#include "simulation_job.hpp"
#include "../../runwaycalc-engine/src/simulation_errors.hpp"
#include "../../runwaycalc-engine/src/io/json_writer.hpp"
#include "../../runwaycalc-engine/src/io/parquet_writer.hpp"

namespace {

// Process exit codes
constexpr int EXIT_DONE = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_FAILED = 2;
constexpr int EXIT_CANCELLED = 3;

struct CLIArgs {
    std::string config_path;
    std::string output_path;
    std::string parquet_path;
    std::string status_path;
    std::string job_id = "cli";
    bool has_seed = false;
    uint64_t seed = 0;
    double timeout_seconds = 300.0;
    std::string log_level = "INFO";
    std::string log_file;
    bool log_json = false;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "RunwayCalc v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " --config <payload.json> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --config <path>             JSON simulation payload (numSimulations, horizonMonths,\n";
    std::cerr << "                              drivers, baselineAssumptions, ...)\n";
    std::cerr << "  --seed <value>              Random seed (overrides the payload; default: payload\n";
    std::cerr << "                              seed, else the payload fingerprint)\n\n";
    std::cerr << "Job options:\n";
    std::cerr << "  --job-id <id>               Job identifier used in log lines (default: cli)\n";
    std::cerr << "  --timeout-seconds <s>       Cancel the run after this many seconds (default: 300,\n";
    std::cerr << "                              0 disables)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON result bundle (default: stdout)\n";
    std::cerr << "  --parquet <path>            Long-form percentile table as Parquet\n";
    std::cerr << "  --status <path>             Job status snapshot as JSON\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-json                  Emit log lines as JSON\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Exit status: 0 done, 1 usage or invalid payload, 2 failed, 3 cancelled/timed out\n\n";
    std::cerr << "Example:\n";
    std::cerr << "  " << program_name << " --config payload.json --seed 42 \\\n";
    std::cerr << "      --output result.json --parquet percentiles.parquet\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--parquet" && i + 1 < argc) {
                args.parquet_path = argv[++i];
            } else if (arg == "--status" && i + 1 < argc) {
                args.status_path = argv[++i];
            } else if (arg == "--job-id" && i + 1 < argc) {
                args.job_id = argv[++i];
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = std::stoull(argv[++i]);
                args.has_seed = true;
            } else if (arg == "--timeout-seconds" && i + 1 < argc) {
                args.timeout_seconds = std::stod(argv[++i]);
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--log-json") {
                args.log_json = true;
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid value for " << arg << ": " << argv[i] << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.config_path.empty()) {
        std::cerr << "Error: --config is required\n";
        valid = false;
    } else if (!file_exists(args.config_path)) {
        std::cerr << "Error: Config file not found: " << args.config_path << "\n";
        valid = false;
    }

    if (args.timeout_seconds < 0) {
        std::cerr << "Error: --timeout-seconds must be non-negative\n";
        valid = false;
    }

    if (args.job_id.empty()) {
        std::cerr << "Error: --job-id must not be empty\n";
        valid = false;
    }

    return valid;
}

void write_status(const std::string& path, const runwaycalc::SimulationOutcome& outcome,
                  double progress) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open status file for writing: " + path);
    }
    file << runwaycalc::io::status_to_json(outcome, progress).dump(2) << "\n";
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    using namespace runwaycalc;
    using namespace runwaycalc::orchestrator;

    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    if (args.help || argc == 1) {
        print_usage(argv[0]);
        return args.help ? EXIT_DONE : EXIT_USAGE;
    }

    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return EXIT_USAGE;
    }

    LoggerConfig log_config;
    log_config.min_level = string_to_level(args.log_level);
    log_config.enable_json = args.log_json;
    log_config.enable_file = !args.log_file.empty();
    if (log_config.enable_file) {
        log_config.log_file_path = args.log_file;
    }
    Logger& logger = Logger::get_instance();
    logger.configure(log_config);

    JobContext parse_ctx(args.job_id, "parse");

    SimulationConfig config;
    try {
        config = parse_simulation_config_from_file(args.config_path);
        if (args.has_seed) {
            config.seed = args.seed;
        }
    } catch (const ValidationError& e) {
        std::cerr << "Error: Invalid simulation payload:\n";
        for (const auto& issue : e.issues()) {
            std::cerr << "  " << issue.field << ": " << issue.message << "\n";
        }
        logger.log_error(parse_ctx, e.what(), "ValidationError");
        return EXIT_USAGE;
    } catch (const ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        logger.log_error(parse_ctx, e.what(), "ConfigParseError");
        return EXIT_USAGE;
    }

    std::cerr << "RunwayCalc v1.0.0\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  Payload:     " << args.config_path << "\n";
    std::cerr << "  Trials:      " << config.num_simulations << "\n";
    std::cerr << "  Horizon:     " << config.horizon_months << " months\n";
    std::cerr << "  Drivers:     " << config.drivers.size() << "\n";
    std::cerr << "\n";

    try {
        SimulationJob job(args.job_id, std::move(config), JobConfig(args.timeout_seconds));
        std::cerr << "  Seed:        " << job.seed() << "\n\n";

        const SimulationOutcome& outcome = job.wait();
        JobSnapshot snapshot = job.snapshot();

        if (!args.status_path.empty()) {
            write_status(args.status_path, outcome, snapshot.progress);
        }

        if (outcome.status == SimulationStatus::Cancelled) {
            std::cerr << "Simulation cancelled" << (job.timed_out() ? " (timeout)" : "")
                      << " after " << outcome.completed_trials << " trials\n";
            return EXIT_CANCELLED;
        }
        if (outcome.status != SimulationStatus::Done || !outcome.result) {
            std::cerr << "Error: " << outcome.error_type << ": " << outcome.error_message << "\n";
            return EXIT_FAILED;
        }

        const SimulationResult& result = *outcome.result;
        const size_t last = static_cast<size_t>(result.horizon_months) - 1;

        std::cerr << "Results:\n";
        std::cerr << "  Effective trials:   " << result.adjustments.effective_trials
                  << " (" << result.adjustments.discarded_trials << " discarded)\n";
        std::cerr << "  Ending cash P5:     " << result.cash_balance.at("p5")[last] << "\n";
        std::cerr << "  Ending cash P50:    " << result.cash_balance.at("p50")[last] << "\n";
        std::cerr << "  Ending cash P95:    " << result.cash_balance.at("p95")[last] << "\n";
        std::cerr << "  Survival (full):    "
                  << result.survival.overall.percentage_surviving_full_period << "%\n";
        if (!result.sensitivity.top_drivers.empty()) {
            std::cerr << "  Top driver:         " << result.sensitivity.top_drivers.front().driver_name
                      << "\n";
        }
        std::cerr << "  Execution:          " << result.execution_time_ms << " ms\n";

        if (args.output_path.empty()) {
            io::write_simulation_result_json(std::cout, result);
        } else {
            io::write_simulation_result_json(args.output_path, result);
            std::cerr << "\nOutput written to: " << args.output_path << "\n";
        }

        if (!args.parquet_path.empty()) {
            ParquetWriter::write_percentiles(result, args.parquet_path);
            std::cerr << "Percentiles written to: " << args.parquet_path << "\n";
        }

        logger.flush();
        return EXIT_DONE;
    } catch (const ValidationError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        logger.log_error(JobContext(args.job_id, "export"), e.what());
        return EXIT_FAILED;
    }
}
