/**
 * @file logger.hpp
 * @brief Structured logging for simulation jobs with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Job context tracking (job ID, stage)
 * - Forwarding of engine diagnostics (discarded trials, batch progress)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef RUNWAYCALC_LOGGER_HPP
#define RUNWAYCALC_LOGGER_HPP

#include "../../runwaycalc-engine/src/simulation_runner.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace runwaycalc {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (batch progress, state transitions)
    INFO,    ///< Informational messages (simulation start/end)
    WARN,    ///< Warning messages (discarded trials, skipped analysis)
    ERROR    ///< Error messages (failures, exceptions)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string (case-insensitive, defaults to INFO)
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Map an engine diagnostic level onto a log level
 */
LogLevel diagnostic_to_log_level(DiagnosticLevel level);

/**
 * @brief Job context attached to every log line
 */
struct JobContext {
    std::string job_id;              ///< Job identifier assigned by the job layer
    std::string stage;               ///< Current stage (parse, simulate, export)

    JobContext() = default;

    explicit JobContext(const std::string& id, const std::string& stage_name = "simulate")
        : job_id(id), stage(stage_name) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("runwaycalc.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "runwaycalc.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   JobContext ctx("job-42");
 *   runner.set_diagnostic_sink([&](const DiagnosticEvent& e) {
 *       logger.log_diagnostic(ctx, e);
 *   });
 *   @endcode
 *
 * All methods are safe to call from the job's worker thread.
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * @param config Logger configuration
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a diagnostic emitted by the simulation engine
     *
     * The diagnostic's event name and fields are carried over verbatim
     * (simulation_start, batch_complete, trials_discarded, ...).
     *
     * @param ctx Job context
     * @param event Engine diagnostic
     */
    void log_diagnostic(const JobContext& ctx, const DiagnosticEvent& event);

    /**
     * @brief Log job completion with its terminal status
     *
     * @param ctx Job context
     * @param status Terminal status
     * @param completed_trials Trials that ran
     * @param discarded_trials Trials dropped for non-finite output
     * @param elapsed_ms Wall time of the job
     */
    void log_job_complete(
        const JobContext& ctx,
        SimulationStatus status,
        size_t completed_trials,
        size_t discarded_trials,
        double elapsed_ms
    );

    /**
     * @brief Log error with context
     *
     * @param ctx Job context
     * @param error_message Error message
     * @param error_type Optional exception type name
     */
    void log_error(
        const JobContext& ctx,
        const std::string& error_message,
        const std::string& error_type = ""
    );

    /**
     * @brief Log warning message
     *
     * @param ctx Job context
     * @param warning_message Warning message
     */
    void log_warning(
        const JobContext& ctx,
        const std::string& warning_message
    );

    /**
     * @brief Log job state transition
     *
     * @param ctx Job context
     * @param old_state Previous status
     * @param new_state New status
     */
    void log_state_transition(
        const JobContext& ctx,
        SimulationStatus old_state,
        SimulationStatus new_state
    );

    /**
     * @brief Flush all log outputs
     */
    void flush();

    /**
     * @brief Set minimum log level
     */
    void set_min_level(LogLevel level);

    /**
     * @brief Get current log level
     */
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    void write_output(const std::string& output);
};

} // namespace runwaycalc

#endif // RUNWAYCALC_LOGGER_HPP
