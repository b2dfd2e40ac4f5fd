/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace runwaycalc {

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

LogLevel diagnostic_to_log_level(DiagnosticLevel level) {
    switch (level) {
        case DiagnosticLevel::Debug: return LogLevel::DEBUG;
        case DiagnosticLevel::Info: return LogLevel::INFO;
        case DiagnosticLevel::Warning: return LogLevel::WARN;
        case DiagnosticLevel::Error: return LogLevel::ERROR;
        default: return LogLevel::INFO;
    }
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    // Open log file if enabled
    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_diagnostic(const JobContext& ctx, const DiagnosticEvent& event) {
    std::map<std::string, std::string> fields = event.fields;
    fields["event"] = event.event;
    fields["job_id"] = ctx.job_id;
    fields["stage"] = ctx.stage;

    log(diagnostic_to_log_level(event.level), event.message, fields);
}

void Logger::log_job_complete(
    const JobContext& ctx,
    SimulationStatus status,
    size_t completed_trials,
    size_t discarded_trials,
    double elapsed_ms
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "job_complete";
    fields["job_id"] = ctx.job_id;
    fields["status"] = status_to_string(status);
    fields["completed_trials"] = std::to_string(completed_trials);
    fields["discarded_trials"] = std::to_string(discarded_trials);
    fields["elapsed_ms"] = std::to_string(elapsed_ms);

    LogLevel level = status == SimulationStatus::Failed ? LogLevel::ERROR : LogLevel::INFO;
    log(level, "Simulation job finished", fields);
}

void Logger::log_error(
    const JobContext& ctx,
    const std::string& error_message,
    const std::string& error_type
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["job_id"] = ctx.job_id;
    fields["stage"] = ctx.stage;
    fields["error_message"] = error_message;

    if (!error_type.empty()) {
        fields["error_type"] = error_type;
    }

    log(LogLevel::ERROR, "Simulation job error", fields);
}

void Logger::log_warning(
    const JobContext& ctx,
    const std::string& warning_message
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["job_id"] = ctx.job_id;
    fields["stage"] = ctx.stage;
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_state_transition(
    const JobContext& ctx,
    SimulationStatus old_state,
    SimulationStatus new_state
) {
    std::map<std::string, std::string> fields;
    fields["event"] = "state_transition";
    fields["job_id"] = ctx.job_id;
    fields["old_state"] = status_to_string(old_state);
    fields["new_state"] = status_to_string(new_state);

    log(LogLevel::DEBUG, "State transition", fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    const std::string timestamp = get_timestamp();

    if (config_.enable_json) {
        std::map<std::string, std::string> record(fields);
        record["timestamp"] = timestamp;
        record["level"] = level_to_string(level);
        record["message"] = message;
        write_output(format_json(record));
        return;
    }

    // Plain text: timestamp [LEVEL] message {key=value, ...}
    std::ostringstream line;
    line << timestamp << " [" << level_to_string(level) << "] " << message;
    const char* separator = " {";
    for (const auto& [key, value] : fields) {
        line << separator << key << "=" << value;
        separator = ", ";
    }
    if (!fields.empty()) {
        line << "}";
    }
    write_output(line.str());
}

// UTC, ISO-8601 with milliseconds: 2026-01-31T09:15:02.123Z
std::string Logger::get_timestamp() const {
    const auto now = std::chrono::system_clock::now();
    const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm utc;
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << millis << 'Z';
    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    // Invalid UTF-8 in messages is replaced rather than thrown
    nlohmann::json obj(fields);
    return obj.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace runwaycalc
