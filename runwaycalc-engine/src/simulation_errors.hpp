#ifndef RUNWAYCALC_SIMULATION_ERRORS_HPP
#define RUNWAYCALC_SIMULATION_ERRORS_HPP

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace runwaycalc {

// Base exception for all simulation engine errors
class SimulationError : public std::runtime_error {
public:
    explicit SimulationError(const std::string& message)
        : std::runtime_error(message) {}
};

// One offending field in a SimulationConfig
struct ValidationIssue {
    std::string field;      // e.g. "numSimulations" or "drivers.churn_rate.min"
    std::string message;

    ValidationIssue(const std::string& f, const std::string& m)
        : field(f), message(m) {}
};

// Raised before any trial runs when the configuration is malformed.
// Carries every problem found, not just the first one.
class ValidationError : public SimulationError {
public:
    explicit ValidationError(std::vector<ValidationIssue> issues);

    const std::vector<ValidationIssue>& issues() const { return issues_; }

private:
    static std::string format(const std::vector<ValidationIssue>& issues);

    std::vector<ValidationIssue> issues_;
};

// Raised when too many trials were discarded for non-finite output
class SimulationIntegrityError : public SimulationError {
public:
    SimulationIntegrityError(size_t discarded, size_t attempted, double threshold,
                             std::vector<std::map<std::string, double>> samples);

    size_t discarded_trials() const { return discarded_; }
    size_t attempted_trials() const { return attempted_; }
    double discard_ratio() const;
    double threshold() const { return threshold_; }

    // Driver values of (up to 5) trials that produced NaN/Infinity
    const std::vector<std::map<std::string, double>>& failing_samples() const {
        return samples_;
    }

private:
    static std::string format(size_t discarded, size_t attempted, double threshold,
                              const std::vector<std::map<std::string, double>>& samples);

    size_t discarded_;
    size_t attempted_;
    double threshold_;
    std::vector<std::map<std::string, double>> samples_;
};

} // namespace runwaycalc

#endif // RUNWAYCALC_SIMULATION_ERRORS_HPP
